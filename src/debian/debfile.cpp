/*
 * Copyright (C) 2025 The debhost developers
 *
 * Licensed under the GNU Lesser General Public License Version 3
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the license, or
 * (at your option) any later version.
 *
 * This software is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this software.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "debfile.h"

#include <array>
#include <format>
#include <initializer_list>
#include <stdexcept>

#include "../errors.h"
#include "../logging.h"
#include "../utils.h"
#include "../zarchive.h"
#include "debutils.h"

namespace DebHost
{

static constexpr std::array<std::string_view, 4> RequiredControlFields = {
    "Package",
    "Version",
    "Architecture",
    "Description"};

static bool hasKnownSuffix(
    const std::string &member,
    std::string_view prefix,
    std::initializer_list<std::string_view> suffixes)
{
    if (!member.starts_with(prefix))
        return false;
    const auto rest = std::string_view(member).substr(prefix.size());
    for (const auto &sfx : suffixes) {
        if (rest == sfx)
            return true;
    }
    return false;
}

DebFile::DebFile(const std::vector<std::uint8_t> &data)
    : m_data(data),
      m_opened(false)
{
}

void DebFile::open()
{
    if (m_opened)
        return;

    ArchiveDecompressor ad;
    ad.openData(m_data, ArchiveFormat::Ar);

    std::vector<std::string> members;
    std::string formatVersion;
    try {
        members = ad.readContents();
        if (members.empty() || members.front() != "debian-binary")
            throw ParseError("Not a Debian package: the first archive member is not 'debian-binary'");

        const auto versionData = ad.readData("debian-binary");
        formatVersion = Utils::trimString(
            std::string_view(reinterpret_cast<const char *>(versionData.data()), versionData.size()));
    } catch (const ParseError &) {
        throw;
    } catch (const std::runtime_error &e) {
        throw ParseError(std::format("Invalid Debian package container: {}", e.what()));
    }

    if (!formatVersion.starts_with("2."))
        throw ParseError(std::format("Unsupported Debian package format version '{}'", formatVersion));

    for (const auto &member : members) {
        if (m_controlMember.empty() && hasKnownSuffix(member, "control.tar", {"", ".gz", ".xz", ".zst"}))
            m_controlMember = member;
        else if (
            m_dataMember.empty() && hasKnownSuffix(member, "data.tar", {"", ".gz", ".xz", ".zst", ".bz2", ".lzma"}))
            m_dataMember = member;
    }

    if (m_controlMember.empty())
        throw ParseError("Debian package has no control archive member");
    if (m_dataMember.empty())
        throw ParseError("Debian package has no data archive member");

    verifyDataMember();
    m_opened = true;
}

void DebFile::verifyDataMember()
{
    ArchiveDecompressor ad;
    ad.openData(m_data, ArchiveFormat::Ar);

    try {
        const auto payload = ad.readData(m_dataMember);

        ArchiveDecompressor dataArchive;
        dataArchive.openData(payload, ArchiveFormat::Tar);
        const auto contents = dataArchive.readContents();
        logDebug("Data member '{}' holds {} files", m_dataMember, contents.size());
    } catch (const std::runtime_error &e) {
        throw ParseError(std::format("Data member '{}' can not be decompressed: {}", m_dataMember, e.what()));
    }
}

std::string DebFile::readControlText()
{
    open();

    ArchiveDecompressor ad;
    ad.openData(m_data, ArchiveFormat::Ar);

    std::vector<std::uint8_t> controlData;
    try {
        const auto controlArchiveData = ad.readData(m_controlMember);

        ArchiveDecompressor ca;
        ca.openData(controlArchiveData, ArchiveFormat::Tar);
        controlData = ca.readData("./control");
    } catch (const std::runtime_error &e) {
        throw ParseError(std::format("Unable to read control file from '{}': {}", m_controlMember, e.what()));
    }

    std::string controlText(controlData.begin(), controlData.end());
    if (controlText.find('\0') != std::string::npos)
        throw ParseError("Control file contains NUL bytes");

    return controlText;
}

ControlStanza DebFile::readControlInformation()
{
    auto stanza = parseControlStanza(readControlText());

    std::vector<std::string> missing;
    for (const auto &name : RequiredControlFields) {
        if (Utils::trimString(stanza.readField(name)).empty())
            missing.emplace_back(name);
    }
    if (!missing.empty())
        throw ParseError(
            std::format("Control file is missing required fields: {}", Utils::joinStrings(missing, ", ")));

    const auto pkgName = stanza.readField("Package");
    if (!isValidPackageName(pkgName))
        throw ParseError(std::format("Invalid package name '{}'", pkgName));

    const auto version = stanza.readField("Version");
    if (!isValidVersion(version))
        throw ParseError(std::format("Invalid version '{}' for package {}", version, pkgName));

    const auto arch = stanza.readField("Architecture");
    if (arch.find_first_of(" \t\n/") != std::string::npos)
        throw ParseError(std::format("Invalid architecture '{}' for package {}", arch, pkgName));

    return stanza;
}

} // namespace DebHost
