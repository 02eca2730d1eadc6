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

#include "ingestor.h"

#include <filesystem>
#include <format>

#include "artifactstore.h"
#include "digests.h"
#include "downloader.h"
#include "errors.h"
#include "logging.h"
#include "utils.h"
#include "debian/debfile.h"

namespace DebHost
{

Ingestor::Ingestor(Catalog &catalog, ArtifactStore &store)
    : m_catalog(catalog),
      m_store(store),
      m_ignoreExisting(false),
      m_downloader(nullptr)
{
}

bool Ingestor::ignoreExisting() const
{
    return m_ignoreExisting;
}

void Ingestor::setIgnoreExisting(bool ignore)
{
    m_ignoreExisting = ignore;
}

void Ingestor::setExpectedArchitecture(const std::string &arch)
{
    m_expectedArch = arch;
}

void Ingestor::setDownloader(Downloader *downloader)
{
    m_downloader = downloader;
}

IngestResult Ingestor::ingest(const std::vector<std::uint8_t> &data, const std::string &origin)
{
    DebFile deb(data);
    const auto stanza = deb.readControlInformation();

    PackageRecord rec;
    rec.name = stanza.readField("Package");
    rec.version = stanza.readField("Version");
    rec.architecture = stanza.readField("Architecture");

    if (!m_expectedArch.empty() && rec.architecture != m_expectedArch && rec.architecture != "all")
        throw ParseError(std::format(
            "Package {} from {} is built for {}, expected {}", rec.id(), origin, rec.architecture, m_expectedArch));

    const auto digests = computeDigests(data);
    rec.control = stanza.render();
    rec.descriptionMd5 = computeDescriptionMd5(stanza.readField("Description"));
    rec.size = digests.size;
    rec.md5 = digests.md5;
    rec.sha1 = digests.sha1;
    rec.sha256 = digests.sha256;

    // the artifact must be on disk before the catalog may reference it
    rec.filepath = m_store.store(data, digests);

    try {
        m_catalog.insert(rec);
    } catch (const DuplicatePackage &e) {
        if (!m_ignoreExisting)
            throw;

        logInfo("Ignoring {}: {}", origin, e.what());
        auto existing = m_catalog.getPackage(rec.name, rec.version, rec.architecture);
        return {IngestStatus::AlreadyPresent, existing ? *existing : rec};
    }

    logInfo("Added {} ({})", rec.id(), rec.filepath);
    return {IngestStatus::Added, rec};
}

IngestResult Ingestor::ingestFile(const std::string &pathOrUrl)
{
    std::vector<std::uint8_t> data;
    try {
        data = Utils::getFileContents(pathOrUrl, 4, m_downloader);
    } catch (const DownloadException &e) {
        throw StorageError(std::format("Unable to download {}: {}", pathOrUrl, e.what()));
    } catch (const std::runtime_error &e) {
        throw StorageError(std::format("Unable to read {}: {}", pathOrUrl, e.what()));
    }

    logDebug("Ingesting {} ({} bytes)", pathOrUrl, data.size());
    return ingest(data, pathOrUrl);
}

std::vector<IngestResult> Ingestor::ingestDirectory(const std::string &dir)
{
    std::vector<std::string> files;
    try {
        files = Utils::findFilesBySuffix(dir, ".deb");
    } catch (const std::runtime_error &e) {
        throw StorageError(e.what());
    }

    if (files.empty())
        logWarning("No packages found in {}", dir);
    else
        logInfo("Found {} package(s) in {}", files.size(), dir);

    std::vector<IngestResult> results;
    results.reserve(files.size());
    for (const auto &fname : files)
        results.push_back(ingestFile(fname));

    return results;
}

std::vector<IngestResult> Ingestor::ingestPath(const std::string &pathOrUrl)
{
    std::error_code ec;
    if (!Utils::isRemote(pathOrUrl) && std::filesystem::is_directory(pathOrUrl, ec))
        return ingestDirectory(pathOrUrl);

    return {ingestFile(pathOrUrl)};
}

} // namespace DebHost
