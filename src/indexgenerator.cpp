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

#include "indexgenerator.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <format>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <sys/wait.h>
#include <glib.h>
#include <tbb/parallel_for_each.h>

#include "atomicfile.h"
#include "catalog.h"
#include "config.h"
#include "errors.h"
#include "logging.h"
#include "utils.h"
#include "zarchive.h"
#include "debian/tagfile.h"

namespace DebHost
{

namespace
{

// fields that describe the repository layout rather than the artifact
constexpr std::array<std::string_view, 6> LAYOUT_FIELDS =
    {"Filename", "Size", "MD5sum", "SHA1", "SHA256", "Description-md5"};

constexpr std::size_t GENERATION_ID_LENGTH = 8;

constexpr auto KEYRING_FILENAME = "archive-keyring.asc";

/**
 * Removes an unpublished generation directory unless released.
 */
class GenerationDirGuard
{
public:
    explicit GenerationDirGuard(fs::path dir)
        : m_dir(std::move(dir)),
          m_released(false)
    {
    }

    ~GenerationDirGuard()
    {
        if (m_released)
            return;
        std::error_code ec;
        fs::remove_all(m_dir, ec);
        if (ec)
            logWarning("Unable to remove incomplete generation {}: {}", m_dir.string(), ec.message());
    }

    GenerationDirGuard(const GenerationDirGuard &) = delete;
    GenerationDirGuard &operator=(const GenerationDirGuard &) = delete;

    void release()
    {
        m_released = true;
    }

private:
    fs::path m_dir;
    bool m_released;
};

/**
 * Execute a command and return its exit code, standard output and error output.
 */
std::tuple<int, std::string, std::string> executeCommand(const std::vector<std::string> &args, const fs::path &workDir)
{
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    g_autofree gchar *stdoutData = nullptr;
    g_autofree gchar *stderrData = nullptr;
    gint exitStatus = 0;
    g_autoptr(GError) error = nullptr;

    gboolean success = g_spawn_sync(
        workDir.c_str(),
        argv.data(),
        nullptr,
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH),
        nullptr,
        nullptr,
        &stdoutData,
        &stderrData,
        &exitStatus,
        &error);

    if (!success)
        return {-1, "", error ? error->message : "Unknown error"};

    int exitCode = WIFEXITED(exitStatus) ? WEXITSTATUS(exitStatus) : -1;
    return {exitCode, stdoutData ? stdoutData : "", stderrData ? stderrData : ""};
}

bool isGenerationOf(const std::string &dirName, const std::string &suite)
{
    const auto prefix = std::format(".{}.", suite);
    if (!dirName.starts_with(prefix))
        return false;
    const auto suffix = std::string_view(dirName).substr(prefix.size());
    return suffix.size() == GENERATION_ID_LENGTH && suffix.find('.') == std::string_view::npos;
}

void appendChecksumSection(
    std::string &out,
    std::string_view title,
    const std::vector<IndexFileInfo> &files,
    std::string (ArtifactDigests::*hexFn)() const)
{
    out += title;
    out += ":\n";
    for (const auto &file : files)
        out += std::format(" {} {:>16} {}\n", (file.digests.*hexFn)(), file.digests.size, file.path);
}

} // namespace

std::string formatRfc1123(std::chrono::system_clock::time_point time)
{
    static constexpr std::array<const char *, 7> dayNames = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr std::array<const char *, 12> monthNames =
        {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    const auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    if (gmtime_r(&tt, &tm) == nullptr)
        throw GenerationError("Unable to convert timestamp to UTC");

    return std::format(
        "{}, {:02} {} {} {:02}:{:02}:{:02} UTC",
        dayNames[tm.tm_wday],
        tm.tm_mday,
        monthNames[tm.tm_mon],
        tm.tm_year + 1900,
        tm.tm_hour,
        tm.tm_min,
        tm.tm_sec);
}

IndexGenerator::IndexGenerator(const Config &conf)
    : m_conf(conf),
      m_gracePeriod(std::chrono::minutes(10))
{
}

fs::path IndexGenerator::distsDir() const
{
    return m_conf.repositoryRoot / "dists";
}

void IndexGenerator::setGracePeriod(std::chrono::seconds period)
{
    m_gracePeriod = period;
}

std::string IndexGenerator::renderStanza(const PackageRecord &record)
{
    auto stanza = parseControlStanza(record.control);
    for (const auto &field : LAYOUT_FIELDS)
        stanza.remove(field);

    stanza.append("Filename", record.filepath);
    stanza.append("Size", std::to_string(record.size));
    stanza.append("MD5sum", Utils::bytesToHex(record.md5));
    stanza.append("SHA1", Utils::bytesToHex(record.sha1));
    stanza.append("SHA256", Utils::bytesToHex(record.sha256));
    stanza.append("Description-md5", Utils::bytesToHex(record.descriptionMd5));

    return stanza.render();
}

std::string IndexGenerator::renderPackages(const std::vector<PackageRecord> &records)
{
    std::string result;
    for (const auto &rec : records) {
        result += renderStanza(rec);
        result += '\n';
    }

    return result;
}

std::string IndexGenerator::renderRelease(
    const std::vector<std::string> &architectures,
    const std::vector<IndexFileInfo> &files,
    std::chrono::system_clock::time_point timestamp) const
{
    const auto &rel = m_conf.release;
    auto sortedFiles = files;
    std::ranges::sort(sortedFiles, [](const IndexFileInfo &a, const IndexFileInfo &b) {
        return a.path < b.path;
    });

    std::string out;
    if (!rel.origin.empty())
        out += std::format("Origin: {}\n", rel.origin);
    if (!rel.label.empty())
        out += std::format("Label: {}\n", rel.label);
    out += std::format("Suite: {}\n", rel.suite);
    if (!rel.version.empty())
        out += std::format("Version: {}\n", rel.version);
    out += std::format("Codename: {}\n", m_conf.codename());
    out += std::format("Date: {}\n", formatRfc1123(timestamp));
    if (m_conf.validForSeconds > 0)
        out += std::format(
            "Valid-Until: {}\n", formatRfc1123(timestamp + std::chrono::seconds(m_conf.validForSeconds)));
    out += std::format("Architectures: {}\n", Utils::joinStrings(architectures, " "));
    out += std::format("Components: {}\n", m_conf.component);
    if (!rel.description.empty())
        out += std::format("Description: {}\n", rel.description);
    out += "Acquire-By-Hash: no\n";

    appendChecksumSection(out, "MD5Sum", sortedFiles, &ArtifactDigests::md5Hex);
    appendChecksumSection(out, "SHA1", sortedFiles, &ArtifactDigests::sha1Hex);
    appendChecksumSection(out, "SHA256", sortedFiles, &ArtifactDigests::sha256Hex);

    return out;
}

std::vector<IndexFileInfo> IndexGenerator::writeArchitectureIndices(
    const fs::path &genDir,
    const std::string &arch,
    const std::vector<PackageRecord> &records) const
{
    const auto relDir = std::format("{}/binary-{}", m_conf.component, arch);
    fs::create_directories(genDir / relDir);

    std::vector<IndexFileInfo> files;
    const auto packagesData = renderPackages(records);
    writeFileAtomically(genDir / relDir / "Packages", packagesData);
    files.push_back({relDir + "/Packages", computeDigests(packagesData)});

    if (m_conf.feature.compressIndices) {
        const auto gzData = compressData(packagesData, ArchiveType::GZIP);
        writeFileAtomically(genDir / relDir / "Packages.gz", gzData);
        files.push_back({relDir + "/Packages.gz", computeDigests(gzData)});

        const auto xzData = compressData(packagesData, ArchiveType::XZ);
        writeFileAtomically(genDir / relDir / "Packages.xz", xzData);
        files.push_back({relDir + "/Packages.xz", computeDigests(xzData)});
    }

    logDebug("Wrote Packages index for {} ({} packages)", arch, records.size());
    return files;
}

fs::path IndexGenerator::signRelease(const fs::path &genDir, const std::string &releaseData) const
{
    const auto releaseFname = (genDir / "Release").string();
    const std::vector<std::string> baseArgs =
        {"gpg", "--batch", "--no-tty", "--yes", "--local-user", m_conf.signingKey};

    auto runGpg = [&](const std::vector<std::string> &extraArgs, const std::string &outName) {
        auto args = baseArgs;
        args.insert(args.end(), extraArgs.begin(), extraArgs.end());
        args.push_back("--output");
        args.push_back("-");
        args.push_back(releaseFname);

        const auto [exitCode, output, errors] = executeCommand(args, genDir);
        if (exitCode != 0)
            throw GenerationError(
                std::format("Unable to create {} with key {}: {}", outName, m_conf.signingKey, errors));
        if (output.empty())
            throw GenerationError(std::format("Signing produced an empty {}", outName));
        writeFileAtomically(genDir / outName, output);
    };

    logDebug("Signing Release ({} bytes) with key {}", releaseData.size(), m_conf.signingKey);
    runGpg({"--clearsign"}, "InRelease");
    runGpg({"--armor", "--detach-sign"}, "Release.gpg");

    // publish the public key so clients can install it as their keyring
    const auto [exitCode, keyData, errors] =
        executeCommand({"gpg", "--batch", "--no-tty", "--armor", "--export", m_conf.signingKey}, genDir);
    if (exitCode != 0)
        throw GenerationError(std::format("Unable to export public key {}: {}", m_conf.signingKey, errors));
    if (keyData.empty())
        throw GenerationError(std::format("Public key {} was not found in the keyring", m_conf.signingKey));

    const auto keyringFname = genDir / KEYRING_FILENAME;
    writeFileAtomically(keyringFname, keyData);
    return keyringFname;
}

void IndexGenerator::publishGeneration(const fs::path &genDir) const
{
    const auto dists = distsDir();
    const auto suiteLink = dists / m_conf.release.suite;
    const auto tmpLink = dists / std::format(".tmp-{}-{}", m_conf.release.suite, Utils::randomString(8));

    std::error_code ec;
    const auto previous = fs::read_symlink(suiteLink, ec);
    ec.clear();

    fs::create_directory_symlink(genDir.filename(), tmpLink, ec);
    if (ec)
        throw GenerationError(std::format("Unable to create link {}: {}", tmpLink.string(), ec.message()));

    if (std::rename(tmpLink.c_str(), suiteLink.c_str()) != 0) {
        const auto err = errno;
        fs::remove(tmpLink, ec);
        throw GenerationError(
            std::format("Unable to publish {}: {}", suiteLink.string(), std::strerror(err)));
    }

    // the grace period of the replaced generation starts now
    if (!previous.empty()) {
        fs::last_write_time(dists / previous.filename(), fs::file_time_type::clock::now(), ec);
        if (ec)
            logWarning("Unable to mark {} as replaced: {}", previous.filename().string(), ec.message());
    }

    logInfo("Published {} -> {}", suiteLink.string(), genDir.filename().string());
}

void IndexGenerator::cleanupOldGenerations() const
{
    const auto dists = distsDir();
    const auto suiteLink = dists / m_conf.release.suite;

    std::error_code ec;
    const auto current = fs::read_symlink(suiteLink, ec).filename().string();
    if (ec) {
        logWarning("Unable to resolve {}: {}", suiteLink.string(), ec.message());
        return;
    }

    const auto now = fs::file_time_type::clock::now();
    std::vector<fs::path> expired;
    for (auto it = fs::directory_iterator(dists, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name == current || !isGenerationOf(name, m_conf.release.suite))
            continue;

        std::error_code tec;
        if (!fs::is_directory(it->symlink_status(tec)) || tec)
            continue;
        const auto mtime = fs::last_write_time(it->path(), tec);
        if (tec || now - mtime < m_gracePeriod)
            continue;
        expired.push_back(it->path());
    }
    if (ec) {
        logWarning("Unable to scan {} for old generations: {}", dists.string(), ec.message());
        return;
    }

    for (const auto &path : expired) {
        fs::remove_all(path, ec);
        if (ec)
            logWarning("Unable to remove old generation {}: {}", path.filename().string(), ec.message());
        else
            logDebug("Removed old generation {}", path.filename().string());
    }
}

GenerationResult IndexGenerator::generate(Catalog &catalog, std::chrono::system_clock::time_point timestamp)
{
    const auto &suite = m_conf.release.suite;
    const auto dists = distsDir();
    const auto suiteLink = dists / suite;

    // read everything from one snapshot before any rendering happens
    std::map<std::string, std::vector<PackageRecord>> recordsByArch;
    try {
        const auto snap = catalog.snapshot();
        std::set<std::string> arches(m_conf.architectures.begin(), m_conf.architectures.end());
        for (const auto &arch : snap->architectures())
            arches.insert(arch);
        for (const auto &arch : arches)
            recordsByArch[arch] = snap->list(arch);
    } catch (const StorageError &e) {
        throw GenerationError(std::format("Unable to read catalog: {}", e.what()));
    }

    std::error_code ec;
    const auto linkStatus = fs::symlink_status(suiteLink, ec);
    if (fs::exists(linkStatus) && !fs::is_symlink(linkStatus))
        throw GenerationError(
            std::format("{} exists and is not a symbolic link, refusing to replace it", suiteLink.string()));

    fs::create_directories(dists, ec);
    if (ec)
        throw GenerationError(std::format("Unable to create {}: {}", dists.string(), ec.message()));

    const auto genDir = dists / std::format(".{}.{}", suite, Utils::randomString(GENERATION_ID_LENGTH));
    fs::create_directory(genDir, ec);
    if (ec)
        throw GenerationError(std::format("Unable to create generation {}: {}", genDir.string(), ec.message()));
    GenerationDirGuard guard(genDir);

    GenerationResult result;
    result.generationDir = genDir;
    result.suiteLink = suiteLink;
    for (const auto &[arch, records] : recordsByArch) {
        result.architectures.push_back(arch);
        result.packageCount += records.size();
    }

    try {
        std::mutex filesMutex;
        tbb::parallel_for_each(
            result.architectures.begin(), result.architectures.end(), [&](const std::string &arch) {
                auto files = writeArchitectureIndices(genDir, arch, recordsByArch.at(arch));

                std::lock_guard<std::mutex> lock(filesMutex);
                result.files.insert(result.files.end(), files.begin(), files.end());
            });
        std::ranges::sort(result.files, [](const IndexFileInfo &a, const IndexFileInfo &b) {
            return a.path < b.path;
        });

        const auto releaseData = renderRelease(result.architectures, result.files, timestamp);
        writeFileAtomically(genDir / "Release", releaseData);

        if (m_conf.signingEnabled())
            result.keyringFile = signRelease(genDir, releaseData);

        publishGeneration(genDir);
    } catch (const GenerationError &) {
        throw;
    } catch (const std::exception &e) {
        throw GenerationError(std::format("Unable to generate indices for {}: {}", suite, e.what()));
    }
    guard.release();

    cleanupOldGenerations();

    logInfo(
        "Generated indices for {} ({} architectures, {} packages)",
        suite,
        result.architectures.size(),
        result.packageCount);
    return result;
}

} // namespace DebHost
