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

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

#include "digests.h"

namespace DebHost
{

namespace fs = std::filesystem;

class Config;
class Catalog;
struct PackageRecord;

/**
 * A generated index file, relative to the suite directory.
 */
struct IndexFileInfo {
    std::string path;
    ArtifactDigests digests;
};

/**
 * Summary of a completed index generation.
 */
struct GenerationResult {
    fs::path generationDir;
    fs::path suiteLink;
    std::vector<std::string> architectures;
    std::vector<IndexFileInfo> files;
    std::size_t packageCount = 0;

    // public key of the signing key, empty for unsigned repositories
    fs::path keyringFile;
};

/**
 * Renders a time point in the RFC 1123 format used by Release files.
 */
std::string formatRfc1123(std::chrono::system_clock::time_point time);

/**
 * Builds the Packages and Release index tree of the repository
 * from a consistent view of the catalog and publishes it atomically.
 */
class IndexGenerator
{
public:
    explicit IndexGenerator(const Config &conf);
    ~IndexGenerator() = default;

    IndexGenerator(const IndexGenerator &) = delete;
    IndexGenerator &operator=(const IndexGenerator &) = delete;

    /**
     * Regenerate all indices under dists/<suite> for every configured
     * architecture and every architecture present in the catalog.
     *
     * Throws GenerationError on failure, in which case the previously
     * published generation is left untouched.
     */
    GenerationResult generate(Catalog &catalog, std::chrono::system_clock::time_point timestamp);

    /**
     * Render one repository stanza for a cataloged package.
     */
    static std::string renderStanza(const PackageRecord &record);

    /**
     * Render the Packages index content for the given records,
     * in the order they are passed.
     */
    static std::string renderPackages(const std::vector<PackageRecord> &records);

    std::string renderRelease(
        const std::vector<std::string> &architectures,
        const std::vector<IndexFileInfo> &files,
        std::chrono::system_clock::time_point timestamp) const;

    /**
     * Directory containing the published suite links and generations.
     */
    fs::path distsDir() const;

    /**
     * A generation is kept for this long after it was replaced by a newer
     * one, so clients still downloading from it are not disturbed.
     */
    void setGracePeriod(std::chrono::seconds period);

private:
    const Config &m_conf;
    std::chrono::seconds m_gracePeriod;

    std::vector<IndexFileInfo> writeArchitectureIndices(
        const fs::path &genDir,
        const std::string &arch,
        const std::vector<PackageRecord> &records) const;
    fs::path signRelease(const fs::path &genDir, const std::string &releaseData) const;
    void publishGeneration(const fs::path &genDir) const;
    void cleanupOldGenerations() const;
};

} // namespace DebHost
