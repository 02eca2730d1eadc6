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

namespace DebHost
{

namespace fs = std::filesystem;

struct ArtifactDigests;

/**
 * Content-addressed storage of package artifacts below the repository root.
 *
 * An artifact lives at pool/<h[0:2]>/<h>.deb, where h is the hex SHA256 of
 * its bytes, so storing the same bytes twice is a no-op and concurrent
 * writers of identical content cannot conflict.
 */
class ArtifactStore
{
public:
    explicit ArtifactStore(const fs::path &repoRoot, std::uint32_t maxRetries = 3);

    /**
     * Repository-relative path for an artifact with the given SHA256.
     */
    static std::string poolPathFor(const std::string &sha256Hex);

    /**
     * Store the artifact bytes. Throws StorageError if the data could not
     * be written after all retries.
     *
     * @return the repository-relative path of the artifact.
     */
    std::string store(const std::vector<std::uint8_t> &data, const ArtifactDigests &digests);

    fs::path absolutePath(const std::string &relPath) const;
    bool exists(const std::string &relPath) const;

    const fs::path &rootDir() const
    {
        return m_root;
    }

    void setRetryDelay(std::chrono::milliseconds delay);

private:
    fs::path m_root;
    std::uint32_t m_maxRetries;
    std::chrono::milliseconds m_retryDelay;

    void writeArtifact(const fs::path &target, const std::vector<std::uint8_t> &data);
};

} // namespace DebHost
