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

#include "artifactstore.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <thread>

#include "atomicfile.h"
#include "digests.h"
#include "errors.h"
#include "logging.h"

namespace DebHost
{

ArtifactStore::ArtifactStore(const fs::path &repoRoot, std::uint32_t maxRetries)
    : m_root(repoRoot),
      m_maxRetries(maxRetries),
      m_retryDelay(200)
{
}

std::string ArtifactStore::poolPathFor(const std::string &sha256Hex)
{
    const bool validHash = sha256Hex.size() == 64 && std::ranges::all_of(sha256Hex, [](unsigned char c) {
                               return std::isdigit(c) || (c >= 'a' && c <= 'f');
                           });
    if (!validHash)
        throw StorageError(std::format("Invalid artifact digest '{}'", sha256Hex));

    return std::format("pool/{}/{}.deb", sha256Hex.substr(0, 2), sha256Hex);
}

fs::path ArtifactStore::absolutePath(const std::string &relPath) const
{
    return m_root / relPath;
}

bool ArtifactStore::exists(const std::string &relPath) const
{
    std::error_code ec;
    return fs::is_regular_file(absolutePath(relPath), ec);
}

void ArtifactStore::setRetryDelay(std::chrono::milliseconds delay)
{
    m_retryDelay = delay;
}

void ArtifactStore::writeArtifact(const fs::path &target, const std::vector<std::uint8_t> &data)
{
    fs::create_directories(target.parent_path());

    std::error_code ec;
    if (fs::is_regular_file(target, ec) && fs::file_size(target, ec) == data.size() && !ec) {
        logDebug("Artifact {} is already stored", target.filename().string());
        return;
    }

    writeFileAtomically(target, data);
}

std::string ArtifactStore::store(const std::vector<std::uint8_t> &data, const ArtifactDigests &digests)
{
    if (digests.size != data.size())
        throw StorageError(
            std::format("Artifact size mismatch: digests describe {} bytes, got {}", digests.size, data.size()));

    const auto relPath = poolPathFor(digests.sha256Hex());
    const auto target = absolutePath(relPath);

    auto delay = m_retryDelay;
    for (std::uint32_t attempt = 0;; ++attempt) {
        try {
            writeArtifact(target, data);
            return relPath;
        } catch (const std::exception &e) {
            if (attempt >= m_maxRetries)
                throw StorageError(std::format("Unable to store artifact {}: {}", relPath, e.what()));

            logWarning(
                "Storing artifact {} failed ({}), retrying in {}ms", relPath, e.what(), delay.count());
        }

        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

} // namespace DebHost
