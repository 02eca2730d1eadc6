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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

struct archive;

namespace DebHost
{

namespace fs = std::filesystem;

enum class ArchiveType {
    GZIP,
    XZ
};

/**
 * Container formats an ArchiveDecompressor accepts.
 * Restricting the format avoids misdetecting arbitrary data
 * as one of the many formats libarchive knows.
 */
enum class ArchiveFormat {
    Ar,
    Tar
};

std::string decompressData(const std::vector<std::uint8_t> &data);

/**
 * Compress data in memory, producing a single raw stream.
 * The output does not depend on the current time.
 */
std::vector<std::uint8_t> compressData(std::string_view data, ArchiveType atype);

class ArchiveDecompressor
{
public:
    ArchiveDecompressor() = default;

    /**
     * Read the archive from memory. The buffer is not copied and must
     * stay alive while this decompressor is open.
     */
    void openData(const std::vector<std::uint8_t> &data, ArchiveFormat format);

    bool isOpen() const;
    void close();

    /**
     * Read the contents of a member. Symbolic and hard links inside the
     * archive are followed, up to MAX_LINK_DEPTH of them.
     */
    std::vector<std::uint8_t> readData(const std::string &fname);

    static constexpr unsigned int MAX_LINK_DEPTH = 8;

    /**
     * List the path names of all non-directory entries, in archive order.
     */
    std::vector<std::string> readContents();

private:
    const std::vector<std::uint8_t> *m_data = nullptr;
    ArchiveFormat m_format = ArchiveFormat::Ar;

    bool pathMatches(const std::string &path1, const std::string &path2) const;
    std::vector<std::uint8_t> readLinkedData(const std::string &fname, unsigned int linkDepth);
    std::vector<std::uint8_t> readEntry(struct archive *ar, const std::string &fname);
    struct archive *openArchive();
};

} // namespace DebHost
