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

#include "zarchive.h"

#include <archive.h>
#include <archive_entry.h>
#include <stdexcept>
#include <memory>
#include <format>

#include "utils.h"
#include "logging.h"

namespace DebHost
{

using ArchivePtr = std::unique_ptr<archive, decltype(&archive_read_free)>;

static std::string getArchiveErrorMessage(archive *ar)
{
    const char *err = archive_error_string(ar);
    return err ? std::string(err) : std::string("unknown error");
}

static std::string readArchiveData(archive *ar)
{
    archive_entry *ae = nullptr;
    std::vector<char> buffer(GENERIC_BUFFER_SIZE);
    std::string data;

    int ret = archive_read_next_header(ar, &ae);
    if (ret == ARCHIVE_EOF)
        return data;

    if (ret != ARCHIVE_OK)
        throw std::runtime_error(
            std::format("Unable to read header of compressed data: {}", getArchiveErrorMessage(ar)));

    while (true) {
        const auto size = archive_read_data(ar, buffer.data(), buffer.size());
        if (size < 0)
            throw std::runtime_error(std::format("Failed to read compressed data: {}", getArchiveErrorMessage(ar)));

        if (size == 0)
            break;

        data.append(buffer.data(), size);
    }

    return data;
}

std::string decompressData(const std::vector<std::uint8_t> &data)
{
    ArchivePtr ar(archive_read_new(), archive_read_free);
    if (!ar)
        throw std::runtime_error("Failed to create archive object");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_empty(ar.get());
    archive_read_support_format_raw(ar.get());

    int ret = archive_read_open_memory(ar.get(), data.data(), data.size());
    if (ret != ARCHIVE_OK)
        throw std::runtime_error(std::format("Unable to open compressed data: {}", getArchiveErrorMessage(ar.get())));

    return readArchiveData(ar.get());
}

static la_ssize_t appendToBuffer(archive *, void *clientData, const void *buffer, size_t length)
{
    auto out = static_cast<std::vector<std::uint8_t> *>(clientData);
    const auto bytes = static_cast<const std::uint8_t *>(buffer);
    out->insert(out->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
}

std::vector<std::uint8_t> compressData(std::string_view data, ArchiveType atype)
{
    ArchivePtr ar(archive_write_new(), archive_write_free);
    if (!ar)
        throw std::runtime_error("Failed to create archive object");

    archive_write_set_format_raw(ar.get());
    if (atype == ArchiveType::GZIP) {
        archive_write_add_filter_gzip(ar.get());
        archive_write_set_filter_option(ar.get(), "gzip", "timestamp", nullptr);
    } else {
        archive_write_add_filter_xz(ar.get());
    }

    // the compressed stream must not be padded to the block size
    archive_write_set_bytes_in_last_block(ar.get(), 1);

    std::vector<std::uint8_t> result;
    if (archive_write_open(ar.get(), &result, nullptr, appendToBuffer, nullptr) != ARCHIVE_OK)
        throw std::runtime_error(
            std::format("Unable to open in-memory compressor: {}", getArchiveErrorMessage(ar.get())));

    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), archive_entry_free);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));

    if (archive_write_header(ar.get(), entry.get()) != ARCHIVE_OK)
        throw std::runtime_error(std::format("Unable to compress data: {}", getArchiveErrorMessage(ar.get())));
    if (!data.empty() && archive_write_data(ar.get(), data.data(), data.size()) < 0)
        throw std::runtime_error(std::format("Unable to compress data: {}", getArchiveErrorMessage(ar.get())));
    if (archive_write_close(ar.get()) != ARCHIVE_OK)
        throw std::runtime_error(std::format("Unable to finish compressed data: {}", getArchiveErrorMessage(ar.get())));

    return result;
}

void ArchiveDecompressor::openData(const std::vector<std::uint8_t> &data, ArchiveFormat format)
{
    m_data = &data;
    m_format = format;
}

bool ArchiveDecompressor::isOpen() const
{
    return m_data != nullptr;
}

void ArchiveDecompressor::close()
{
    m_data = nullptr;
}

bool ArchiveDecompressor::pathMatches(const std::string &path1, const std::string &path2) const
{
    if (path1 == path2)
        return true;

    auto abs1 = (fs::path("/") / path1).lexically_normal();
    auto abs2 = (fs::path("/") / path2).lexically_normal();

    return abs1 == abs2;
}

std::vector<std::uint8_t> ArchiveDecompressor::readEntry(archive *ar, const std::string &fname)
{
    const void *buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    std::vector<std::uint8_t> result;

    while (true) {
        const int ret = archive_read_data_block(ar, &buff, &size, &offset);
        if (ret == ARCHIVE_EOF)
            break;
        if (ret != ARCHIVE_OK)
            throw std::runtime_error(std::format(
                "Failed to read '{}' from archive: {}", fname, getArchiveErrorMessage(ar)));

        // sparse entries: fill holes with zeros
        if (static_cast<std::size_t>(offset) > result.size())
            result.resize(static_cast<std::size_t>(offset), 0);

        const auto ptr = static_cast<const std::uint8_t *>(buff);
        result.insert(result.end(), ptr, ptr + size);
    }

    return result;
}

archive *ArchiveDecompressor::openArchive()
{
    if (!isOpen())
        throw std::runtime_error("Archive was not opened");

    ArchivePtr ar(archive_read_new(), archive_read_free);
    if (!ar)
        throw std::runtime_error("Failed to create archive object");

    switch (m_format) {
    case ArchiveFormat::Ar:
        archive_read_support_format_ar(ar.get());
        break;
    case ArchiveFormat::Tar:
        archive_read_support_filter_all(ar.get());
        archive_read_support_format_tar(ar.get());
        break;
    }

    if (archive_read_open_memory(ar.get(), m_data->data(), m_data->size()) != ARCHIVE_OK)
        throw std::runtime_error(std::format("Unable to open archive: {}", getArchiveErrorMessage(ar.get())));

    return ar.release();
}

/**
 * Advance to the next entry. Returns false at the end of the archive,
 * and throws if the archive is damaged.
 */
static bool nextHeader(archive *ar, archive_entry **en)
{
    const int ret = archive_read_next_header(ar, en);
    if (ret == ARCHIVE_EOF)
        return false;
    if (ret == ARCHIVE_WARN) {
        logDebug("Warning while reading archive: {}", getArchiveErrorMessage(ar));
        return true;
    }
    if (ret != ARCHIVE_OK)
        throw std::runtime_error(std::format("Unable to read archive: {}", getArchiveErrorMessage(ar)));
    return true;
}

/**
 * Path name of an entry, throws for entries whose name libarchive could not read.
 */
static std::string entryPathname(archive_entry *en)
{
    const char *pathname = archive_entry_pathname(en);
    if (pathname == nullptr)
        throw std::runtime_error("Archive contains an entry without a readable path name");
    return pathname;
}

std::vector<std::uint8_t> ArchiveDecompressor::readData(const std::string &fname)
{
    return readLinkedData(fname, 0);
}

std::vector<std::uint8_t> ArchiveDecompressor::readLinkedData(const std::string &fname, unsigned int linkDepth)
{
    archive_entry *en = nullptr;
    ArchivePtr ar(openArchive(), archive_read_free);

    while (nextHeader(ar.get(), &en)) {
        const auto pathname = entryPathname(en);
        if (!pathMatches(fname, pathname))
            continue;

        const auto filetype = archive_entry_filetype(en);
        if (filetype == AE_IFDIR)
            throw std::runtime_error(std::format("Path '{}' is a directory and can not be extracted.", fname));

        const char *hardlinkTarget = archive_entry_size(en) == 0 ? archive_entry_hardlink(en) : nullptr;
        if ((filetype == AE_IFLNK || hardlinkTarget != nullptr) && linkDepth >= MAX_LINK_DEPTH)
            throw std::runtime_error(std::format("Too many levels of links while resolving '{}'.", fname));

        if (filetype == AE_IFLNK) {
            const char *linkTarget = archive_entry_symlink(en);
            if (!linkTarget)
                throw std::runtime_error(std::format("Unable to read destination of symbolic link for '{}'.", fname));

            std::string linkTargetStr(linkTarget);
            if (!fs::path(linkTargetStr).is_absolute())
                linkTargetStr = (fs::path(fname).parent_path() / linkTargetStr).string();
            return readLinkedData(linkTargetStr, linkDepth + 1);
        }

        if (hardlinkTarget != nullptr)
            return readLinkedData(hardlinkTarget, linkDepth + 1);

        // ar members have no file type set
        if (filetype != AE_IFREG && filetype != 0)
            throw std::runtime_error(std::format("Refusing to read non-regular file '{}' from the archive", fname));

        return readEntry(ar.get(), fname);
    }

    throw std::runtime_error(std::format("File '{}' was not found in the archive.", fname));
}

std::vector<std::string> ArchiveDecompressor::readContents()
{
    archive_entry *en = nullptr;
    std::vector<std::string> contents;
    ArchivePtr ar(openArchive(), archive_read_free);

    while (nextHeader(ar.get(), &en)) {
        auto pathname = entryPathname(en);

        // ignore directories
        if (archive_entry_filetype(en) == AE_IFDIR || (!pathname.empty() && pathname.back() == '/'))
            continue;

        contents.push_back(std::move(pathname));
    }

    return contents;
}

} // namespace DebHost
