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

#include "digests.h"

#include <algorithm>
#include <format>
#include <memory>

#include <glib.h>

#include "errors.h"
#include "utils.h"

namespace DebHost
{

using ChecksumPtr = std::unique_ptr<GChecksum, decltype(&g_checksum_free)>;

static ChecksumPtr newChecksum(GChecksumType type)
{
    ChecksumPtr cs(g_checksum_new(type), g_checksum_free);
    if (!cs)
        throw StorageError(std::format("Checksum type {} is not supported", static_cast<int>(type)));
    return cs;
}

static std::vector<std::uint8_t> finishChecksum(GChecksum *cs, GChecksumType type)
{
    const auto len = g_checksum_type_get_length(type);
    if (len <= 0)
        throw StorageError("Unable to determine checksum length");

    std::vector<std::uint8_t> digest(static_cast<std::size_t>(len));
    gsize digestLen = digest.size();
    g_checksum_get_digest(cs, digest.data(), &digestLen);
    digest.resize(digestLen);

    return digest;
}

std::string ArtifactDigests::md5Hex() const
{
    return Utils::bytesToHex(md5);
}

std::string ArtifactDigests::sha1Hex() const
{
    return Utils::bytesToHex(sha1);
}

std::string ArtifactDigests::sha256Hex() const
{
    return Utils::bytesToHex(sha256);
}

ArtifactDigests computeDigests(const std::uint8_t *data, std::size_t len)
{
    auto md5 = newChecksum(G_CHECKSUM_MD5);
    auto sha1 = newChecksum(G_CHECKSUM_SHA1);
    auto sha256 = newChecksum(G_CHECKSUM_SHA256);

    // GChecksum takes a signed length, feed large inputs in chunks
    constexpr std::size_t chunkSize = 1 << 20;
    for (std::size_t pos = 0; pos < len; pos += chunkSize) {
        const auto n = static_cast<gssize>(std::min(chunkSize, len - pos));
        g_checksum_update(md5.get(), data + pos, n);
        g_checksum_update(sha1.get(), data + pos, n);
        g_checksum_update(sha256.get(), data + pos, n);
    }

    ArtifactDigests result;
    result.md5 = finishChecksum(md5.get(), G_CHECKSUM_MD5);
    result.sha1 = finishChecksum(sha1.get(), G_CHECKSUM_SHA1);
    result.sha256 = finishChecksum(sha256.get(), G_CHECKSUM_SHA256);
    result.size = len;

    return result;
}

ArtifactDigests computeDigests(const std::vector<std::uint8_t> &data)
{
    return computeDigests(data.data(), data.size());
}

ArtifactDigests computeDigests(std::string_view data)
{
    return computeDigests(reinterpret_cast<const std::uint8_t *>(data.data()), data.size());
}

std::vector<std::uint8_t> computeDescriptionMd5(std::string_view description)
{
    auto md5 = newChecksum(G_CHECKSUM_MD5);

    std::string text;
    text.reserve(description.size() + 1);
    for (std::size_t i = 0; i < description.size(); ++i) {
        if (description[i] == '\r' && (i + 1 == description.size() || description[i + 1] == '\n'))
            continue;
        text += description[i];
    }
    text += '\n';

    g_checksum_update(md5.get(), reinterpret_cast<const guchar *>(text.data()), static_cast<gssize>(text.size()));
    return finishChecksum(md5.get(), G_CHECKSUM_MD5);
}

} // namespace DebHost
