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

namespace DebHost
{

/**
 * Digests and size of a complete byte sequence.
 */
struct ArtifactDigests {
    std::vector<std::uint8_t> md5;
    std::vector<std::uint8_t> sha1;
    std::vector<std::uint8_t> sha256;
    std::uint64_t size = 0;

    std::string md5Hex() const;
    std::string sha1Hex() const;
    std::string sha256Hex() const;
};

ArtifactDigests computeDigests(const std::uint8_t *data, std::size_t len);
ArtifactDigests computeDigests(const std::vector<std::uint8_t> &data);
ArtifactDigests computeDigests(std::string_view data);

/**
 * MD5 of a Description field value, as APT computes it for the
 * Description-md5 field: the value exactly as it follows "Description: "
 * in the stanza, continuation lines included, plus a terminating newline.
 */
std::vector<std::uint8_t> computeDescriptionMd5(std::string_view description);

} // namespace DebHost
