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

namespace DebHost
{

inline constexpr std::size_t GENERIC_BUFFER_SIZE = 8192;
namespace fs = std::filesystem;

class Downloader;

namespace Utils
{

/**
 * Generate a random alphanumeric string.
 */
std::string randomString(std::uint32_t len);

/**
 * Check if string contains a remote URI.
 */
bool isRemote(const std::string &uri);

/**
 * Download or open `path` and return it as a byte array.
 *
 * @param path The path or URL to access.
 * @param maxTryCount Maximum number of retry attempts for remote data.
 * @param downloader Downloader instance (can be null).
 * @return The data if successful.
 */
std::vector<std::uint8_t> getFileContents(
    const std::string &path,
    std::uint32_t maxTryCount = 4,
    Downloader *downloader = nullptr);

/**
 * Find all regular files below `dir` whose name ends with `suffix`,
 * descending into subdirectories. The result is sorted.
 */
std::vector<std::string> findFilesBySuffix(const fs::path &dir, const std::string &suffix);

/**
 * Get path of the directory with test samples.
 */
fs::path getTestSamplesDir();

/**
 * Extract filename from URI, removing query parameters and fragments.
 */
std::string filenameFromURI(const std::string &uri);

/**
 * Render binary data as lowercase hexadecimal string.
 */
[[nodiscard]] std::string bytesToHex(const std::vector<std::uint8_t> &data);

/**
 * Convert a string to lowercase.
 *
 * @param s The string to convert to lowercase.
 */
[[nodiscard]] std::string toLower(std::string_view s);

/**
 * Compare two ASCII strings, ignoring case.
 */
[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

/**
 * Trim whitespace from the right end of a string.
 *
 * @param s The string to trim.
 */
[[nodiscard]] std::string rtrimString(std::string_view s);

/**
 * Trim whitespace from both ends of a string.
 *
 * @param s The string to trim.
 */
[[nodiscard]] std::string trimString(std::string_view s) noexcept;

/**
 * Join a vector of strings with a delimiter.
 *
 * @param strings The strings to join.
 * @param delimiter The delimiter to use.
 */
[[nodiscard]] std::string joinStrings(const std::vector<std::string> &strings, const std::string &delimiter);

/**
 * Split a string by a delimiter character.
 *
 * @param s The string to split.
 * @param delimiter The delimiter character.
 */
[[nodiscard]] std::vector<std::string> splitString(const std::string &s, char delimiter);

} // namespace Utils

} // namespace DebHost
