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

#include "utils.h"

#include <algorithm>
#include <random>
#include <regex>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <format>

#include "downloader.h"

namespace DebHost
{

namespace Utils
{

std::string randomString(std::uint32_t len)
{
    if (len == 0)
        len = 1;

    static constexpr std::string_view chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dis(0, chars.size() - 1);

    std::string result;
    result.reserve(len);
    for (std::uint32_t i = 0; i < len; ++i)
        result += chars[dis(gen)];

    return result;
}

bool isRemote(const std::string &uri)
{
    static const std::regex uriRegex(R"(^(https?|ftps?)://)");
    return std::regex_search(uri, uriRegex);
}

std::vector<std::uint8_t> getFileContents(const std::string &path, std::uint32_t maxTryCount, Downloader *downloader)
{
    if (isRemote(path)) {
        Downloader *dl = downloader;
        if (dl == nullptr)
            dl = &Downloader::get();

        return dl->download(path, maxTryCount);
    }

    std::error_code ec;
    if (fs::is_directory(path, ec))
        throw std::runtime_error(std::format("Failed to read '{}': it is a directory", path));

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
        throw std::runtime_error(std::format("Failed to open file '{}'", path));

    const auto fileSize = file.tellg();
    if (fileSize < 0)
        throw std::runtime_error(std::format("Failed to determine the size of '{}'", path));

    std::vector<std::uint8_t> data;
    data.resize(static_cast<std::size_t>(fileSize));
    file.seekg(0, std::ios::beg);
    if (!file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size())))
        throw std::runtime_error(std::format("Failed to read file '{}'", path));

    return data;
}

std::vector<std::string> findFilesBySuffix(const fs::path &dir, const std::string &suffix)
{
    std::error_code ec;
    std::vector<std::string> files;
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::none, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec) || ec)
            continue;
        const auto fname = it->path().string();
        if (fname.ends_with(suffix))
            files.push_back(fname);
    }
    if (ec)
        throw std::runtime_error(std::format("Error traversing directory {}: {}", dir.string(), ec.message()));

    std::sort(files.begin(), files.end());
    return files;
}

fs::path getTestSamplesDir()
{
    return fs::path(__FILE__).parent_path().parent_path() / "tests" / "samples";
}

std::string filenameFromURI(const std::string &uri)
{
    std::string bname = fs::path(uri).filename().string();

    auto qInd = bname.find('?');
    if (qInd != std::string::npos)
        bname = bname.substr(0, qInd);

    auto hInd = bname.find('#');
    if (hInd != std::string::npos)
        bname = bname.substr(0, hInd);

    return bname;
}

std::string bytesToHex(const std::vector<std::uint8_t> &data)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(data.size() * 2);
    for (const auto b : data) {
        hex += digits[b >> 4];
        hex += digits[b & 0x0f];
    }

    return hex;
}

std::string toLower(std::string_view s)
{
    std::string out;
    out.resize(s.size());
    std::ranges::transform(s, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    return out;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::string rtrimString(std::string_view s)
{
    auto end = s.find_last_not_of(" \t\r\n\v\f");
    if (end == std::string_view::npos)
        return {};
    return std::string(s.substr(0, end + 1));
}

std::string trimString(std::string_view s) noexcept
{
    const char *b = s.data();
    const char *e = b + s.size();

    auto is_space = [](unsigned char c) constexpr noexcept {
        return c == ' ' || (c >= '\t' && c <= '\r');
    };

    while (b != e && is_space(static_cast<unsigned char>(*b)))
        ++b;
    while (e != b && is_space(static_cast<unsigned char>(e[-1])))
        --e;

    return std::string(b, e);
}

std::string joinStrings(const std::vector<std::string> &strings, const std::string &delimiter)
{
    std::string result;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0)
            result += delimiter;
        result += strings[i];
    }

    return result;
}

std::vector<std::string> splitString(const std::string &s, char delimiter)
{
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;

    while (std::getline(ss, item, delimiter))
        result.push_back(item);

    return result;
}

} // namespace Utils

} // namespace DebHost
