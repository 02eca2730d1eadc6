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
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace DebHost
{

class DownloadException : public std::exception
{
public:
    explicit DownloadException(const std::string &message);
    const char *what() const noexcept override;

private:
    std::string m_message;
};

/**
 * Download data via HTTP(S) or FTP. Based on cURL.
 */
class Downloader
{
public:
    /**
     * Get thread-local instance, configured from the global configuration.
     */
    static Downloader &get();

    Downloader();
    explicit Downloader(const std::string &caInfo);

    /**
     * Download `url` to memory.
     *
     * Failed attempts are retried up to `maxTryCount` times, waiting
     * twice as long before each new attempt.
     *
     * Params:
     *      url = The URL to download.
     *      maxTryCount = Number of times to retry a failed download.
     */
    std::vector<std::uint8_t> download(const std::string &url, std::uint32_t maxTryCount = 4);

    /**
     * Set the delay before the first retry. Mainly useful for tests.
     */
    void setRetryDelay(std::chrono::milliseconds delay);

private:
    const std::string userAgent;
    const std::string caInfo;
    std::chrono::milliseconds m_retryDelay;

    static thread_local std::unique_ptr<Downloader> instance_;

    std::vector<std::uint8_t> downloadOnce(const std::string &url, bool &retryable);
};

} // namespace DebHost
