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

#include "downloader.h"

#include <algorithm>
#include <format>
#include <mutex>
#include <thread>
#include <curl/curl.h>

#include "defines.h"
#include "config.h"
#include "logging.h"
#include "utils.h"

namespace DebHost
{

thread_local std::unique_ptr<Downloader> Downloader::instance_;

/**
 * Upper bound for the wait between two download attempts.
 */
static constexpr std::chrono::milliseconds MAX_RETRY_DELAY{30000};

DownloadException::DownloadException(const std::string &message)
    : m_message(message)
{
}

const char *DownloadException::what() const noexcept
{
    return m_message.c_str();
}

static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userData)
{
    const size_t totalSize = size * nmemb;
    auto buffer = static_cast<std::vector<std::uint8_t> *>(userData);

    const auto *bytes = static_cast<const std::uint8_t *>(contents);
    buffer->insert(buffer->end(), bytes, bytes + totalSize);
    return totalSize;
}

struct HeaderCallbackData {
    bool httpsUrl;
    bool insecureRedirect;
};

static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userData)
{
    const size_t totalSize = size * nitems;
    auto data = static_cast<HeaderCallbackData *>(userData);

    const auto header = Utils::toLower(std::string_view(buffer, totalSize));

    // refuse HTTPS -> HTTP downgrades; returning a short count aborts the transfer
    if (data->httpsUrl && header.starts_with("location:") && header.find("http:") != std::string::npos) {
        data->insecureRedirect = true;
        return 0;
    }

    return totalSize;
}

Downloader &Downloader::get()
{
    if (!instance_)
        instance_ = std::make_unique<Downloader>();
    return *instance_;
}

Downloader::Downloader()
    : Downloader(Config::get().caInfo)
{
}

Downloader::Downloader(const std::string &caInfoPath)
    : userAgent(std::format("debhost/{}", DEBHOST_VERSION)),
      caInfo(caInfoPath),
      m_retryDelay(500)
{
    static std::once_flag curlInitialized;
    std::call_once(curlInitialized, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

void Downloader::setRetryDelay(std::chrono::milliseconds delay)
{
    m_retryDelay = delay;
}

std::vector<std::uint8_t> Downloader::downloadOnce(const std::string &url, bool &retryable)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        retryable = false;
        throw DownloadException("Failed to initialize curl");
    }

    std::vector<std::uint8_t> buffer;
    HeaderCallbackData headerData{url.starts_with("https"), false};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headerData);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);

    if (!caInfo.empty())
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, caInfo.c_str());

    const CURLcode res = curl_easy_perform(curl.get());
    if (headerData.insecureRedirect) {
        retryable = false;
        throw DownloadException("HTTPS URL tried to redirect to a less secure HTTP URL.");
    }
    if (res != CURLE_OK) {
        retryable = true;
        throw DownloadException(std::format("curl_easy_perform() failed: {}", curl_easy_strerror(res)));
    }

    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);

    // FTP and file transfers report no HTTP status code
    if (responseCode == 0 && buffer.empty()) {
        retryable = true;
        throw DownloadException("No data was received from the remote end.");
    }
    if (responseCode >= 400) {
        retryable = responseCode >= 500 || responseCode == 408 || responseCode == 429;
        throw DownloadException(std::format("HTTP request returned status code {}", responseCode));
    }

    return buffer;
}

std::vector<std::uint8_t> Downloader::download(const std::string &url, std::uint32_t maxTryCount)
{
    if (!Utils::isRemote(url))
        throw DownloadException("URL is not remote");

    auto delay = m_retryDelay;
    for (std::uint32_t attempt = 0;; ++attempt) {
        logDebug("Downloading {}", url);

        bool retryable = false;
        try {
            auto data = downloadOnce(url, retryable);
            logDebug("Downloaded {} ({} bytes)", url, data.size());
            return data;
        } catch (const DownloadException &e) {
            if (!retryable || attempt >= maxTryCount)
                throw DownloadException(std::format("Unable to download {}: {}", url, e.what()));

            const auto remaining = maxTryCount - attempt;
            logDebug(
                "Failed to download {} ({}), will retry {} more {}",
                url,
                e.what(),
                remaining,
                remaining > 1 ? "times" : "time");
        }

        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, MAX_RETRY_DELAY);
    }
}

} // namespace DebHost
