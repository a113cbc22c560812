/*
 * Copyright (C) 2025-2026 Matthias Klumpp <matthias@tenstral.net>
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
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <ctime>
#include <curl/curl.h>
#include <fcntl.h>
#include <sys/stat.h>

#include "defines.h"
#include "config.h"
#include "logging.h"
#include "utils.h"

namespace ASCatalog
{

// Thread-local instance
thread_local std::unique_ptr<Downloader> Downloader::instance_;

DownloadException::DownloadException(const std::string &message)
    : m_message(message)
{
}

const char *DownloadException::what() const noexcept
{
    return m_message.c_str();
}

// Callback function for writing data to the receive buffer
static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userData)
{
    const size_t totalSize = size * nmemb;
    auto *buffer = static_cast<std::vector<std::uint8_t> *>(userData);

    const auto *bytes = static_cast<const std::uint8_t *>(contents);
    buffer->insert(buffer->end(), bytes, bytes + totalSize);
    return totalSize;
}

struct HeaderCallbackData {
    bool httpsUrl;
    bool insecureRedirect;
    std::optional<std::chrono::system_clock::time_point> *lastModified;
};

static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userData)
{
    const size_t totalSize = size * nitems;
    auto *data = static_cast<HeaderCallbackData *>(userData);

    const auto header = Utils::toLower(std::string_view(buffer, totalSize));

    // Refuse HTTPS -> HTTP downgrades. We must not throw through libcurl's C stack,
    // so we flag the issue and abort the transfer by returning a short count.
    if (data->httpsUrl && header.starts_with("location:")) {
        if (header.find("http:") != std::string::npos) {
            data->insecureRedirect = true;
            return 0;
        }
    }

    if (header.starts_with("last-modified:")) {
        auto dateStr = Utils::trimString(std::string_view(buffer, totalSize).substr(14));

        // Parse RFC822 date format using strptime
        std::tm tm = {};
        if (strptime(dateStr.c_str(), "%a, %d %b %Y %H:%M:%S", &tm)) {
            auto timeT = timegm(&tm);
            if (timeT != -1)
                *(data->lastModified) = std::chrono::system_clock::from_time_t(timeT);
        }
    }

    return totalSize;
}

static int progressCallback(void *userData, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto *token = static_cast<const std::stop_token *>(userData);
    // a non-zero return value aborts the transfer
    return token->stop_requested() ? 1 : 0;
}

Downloader &Downloader::get()
{
    if (!instance_)
        instance_ = std::make_unique<Downloader>();
    return *instance_;
}

Downloader::Downloader()
    : userAgent(std::format("appstream-catalog/{}", std::string(ASCAT_VERSION))),
      caInfo(Config::get().caInfo),
      m_timeout(30)
{
    // Initialize curl globally (must be done once per process)
    static std::once_flag curlInitialized;
    std::call_once(curlInitialized, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

void Downloader::setTimeout(std::chrono::seconds timeout)
{
    m_timeout = timeout;
}

std::chrono::seconds Downloader::timeout() const
{
    return m_timeout;
}

void Downloader::setStopToken(std::stop_token token)
{
    m_stopToken = std::move(token);
}

void Downloader::performTransfer(
    const std::string &url,
    std::vector<std::uint8_t> &buffer,
    std::optional<std::chrono::system_clock::time_point> &lastModified,
    std::uint32_t maxTryCount)
{
    if (m_stopToken.stop_requested())
        throw DownloadException(std::format("Download of {} was cancelled", url));

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw DownloadException("Failed to initialize curl");

    HeaderCallbackData headerData{url.starts_with("https"), false, &lastModified};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headerData);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(m_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &m_stopToken);

    if (!caInfo.empty())
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, caInfo.c_str());

    const CURLcode res = curl_easy_perform(curl.get());
    if (headerData.insecureRedirect)
        throw DownloadException("HTTPS URL tried to redirect to a less secure HTTP URL.");

    if (res == CURLE_ABORTED_BY_CALLBACK)
        throw DownloadException(std::format("Download of {} was cancelled", url));

    if (res != CURLE_OK) {
        if (maxTryCount > 0) {
            logDebug(
                "Failed to download {}, will retry {} more {}", url, maxTryCount, maxTryCount > 1 ? "times" : "time");
            buffer.clear();
            lastModified.reset();
            curl.reset();
            performTransfer(url, buffer, lastModified, maxTryCount - 1);
            return;
        }

        throw DownloadException(std::format("curl_easy_perform() failed: {}", curl_easy_strerror(res)));
    }

    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);

    if (responseCode != 200 && responseCode != 301 && responseCode != 302) {
        if (responseCode == 0) {
            // just to be safe, check whether we received data before assuming everything went fine
            if (buffer.empty())
                throw DownloadException(
                    std::format("No data was received from the remote end (Code: {}).", responseCode));
        } else {
            throw DownloadException(std::format("HTTP request returned status code {}", responseCode));
        }
    }

    logDebug("Downloaded {}", url);
}

std::vector<std::uint8_t> Downloader::download(
    const std::string &url,
    std::uint32_t maxTryCount,
    std::optional<std::chrono::system_clock::time_point> *lastModified)
{
    if (!Utils::isRemote(url))
        throw DownloadException("URL is not remote");

    logDebug("Downloading {}", url);

    std::vector<std::uint8_t> buffer;
    std::optional<std::chrono::system_clock::time_point> lastMod;
    performTransfer(url, buffer, lastMod, maxTryCount);

    if (lastModified)
        *lastModified = lastMod;
    return buffer;
}

void Downloader::downloadFile(const std::string &url, const std::string &dest, std::uint32_t maxTryCount)
{
    std::optional<std::chrono::system_clock::time_point> lastModified;
    const auto data = download(url, maxTryCount, &lastModified);

    try {
        Utils::writeFileAtomic(dest, data);
    } catch (const std::exception &e) {
        throw DownloadException(std::format("Unable to store download of {}: {}", url, e.what()));
    }

    if (lastModified) {
        // Set file times if we have last-modified information
        auto timeT = std::chrono::system_clock::to_time_t(*lastModified);
        auto currentTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        struct timespec times[2];
        times[0].tv_sec = currentTime; // access time
        times[0].tv_nsec = 0;
        times[1].tv_sec = timeT; // modification time
        times[1].tv_nsec = 0;

        if (utimensat(AT_FDCWD, dest.c_str(), times, 0) != 0)
            logDebug("Unable to set modification time of {}", dest);
    }
}

std::string Downloader::downloadText(const std::string &url, std::uint32_t maxTryCount)
{
    auto data = download(url, maxTryCount);
    return std::string(data.begin(), data.end());
}

} // namespace ASCatalog
