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

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <memory>
#include <stop_token>
#include <cstdint>

namespace ASCatalog
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
 * Download data via HTTP. Based on cURL.
 */
class Downloader
{
public:
    /**
     * Get thread-local singleton instance
     */
    static Downloader &get();

    Downloader();

    /**
     * Maximum time a single transfer attempt may take.
     */
    void setTimeout(std::chrono::seconds timeout);
    std::chrono::seconds timeout() const;

    /**
     * Abort running and future transfers of this instance once a stop is requested on `token`.
     */
    void setStopToken(std::stop_token token);

    /**
     * Download to memory and return data as byte vector.
     * If `lastModified` is non-null, it receives the server's Last-Modified time if one was sent.
     */
    std::vector<std::uint8_t> download(
        const std::string &url,
        std::uint32_t maxTryCount = 4,
        std::optional<std::chrono::system_clock::time_point> *lastModified = nullptr);

    /**
     * Download `url` to `dest`.
     *
     * Params:
     *      url = The URL to download.
     *      dest = The location for the downloaded file.
     *      maxTryCount = Number of times to attempt the download.
     */
    void downloadFile(const std::string &url, const std::string &dest, std::uint32_t maxTryCount = 4);

    /**
     * Download `url` and return a string with its contents.
     */
    std::string downloadText(const std::string &url, std::uint32_t maxTryCount = 4);

private:
    const std::string userAgent;
    const std::string caInfo;
    std::chrono::seconds m_timeout;
    std::stop_token m_stopToken;

    // thread local instance
    static thread_local std::unique_ptr<Downloader> instance_;

    void performTransfer(
        const std::string &url,
        std::vector<std::uint8_t> &buffer,
        std::optional<std::chrono::system_clock::time_point> &lastModified,
        std::uint32_t maxTryCount);
};

} // namespace ASCatalog
