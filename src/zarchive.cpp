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

#include "zarchive.h"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <cstring>
#include <format>

#include "utils.h"
#include "logging.h"

namespace ASCatalog
{

/**
 * Chunk size for reading data from the archive.
 */
constexpr size_t DEFAULT_BLOCK_SIZE = 65536;

using ArchivePtr = std::unique_ptr<archive, decltype(&archive_read_free)>;

static std::string getArchiveErrorMessage(archive *ar)
{
    const char *err = archive_error_string(ar);
    return err ? std::string(err) : std::string();
}

static void setupRawReader(archive *ar)
{
    archive_read_support_filter_all(ar);
    archive_read_support_format_empty(ar);
    archive_read_support_format_raw(ar);
}

std::string decompressData(const std::vector<std::uint8_t> &data)
{
    ArchivePtr ar(archive_read_new(), archive_read_free);
    if (!ar)
        throw std::runtime_error("Failed to create archive object");

    setupRawReader(ar.get());

    int ret = archive_read_open_memory(ar.get(), data.data(), data.size());
    if (ret != ARCHIVE_OK)
        throw std::runtime_error(std::format("Unable to open compressed data: {}", getArchiveErrorMessage(ar.get())));

    archive_entry *ae = nullptr;
    ret = archive_read_next_header(ar.get(), &ae);
    if (ret == ARCHIVE_EOF)
        return {};
    if (ret != ARCHIVE_OK)
        throw std::runtime_error(
            std::format("Unable to read header of compressed data: {}", getArchiveErrorMessage(ar.get())));

    std::string result;
    std::vector<char> buffer(GENERIC_BUFFER_SIZE);
    while (true) {
        const ssize_t size = archive_read_data(ar.get(), buffer.data(), buffer.size());
        if (size < 0)
            throw std::runtime_error(std::format("Failed to read compressed data: {}", getArchiveErrorMessage(ar.get())));
        if (size == 0)
            break;

        result.append(buffer.data(), size);
    }

    return result;
}

bool isCompressedData(const std::vector<std::uint8_t> &data) noexcept
{
    auto startsWith = [&data](std::initializer_list<std::uint8_t> magic) {
        if (data.size() < magic.size())
            return false;
        return std::equal(magic.begin(), magic.end(), data.begin());
    };

    return startsWith({0x1f, 0x8b})                     // gzip
           || startsWith({0xfd, '7', 'z', 'X', 'Z', 0x00}) // xz
           || startsWith({0x28, 0xb5, 0x2f, 0xfd})      // zstd
           || startsWith({'B', 'Z', 'h'});              // bzip2
}

ArchiveStream::ArchiveStream()
    : m_ar(nullptr),
      m_eof(false)
{
}

ArchiveStream::~ArchiveStream()
{
    close();
}

void ArchiveStream::open(const std::string &fname)
{
    close();
    m_name = fname;

    m_ar = archive_read_new();
    if (!m_ar)
        throw std::runtime_error("Failed to create archive object");
    setupRawReader(m_ar);

    if (archive_read_open_filename(m_ar, fname.c_str(), DEFAULT_BLOCK_SIZE) != ARCHIVE_OK) {
        const auto msg = std::format(
            "Unable to open file '{}': {} ({})",
            fname,
            getArchiveErrorMessage(m_ar),
            std::strerror(archive_errno(m_ar)));
        close();
        throw std::runtime_error(msg);
    }

    startReading();
}

void ArchiveStream::openMemory(const std::uint8_t *data, std::size_t len)
{
    close();
    m_name = "<memory>";

    m_ar = archive_read_new();
    if (!m_ar)
        throw std::runtime_error("Failed to create archive object");
    setupRawReader(m_ar);

    if (archive_read_open_memory(m_ar, data, len) != ARCHIVE_OK) {
        const auto msg = std::format("Unable to open data: {}", getArchiveErrorMessage(m_ar));
        close();
        throw std::runtime_error(msg);
    }

    startReading();
}

void ArchiveStream::startReading()
{
    archive_entry *ae = nullptr;
    const int ret = archive_read_next_header(m_ar, &ae);
    if (ret == ARCHIVE_EOF) {
        // empty input
        m_eof = true;
        return;
    }

    if (ret != ARCHIVE_OK) {
        const auto msg = std::format(
            "Unable to read header of compressed file '{}': {}", m_name, getArchiveErrorMessage(m_ar));
        close();
        throw std::runtime_error(msg);
    }
    m_eof = false;
}

bool ArchiveStream::isOpen() const
{
    return m_ar != nullptr;
}

void ArchiveStream::close()
{
    if (m_ar)
        archive_read_free(m_ar);
    m_ar = nullptr;
    m_eof = false;
}

std::size_t ArchiveStream::read(char *buf, std::size_t len)
{
    if (!m_ar)
        throw std::runtime_error("Tried to read from a closed stream");
    if (m_eof)
        return 0;

    const ssize_t size = archive_read_data(m_ar, buf, len);
    if (size < 0)
        throw std::runtime_error(std::format("Failed to read data from '{}': {}", m_name, getArchiveErrorMessage(m_ar)));
    if (size == 0)
        m_eof = true;

    return static_cast<std::size_t>(size);
}

const std::string &ArchiveStream::name() const
{
    return m_name;
}

} // namespace ASCatalog
