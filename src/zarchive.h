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
#include <cstdint>
#include <memory>
#include <sys/types.h>

struct archive;

namespace ASCatalog
{

/**
 * Decompress an in-memory buffer compressed with any filter supported by libarchive.
 * Uncompressed data is returned unchanged.
 */
std::string decompressData(const std::vector<std::uint8_t> &data);

/**
 * Check whether `data` starts with the signature of a compression format
 * we can unpack (gzip, xz, zstd, bzip2).
 */
bool isCompressedData(const std::vector<std::uint8_t> &data) noexcept;

/**
 * Sequential reader for a single (optionally compressed) data stream.
 *
 * Data is decompressed in fixed-size chunks as it is read, so arbitrarily
 * large documents can be consumed with bounded memory.
 */
class ArchiveStream
{
public:
    ArchiveStream();
    ~ArchiveStream();

    ArchiveStream(const ArchiveStream &) = delete;
    ArchiveStream &operator=(const ArchiveStream &) = delete;

    /**
     * Open a file on disk.
     */
    void open(const std::string &fname);

    /**
     * Open an in-memory buffer. The buffer must outlive this stream.
     */
    void openMemory(const std::uint8_t *data, std::size_t len);

    bool isOpen() const;
    void close();

    /**
     * Read up to `len` bytes of decompressed data into `buf`.
     * Returns 0 at the end of the stream, throws on read errors.
     */
    std::size_t read(char *buf, std::size_t len);

    const std::string &name() const;

private:
    struct archive *m_ar;
    std::string m_name;
    bool m_eof;

    void startReading();
};

} // namespace ASCatalog
