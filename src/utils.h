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
#include <string_view>
#include <vector>
#include <optional>
#include <format>
#include <compare>
#include <chrono>
#include <filesystem>

namespace ASCatalog
{

inline constexpr std::size_t GENERIC_BUFFER_SIZE = 8192;
namespace fs = std::filesystem;

class Downloader;

/**
 * Structure representing image dimensions and scale factor.
 */
struct ImageSize {
    uint32_t width;
    uint32_t height;
    uint32_t scale;

    constexpr ImageSize(std::uint32_t w, std::uint32_t h, std::uint32_t s)
        : width(w),
          height(h),
          scale(s)
    {
    }

    constexpr ImageSize(std::uint32_t w, std::uint32_t h)
        : width(w),
          height(h),
          scale(1)
    {
    }

    /**
     * Constructor with size (square image, scale = 1).
     */
    explicit constexpr ImageSize(std::uint32_t s)
        : width(s),
          height(s),
          scale(1)
    {
    }

    explicit constexpr ImageSize()
        : width(0),
          height(0),
          scale(1)
    {
    }

    /**
     * Constructor from string representation (e.g., "64x64" or "64x64@2").
     */
    explicit ImageSize(const std::string &str);

    /**
     * Convert to string representation.
     */
    std::string toString() const;

    /**
     * Convert to integer (larger dimension * scale).
     */
    std::uint32_t toInt() const;

    // clang-format off
    std::strong_ordering operator<=> (const ImageSize &other) const
    {
        if (auto cmp = width <=> other.width; cmp != 0)
            return cmp;
        return scale <=> other.scale;
    }

    bool operator==(const ImageSize &other) const = default;
    // clang-format on
};

namespace Utils
{

/**
 * Generate a random alphanumeric string.
 */
std::string randomString(std::uint32_t len);

/**
 * Check if a path exists and is a directory.
 */
bool existsAndIsDir(const std::string &path);

/**
 * Check if string contains a remote URI.
 */
bool isRemote(const std::string &uri);

/**
 * Download or open `path` and return it as a byte array.
 *
 * @param path The path to access.
 * @param maxTryCount Maximum number of retry attempts.
 * @param downloader Downloader instance (can be null).
 * @return The data if successful.
 */
std::vector<std::uint8_t> getFileContents(
    const std::string &path,
    std::uint32_t maxTryCount = 4,
    Downloader *downloader = nullptr);

/**
 * Write `data` to `fname` so readers never see a partially written file.
 * The data is written to a temporary file in the same directory first,
 * which is then renamed over the destination.
 */
void writeFileAtomic(const fs::path &fname, const std::vector<std::uint8_t> &data);

/**
 * Get path of the directory with test samples.
 */
fs::path getTestSamplesDir();

/**
 * Extract filename from URI, removing query parameters and fragments.
 */
std::string filenameFromURI(const std::string &uri);

/**
 * Convert a string to lowercase (ASCII only).
 */
[[nodiscard]] std::string toLower(std::string_view s);

/**
 * Trim whitespace from both ends of a string.
 */
[[nodiscard]] std::string trimString(std::string_view s) noexcept;

/**
 * Join a vector of strings with a delimiter.
 */
[[nodiscard]] std::string joinStrings(const std::vector<std::string> &strings, const std::string &delimiter);

/**
 * Split a string by a delimiter character.
 */
[[nodiscard]] std::vector<std::string> splitString(const std::string &s, char delimiter);

/**
 * Split a string at whitespace, dropping empty parts.
 */
[[nodiscard]] std::vector<std::string> splitWhitespace(std::string_view s);

} // namespace Utils

} // namespace ASCatalog

// Hash function for ImageSize to use in std::unordered_map
template<>
struct std::hash<ASCatalog::ImageSize> {
    std::size_t operator()(const ASCatalog::ImageSize &size) const noexcept
    {
        std::size_t h1 = std::hash<std::uint32_t>{}(size.width);
        std::size_t h2 = std::hash<std::uint32_t>{}(size.height);
        std::size_t h3 = std::hash<std::uint32_t>{}(size.scale);

        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};
