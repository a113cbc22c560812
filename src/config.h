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
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>

#include "utils.h"

namespace ASCatalog
{

/**
 * Default icon size used for the icon cache and search results.
 */
inline constexpr ImageSize DefaultIconSize = ImageSize(64);

/**
 * Settings for the popularity statistics cache.
 */
struct StatsSettings {
    std::string url;
    std::string metadataUrl;
    std::chrono::days maxAge{30};
    std::chrono::days entryMaxAge{365};
    /* artifact shipped with the application, used while no cache is available */
    fs::path bundledFile;
};

/**
 * Settings for the icon loader.
 */
struct IconSettings {
    ImageSize size = DefaultIconSize;
    std::uint32_t workers = 4;
    std::chrono::seconds timeout{10};
};

/**
 * Features that can be toggled by the user.
 */
struct ClientFeatures {
    bool noDownloads = false;
    bool loadIcons = true;
    bool refreshStats = true;
};

/**
 * The global configuration for the catalog client.
 */
class Config
{
public:
    ~Config();

    // Singleton access
    static Config &get();

    std::vector<std::string> catalogSources;
    std::vector<fs::path> iconRoots;
    std::vector<fs::path> iconThemeDirs;

    StatsSettings stats;
    IconSettings icons;
    ClientFeatures feature;

    std::string caInfo;

    fs::path cacheDir() const;
    fs::path statsCacheFile() const;
    fs::path catalogDownloadDir() const;

    /**
     * Reset all settings to their defaults.
     */
    void resetDefaults();

    void loadFromFile(const std::string &fname, const std::string &enforcedCacheDir = "");

    void setCacheDir(const fs::path &dir);

    // Delete copy constructor and assignment operator for singleton
    Config(const Config &) = delete;
    Config &operator=(const Config &) = delete;

private:
    static std::unique_ptr<Config> instance_;
    static std::once_flag initialized_;
    Config();

    fs::path m_cacheDir;
};

} // namespace ASCatalog
