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

#include "config.h"

#include <fstream>
#include <sstream>
#include <format>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <optional>

#include <libfyaml.h>
#include <glib.h>

#include "logging.h"
#include "utils.h"

namespace fs = std::filesystem;

namespace ASCatalog
{

// Static member definitions
std::unique_ptr<Config> Config::instance_;
std::once_flag Config::initialized_;

/**
 * Locations where distributions install their AppStream catalog data.
 */
static const std::array<std::string_view, 2> SystemCatalogDirs = {"/usr/share/swcatalog/xml", "/var/lib/app-info/xml"};

Config::Config()
{
    resetDefaults();
}

Config::~Config() = default;

Config &Config::get()
{
    std::call_once(initialized_, []() {
        instance_ = std::unique_ptr<Config>(new Config());
    });
    return *instance_;
}

void Config::resetDefaults()
{
    m_cacheDir = fs::path(g_get_user_cache_dir()) / "appstream-catalog";

    catalogSources.clear();
    for (const auto &dir : SystemCatalogDirs) {
        if (!Utils::existsAndIsDir(std::string(dir)))
            continue;
        for (const auto &dirEntry : fs::directory_iterator(dir)) {
            const auto fname = dirEntry.path().filename().string();
            if (fname.ends_with(".xml") || fname.ends_with(".xml.gz") || fname.ends_with(".xml.xz")
                || fname.ends_with(".xml.zst"))
                catalogSources.push_back(dirEntry.path().string());
        }
    }
    std::ranges::sort(catalogSources);

    iconRoots = {"/usr/share/swcatalog/icons", "/var/lib/app-info/icons"};
    iconThemeDirs = {"/usr/share/icons"};

    stats = StatsSettings{};
    icons = IconSettings{};
    feature = ClientFeatures{};
    caInfo.clear();
}

fs::path Config::cacheDir() const
{
    return m_cacheDir;
}

fs::path Config::statsCacheFile() const
{
    return m_cacheDir / "popularity-stats.bin";
}

fs::path Config::catalogDownloadDir() const
{
    return m_cacheDir / "catalog";
}

void Config::setCacheDir(const fs::path &dir)
{
    m_cacheDir = dir.is_absolute() ? dir : fs::absolute(dir);
}

static std::string readFileToString(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error(std::format("Could not open file: {}", filename));

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static fy_document *parseJsonDocument(const std::string &jsonData)
{
    fy_parse_cfg cfg = {};
    cfg.flags = FYPCF_JSON_FORCE; // Force JSON mode

    auto fyp = fy_parser_create(&cfg);
    if (!fyp)
        throw std::runtime_error("Failed to create JSON parser");

    if (fy_parser_set_string(fyp, jsonData.c_str(), jsonData.length()) != 0) {
        fy_parser_destroy(fyp);
        throw std::runtime_error("Failed to set parser input");
    }

    auto fyd = fy_parse_load_document(fyp);
    fy_parser_destroy(fyp);

    if (!fyd)
        throw std::runtime_error("Failed to parse JSON configuration document");

    return fyd;
}

static std::string getNodeStringValue(fy_node *node)
{
    if (!node || fy_node_get_type(node) != FYNT_SCALAR)
        return "";

    size_t len = 0;
    const char *value = fy_node_get_scalar(node, &len);
    return value ? std::string(value, len) : "";
}

static int64_t getNodeIntValue(fy_node *node, const std::string &key, int64_t defaultValue)
{
    const auto value = getNodeStringValue(node);
    if (value.empty())
        return defaultValue;

    try {
        return std::stoll(value);
    } catch (const std::exception &) {
        logError("Invalid numeric value '{}' for {} in configuration, using default ({}).", value, key, defaultValue);
        return defaultValue;
    }
}

static bool getNodeBoolValue(fy_node *node, bool defaultValue = false)
{
    if (!node || fy_node_get_type(node) != FYNT_SCALAR)
        return defaultValue;

    const auto strValue = getNodeStringValue(node);
    return strValue == "true" || strValue == "1" || strValue == "yes";
}

static std::vector<std::string> getNodeArrayValues(fy_node *node)
{
    std::vector<std::string> result;

    if (!node || fy_node_get_type(node) != FYNT_SEQUENCE)
        return result;

    fy_node *item;
    void *iter = nullptr;
    while ((item = fy_node_sequence_iterate(node, &iter)) != nullptr) {
        auto value = getNodeStringValue(item);
        if (!value.empty())
            result.push_back(value);
    }

    return result;
}

/**
 * Call `func` with key and value node for every entry of a JSON object.
 */
template<typename Func>
static void forEachMappingPair(fy_node *mapping, Func &&func)
{
    if (!mapping || fy_node_get_type(mapping) != FYNT_MAPPING)
        return;

    fy_node_pair *pair;
    void *iter = nullptr;
    while ((pair = fy_node_mapping_iterate(mapping, &iter)) != nullptr)
        func(getNodeStringValue(fy_node_pair_key(pair)), fy_node_pair_value(pair));
}

void Config::loadFromFile(const std::string &fname, const std::string &enforcedCacheDir)
{
    resetDefaults();

    // read the configuration JSON file
    auto jsonData = readFileToString(fname);

    std::unique_ptr<fy_document, decltype(&fy_document_destroy)> document(
        parseJsonDocument(jsonData), fy_document_destroy);

    auto root = fy_document_root(document.get());
    if (!root || fy_node_get_type(root) != FYNT_MAPPING)
        throw std::runtime_error("Invalid JSON configuration file");

    std::optional<std::string> cacheDirValue;
    forEachMappingPair(root, [&](const std::string &key, fy_node *value) {
        if (key == "CacheDir") {
            cacheDirValue = getNodeStringValue(value);
        } else if (key == "CatalogSources") {
            catalogSources = getNodeArrayValues(value);
        } else if (key == "IconRoots") {
            iconRoots.clear();
            for (const auto &dir : getNodeArrayValues(value))
                iconRoots.emplace_back(dir);
        } else if (key == "IconThemeDirs") {
            iconThemeDirs.clear();
            for (const auto &dir : getNodeArrayValues(value))
                iconThemeDirs.emplace_back(dir);
        } else if (key == "CAInfo") {
            caInfo = getNodeStringValue(value);
        } else if (key == "Stats") {
            forEachMappingPair(value, [&](const std::string &skey, fy_node *svalue) {
                if (skey == "Url")
                    stats.url = getNodeStringValue(svalue);
                else if (skey == "MetadataUrl")
                    stats.metadataUrl = getNodeStringValue(svalue);
                else if (skey == "MaxAgeDays")
                    stats.maxAge = std::chrono::days(getNodeIntValue(svalue, skey, stats.maxAge.count()));
                else if (skey == "EntryMaxAgeDays")
                    stats.entryMaxAge = std::chrono::days(getNodeIntValue(svalue, skey, stats.entryMaxAge.count()));
                else if (skey == "BundledFile")
                    stats.bundledFile = getNodeStringValue(svalue);
                else
                    logWarning("Unknown statistics setting in config: {}", skey);
            });
        } else if (key == "Icons") {
            forEachMappingPair(value, [&](const std::string &ikey, fy_node *ivalue) {
                if (ikey == "Size") {
                    const auto sizeStr = getNodeStringValue(ivalue);
                    ImageSize size;
                    try {
                        size = ImageSize(sizeStr);
                    } catch (const std::exception &) {
                        size = ImageSize();
                    }
                    if (size.width == 0 || size.height == 0 || size.scale == 0)
                        logError("Malformed icon size '{}' found in configuration, using default.", sizeStr);
                    else
                        icons.size = size;
                } else if (ikey == "Workers") {
                    const auto workers = getNodeIntValue(ivalue, ikey, icons.workers);
                    if (workers < 1) {
                        logError("Icon worker count must be at least 1, using default ({}).", icons.workers);
                    } else {
                        icons.workers = static_cast<std::uint32_t>(workers);
                    }
                } else if (ikey == "Timeout") {
                    icons.timeout = std::chrono::seconds(getNodeIntValue(ivalue, ikey, icons.timeout.count()));
                } else {
                    logWarning("Unknown icon setting in config: {}", ikey);
                }
            });
        } else if (key == "Features") {
            forEachMappingPair(value, [&](const std::string &featureId, fy_node *fvalue) {
                if (featureId == "noDownloads")
                    feature.noDownloads = getNodeBoolValue(fvalue);
                else if (featureId == "loadIcons")
                    feature.loadIcons = getNodeBoolValue(fvalue, true);
                else if (featureId == "refreshStats")
                    feature.refreshStats = getNodeBoolValue(fvalue, true);
                else
                    logWarning("Unknown feature in config: {}", featureId);
            });
        } else {
            logWarning("Unknown configuration key: {}", key);
        }
    });

    // relative paths are relative to the configuration file
    const auto configDir = fs::absolute(fname).parent_path();
    for (auto &src : catalogSources) {
        if (!Utils::isRemote(src) && fs::path(src).is_relative())
            src = (configDir / src).string();
    }
    for (auto &dir : iconRoots) {
        if (dir.is_relative())
            dir = configDir / dir;
    }
    for (auto &dir : iconThemeDirs) {
        if (dir.is_relative())
            dir = configDir / dir;
    }
    if (!stats.bundledFile.empty() && stats.bundledFile.is_relative())
        stats.bundledFile = configDir / stats.bundledFile;

    if (cacheDirValue) {
        if (cacheDirValue->empty())
            logError("Empty CacheDir in configuration, using default ({}).", m_cacheDir.string());
        else if (fs::path(*cacheDirValue).is_relative())
            setCacheDir(configDir / *cacheDirValue);
        else
            setCacheDir(*cacheDirValue);
    }

    // allow overriding the cache location
    if (!enforcedCacheDir.empty())
        setCacheDir(enforcedCacheDir);

    if (feature.noDownloads) {
        // since disallowing network access has quite a lot of sideeffects, we print
        // a message to the logs to make debugging easier.
        logWarning("Configuration does not permit downloading files. Statistics will not be refreshed.");
        feature.refreshStats = false;
    }

    if (feature.refreshStats && stats.url.empty()) {
        logDebug("No statistics URL configured, statistics refresh disabled.");
        feature.refreshStats = false;
    }
}

} // namespace ASCatalog
