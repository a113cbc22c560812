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
#include <unordered_map>
#include <memory>
#include <atomic>
#include <mutex>
#include <future>
#include <thread>
#include <expected>
#include <optional>
#include <chrono>
#include <cstdint>

#include "config.h"
#include "utils.h"

namespace ASCatalog
{

/**
 * Version of the statistics cache format this client understands.
 * Artifacts with any other version are ignored.
 */
inline constexpr std::uint16_t StatsSchemaVersion = 2;

/**
 * Magic bytes at the start of every statistics cache file.
 */
inline constexpr std::string_view StatsMagic = "ASCSTATS";

struct StatsEntry {
    std::string id;
    std::uint64_t downloads = 0;
    /* UNIX timestamp of the last update of this entry */
    std::uint64_t lastUpdated = 0;
    std::uint16_t schemaVersion = StatsSchemaVersion;

    bool operator==(const StatsEntry &other) const = default;
};

/**
 * An immutable set of popularity statistics, as read from one artifact.
 */
struct StatsSnapshot {
    std::uint16_t schemaVersion = StatsSchemaVersion;
    std::uint64_t generatedAt = 0;
    std::unordered_map<std::string, StatsEntry> entries;

    /* number of records dropped because they were invalid */
    std::size_t droppedEntries = 0;

    const StatsEntry *find(const std::string &id) const;
};

enum class CacheError {
    NotFound,
    VersionMismatch,
    Malformed,
    IoError
};

std::string_view cacheErrorToString(CacheError error) noexcept;

/**
 * Coarse popularity class of an application, derived from its download count.
 */
enum class PopularityTier {
    None,
    Low,
    Medium,
    High
};

PopularityTier popularityTier(std::optional<std::uint64_t> downloads) noexcept;
std::string_view popularityTierToString(PopularityTier tier) noexcept;

/**
 * Check whether `entry` may be used with an artifact generated at `generatedAt`.
 */
bool isValidStatsEntry(const StatsEntry &entry, std::uint64_t generatedAt, std::chrono::days entryMaxAge);

std::vector<std::uint8_t> encodeStatsCache(const StatsSnapshot &snapshot);

/**
 * Decode a statistics artifact. Magic and schema version are checked before
 * anything else is read, invalid entries are dropped.
 */
std::expected<StatsSnapshot, CacheError> decodeStatsCache(
    const std::vector<std::uint8_t> &data,
    std::chrono::days entryMaxAge = std::chrono::days(365));

/**
 * Write a statistics artifact atomically to `fname`.
 * Throws std::runtime_error on I/O errors.
 */
void saveStatsCache(const fs::path &fname, const StatsSnapshot &snapshot);

std::expected<StatsSnapshot, CacheError> loadStatsCache(
    const fs::path &fname,
    std::chrono::days entryMaxAge = std::chrono::days(365));

/**
 * Where fresh statistics come from.
 */
class StatsSource
{
public:
    virtual ~StatsSource() = default;

    /**
     * Generation time of the currently published artifact, if the source knows it.
     * May throw if the source can not be reached.
     */
    virtual std::optional<std::uint64_t> fetchGeneratedAt() = 0;

    /**
     * Fetch the published artifact, which may be compressed.
     * Throws on failure.
     */
    virtual std::vector<std::uint8_t> fetchArtifact() = 0;
};

/**
 * Fetches statistics artifacts via HTTP(S).
 */
class RemoteStatsSource : public StatsSource
{
public:
    RemoteStatsSource(std::string url, std::string metadataUrl);

    std::optional<std::uint64_t> fetchGeneratedAt() override;
    std::vector<std::uint8_t> fetchArtifact() override;

private:
    std::string m_url;
    std::string m_metadataUrl;
};

/**
 * Read the generation time from the JSON metadata document published
 * next to a statistics artifact.
 */
std::optional<std::uint64_t> parseStatsMetadata(const std::string &json);

struct StatsRefreshResult {
    bool success = false;
    /* true if a new snapshot was published */
    bool updated = false;
    std::string error;
    std::shared_ptr<const StatsSnapshot> snapshot;
};

enum class StatsState {
    Absent,
    Stale,
    Fresh
};

std::string_view statsStateToString(StatsState state) noexcept;

/**
 * Holds the current statistics snapshot and keeps it up to date.
 *
 * Readers always get a complete snapshot, a refresh replaces it
 * wholesale. Only one refresh runs at a time, concurrent requests
 * share its result.
 */
class StatsCache
{
public:
    StatsCache(fs::path cacheFile, StatsSettings settings, std::shared_ptr<StatsSource> source = nullptr);
    ~StatsCache();

    StatsCache(const StatsCache &) = delete;
    StatsCache &operator=(const StatsCache &) = delete;

    /**
     * Load the local cache file and publish it.
     * A snapshot that is already held is kept if the file is unusable.
     * If no snapshot is held and the file is unusable, the bundled artifact
     * configured in the settings is published instead.
     */
    std::expected<std::shared_ptr<const StatsSnapshot>, CacheError> loadLocal();

    /**
     * The currently published snapshot, or nullptr if there is none.
     */
    std::shared_ptr<const StatsSnapshot> snapshot() const;

    StatsState state(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
    bool isStale(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    bool canRefresh() const;

    /**
     * Fetch new statistics in the background.
     * While a refresh is running, further calls return the same future.
     */
    std::shared_future<StatsRefreshResult> refresh();

    bool refreshInProgress() const;

private:
    fs::path m_cacheFile;
    StatsSettings m_settings;
    std::shared_ptr<StatsSource> m_source;

    std::atomic<std::shared_ptr<const StatsSnapshot>> m_snapshot;
    std::atomic<std::int64_t> m_cacheTime; // seconds since epoch, 0 if unknown

    mutable std::mutex m_refreshMutex;
    bool m_refreshRunning;
    std::shared_future<StatsRefreshResult> m_inflight;
    std::jthread m_worker;

    std::shared_ptr<const StatsSnapshot> loadBundled();
    StatsRefreshResult performRefresh();
    void publish(std::shared_ptr<const StatsSnapshot> snap, std::chrono::system_clock::time_point cacheTime);
};

} // namespace ASCatalog
