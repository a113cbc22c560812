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
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <chrono>
#include <cstdint>
#include <tbb/task_arena.h>

#include "catalog.h"
#include "config.h"
#include "utils.h"

namespace ASCatalog
{

enum class IconState {
    Absent,
    Pending,
    Ready,
    Placeholder
};

std::string_view iconStateToString(IconState state) noexcept;

/**
 * A decoded icon, or the placeholder for an icon that could not be loaded.
 */
struct IconCacheEntry {
    std::string id;
    IconState state = IconState::Placeholder;

    std::vector<std::uint8_t> pixels;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t rowstride = 0;
    std::uint32_t channels = 0;

    /* format of the source image, e.g. "png" */
    std::string format;
    std::chrono::system_clock::time_point fetchedAt;

    /* why the icon could not be loaded, for placeholders */
    std::string error;

    bool isPlaceholder() const
    {
        return state == IconState::Placeholder;
    }
};

struct IconRequest {
    std::string id;
    std::string origin;
    IconReference icon;
};

/**
 * Create an icon request for `entry`, if it references an icon at all.
 */
std::optional<IconRequest> iconRequestForEntry(const CatalogEntry &entry);

/**
 * Raw, still encoded icon data.
 */
struct FetchedIcon {
    std::vector<std::uint8_t> data;
    /* filename the data was read from, used to guess the image format */
    std::string filename;
};

/**
 * Retrieves the encoded data of an icon.
 */
class IconFetcher
{
public:
    virtual ~IconFetcher() = default;

    /**
     * Fetch the icon data. Throws if the icon can not be retrieved.
     * Called concurrently from the worker pool.
     */
    virtual FetchedIcon fetch(const IconRequest &request) = 0;
};

/**
 * Fetches icons from the icon caches of the system catalog, local paths,
 * the network and the icon theme.
 */
class DefaultIconFetcher : public IconFetcher
{
public:
    DefaultIconFetcher(
        std::vector<fs::path> iconRoots,
        std::vector<fs::path> themeDirs,
        const ImageSize &size,
        std::chrono::seconds timeout,
        bool allowDownloads);

    /**
     * Create a fetcher using the global configuration.
     */
    static std::shared_ptr<DefaultIconFetcher> fromConfig();

    FetchedIcon fetch(const IconRequest &request) override;

    std::optional<fs::path> findCachedIcon(const IconRequest &request) const;
    std::optional<fs::path> findStockIcon(const std::string &name) const;

private:
    std::vector<fs::path> m_iconRoots;
    std::vector<fs::path> m_themeDirs;
    ImageSize m_size;
    std::chrono::seconds m_timeout;
    bool m_allowDownloads;
};

struct IconBatchSummary {
    std::size_t requested = 0;
    std::size_t loaded = 0;
    std::size_t placeholders = 0;
    /* entries that were already cached or being loaded */
    std::size_t reused = 0;
    /* entries not loaded because the batch was cancelled */
    std::size_t skipped = 0;
};

/**
 * Loads icons with a bounded number of workers and keeps the results.
 *
 * A failing icon never affects the others, it is stored as placeholder.
 * Stored entries are reused until they are invalidated.
 */
class IconLoader
{
public:
    IconLoader(std::shared_ptr<IconFetcher> fetcher, std::uint32_t workers, const ImageSize &size = DefaultIconSize);
    ~IconLoader();

    IconLoader(const IconLoader &) = delete;
    IconLoader &operator=(const IconLoader &) = delete;

    /**
     * Load all requested icons and wait for them.
     * Once a stop is requested, no new icons are fetched.
     */
    IconBatchSummary load(const std::vector<IconRequest> &requests, std::stop_token stopToken = {});

    /**
     * Load icons in the background.
     * Threads of batches that have finished are joined on the next call.
     */
    std::future<IconBatchSummary> loadAsync(std::vector<IconRequest> requests, std::stop_token stopToken = {});

    /**
     * Number of background batch threads that have not been joined yet.
     */
    std::size_t backgroundBatches() const;

    /**
     * The cached icon for `id`, or nullptr if there is none (yet).
     */
    std::shared_ptr<const IconCacheEntry> lookup(const std::string &id) const;
    IconState state(const std::string &id) const;

    void invalidate(const std::string &id);
    void clear();

    std::size_t size() const;
    std::uint32_t workers() const;

private:
    std::shared_ptr<IconFetcher> m_fetcher;
    std::uint32_t m_workers;
    ImageSize m_size;
    std::unique_ptr<tbb::task_arena> m_taskArena;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<const IconCacheEntry>> m_cache;
    std::unordered_set<std::string> m_pending;
    std::uint64_t m_epoch;

    struct AsyncBatch {
        std::jthread thread;
        std::shared_ptr<std::atomic_bool> done;
    };
    mutable std::mutex m_asyncMutex;
    std::vector<AsyncBatch> m_asyncBatches;

    std::shared_ptr<const IconCacheEntry> loadIcon(const IconRequest &request) const;
};

/**
 * Decode image data and scale it down to fit `size`.
 * Throws std::runtime_error if the data is not a usable image.
 */
IconCacheEntry decodeIconData(const std::string &id, const FetchedIcon &icon, const ImageSize &size);

} // namespace ASCatalog
