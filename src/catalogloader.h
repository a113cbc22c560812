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
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <thread>
#include <functional>
#include <stop_token>
#include <optional>

#include "catalog.h"
#include "compatclassifier.h"
#include "statscache.h"
#include "searchindex.h"
#include "iconloader.h"

namespace ASCatalog
{

enum class LoadStage {
    Parsing,
    Classifying,
    LoadingStats,
    Indexing,
    Ready,
    Cancelled
};

std::string_view loadStageToString(LoadStage stage) noexcept;

struct LoadProgress {
    /* in [0, 1], never decreases during one run */
    double fraction = 0;
    LoadStage stage = LoadStage::Parsing;
    std::string message;
};

/**
 * Receives progress updates from the loader thread. Must not block.
 */
using ProgressCallback = std::function<void(const LoadProgress &)>;

struct LoadReport {
    std::size_t entriesParsed = 0;
    std::size_t entriesSkipped = 0;
    std::size_t duplicates = 0;
    std::size_t documentsFailed = 0;

    std::size_t statsMerged = 0;
    StatsState statsState = StatsState::Absent;
    bool statsRefreshStarted = false;

    std::size_t iconsRequested = 0;
    bool cancelled = false;
    std::uint64_t indexGeneration = 0;
};

struct LoaderOptions {
    std::vector<std::string> catalogSources;
    fs::path downloadDir;
    ImageSize iconSize = DefaultIconSize;
    bool loadIcons = true;
    bool refreshStats = true;

    static LoaderOptions fromConfig();
};

/**
 * Drives loading the catalog and everything derived from it.
 *
 * Catalog entries are parsed first, then classified while the statistics
 * are loaded, and finally the search index is built and published.
 * Icons are loaded in the background and are not needed for the loader
 * to become ready. If the statistics were missing or stale, they are
 * refreshed afterwards and the index is rebuilt once new data arrives.
 *
 * A loader performs one load run, cancelling it is final.
 */
class CatalogLoader
{
public:
    CatalogLoader(LoaderOptions options, std::shared_ptr<StatsCache> stats, std::shared_ptr<IconLoader> icons);
    ~CatalogLoader();

    CatalogLoader(const CatalogLoader &) = delete;
    CatalogLoader &operator=(const CatalogLoader &) = delete;

    void setProgressCallback(ProgressCallback callback);

    /**
     * Run the loading sequence on the calling thread.
     */
    LoadReport run();

    /**
     * Run the loading sequence on a background thread.
     */
    std::shared_future<LoadReport> start();

    /**
     * Stop the current run. Nothing is published from a cancelled run.
     */
    void cancel();
    bool isCancelled() const;

    bool isReady() const;

    /**
     * The most recently published search index, nullptr if not ready.
     */
    std::shared_ptr<const SearchIndex> index() const;
    std::shared_ptr<const Catalog> catalog() const;

    /**
     * Wait until icon loading and a running statistics refresh
     * (including the index rebuild it triggers) have finished.
     */
    void waitForBackgroundTasks();

    std::optional<IconBatchSummary> iconSummary() const;

    std::shared_ptr<IconLoader> iconLoader() const
    {
        return m_icons;
    }

private:
    LoaderOptions m_options;
    std::shared_ptr<StatsCache> m_stats;
    std::shared_ptr<IconLoader> m_icons;

    std::stop_source m_stopSource;
    std::atomic<bool> m_ready;
    std::atomic<std::shared_ptr<const SearchIndex>> m_index;

    std::mutex m_progressMutex;
    ProgressCallback m_progressCb;
    double m_lastFraction;

    std::mutex m_publishMutex;
    std::shared_ptr<const std::vector<CompatibilityAssessment>> m_assessments;

    mutable std::mutex m_tasksMutex;
    std::shared_future<IconBatchSummary> m_iconsFuture;
    std::shared_future<LoadReport> m_runFuture;
    std::jthread m_runThread;
    std::jthread m_refreshWatcher;

    void emitProgress(double fraction, LoadStage stage, std::string message);
    void startStatsRefresh();
    bool publishIndex(std::shared_ptr<const SearchIndex> index);
};

} // namespace ASCatalog
