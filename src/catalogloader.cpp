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

#include "catalogloader.h"

#include <algorithm>
#include <format>
#include <tbb/parallel_invoke.h>

#include "catalogparser.h"
#include "config.h"
#include "logging.h"

namespace ASCatalog
{

static constexpr auto RefreshPollInterval = std::chrono::milliseconds(100);

std::string_view loadStageToString(LoadStage stage) noexcept
{
    switch (stage) {
    case LoadStage::Parsing:
        return "parsing";
    case LoadStage::Classifying:
        return "classifying";
    case LoadStage::LoadingStats:
        return "loading-stats";
    case LoadStage::Indexing:
        return "indexing";
    case LoadStage::Ready:
        return "ready";
    case LoadStage::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

LoaderOptions LoaderOptions::fromConfig()
{
    const auto &conf = Config::get();

    LoaderOptions options;
    options.catalogSources = conf.catalogSources;
    options.downloadDir = conf.catalogDownloadDir();
    options.iconSize = conf.icons.size;
    options.loadIcons = conf.feature.loadIcons;
    options.refreshStats = conf.feature.refreshStats;
    return options;
}

CatalogLoader::CatalogLoader(
    LoaderOptions options,
    std::shared_ptr<StatsCache> stats,
    std::shared_ptr<IconLoader> icons)
    : m_options(std::move(options)),
      m_stats(std::move(stats)),
      m_icons(std::move(icons)),
      m_ready(false),
      m_lastFraction(0)
{
}

CatalogLoader::~CatalogLoader()
{
    m_stopSource.request_stop();

    // the threads refer to us, so they must be gone before our members are.
    // The run thread takes the tasks lock itself, join it first.
    if (m_runThread.joinable())
        m_runThread.join();

    std::lock_guard lock(m_tasksMutex);
    if (m_refreshWatcher.joinable())
        m_refreshWatcher.join();
    if (m_iconsFuture.valid())
        m_iconsFuture.wait();
}

void CatalogLoader::setProgressCallback(ProgressCallback callback)
{
    std::lock_guard lock(m_progressMutex);
    m_progressCb = std::move(callback);
}

void CatalogLoader::emitProgress(double fraction, LoadStage stage, std::string message)
{
    std::lock_guard lock(m_progressMutex);
    m_lastFraction = std::clamp(std::max(fraction, m_lastFraction), 0.0, 1.0);
    logDebug("[{:3.0f}%] {}: {}", m_lastFraction * 100, loadStageToString(stage), message);
    if (m_progressCb)
        m_progressCb(LoadProgress{m_lastFraction, stage, std::move(message)});
}

void CatalogLoader::cancel()
{
    m_stopSource.request_stop();
}

bool CatalogLoader::isCancelled() const
{
    return m_stopSource.stop_requested();
}

bool CatalogLoader::isReady() const
{
    return m_ready.load();
}

std::shared_ptr<const SearchIndex> CatalogLoader::index() const
{
    return m_index.load();
}

std::shared_ptr<const Catalog> CatalogLoader::catalog() const
{
    const auto idx = m_index.load();
    return idx ? idx->catalog() : nullptr;
}

std::optional<IconBatchSummary> CatalogLoader::iconSummary() const
{
    std::shared_future<IconBatchSummary> future;
    {
        std::lock_guard lock(m_tasksMutex);
        future = m_iconsFuture;
    }
    if (!future.valid() || future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        return std::nullopt;
    return future.get();
}

bool CatalogLoader::publishIndex(std::shared_ptr<const SearchIndex> index)
{
    std::lock_guard lock(m_publishMutex);
    if (m_stopSource.stop_requested())
        return false;

    const auto current = m_index.load();
    if (current && current->generation() > index->generation())
        return false;

    m_index.store(std::move(index));
    m_ready = true;
    return true;
}

void CatalogLoader::startStatsRefresh()
{
    auto refreshFuture = m_stats->refresh();

    std::lock_guard lock(m_tasksMutex);
    if (m_refreshWatcher.joinable())
        m_refreshWatcher.join();
    m_refreshWatcher = std::jthread([this, refreshFuture](std::stop_token stopToken) {
        // the refresh may take long, don't hold up cancellation until it is done
        while (refreshFuture.wait_for(RefreshPollInterval) != std::future_status::ready) {
            if (stopToken.stop_requested() || m_stopSource.stop_requested()) {
                logDebug("No longer waiting for the statistics refresh, loading was cancelled");
                return;
            }
        }
        const auto result = refreshFuture.get();
        if (stopToken.stop_requested() || m_stopSource.stop_requested())
            return;
        if (!result.success || !result.updated)
            return;

        const auto current = m_index.load();
        std::shared_ptr<const std::vector<CompatibilityAssessment>> assessments;
        {
            std::lock_guard lock(m_publishMutex);
            assessments = m_assessments;
        }
        if (!current || !assessments)
            return;

        try {
            auto index = SearchIndex::build(current->catalog(), *assessments, result.snapshot);
            if (publishIndex(index))
                logInfo(
                    "Updated search index with new popularity statistics (generation {}, {} entries with statistics)",
                    index->generation(),
                    index->statsMerged());
        } catch (const std::logic_error &e) {
            logError("Unable to rebuild search index with new statistics: {}", e.what());
        }
    });
}

LoadReport CatalogLoader::run()
{
    LoadReport report;
    const auto stopToken = m_stopSource.get_token();

    auto cancelled = [&]() {
        if (!stopToken.stop_requested())
            return false;
        report.cancelled = true;
        emitProgress(0, LoadStage::Cancelled, "Loading was cancelled");
        logInfo("Catalog loading cancelled");
        return true;
    };

    // parse
    emitProgress(0, LoadStage::Parsing, "Reading catalog data");
    CatalogParser parser(m_options.iconSize);
    parser.setStopToken(stopToken);
    const auto sourceCount = m_options.catalogSources.size();
    for (std::size_t i = 0; i < sourceCount; ++i) {
        if (stopToken.stop_requested())
            break;
        const auto &source = m_options.catalogSources[i];
        const auto status = parser.parseSource(source, m_options.downloadDir);
        if (status == DocumentStatus::Cancelled)
            break;
        emitProgress(
            0.4 * static_cast<double>(i + 1) / static_cast<double>(sourceCount),
            LoadStage::Parsing,
            status == DocumentStatus::Read ? std::format("Read {}", source) : std::format("Failed to read {}", source));
    }
    if (cancelled())
        return report;

    auto parseResult = parser.takeResult();
    report.entriesParsed = parseResult.entries.size();
    report.entriesSkipped = parseResult.skipped;
    report.duplicates = parseResult.duplicates;
    report.documentsFailed = parseResult.documentsFailed;
    const auto catalog = std::make_shared<const Catalog>(std::move(parseResult.entries));

    // icons load in the background, the index does not wait for them
    if (m_options.loadIcons && m_icons) {
        std::vector<IconRequest> requests;
        for (const auto &entry : catalog->entries()) {
            if (auto req = iconRequestForEntry(entry))
                requests.push_back(std::move(*req));
        }
        report.iconsRequested = requests.size();

        std::lock_guard lock(m_tasksMutex);
        m_iconsFuture = m_icons->loadAsync(std::move(requests), stopToken).share();
    }

    // classify and load statistics
    emitProgress(0.45, LoadStage::Classifying, std::format("Classifying {} entries", catalog->size()));
    std::vector<CompatibilityAssessment> assessments;
    tbb::parallel_invoke(
        [&] {
            assessments = classifyCatalog(*catalog);
        },
        [&] {
            if (!m_stats)
                return;
            if (!m_stats->loadLocal() && m_stats->snapshot())
                logDebug("Keeping previously loaded popularity statistics");
            report.statsState = m_stats->state();
        });
    emitProgress(0.7, LoadStage::LoadingStats, std::format("Statistics are {}", statsStateToString(report.statsState)));
    if (cancelled())
        return report;

    // index
    emitProgress(0.75, LoadStage::Indexing, "Building search index");
    const auto sharedAssessments = std::make_shared<const std::vector<CompatibilityAssessment>>(
        std::move(assessments));
    auto index = SearchIndex::build(catalog, *sharedAssessments, m_stats ? m_stats->snapshot() : nullptr);
    report.statsMerged = index->statsMerged();
    report.indexGeneration = index->generation();

    {
        std::lock_guard lock(m_publishMutex);
        m_assessments = sharedAssessments;
    }
    if (!publishIndex(index)) {
        report.cancelled = cancelled();
        return report;
    }

    emitProgress(
        1.0,
        LoadStage::Ready,
        std::format("Loaded {} entries ({} skipped)", report.entriesParsed, report.entriesSkipped));

    if (m_stats && report.statsState != StatsState::Fresh) {
        if (m_options.refreshStats && m_stats->canRefresh()) {
            logInfo("Popularity statistics are {}, refreshing in the background", statsStateToString(report.statsState));
            startStatsRefresh();
            report.statsRefreshStarted = true;
        }
    }

    return report;
}

std::shared_future<LoadReport> CatalogLoader::start()
{
    std::lock_guard lock(m_tasksMutex);
    if (m_runFuture.valid())
        return m_runFuture;

    auto promise = std::make_shared<std::promise<LoadReport>>();
    m_runFuture = promise->get_future().share();
    m_runThread = std::jthread([this, promise]() {
        try {
            promise->set_value(run());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    return m_runFuture;
}

void CatalogLoader::waitForBackgroundTasks()
{
    std::shared_future<IconBatchSummary> iconsFuture;
    {
        std::lock_guard lock(m_tasksMutex);
        iconsFuture = m_iconsFuture;
        if (m_refreshWatcher.joinable())
            m_refreshWatcher.join();
    }
    if (iconsFuture.valid())
        iconsFuture.wait();
}

} // namespace ASCatalog
