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

#include "iconloader.h"

#include <format>
#include <limits>
#include <stdexcept>
#include <glib.h>
#include <appstream-compose.h>
#include <gdk-pixbuf/gdk-pixbuf.h>
#include <tbb/parallel_for_each.h>

#include "downloader.h"
#include "logging.h"

namespace ASCatalog
{

std::string_view iconStateToString(IconState state) noexcept
{
    switch (state) {
    case IconState::Pending:
        return "pending";
    case IconState::Ready:
        return "ready";
    case IconState::Placeholder:
        return "placeholder";
    default:
        return "absent";
    }
}

std::optional<IconRequest> iconRequestForEntry(const CatalogEntry &entry)
{
    if (!entry.icon || !entry.icon->isValid())
        return std::nullopt;
    return IconRequest{entry.id, entry.origin, *entry.icon};
}

static std::optional<ImageSize> sizeFromDirName(const std::string &name)
{
    try {
        ImageSize size(name);
        if (size.width == 0 || size.height == 0 || size.scale == 0)
            return std::nullopt;
        return size;
    } catch (const std::exception &) {
        // not a size directory
        return std::nullopt;
    }
}

DefaultIconFetcher::DefaultIconFetcher(
    std::vector<fs::path> iconRoots,
    std::vector<fs::path> themeDirs,
    const ImageSize &size,
    std::chrono::seconds timeout,
    bool allowDownloads)
    : m_iconRoots(std::move(iconRoots)),
      m_themeDirs(std::move(themeDirs)),
      m_size(size),
      m_timeout(timeout),
      m_allowDownloads(allowDownloads)
{
}

std::shared_ptr<DefaultIconFetcher> DefaultIconFetcher::fromConfig()
{
    const auto &conf = Config::get();
    return std::make_shared<DefaultIconFetcher>(
        conf.iconRoots, conf.iconThemeDirs, conf.icons.size, conf.icons.timeout, !conf.feature.noDownloads);
}

std::optional<fs::path> DefaultIconFetcher::findCachedIcon(const IconRequest &request) const
{
    ImageSize wanted = m_size;
    if (request.icon.width > 0)
        wanted = ImageSize(request.icon.width, request.icon.height, request.icon.scale);
    const auto wantedPx = static_cast<std::int64_t>(wanted.toInt());

    for (const auto &root : m_iconRoots) {
        const auto originDir = request.origin.empty() ? root : root / request.origin;
        const auto exact = originDir / wanted.toString() / request.icon.value;
        if (fs::exists(exact))
            return exact;

        std::error_code ec;
        if (!fs::is_directory(originDir, ec))
            continue;

        // fall back to the closest size we have, preferring larger images
        std::optional<fs::path> best;
        std::int64_t bestDistance = std::numeric_limits<std::int64_t>::max();
        for (const auto &dirEntry : fs::directory_iterator(originDir, ec)) {
            if (!dirEntry.is_directory())
                continue;
            const auto size = sizeFromDirName(dirEntry.path().filename().string());
            if (!size)
                continue;
            const auto candidate = dirEntry.path() / request.icon.value;
            if (!fs::exists(candidate))
                continue;

            const auto px = static_cast<std::int64_t>(size->toInt());
            auto distance = px >= wantedPx ? px - wantedPx : (wantedPx - px) * 2;
            if (distance < bestDistance) {
                bestDistance = distance;
                best = candidate;
            }
        }
        if (best)
            return best;
    }

    return std::nullopt;
}

std::optional<fs::path> DefaultIconFetcher::findStockIcon(const std::string &name) const
{
    for (const auto &themeDir : m_themeDirs) {
        const auto hicolor = themeDir / "hicolor";
        const auto png = hicolor / m_size.toString() / "apps" / std::format("{}.png", name);
        if (fs::exists(png))
            return png;
        const auto svg = hicolor / "scalable" / "apps" / std::format("{}.svg", name);
        if (fs::exists(svg))
            return svg;
    }

    return std::nullopt;
}

FetchedIcon DefaultIconFetcher::fetch(const IconRequest &request)
{
    FetchedIcon result;
    const auto &icon = request.icon;

    switch (icon.kind) {
    case AS_ICON_KIND_CACHED: {
        const auto path = findCachedIcon(request);
        if (!path)
            throw std::runtime_error(std::format("Cached icon '{}' not found", icon.value));
        result.filename = path->string();
        result.data = Utils::getFileContents(result.filename);
        break;
    }
    case AS_ICON_KIND_LOCAL:
        if (!fs::path(icon.value).is_absolute())
            throw std::runtime_error(std::format("Local icon path '{}' is not absolute", icon.value));
        result.filename = icon.value;
        result.data = Utils::getFileContents(icon.value);
        break;
    case AS_ICON_KIND_REMOTE: {
        if (!m_allowDownloads)
            throw std::runtime_error(std::format("Not downloading remote icon '{}', downloads are disabled", icon.value));
        auto &dl = Downloader::get();
        const auto prevTimeout = dl.timeout();
        dl.setTimeout(m_timeout);
        try {
            result.data = dl.download(icon.value, 2);
        } catch (const std::exception &) {
            dl.setTimeout(prevTimeout);
            throw;
        }
        dl.setTimeout(prevTimeout);
        result.filename = Utils::filenameFromURI(icon.value);
        break;
    }
    case AS_ICON_KIND_STOCK: {
        const auto path = findStockIcon(icon.value);
        if (!path)
            throw std::runtime_error(std::format("Stock icon '{}' not found in any icon theme", icon.value));
        result.filename = path->string();
        result.data = Utils::getFileContents(result.filename);
        break;
    }
    default:
        throw std::runtime_error("Unknown icon type");
    }

    if (result.data.empty())
        throw std::runtime_error(std::format("Icon data for '{}' is empty", icon.value));
    return result;
}

IconCacheEntry decodeIconData(const std::string &id, const FetchedIcon &icon, const ImageSize &size)
{
    const auto iformat = asc_image_format_from_filename(icon.filename.c_str());
    const bool isVector = iformat == ASC_IMAGE_FORMAT_SVG || iformat == ASC_IMAGE_FORMAT_SVGZ;
    const auto targetWidth = static_cast<gint>(size.width * size.scale);
    const auto targetHeight = static_cast<gint>(size.height * size.scale);

    g_autoptr(GError) error = nullptr;
    g_autoptr(AscImage) img = asc_image_new_from_data(
        icon.data.data(),
        static_cast<gssize>(icon.data.size()),
        isVector ? targetWidth : -1,
        isVector ? targetHeight : -1,
        ASC_IMAGE_LOAD_FLAG_NONE,
        iformat,
        &error);
    if (img == nullptr)
        throw std::runtime_error(
            std::format("Unable to decode icon {}: {}", icon.filename, error ? error->message : "unknown error"));

    // never scale up, the result would just be blurry
    if (static_cast<gint>(asc_image_get_width(img)) > targetWidth
        || static_cast<gint>(asc_image_get_height(img)) > targetHeight)
        asc_image_scale(img, targetWidth, targetHeight);

    GdkPixbuf *pixbuf = asc_image_get_pixbuf(img);
    if (pixbuf == nullptr)
        throw std::runtime_error(std::format("Icon {} has no pixel data", icon.filename));

    IconCacheEntry entry;
    entry.id = id;
    entry.state = IconState::Ready;
    entry.width = static_cast<std::uint32_t>(gdk_pixbuf_get_width(pixbuf));
    entry.height = static_cast<std::uint32_t>(gdk_pixbuf_get_height(pixbuf));
    entry.rowstride = static_cast<std::uint32_t>(gdk_pixbuf_get_rowstride(pixbuf));
    entry.channels = static_cast<std::uint32_t>(gdk_pixbuf_get_n_channels(pixbuf));

    const auto *pixels = gdk_pixbuf_read_pixels(pixbuf);
    entry.pixels.assign(pixels, pixels + gdk_pixbuf_get_byte_length(pixbuf));

    auto ext = Utils::toLower(fs::path(icon.filename).extension().string());
    entry.format = ext.empty() ? std::string("unknown") : ext.substr(1);
    entry.fetchedAt = std::chrono::system_clock::now();

    return entry;
}

IconLoader::IconLoader(std::shared_ptr<IconFetcher> fetcher, std::uint32_t workers, const ImageSize &size)
    : m_fetcher(std::move(fetcher)),
      m_workers(workers == 0 ? 1 : workers),
      m_size(size),
      m_epoch(0)
{
    if (!m_fetcher)
        throw std::invalid_argument("IconLoader requires an icon fetcher");
    m_taskArena = std::make_unique<tbb::task_arena>(static_cast<int>(m_workers));
}

IconLoader::~IconLoader()
{
    std::lock_guard lock(m_asyncMutex);
    m_asyncBatches.clear();
}

std::shared_ptr<const IconCacheEntry> IconLoader::loadIcon(const IconRequest &request) const
{
    try {
        const auto data = m_fetcher->fetch(request);
        return std::make_shared<const IconCacheEntry>(decodeIconData(request.id, data, m_size));
    } catch (const std::exception &e) {
        logDebug("Using placeholder icon for {}: {}", request.id, e.what());

        auto placeholder = std::make_shared<IconCacheEntry>();
        placeholder->id = request.id;
        placeholder->state = IconState::Placeholder;
        placeholder->error = e.what();
        placeholder->fetchedAt = std::chrono::system_clock::now();
        return placeholder;
    }
}

IconBatchSummary IconLoader::load(const std::vector<IconRequest> &requests, std::stop_token stopToken)
{
    IconBatchSummary summary;
    summary.requested = requests.size();

    std::vector<const IconRequest *> work;
    std::uint64_t epoch = 0;
    {
        std::lock_guard lock(m_mutex);
        epoch = m_epoch;
        for (const auto &req : requests) {
            if (m_cache.contains(req.id) || m_pending.contains(req.id)) {
                summary.reused++;
                continue;
            }
            m_pending.insert(req.id);
            work.push_back(&req);
        }
    }

    std::atomic<std::size_t> loaded{0};
    std::atomic<std::size_t> placeholders{0};
    std::atomic<std::size_t> skipped{0};

    if (work.empty()) {
        logDebug("All {} requested icons are cached or already loading", summary.requested);
        return summary;
    }

    m_taskArena->execute([&] {
        tbb::parallel_for_each(work.begin(), work.end(), [&](const IconRequest *req) {
            if (stopToken.stop_requested()) {
                std::lock_guard lock(m_mutex);
                m_pending.erase(req->id);
                skipped++;
                return;
            }

            auto entry = loadIcon(*req);
            if (entry->isPlaceholder())
                placeholders++;
            else
                loaded++;

            std::lock_guard lock(m_mutex);
            m_pending.erase(req->id);
            // the cache was cleared while we were loading, drop the result
            if (m_epoch == epoch)
                m_cache[req->id] = std::move(entry);
        });
    });

    summary.loaded = loaded;
    summary.placeholders = placeholders;
    summary.skipped = skipped;

    logDebug(
        "Loaded {} icons, {} placeholders, {} reused, {} skipped",
        summary.loaded,
        summary.placeholders,
        summary.reused,
        summary.skipped);
    return summary;
}

std::future<IconBatchSummary> IconLoader::loadAsync(std::vector<IconRequest> requests, std::stop_token stopToken)
{
    auto promise = std::make_shared<std::promise<IconBatchSummary>>();
    auto future = promise->get_future();
    auto done = std::make_shared<std::atomic_bool>(false);

    std::lock_guard lock(m_asyncMutex);
    // join the threads of finished batches, they only return from here on
    std::erase_if(m_asyncBatches, [](const AsyncBatch &batch) {
        return batch.done->load();
    });

    std::jthread thread([this, promise, done, requests = std::move(requests), stopToken]() {
        try {
            auto summary = load(requests, stopToken);
            done->store(true);
            promise->set_value(std::move(summary));
        } catch (const std::exception &e) {
            logError("Icon loading failed: {}", e.what());
            done->store(true);
            promise->set_exception(std::current_exception());
        }
    });
    m_asyncBatches.push_back(AsyncBatch{std::move(thread), std::move(done)});

    return future;
}

std::size_t IconLoader::backgroundBatches() const
{
    std::lock_guard lock(m_asyncMutex);
    return m_asyncBatches.size();
}

std::shared_ptr<const IconCacheEntry> IconLoader::lookup(const std::string &id) const
{
    std::lock_guard lock(m_mutex);
    const auto it = m_cache.find(id);
    if (it == m_cache.end())
        return nullptr;
    return it->second;
}

IconState IconLoader::state(const std::string &id) const
{
    std::lock_guard lock(m_mutex);
    const auto it = m_cache.find(id);
    if (it != m_cache.end())
        return it->second->state;
    if (m_pending.contains(id))
        return IconState::Pending;
    return IconState::Absent;
}

void IconLoader::invalidate(const std::string &id)
{
    std::lock_guard lock(m_mutex);
    m_cache.erase(id);
}

void IconLoader::clear()
{
    std::lock_guard lock(m_mutex);
    m_cache.clear();
    m_epoch++;
}

std::size_t IconLoader::size() const
{
    std::lock_guard lock(m_mutex);
    return m_cache.size();
}

std::uint32_t IconLoader::workers() const
{
    return m_workers;
}

} // namespace ASCatalog
