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

#include "statscache.h"

#include <fstream>
#include <format>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "downloader.h"
#include "logging.h"
#include "zarchive.h"

namespace ASCatalog
{

namespace
{

/* uint16 idLen + uint64 downloads + uint64 lastUpdated */
constexpr std::size_t MinRecordSize = 2 + 8 + 8;

/* magic + uint16 version + uint64 generatedAt + uint32 count */
constexpr std::size_t HeaderSize = 8 + 2 + 8 + 4;

template<typename T>
void writeLE(std::vector<std::uint8_t> &out, T value)
{
    for (std::size_t i = 0; i < sizeof(T); ++i)
        out.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> (8 * i)) & 0xFF));
}

/**
 * Bounds-checked little-endian reader over a byte buffer.
 */
class ByteReader
{
public:
    explicit ByteReader(const std::vector<std::uint8_t> &data)
        : m_data(data),
          m_pos(0)
    {
    }

    template<typename T>
    bool read(T &value)
    {
        if (remaining() < sizeof(T))
            return false;
        std::uint64_t result = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i)
            result |= static_cast<std::uint64_t>(m_data[m_pos + i]) << (8 * i);
        m_pos += sizeof(T);
        value = static_cast<T>(result);
        return true;
    }

    bool readString(std::size_t len, std::string &value)
    {
        if (remaining() < len)
            return false;
        value.assign(reinterpret_cast<const char *>(m_data.data()) + m_pos, len);
        m_pos += len;
        return true;
    }

    std::size_t remaining() const
    {
        return m_data.size() - m_pos;
    }

private:
    const std::vector<std::uint8_t> &m_data;
    std::size_t m_pos;
};

std::int64_t toSeconds(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

const StatsEntry *StatsSnapshot::find(const std::string &id) const
{
    const auto it = entries.find(id);
    if (it == entries.end())
        return nullptr;
    return &it->second;
}

std::string_view cacheErrorToString(CacheError error) noexcept
{
    switch (error) {
    case CacheError::NotFound:
        return "not found";
    case CacheError::VersionMismatch:
        return "schema version mismatch";
    case CacheError::Malformed:
        return "malformed data";
    case CacheError::IoError:
        return "I/O error";
    default:
        return "unknown error";
    }
}

PopularityTier popularityTier(std::optional<std::uint64_t> downloads) noexcept
{
    if (!downloads.has_value())
        return PopularityTier::None;
    if (*downloads < 1000)
        return PopularityTier::Low;
    if (*downloads < 50000)
        return PopularityTier::Medium;
    return PopularityTier::High;
}

std::string_view popularityTierToString(PopularityTier tier) noexcept
{
    switch (tier) {
    case PopularityTier::Low:
        return "low";
    case PopularityTier::Medium:
        return "medium";
    case PopularityTier::High:
        return "high";
    default:
        return "none";
    }
}

std::string_view statsStateToString(StatsState state) noexcept
{
    switch (state) {
    case StatsState::Fresh:
        return "fresh";
    case StatsState::Stale:
        return "stale";
    default:
        return "absent";
    }
}

bool isValidStatsEntry(const StatsEntry &entry, std::uint64_t generatedAt, std::chrono::days entryMaxAge)
{
    if (entry.schemaVersion != StatsSchemaVersion)
        return false;
    if (entry.lastUpdated == 0 || entry.lastUpdated > generatedAt)
        return false;

    const auto maxAgeSecs = static_cast<std::uint64_t>(std::chrono::seconds(entryMaxAge).count());
    return generatedAt - entry.lastUpdated <= maxAgeSecs;
}

std::vector<std::uint8_t> encodeStatsCache(const StatsSnapshot &snapshot)
{
    std::vector<std::uint8_t> out;
    out.reserve(HeaderSize + snapshot.entries.size() * (MinRecordSize + 32));

    out.insert(out.end(), StatsMagic.begin(), StatsMagic.end());
    writeLE<std::uint16_t>(out, StatsSchemaVersion);
    writeLE<std::uint64_t>(out, snapshot.generatedAt);
    writeLE<std::uint32_t>(out, static_cast<std::uint32_t>(snapshot.entries.size()));

    for (const auto &[id, entry] : snapshot.entries) {
        if (id.size() > std::numeric_limits<std::uint16_t>::max())
            throw std::length_error(std::format("Statistics entry ID is too long: {}", id.substr(0, 64)));
        writeLE<std::uint16_t>(out, static_cast<std::uint16_t>(id.size()));
        out.insert(out.end(), id.begin(), id.end());
        writeLE<std::uint64_t>(out, entry.downloads);
        writeLE<std::uint64_t>(out, entry.lastUpdated);
    }

    return out;
}

std::expected<StatsSnapshot, CacheError> decodeStatsCache(
    const std::vector<std::uint8_t> &data,
    std::chrono::days entryMaxAge)
{
    ByteReader reader(data);

    std::string magic;
    if (!reader.readString(StatsMagic.size(), magic) || magic != StatsMagic)
        return std::unexpected(CacheError::Malformed);

    StatsSnapshot snapshot;
    if (!reader.read(snapshot.schemaVersion))
        return std::unexpected(CacheError::Malformed);
    if (snapshot.schemaVersion != StatsSchemaVersion)
        return std::unexpected(CacheError::VersionMismatch);

    std::uint32_t count = 0;
    if (!reader.read(snapshot.generatedAt) || !reader.read(count))
        return std::unexpected(CacheError::Malformed);
    if (count > reader.remaining() / MinRecordSize)
        return std::unexpected(CacheError::Malformed);

    snapshot.entries.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        StatsEntry entry;
        entry.schemaVersion = snapshot.schemaVersion;

        std::uint16_t idLen = 0;
        if (!reader.read(idLen) || !reader.readString(idLen, entry.id))
            return std::unexpected(CacheError::Malformed);
        if (!reader.read(entry.downloads) || !reader.read(entry.lastUpdated))
            return std::unexpected(CacheError::Malformed);

        if (entry.id.empty() || !isValidStatsEntry(entry, snapshot.generatedAt, entryMaxAge)) {
            snapshot.droppedEntries++;
            continue;
        }
        auto id = entry.id;
        if (!snapshot.entries.emplace(std::move(id), std::move(entry)).second)
            snapshot.droppedEntries++;
    }

    if (reader.remaining() != 0)
        return std::unexpected(CacheError::Malformed);

    return snapshot;
}

void saveStatsCache(const fs::path &fname, const StatsSnapshot &snapshot)
{
    if (fname.has_parent_path())
        fs::create_directories(fname.parent_path());
    Utils::writeFileAtomic(fname, encodeStatsCache(snapshot));
}

std::expected<StatsSnapshot, CacheError> loadStatsCache(const fs::path &fname, std::chrono::days entryMaxAge)
{
    std::error_code ec;
    if (!fs::exists(fname, ec))
        return std::unexpected(CacheError::NotFound);

    std::ifstream file(fname, std::ios::binary);
    if (!file.is_open())
        return std::unexpected(CacheError::IoError);

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
        return std::unexpected(CacheError::IoError);

    // shipped artifacts may be compressed
    if (isCompressedData(data)) {
        try {
            const auto plain = decompressData(data);
            data.assign(plain.begin(), plain.end());
        } catch (const std::exception &e) {
            logDebug("Unable to decompress statistics file {}: {}", fname.string(), e.what());
            return std::unexpected(CacheError::Malformed);
        }
    }

    return decodeStatsCache(data, entryMaxAge);
}

std::optional<std::uint64_t> parseStatsMetadata(const std::string &json)
{
    nlohmann::json metaJson;
    try {
        metaJson = nlohmann::json::parse(json);
    } catch (const std::exception &e) {
        logWarning("Failed to parse statistics metadata: {}", e.what());
        return std::nullopt;
    }

    if (!metaJson.is_object() || !metaJson.contains("generated_at"))
        return std::nullopt;

    const auto &genAt = metaJson["generated_at"];
    if (genAt.is_number_unsigned())
        return genAt.get<std::uint64_t>();
    if (genAt.is_number_integer() && genAt.get<std::int64_t>() >= 0)
        return static_cast<std::uint64_t>(genAt.get<std::int64_t>());
    if (genAt.is_string()) {
        try {
            return std::stoull(genAt.get<std::string>());
        } catch (const std::exception &e) {
            logWarning("Invalid generation time in statistics metadata: {}", e.what());
        }
    }

    return std::nullopt;
}

RemoteStatsSource::RemoteStatsSource(std::string url, std::string metadataUrl)
    : m_url(std::move(url)),
      m_metadataUrl(std::move(metadataUrl))
{
}

std::optional<std::uint64_t> RemoteStatsSource::fetchGeneratedAt()
{
    if (m_metadataUrl.empty())
        return std::nullopt;
    return parseStatsMetadata(Downloader::get().downloadText(m_metadataUrl));
}

std::vector<std::uint8_t> RemoteStatsSource::fetchArtifact()
{
    if (m_url.empty())
        throw std::runtime_error("No statistics URL configured");
    return Downloader::get().download(m_url);
}

StatsCache::StatsCache(fs::path cacheFile, StatsSettings settings, std::shared_ptr<StatsSource> source)
    : m_cacheFile(std::move(cacheFile)),
      m_settings(std::move(settings)),
      m_source(std::move(source)),
      m_cacheTime(0),
      m_refreshRunning(false)
{
}

StatsCache::~StatsCache()
{
    // a running refresh still refers to us, abort its downloads and wait for it
    if (m_worker.joinable()) {
        m_worker.request_stop();
        m_worker.join();
    }
}

void StatsCache::publish(std::shared_ptr<const StatsSnapshot> snap, std::chrono::system_clock::time_point cacheTime)
{
    m_cacheTime.store(toSeconds(cacheTime));
    m_snapshot.store(std::move(snap));
}

std::expected<std::shared_ptr<const StatsSnapshot>, CacheError> StatsCache::loadLocal()
{
    auto res = loadStatsCache(m_cacheFile, m_settings.entryMaxAge);
    if (!res) {
        if (res.error() == CacheError::NotFound)
            logDebug("No statistics cache found at {}", m_cacheFile.string());
        else
            logWarning(
                "Ignoring statistics cache {}: {}",
                m_cacheFile.string(),
                cacheErrorToString(res.error()));

        // nothing to serve yet, fall back to the statistics shipped with the application
        if (!m_snapshot.load()) {
            auto bundled = loadBundled();
            if (bundled)
                return bundled;
        }
        return std::unexpected(res.error());
    }

    std::chrono::system_clock::time_point cacheTime{std::chrono::seconds(res->generatedAt)};
    std::error_code ec;
    const auto mtime = fs::last_write_time(m_cacheFile, ec);
    if (!ec)
        cacheTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::clock_cast<std::chrono::system_clock>(mtime));

    logDebug(
        "Loaded statistics for {} applications ({} invalid entries dropped)",
        res->entries.size(),
        res->droppedEntries);

    auto snap = std::make_shared<const StatsSnapshot>(std::move(*res));
    publish(snap, cacheTime);
    return snap;
}

std::shared_ptr<const StatsSnapshot> StatsCache::loadBundled()
{
    if (m_settings.bundledFile.empty())
        return nullptr;

    auto res = loadStatsCache(m_settings.bundledFile, m_settings.entryMaxAge);
    if (!res) {
        logWarning(
            "Ignoring bundled statistics {}: {}",
            m_settings.bundledFile.string(),
            cacheErrorToString(res.error()));
        return nullptr;
    }

    logInfo(
        "Using bundled statistics for {} applications from {}",
        res->entries.size(),
        m_settings.bundledFile.string());

    // bundled data is as old as its artifact, so it gets refreshed once it is stale
    const std::chrono::system_clock::time_point cacheTime{std::chrono::seconds(res->generatedAt)};
    auto snap = std::make_shared<const StatsSnapshot>(std::move(*res));
    publish(snap, cacheTime);
    return snap;
}

std::shared_ptr<const StatsSnapshot> StatsCache::snapshot() const
{
    return m_snapshot.load();
}

StatsState StatsCache::state(std::chrono::system_clock::time_point now) const
{
    if (!m_snapshot.load())
        return StatsState::Absent;

    const auto cacheTime = m_cacheTime.load();
    const auto ageSecs = toSeconds(now) - cacheTime;
    if (ageSecs > std::chrono::seconds(m_settings.maxAge).count())
        return StatsState::Stale;
    return StatsState::Fresh;
}

bool StatsCache::isStale(std::chrono::system_clock::time_point now) const
{
    return state(now) != StatsState::Fresh;
}

bool StatsCache::canRefresh() const
{
    return m_source != nullptr;
}

bool StatsCache::refreshInProgress() const
{
    std::lock_guard lock(m_refreshMutex);
    return m_refreshRunning;
}

std::shared_future<StatsRefreshResult> StatsCache::refresh()
{
    std::lock_guard lock(m_refreshMutex);
    if (m_refreshRunning)
        return m_inflight;

    // the previous worker has already released the flag, so this won't block for long
    if (m_worker.joinable())
        m_worker.join();

    m_refreshRunning = true;
    auto promise = std::make_shared<std::promise<StatsRefreshResult>>();
    m_inflight = promise->get_future().share();

    m_worker = std::jthread([this, promise](std::stop_token stopToken) {
        Downloader::get().setStopToken(stopToken);

        StatsRefreshResult result;
        try {
            result = performRefresh();
        } catch (const std::exception &e) {
            result.success = false;
            result.error = e.what();
            result.snapshot = snapshot();
        }
        if (!result.success)
            logWarning("Unable to refresh popularity statistics: {}", result.error);

        {
            std::lock_guard lock(m_refreshMutex);
            m_refreshRunning = false;
        }
        promise->set_value(std::move(result));
    });

    return m_inflight;
}

StatsRefreshResult StatsCache::performRefresh()
{
    StatsRefreshResult result;
    auto current = snapshot();
    result.snapshot = current;

    if (!m_source) {
        result.error = "no statistics source configured";
        return result;
    }

    const auto remoteGeneratedAt = m_source->fetchGeneratedAt();
    if (current && remoteGeneratedAt && current->generatedAt >= *remoteGeneratedAt) {
        logDebug("Popularity statistics are up to date (generated at {})", current->generatedAt);

        // remember that we checked, so the cache counts as fresh again
        const auto now = std::chrono::system_clock::now();
        std::error_code ec;
        fs::last_write_time(m_cacheFile, fs::file_time_type::clock::now(), ec);
        m_cacheTime.store(toSeconds(now));

        result.success = true;
        return result;
    }

    auto data = m_source->fetchArtifact();
    if (isCompressedData(data)) {
        const auto plain = decompressData(data);
        data.assign(plain.begin(), plain.end());
    }

    auto decoded = decodeStatsCache(data, m_settings.entryMaxAge);
    if (!decoded) {
        result.error = std::format("downloaded statistics are unusable: {}", cacheErrorToString(decoded.error()));
        return result;
    }
    if (current && current->generatedAt > decoded->generatedAt) {
        logDebug("Ignoring downloaded statistics, they are older than the ones we have");
        result.success = true;
        return result;
    }

    try {
        if (m_cacheFile.has_parent_path())
            fs::create_directories(m_cacheFile.parent_path());
        Utils::writeFileAtomic(m_cacheFile, data);
    } catch (const std::exception &e) {
        logWarning("Unable to store popularity statistics in {}: {}", m_cacheFile.string(), e.what());
    }

    logInfo("Refreshed popularity statistics for {} applications", decoded->entries.size());
    auto snap = std::make_shared<const StatsSnapshot>(std::move(*decoded));
    publish(snap, std::chrono::system_clock::now());

    result.success = true;
    result.updated = true;
    result.snapshot = std::move(snap);
    return result;
}

} // namespace ASCatalog
