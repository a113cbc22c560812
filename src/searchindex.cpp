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

#include "searchindex.h"

#include <algorithm>
#include <atomic>
#include <format>
#include <iterator>
#include <limits>
#include <map>
#include <stdexcept>

#include "logging.h"
#include "utils.h"

namespace ASCatalog
{

/* number of query results kept per index, enough for paging through a few searches */
static constexpr std::size_t ResultCacheSize = 8;

static constexpr std::uint64_t MaxSortValue = std::numeric_limits<std::int64_t>::max();

static std::atomic<std::uint64_t> g_lastGeneration{0};

std::string normalizeSearchText(std::string_view text)
{
    return Utils::joinStrings(Utils::splitWhitespace(Utils::toLower(text)), " ");
}

std::string_view sortModeToString(SortMode mode) noexcept
{
    switch (mode) {
    case SortMode::Relevance:
        return "relevance";
    case SortMode::MostDownloads:
        return "downloads";
    case SortMode::RecentlyUpdated:
        return "updated";
    case SortMode::LowestRisk:
        return "risk";
    default:
        return "unknown";
    }
}

std::optional<SortMode> sortModeFromString(std::string_view str)
{
    for (const auto mode :
         {SortMode::Relevance, SortMode::MostDownloads, SortMode::RecentlyUpdated, SortMode::LowestRisk}) {
        if (sortModeToString(mode) == str)
            return mode;
    }
    return std::nullopt;
}

static std::string filtersCacheKey(const std::string &normQuery, const SearchFilters &filters, SortMode sort)
{
    std::string risks;
    for (const auto risk : filters.allowedRisks)
        risks += std::to_string(static_cast<int>(risk));
    std::string kinds;
    for (const auto kind : filters.kinds)
        kinds += std::format("{},", static_cast<int>(kind));

    return std::format(
        "{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}",
        normQuery,
        filters.category.value_or("\x1e"),
        filters.minDownloads,
        filters.maxRisk ? static_cast<int>(*filters.maxRisk) : -1,
        risks,
        kinds,
        static_cast<int>(sort));
}

SearchIndex::SearchIndex()
    : m_generation(0),
      m_statsMerged(0)
{
}

std::shared_ptr<const SearchIndex> SearchIndex::build(
    std::shared_ptr<const Catalog> catalog,
    std::vector<CompatibilityAssessment> assessments,
    std::shared_ptr<const StatsSnapshot> stats)
{
    if (!catalog)
        throw std::logic_error("Can not build a search index without a catalog");

    const auto &entries = catalog->entries();
    if (assessments.size() != entries.size())
        throw std::logic_error(
            std::format(
                "Search index inconsistency: {} assessments for {} catalog entries",
                assessments.size(),
                entries.size()));

    // private constructor, so no make_shared
    std::shared_ptr<SearchIndex> index(new SearchIndex());
    index->m_catalog = catalog;
    index->m_stats = stats;
    index->m_records.reserve(entries.size());

    std::map<std::string, std::vector<std::uint32_t>> postings;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto &entry = entries[i];
        if (assessments[i].id != entry.id)
            throw std::logic_error(
                std::format(
                    "Search index inconsistency: assessment for '{}' found at position of '{}'",
                    assessments[i].id,
                    entry.id));

        IndexRecord rec;
        rec.entry = &entry;
        rec.assessment = std::move(assessments[i]);
        rec.normalizedName = normalizeSearchText(entry.name);
        if (stats) {
            const auto statsEntry = stats->find(entry.id);
            if (statsEntry != nullptr) {
                rec.stats = *statsEntry;
                index->m_statsMerged++;
            }
        }

        const auto recIdx = static_cast<std::uint32_t>(i);
        auto addTerm = [&](std::string term) {
            if (term.empty())
                return;
            auto &list = postings[std::move(term)];
            // records are visited in order, so the lists stay sorted
            if (list.empty() || list.back() != recIdx)
                list.push_back(recIdx);
        };
        for (auto &token : Utils::splitWhitespace(rec.normalizedName))
            addTerm(std::move(token));
        addTerm(rec.normalizedName);
        for (const auto &category : entry.categories)
            addTerm(Utils::toLower(category));

        index->m_records.push_back(std::move(rec));
    }

    index->m_terms.reserve(postings.size());
    index->m_postings.reserve(postings.size());
    for (auto &[term, list] : postings) {
        index->m_terms.push_back(term);
        index->m_postings.push_back(std::move(list));
    }

    index->m_generation = ++g_lastGeneration;
    logDebug(
        "Built search index generation {}: {} records, {} terms, {} with statistics",
        index->m_generation,
        index->m_records.size(),
        index->m_terms.size(),
        index->m_statsMerged);

    return index;
}

bool SearchIndex::matchesFilters(const IndexRecord &rec, const SearchFilters &filters) const
{
    if (filters.category) {
        const auto &cats = rec.entry->categories;
        if (std::find(cats.begin(), cats.end(), *filters.category) == cats.end())
            return false;
    }
    if (filters.minDownloads > 0) {
        if (!rec.stats || rec.stats->downloads < filters.minDownloads)
            return false;
    }
    if (filters.maxRisk && rec.assessment.risk > *filters.maxRisk)
        return false;
    if (!filters.allowedRisks.empty() && !filters.allowedRisks.contains(rec.assessment.risk))
        return false;
    if (!filters.kinds.empty() && !filters.kinds.contains(rec.entry->kind))
        return false;

    return true;
}

std::vector<std::uint32_t> SearchIndex::computeMatches(
    const std::vector<std::string> &tokens,
    const SearchFilters &filters,
    SortMode sort) const
{
    std::vector<std::uint32_t> candidates;
    if (tokens.empty()) {
        candidates.resize(m_records.size());
        for (std::uint32_t i = 0; i < candidates.size(); ++i)
            candidates[i] = i;
    } else {
        bool first = true;
        for (const auto &token : tokens) {
            // postings of every term containing this token, merged once
            std::vector<std::uint32_t> tokenMatches;
            for (std::size_t t = 0; t < m_terms.size(); ++t) {
                if (m_terms[t].find(token) != std::string::npos)
                    tokenMatches.insert(tokenMatches.end(), m_postings[t].begin(), m_postings[t].end());
            }
            std::sort(tokenMatches.begin(), tokenMatches.end());
            tokenMatches.erase(std::unique(tokenMatches.begin(), tokenMatches.end()), tokenMatches.end());

            if (first) {
                candidates = std::move(tokenMatches);
                first = false;
            } else {
                std::vector<std::uint32_t> intersection;
                std::set_intersection(
                    candidates.begin(),
                    candidates.end(),
                    tokenMatches.begin(),
                    tokenMatches.end(),
                    std::back_inserter(intersection));
                candidates = std::move(intersection);
            }
            if (candidates.empty())
                break;
        }
    }

    std::erase_if(candidates, [&](std::uint32_t idx) {
        return !matchesFilters(m_records[idx], filters);
    });

    const auto normQuery = Utils::joinStrings(tokens, " ");
    auto matchTier = [&](const IndexRecord &rec) -> int {
        if (normQuery.empty())
            return 0;
        if (rec.normalizedName == normQuery)
            return 0;
        if (rec.normalizedName.starts_with(normQuery))
            return 1;
        return 2;
    };

    // primary sort key, smaller sorts first
    auto sortKey = [&](const IndexRecord &rec) -> std::int64_t {
        switch (sort) {
        case SortMode::MostDownloads:
            return -static_cast<std::int64_t>(std::min<std::uint64_t>(rec.downloads(), MaxSortValue));
        case SortMode::RecentlyUpdated:
            return -static_cast<std::int64_t>(std::min<std::uint64_t>(rec.entry->lastRelease, MaxSortValue));
        case SortMode::LowestRisk:
            return static_cast<std::int64_t>(rec.assessment.risk);
        case SortMode::Relevance:
        default:
            return matchTier(rec);
        }
    };

    std::vector<std::pair<std::int64_t, std::uint32_t>> ranked;
    ranked.reserve(candidates.size());
    for (const auto idx : candidates)
        ranked.emplace_back(sortKey(m_records[idx]), idx);

    std::sort(ranked.begin(), ranked.end(), [this, sort](const auto &a, const auto &b) {
        if (a.first != b.first)
            return a.first < b.first;
        const auto &recA = m_records[a.second];
        const auto &recB = m_records[b.second];
        if (sort == SortMode::Relevance) {
            if (recA.downloads() != recB.downloads())
                return recA.downloads() > recB.downloads();
        } else if (recA.normalizedName != recB.normalizedName) {
            return recA.normalizedName < recB.normalizedName;
        }
        return recA.id() < recB.id();
    });

    std::vector<std::uint32_t> result;
    result.reserve(ranked.size());
    for (const auto &item : ranked)
        result.push_back(item.second);
    return result;
}

std::shared_ptr<const std::vector<std::uint32_t>> SearchIndex::lookup(
    std::string_view text,
    const SearchFilters &filters,
    SortMode sort) const
{
    const auto tokens = Utils::splitWhitespace(Utils::toLower(text));
    const auto key = filtersCacheKey(Utils::joinStrings(tokens, " "), filters, sort);

    {
        std::lock_guard lock(m_cacheMutex);
        for (auto it = m_resultCache.begin(); it != m_resultCache.end(); ++it) {
            if (it->first != key)
                continue;
            // move to front, most recently used
            m_resultCache.splice(m_resultCache.begin(), m_resultCache, it);
            return m_resultCache.front().second;
        }
    }

    auto matches = std::make_shared<const std::vector<std::uint32_t>>(computeMatches(tokens, filters, sort));

    std::lock_guard lock(m_cacheMutex);
    m_resultCache.emplace_front(key, matches);
    if (m_resultCache.size() > ResultCacheSize)
        m_resultCache.pop_back();

    return matches;
}

std::vector<std::string> SearchIndex::query(std::string_view text, const SearchFilters &filters, SortMode sort) const
{
    const auto matches = lookup(text, filters, sort);

    std::vector<std::string> ids;
    ids.reserve(matches->size());
    for (const auto idx : *matches)
        ids.push_back(m_records[idx].id());
    return ids;
}

std::vector<std::string> SearchIndex::queryPage(
    std::string_view text,
    const SearchFilters &filters,
    std::size_t offset,
    std::size_t limit,
    SortMode sort) const
{
    const auto matches = lookup(text, filters, sort);
    if (offset >= matches->size())
        return {};

    // offset + limit may overflow
    const auto end = offset + std::min(limit, matches->size() - offset);
    std::vector<std::string> ids;
    ids.reserve(end - offset);
    for (auto i = offset; i < end; ++i)
        ids.push_back(m_records[(*matches)[i]].id());
    return ids;
}

const IndexRecord *SearchIndex::record(const std::string &id) const
{
    const auto entry = m_catalog->find(id);
    if (entry == nullptr)
        return nullptr;

    // records share the catalog's order
    const auto idx = static_cast<std::size_t>(entry - m_catalog->entries().data());
    return &m_records[idx];
}

const std::vector<IndexRecord> &SearchIndex::records() const
{
    return m_records;
}

std::uint64_t SearchIndex::generation() const
{
    return m_generation;
}

std::size_t SearchIndex::size() const
{
    return m_records.size();
}

std::size_t SearchIndex::statsMerged() const
{
    return m_statsMerged;
}

std::size_t SearchIndex::termCount() const
{
    return m_terms.size();
}

std::shared_ptr<const Catalog> SearchIndex::catalog() const
{
    return m_catalog;
}

std::shared_ptr<const StatsSnapshot> SearchIndex::stats() const
{
    return m_stats;
}

} // namespace ASCatalog
