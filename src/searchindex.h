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
#include <set>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <cstdint>

#include "catalog.h"
#include "compatclassifier.h"
#include "statscache.h"

namespace ASCatalog
{

/**
 * Order of search results.
 */
enum class SortMode {
    /* exact name, then name prefix, then other matches, popular entries first */
    Relevance,
    MostDownloads,
    /* newest release first, entries without release information last */
    RecentlyUpdated,
    LowestRisk
};

std::string_view sortModeToString(SortMode mode) noexcept;
std::optional<SortMode> sortModeFromString(std::string_view str);

/**
 * Search constraints. All set filters must match (logical AND).
 */
struct SearchFilters {
    /* exact category value, as written in the catalog */
    std::optional<std::string> category;
    /* entries without statistics fail any threshold above zero */
    std::uint64_t minDownloads = 0;
    std::optional<RiskLevel> maxRisk;
    /* empty set allows all risk levels */
    std::set<RiskLevel> allowedRisks;
    /* empty set allows all component kinds */
    std::set<AsComponentKind> kinds;
};

/**
 * Merged, searchable view of one catalog entry.
 */
struct IndexRecord {
    const CatalogEntry *entry = nullptr;
    CompatibilityAssessment assessment;
    std::optional<StatsEntry> stats;

    /* lowercase name with collapsed whitespace */
    std::string normalizedName;

    const std::string &id() const
    {
        return entry->id;
    }

    std::uint64_t downloads() const
    {
        return stats ? stats->downloads : 0;
    }
};

/**
 * Immutable search index over one catalog generation.
 *
 * The term dictionary and the postings are computed once when the index is
 * built. Changes to the catalog, the assessments or the statistics require
 * building a new index, which replaces the old one as a whole.
 */
class SearchIndex
{
public:
    /**
     * Build a new index. `assessments` must be in catalog order, one per entry,
     * otherwise std::logic_error is thrown. `stats` may be null.
     */
    static std::shared_ptr<const SearchIndex> build(
        std::shared_ptr<const Catalog> catalog,
        std::vector<CompatibilityAssessment> assessments,
        std::shared_ptr<const StatsSnapshot> stats);

    /**
     * Find all records matching `text` and `filters`, ordered by `sort`.
     */
    std::vector<std::string> query(
        std::string_view text,
        const SearchFilters &filters = {},
        SortMode sort = SortMode::Relevance) const;

    /**
     * Like query(), but only returns `limit` results starting at `offset`.
     */
    std::vector<std::string> queryPage(
        std::string_view text,
        const SearchFilters &filters,
        std::size_t offset,
        std::size_t limit,
        SortMode sort = SortMode::Relevance) const;

    const IndexRecord *record(const std::string &id) const;
    const std::vector<IndexRecord> &records() const;

    std::uint64_t generation() const;
    std::size_t size() const;
    std::size_t statsMerged() const;
    std::size_t termCount() const;

    std::shared_ptr<const Catalog> catalog() const;
    std::shared_ptr<const StatsSnapshot> stats() const;

    SearchIndex(const SearchIndex &) = delete;
    SearchIndex &operator=(const SearchIndex &) = delete;

private:
    SearchIndex();

    std::shared_ptr<const Catalog> m_catalog;
    std::shared_ptr<const StatsSnapshot> m_stats;
    std::vector<IndexRecord> m_records;
    std::uint64_t m_generation;
    std::size_t m_statsMerged;

    /* sorted term dictionary, with a sorted postings list for each term */
    std::vector<std::string> m_terms;
    std::vector<std::vector<std::uint32_t>> m_postings;

    using CachedResult = std::pair<std::string, std::shared_ptr<const std::vector<std::uint32_t>>>;
    mutable std::mutex m_cacheMutex;
    mutable std::list<CachedResult> m_resultCache;

    std::shared_ptr<const std::vector<std::uint32_t>> lookup(
        std::string_view text,
        const SearchFilters &filters,
        SortMode sort) const;
    std::vector<std::uint32_t> computeMatches(
        const std::vector<std::string> &tokens,
        const SearchFilters &filters,
        SortMode sort) const;
    bool matchesFilters(const IndexRecord &rec, const SearchFilters &filters) const;
};

/**
 * Normalize a name or query for matching: lowercase, whitespace collapsed.
 */
std::string normalizeSearchText(std::string_view text);

} // namespace ASCatalog
