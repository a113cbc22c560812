/*
 * Copyright (C) 2025-2026 Matthias Klumpp <matthias@tenstral.net>
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <algorithm>
#include <format>
#include <limits>
#include <thread>

#include "logging.h"
#include "utils.h"
#include "catalog.h"
#include "compatclassifier.h"
#include "statscache.h"
#include "searchindex.h"

using namespace ASCatalog;

static struct TestSetup {
    TestSetup()
    {
        setVerbose(true);
    }
} testSetup;

static constexpr std::uint64_t GeneratedAt = 1700000000;

static CatalogEntry makeEntry(const std::string &id, const std::string &name, std::vector<std::string> categories)
{
    CatalogEntry entry;
    entry.id = id;
    entry.name = name;
    entry.kind = AS_COMPONENT_KIND_DESKTOP_APP;
    entry.categories = std::move(categories);
    return entry;
}

static CompatibilityAssessment makeAssessment(const std::string &id, RiskLevel risk)
{
    CompatibilityAssessment res;
    res.id = id;
    res.risk = risk;
    return res;
}

static std::shared_ptr<const StatsSnapshot> makeStats(
    const std::vector<std::pair<std::string, std::uint64_t>> &downloads)
{
    auto snap = std::make_shared<StatsSnapshot>();
    snap->generatedAt = GeneratedAt;
    for (const auto &[id, count] : downloads) {
        StatsEntry entry;
        entry.id = id;
        entry.downloads = count;
        entry.lastUpdated = GeneratedAt - 60;
        snap->entries.emplace(id, entry);
    }
    return snap;
}

/**
 * Four applications:
 *  Editor (10 downloads, low risk), Editor Pro (1000, high),
 *  Text Tool with Editor (50, medium) and Space Game (no statistics, critical).
 */
static std::shared_ptr<const SearchIndex> buildTestIndex()
{
    auto catalog = std::make_shared<const Catalog>(std::vector<CatalogEntry>{
        makeEntry("org.example.Editor", "Editor", {"Utility", "Office"}),
        makeEntry("org.example.EditorPro", "Editor  Pro", {"Development", "Office"}),
        makeEntry("org.example.TextTool", "Text Tool with Editor", {"Utility"}),
        makeEntry("org.example.Game", "Space Game", {"Game"}),
    });
    std::vector<CompatibilityAssessment> assessments = {
        makeAssessment("org.example.Editor", RiskLevel::Low),
        makeAssessment("org.example.EditorPro", RiskLevel::High),
        makeAssessment("org.example.TextTool", RiskLevel::Medium),
        makeAssessment("org.example.Game", RiskLevel::Critical),
    };
    auto stats = makeStats({
        {"org.example.Editor",    10  },
        {"org.example.EditorPro", 1000},
        {"org.example.TextTool",  50  },
        {"org.example.Ghost",     9999},
    });

    return SearchIndex::build(catalog, std::move(assessments), stats);
}

using IdList = std::vector<std::string>;

TEST_CASE("Building the search index", "[index]")
{
    const auto index = buildTestIndex();
    REQUIRE(index->size() == 4);
    REQUIRE(index->records().size() == 4);
    REQUIRE(index->termCount() > 0);

    // statistics for unknown applications are not merged
    REQUIRE(index->statsMerged() == 3);
    REQUIRE(index->record("org.example.Ghost") == nullptr);

    const auto pro = index->record("org.example.EditorPro");
    REQUIRE(pro != nullptr);
    REQUIRE(pro->id() == "org.example.EditorPro");
    REQUIRE(pro->normalizedName == "editor pro");
    REQUIRE(pro->downloads() == 1000);
    REQUIRE(pro->assessment.risk == RiskLevel::High);

    const auto game = index->record("org.example.Game");
    REQUIRE(game != nullptr);
    REQUIRE_FALSE(game->stats.has_value());
    REQUIRE(game->downloads() == 0);
}

TEST_CASE("Index generations increase", "[index]")
{
    const auto first = buildTestIndex();
    const auto second = buildTestIndex();
    REQUIRE(second->generation() > first->generation());
}

TEST_CASE("Inconsistent index input is refused", "[index]")
{
    auto catalog = std::make_shared<const Catalog>(std::vector<CatalogEntry>{
        makeEntry("org.example.A", "A", {}),
        makeEntry("org.example.B", "B", {}),
    });

    REQUIRE_THROWS_AS(
        SearchIndex::build(catalog, {makeAssessment("org.example.A", RiskLevel::Low)}, nullptr),
        std::logic_error);
    REQUIRE_THROWS_AS(
        SearchIndex::build(
            catalog,
            {makeAssessment("org.example.B", RiskLevel::Low), makeAssessment("org.example.A", RiskLevel::Low)},
            nullptr),
        std::logic_error);
    REQUIRE_THROWS_AS(SearchIndex::build(nullptr, {}, nullptr), std::logic_error);

    // statistics are optional
    const auto index = SearchIndex::build(
        catalog,
        {makeAssessment("org.example.A", RiskLevel::Low), makeAssessment("org.example.B", RiskLevel::Low)},
        nullptr);
    REQUIRE(index->size() == 2);
    REQUIRE(index->statsMerged() == 0);
    REQUIRE(index->stats() == nullptr);
}

TEST_CASE("Search ranking", "[index]")
{
    const auto index = buildTestIndex();

    // exact match beats the prefix match, even with fewer downloads
    REQUIRE(index->query("editor") == IdList{"org.example.Editor", "org.example.EditorPro", "org.example.TextTool"});

    // case and whitespace do not matter
    REQUIRE(index->query("  EDITOR ") == index->query("editor"));

    // all terms have to match
    REQUIRE(index->query("text editor") == IdList{"org.example.TextTool"});
    REQUIRE(index->query("edi pro") == IdList{"org.example.EditorPro"});
    REQUIRE(index->query("editor game").empty());

    // substring matches
    REQUIRE(index->query("pac") == IdList{"org.example.Game"});
    REQUIRE(index->query("nothing like this").empty());

    // categories are searchable as well
    REQUIRE(index->query("development") == IdList{"org.example.EditorPro"});

    // without query text, the most popular entries come first
    REQUIRE(
        index->query("")
        == IdList{"org.example.EditorPro", "org.example.TextTool", "org.example.Editor", "org.example.Game"});
}

TEST_CASE("Search filters", "[index]")
{
    const auto index = buildTestIndex();

    SearchFilters byCategory;
    byCategory.category = "Utility";
    REQUIRE(index->query("", byCategory) == IdList{"org.example.TextTool", "org.example.Editor"});
    byCategory.category = "utility";
    REQUIRE(index->query("", byCategory).empty());

    // entries without statistics never pass a download threshold
    SearchFilters popular;
    popular.minDownloads = 20;
    REQUIRE(index->query("", popular) == IdList{"org.example.EditorPro", "org.example.TextTool"});
    popular.minDownloads = 1;
    REQUIRE(index->query("game", popular).empty());

    SearchFilters lowRisk;
    lowRisk.maxRisk = RiskLevel::Medium;
    REQUIRE(index->query("", lowRisk) == IdList{"org.example.TextTool", "org.example.Editor"});

    SearchFilters risky;
    risky.allowedRisks = {RiskLevel::High, RiskLevel::Critical};
    REQUIRE(index->query("", risky) == IdList{"org.example.EditorPro", "org.example.Game"});

    SearchFilters combined;
    combined.category = "Office";
    combined.maxRisk = RiskLevel::High;
    combined.minDownloads = 5;
    REQUIRE(index->query("editor", combined) == IdList{"org.example.Editor", "org.example.EditorPro"});
    combined.allowedRisks = {RiskLevel::Medium};
    REQUIRE(index->query("editor", combined).empty());
}

TEST_CASE("Filtered results are a subset of unfiltered results", "[index]")
{
    const auto index = buildTestIndex();

    std::vector<SearchFilters> filterSets(5);
    filterSets[0].category = "Office";
    filterSets[1].minDownloads = 100;
    filterSets[2].maxRisk = RiskLevel::Low;
    filterSets[3].allowedRisks = {RiskLevel::Medium, RiskLevel::Critical};
    filterSets[4].category = "Game";
    filterSets[4].maxRisk = RiskLevel::Critical;

    for (const auto &text : {"", "editor", "e", "game", "tool"}) {
        const auto all = index->query(text);
        for (const auto &filters : filterSets) {
            const auto filtered = index->query(text, filters);
            for (const auto &id : filtered) {
                INFO("query: '" << text << "', id: " << id);
                REQUIRE(std::find(all.begin(), all.end(), id) != all.end());

                const auto rec = index->record(id);
                REQUIRE(rec != nullptr);
                if (filters.category) {
                    const auto &cats = rec->entry->categories;
                    REQUIRE(std::find(cats.begin(), cats.end(), *filters.category) != cats.end());
                }
                if (filters.maxRisk)
                    REQUIRE(rec->assessment.risk <= *filters.maxRisk);
                if (!filters.allowedRisks.empty())
                    REQUIRE(filters.allowedRisks.contains(rec->assessment.risk));
                REQUIRE(rec->downloads() >= filters.minDownloads);
            }
        }
    }
}

TEST_CASE("Paging through search results", "[index]")
{
    const auto index = buildTestIndex();

    REQUIRE(index->queryPage("", {}, 0, 2) == IdList{"org.example.EditorPro", "org.example.TextTool"});
    REQUIRE(index->queryPage("", {}, 2, 2) == IdList{"org.example.Editor", "org.example.Game"});
    REQUIRE(index->queryPage("", {}, 3, 10) == IdList{"org.example.Game"});
    REQUIRE(index->queryPage("", {}, 4, 10).empty());
    REQUIRE(index->queryPage("", {}, 1, 0).empty());

    // pages put together are the full result
    IdList joined;
    for (std::size_t offset = 0; offset < index->size(); offset += 3) {
        const auto page = index->queryPage("e", {}, offset, 3);
        joined.insert(joined.end(), page.begin(), page.end());
    }
    REQUIRE(joined == index->query("e"));

    // unbounded pages
    constexpr auto unlimited = std::numeric_limits<std::size_t>::max();
    REQUIRE(index->queryPage("", {}, 0, unlimited) == index->query(""));
    REQUIRE(
        index->queryPage("", {}, 1, unlimited)
        == IdList{"org.example.TextTool", "org.example.Editor", "org.example.Game"});
    REQUIRE(index->queryPage("", {}, unlimited, unlimited).empty());

    // pages follow the requested order
    REQUIRE(
        index->queryPage("", {}, 0, 2, SortMode::LowestRisk) == IdList{"org.example.Editor", "org.example.TextTool"});
}

TEST_CASE("Sorting search results", "[index]")
{
    const auto index = buildTestIndex();

    REQUIRE(index->query("editor", {}, SortMode::Relevance) == index->query("editor"));

    // match quality does not matter for the other orders
    REQUIRE(
        index->query("editor", {}, SortMode::MostDownloads)
        == IdList{"org.example.EditorPro", "org.example.TextTool", "org.example.Editor"});
    REQUIRE(
        index->query("", {}, SortMode::LowestRisk)
        == IdList{"org.example.Editor", "org.example.TextTool", "org.example.EditorPro", "org.example.Game"});

    // entries without statistics count as not downloaded
    REQUIRE(index->query("", {}, SortMode::MostDownloads).back() == "org.example.Game");

    REQUIRE(sortModeFromString("downloads") == SortMode::MostDownloads);
    REQUIRE(sortModeFromString(sortModeToString(SortMode::RecentlyUpdated)) == SortMode::RecentlyUpdated);
    REQUIRE_FALSE(sortModeFromString("alphabetical").has_value());
}

TEST_CASE("Release dates and component kinds", "[index]")
{
    auto makeKindEntry = [](const std::string &id, const std::string &name, AsComponentKind kind, std::uint64_t release) {
        auto entry = makeEntry(id, name, {});
        entry.kind = kind;
        entry.lastRelease = release;
        return entry;
    };
    auto catalog = std::make_shared<const Catalog>(std::vector<CatalogEntry>{
        makeKindEntry("org.example.Alpha", "Alpha", AS_COMPONENT_KIND_DESKTOP_APP, 300),
        makeKindEntry("org.example.Beta", "Beta", AS_COMPONENT_KIND_DESKTOP_APP, 0),
        makeKindEntry("org.example.Gamma", "Gamma", AS_COMPONENT_KIND_CONSOLE_APP, 500),
        makeKindEntry("org.example.Delta", "Delta Addon", AS_COMPONENT_KIND_ADDON, 300),
    });
    std::vector<CompatibilityAssessment> assessments;
    for (const auto &entry : catalog->entries())
        assessments.push_back(makeAssessment(entry.id, RiskLevel::Medium));
    const auto index = SearchIndex::build(catalog, std::move(assessments), nullptr);

    // newest first, same dates by name, unreleased last
    REQUIRE(
        index->query("", {}, SortMode::RecentlyUpdated)
        == IdList{"org.example.Gamma", "org.example.Alpha", "org.example.Delta", "org.example.Beta"});

    SearchFilters appsOnly;
    appsOnly.kinds = {AS_COMPONENT_KIND_DESKTOP_APP};
    REQUIRE(index->query("", appsOnly) == IdList{"org.example.Alpha", "org.example.Beta"});
    REQUIRE(index->query("a", appsOnly, SortMode::RecentlyUpdated) == IdList{"org.example.Alpha", "org.example.Beta"});

    appsOnly.kinds.insert(AS_COMPONENT_KIND_CONSOLE_APP);
    REQUIRE(
        index->query("", appsOnly, SortMode::RecentlyUpdated)
        == IdList{"org.example.Gamma", "org.example.Alpha", "org.example.Beta"});

    // a different kind selection is not served from the result cache of the previous one
    appsOnly.kinds = {AS_COMPONENT_KIND_ADDON};
    REQUIRE(index->query("", appsOnly, SortMode::RecentlyUpdated) == IdList{"org.example.Delta"});
}

TEST_CASE("Concurrent queries on a shared index", "[index]")
{
    const auto index = buildTestIndex();
    const auto expected = index->query("editor");

    std::vector<IdList> results(8);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i]() {
                // more distinct queries than the result cache holds
                for (int n = 0; n < 20; ++n)
                    index->query(std::string(static_cast<std::size_t>(n % 10) + 1, 'e'));
                results[i] = index->query("editor");
            });
        }
    }

    for (const auto &res : results)
        REQUIRE(res == expected);
}

TEST_CASE("Short queries matching many terms", "[index]")
{
    std::vector<CatalogEntry> entries;
    std::vector<CompatibilityAssessment> assessments;
    for (int i = 0; i < 3000; ++i) {
        const auto id = std::format("org.example.App{:04}", i);
        // every entry gets its own terms, about half of them contain an "e"
        const auto name = i % 2 == 0 ? std::format("tool{} editor{}", i, i) : std::format("app{} box{}", i, i);
        entries.push_back(makeEntry(id, name, {}));
        assessments.push_back(makeAssessment(id, RiskLevel::Low));
    }
    const auto catalog = std::make_shared<const Catalog>(std::move(entries));
    const auto index = SearchIndex::build(catalog, std::move(assessments), nullptr);
    REQUIRE(index->termCount() >= 6000);

    IdList expected;
    for (const auto &entry : catalog->entries()) {
        if (entry.name.find('e') != std::string::npos)
            expected.push_back(entry.id);
    }
    REQUIRE(expected.size() == 1500);

    // no downloads anywhere, so substring matches come in ID order
    REQUIRE(index->query("e") == expected);
    REQUIRE(index->query("x").size() == 1500);
    REQUIRE(index->query("e x").empty());
}
