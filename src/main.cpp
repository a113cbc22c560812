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

#include "defines.h"

#include <iostream>
#include <filesystem>
#include <format>
#include <vector>
#include <string>
#include <clocale>

#include <glib.h>
#include <appstream.h>

#ifdef HAVE_BACKWARD
#define BACKWARD_HAS_UNWIND 1
#include <backward.hpp>
#endif

#include "logging.h"
#include "config.h"
#include "utils.h"
#include "catalogloader.h"
#include "compatclassifier.h"
#include "iconloader.h"
#include "searchindex.h"
#include "statscache.h"

using namespace ASCatalog;

struct CommandOptions {
    SearchFilters filters;
    SortMode sort = SortMode::Relevance;
    std::size_t offset = 0;
    std::size_t limit = 20;
    bool loadIcons = false;
};

/**
 * Print version information to stdout.
 */
static void printVersion()
{
    std::cout << "AppStream Catalog version: " << ASCAT_VERSION << std::endl;
    std::cout << "Using AppStream " << as_version_string() << std::endl;
}

static std::shared_ptr<StatsCache> createStatsCache()
{
    const auto &conf = Config::get();
    std::shared_ptr<StatsSource> source;
    if (!conf.stats.url.empty() && !conf.feature.noDownloads)
        source = std::make_shared<RemoteStatsSource>(conf.stats.url, conf.stats.metadataUrl);

    return std::make_shared<StatsCache>(conf.statsCacheFile(), conf.stats, source);
}

/**
 * Load the catalog, printing progress in verbose mode.
 * Returns nullptr if nothing could be loaded.
 */
static std::unique_ptr<CatalogLoader> loadCatalog(const CommandOptions &options, LoadReport &report)
{
    const auto &conf = Config::get();

    auto loaderOpts = LoaderOptions::fromConfig();
    loaderOpts.loadIcons = options.loadIcons && conf.feature.loadIcons;

    std::shared_ptr<IconLoader> icons;
    if (loaderOpts.loadIcons)
        icons = std::make_shared<IconLoader>(DefaultIconFetcher::fromConfig(), conf.icons.workers, conf.icons.size);

    auto loader = std::make_unique<CatalogLoader>(loaderOpts, createStatsCache(), icons);
    report = loader->run();
    if (!loader->isReady())
        return nullptr;

    return loader;
}

static void printRecordLine(const IndexRecord &rec)
{
    std::cout << std::format(
                     "{:<40} {:<30} {:<9} {:>10}",
                     rec.id(),
                     rec.entry->name,
                     riskLevelToString(rec.assessment.risk),
                     rec.stats ? std::to_string(rec.stats->downloads) : std::string("-"))
              << std::endl;
}

static int commandSearch(const std::vector<std::string> &args, const CommandOptions &options)
{
    LoadReport report;
    const auto loader = loadCatalog(options, report);
    if (!loader) {
        std::cerr << "Unable to load the software catalog." << std::endl;
        return 2;
    }

    std::vector<std::string> terms(args.begin() + 2, args.end());
    const auto query = Utils::joinStrings(terms, " ");
    const auto index = loader->index();
    const auto ids = index->queryPage(query, options.filters, options.offset, options.limit, options.sort);
    if (ids.empty()) {
        std::cout << "No matching software found." << std::endl;
        return 0;
    }

    for (const auto &id : ids)
        printRecordLine(*index->record(id));

    return 0;
}

static void printIconDetails(const CatalogEntry &entry, CatalogLoader &loader, const CommandOptions &options)
{
    if (!entry.icon) {
        std::cout << "Icon:       none" << std::endl;
        return;
    }
    std::cout << std::format(
                     "Icon:       {} ({}, {}x{}@{})",
                     entry.icon->value,
                     as_icon_kind_to_string(entry.icon->kind),
                     entry.icon->width,
                     entry.icon->height,
                     entry.icon->scale)
              << std::endl;

    const auto icons = loader.iconLoader();
    if (!options.loadIcons || !icons)
        return;

    loader.waitForBackgroundTasks();
    const auto cached = icons->lookup(entry.id);
    if (cached && !cached->isPlaceholder())
        std::cout << std::format(
                         "            loaded, {}x{} pixels, {} channels ({})",
                         cached->width,
                         cached->height,
                         cached->channels,
                         cached->format)
                  << std::endl;
    else if (cached)
        std::cout << std::format("            not available: {}", cached->error) << std::endl;
    else
        std::cout << "            " << iconStateToString(icons->state(entry.id)) << std::endl;
}

static int commandInfo(const std::vector<std::string> &args, const CommandOptions &options)
{
    if (args.size() != 3) {
        std::cerr << "Invalid number of parameters: You need to specify a component ID." << std::endl;
        return 1;
    }

    LoadReport report;
    const auto loader = loadCatalog(options, report);
    if (!loader) {
        std::cerr << "Unable to load the software catalog." << std::endl;
        return 2;
    }

    const auto rec = loader->index()->record(args[2]);
    if (rec == nullptr) {
        std::cerr << std::format("No software with ID '{}' found.", args[2]) << std::endl;
        return 3;
    }
    const auto &entry = *rec->entry;

    printSectionBox(entry.name);
    std::cout << "ID:         " << entry.id << std::endl;
    std::cout << "Kind:       " << as_component_kind_to_string(entry.kind) << std::endl;
    std::cout << "Summary:    " << entry.summary << std::endl;
    std::cout << "Origin:     " << entry.origin << std::endl;
    std::cout << "Categories: " << Utils::joinStrings(entry.categories, ", ") << std::endl;
    printIconDetails(entry, *loader, options);

    std::cout << std::endl;
    std::cout << "Framework:  " << frameworkToString(rec->assessment.framework) << " ("
              << frameworkFamilyToString(frameworkFamily(rec->assessment.framework)) << ")" << std::endl;
    std::cout << "Display:    " << displaySupportToString(rec->assessment.displaySupport) << std::endl;
    std::cout << "Risk:       " << riskLevelToString(rec->assessment.risk) << std::endl;
    for (const auto &reason : rec->assessment.reasons)
        std::cout << "  - " << reason << std::endl;

    std::cout << std::endl;
    const std::optional<std::uint64_t> downloads = rec->stats ? std::optional(rec->stats->downloads) : std::nullopt;
    std::cout << "Downloads:  " << (downloads ? std::to_string(*downloads) : std::string("unknown")) << " ("
              << popularityTierToString(popularityTier(downloads)) << " popularity)" << std::endl;

    return 0;
}

static int commandClassify(const std::vector<std::string> &args, const CommandOptions &options)
{
    LoadReport report;
    const auto loader = loadCatalog(options, report);
    if (!loader) {
        std::cerr << "Unable to load the software catalog." << std::endl;
        return 2;
    }
    const auto index = loader->index();

    std::vector<const IndexRecord *> records;
    if (args.size() > 2) {
        for (std::size_t i = 2; i < args.size(); ++i) {
            const auto rec = index->record(args[i]);
            if (rec == nullptr) {
                std::cerr << std::format("No software with ID '{}' found.", args[i]) << std::endl;
                return 3;
            }
            records.push_back(rec);
        }
    } else {
        for (const auto &rec : index->records())
            records.push_back(&rec);
    }

    for (const auto rec : records) {
        std::cout << std::format(
                         "{:<40} {:<9} {:<12} {:<9} {}",
                         rec->id(),
                         riskLevelToString(rec->assessment.risk),
                         frameworkToString(rec->assessment.framework),
                         displaySupportToString(rec->assessment.displaySupport),
                         rec->assessment.reasons.back())
                  << std::endl;
    }

    return 0;
}

static int commandRefreshStats()
{
    auto stats = createStatsCache();
    if (!stats->loadLocal())
        logDebug("No usable local statistics, downloading them");
    if (!stats->canRefresh()) {
        std::cerr << "No statistics URL configured, or downloads are disabled." << std::endl;
        return 1;
    }

    const auto result = stats->refresh().get();
    if (!result.success) {
        std::cerr << std::format("Unable to refresh statistics: {}", result.error) << std::endl;
        return 2;
    }

    if (result.updated)
        std::cout << std::format(
                         "Downloaded statistics for {} applications (generated at {}).",
                         result.snapshot->entries.size(),
                         result.snapshot->generatedAt)
                  << std::endl;
    else
        std::cout << "Statistics are already up to date." << std::endl;

    return 0;
}

static int commandStatus(const CommandOptions &options)
{
    const auto &conf = Config::get();

    printSectionBox("Configuration");
    std::cout << "Cache directory:  " << conf.cacheDir().string() << std::endl;
    std::cout << "Catalog sources:  " << Utils::joinStrings(conf.catalogSources, ", ") << std::endl;
    std::cout << "Statistics URL:   " << (conf.stats.url.empty() ? "(none)" : conf.stats.url) << std::endl;

    LoadReport report;
    const auto loader = loadCatalog(options, report);

    printSectionBox("Catalog");
    std::cout << "Entries:          " << report.entriesParsed << std::endl;
    std::cout << "Skipped:          " << report.entriesSkipped << std::endl;
    std::cout << "Duplicates:       " << report.duplicates << std::endl;
    std::cout << "Failed documents: " << report.documentsFailed << std::endl;
    std::cout << "Statistics:       " << statsStateToString(report.statsState) << " (" << report.statsMerged
              << " entries merged)" << std::endl;
    if (report.statsRefreshStarted)
        std::cout << "                  refresh started in the background" << std::endl;
    std::cout << "Index generation: " << report.indexGeneration << std::endl;

    if (loader && options.loadIcons) {
        loader->waitForBackgroundTasks();
        const auto summary = loader->iconSummary();
        if (summary)
            std::cout << std::format(
                             "Icons:            {} loaded, {} placeholders", summary->loaded, summary->placeholders)
                      << std::endl;
    }

    return loader ? 0 : 2;
}

/**
 * Execute the specified command with the given arguments.
 */
static int executeCommand(const std::string &command, const std::vector<std::string> &args, const CommandOptions &options)
{
    if (command == "search")
        return commandSearch(args, options);
    if (command == "info")
        return commandInfo(args, options);
    if (command == "classify")
        return commandClassify(args, options);
    if (command == "refresh-stats")
        return commandRefreshStats();
    if (command == "status")
        return commandStatus(options);

    std::cerr << std::format("The command '{}' is unknown.", command) << std::endl;
    return 1;
}

static bool parseRiskList(const std::string &value, std::set<RiskLevel> &risks)
{
    for (const auto &part : Utils::splitString(value, ',')) {
        const auto risk = riskLevelFromString(Utils::trimString(part));
        if (!risk)
            return false;
        risks.insert(*risk);
    }
    return true;
}

static bool parseKindList(const std::string &value, std::set<AsComponentKind> &kinds)
{
    for (const auto &part : Utils::splitString(value, ',')) {
        const auto name = Utils::trimString(part);
        if (name == "all") {
            kinds.clear();
            return true;
        }
        const auto kind = as_component_kind_from_string(name.c_str());
        if (kind == AS_COMPONENT_KIND_UNKNOWN)
            return false;
        kinds.insert(kind);
    }
    return true;
}

/**
 * Main function
 */
int main(int argc, char **argv)
{
    gboolean verbose = FALSE;
    gboolean showHelp = FALSE;
    gboolean showVersion = FALSE;
    gboolean withIcons = FALSE;
    gint limit = 20;
    gint offset = 0;
    gint64 minDownloads = 0;
    g_autofree gchar *configFname = nullptr;
    g_autofree gchar *cacheDir = nullptr;
    g_autofree gchar *category = nullptr;
    g_autofree gchar *maxRisk = nullptr;
    g_autofree gchar *risks = nullptr;
    g_autofree gchar *kinds = nullptr;
    g_autofree gchar *sortMode = nullptr;

    // Initialize locale for proper UTF-8 handling
    if (!setlocale(LC_ALL, "")) {
        logInfo("No locale set, falling back to C.UTF-8.");
        if (!setlocale(LC_ALL, "C.UTF-8") && !setlocale(LC_ALL, "en_US.UTF-8"))
            logWarning("Warning: Could not set UTF-8 locale. UTF-8 text may be corrupted.");
    }
    // Make sure nothing localizes numbers by accident
    std::setlocale(LC_NUMERIC, "C");

#ifdef HAVE_BACKWARD
    backward::SignalHandling sh;
    if (sh.loaded())
        logDebug("Backward registered for stack-trace printing.");
#endif

    GOptionEntry entries[] = {
        {"help", 'h', 0, G_OPTION_ARG_NONE, &showHelp, "Show help options", nullptr},
        {"verbose", 0, 0, G_OPTION_ARG_NONE, &verbose, "Show extra debugging information", nullptr},
        {"version", 0, 0, G_OPTION_ARG_NONE, &showVersion, "Show the program version", nullptr},
        {"config", 'c', 0, G_OPTION_ARG_STRING, &configFname, "Use the given configuration file", "FILE"},
        {"cache-dir", 0, 0, G_OPTION_ARG_STRING, &cacheDir, "Override the cache directory", "DIR"},
        {"category", 0, 0, G_OPTION_ARG_STRING, &category, "Only show software in this category", "CATEGORY"},
        {"min-downloads", 0, 0, G_OPTION_ARG_INT64, &minDownloads, "Only show software with at least N downloads", "N"},
        {"max-risk", 0, 0, G_OPTION_ARG_STRING, &maxRisk, "Highest acceptable compatibility risk", "LEVEL"},
        {"risk", 0, 0, G_OPTION_ARG_STRING, &risks, "Comma-separated list of allowed risk levels", "LEVELS"},
        {"kind", 0, 0, G_OPTION_ARG_STRING, &kinds, "Comma-separated list of component types to show, or 'all' (default: desktop-application)", "TYPES"},
        {"sort", 0, 0, G_OPTION_ARG_STRING, &sortMode, "Order of search results: relevance, downloads, updated or risk", "MODE"},
        {"limit", 'n', 0, G_OPTION_ARG_INT, &limit, "Maximum number of search results", "N"},
        {"offset", 0, 0, G_OPTION_ARG_INT, &offset, "Skip the first N search results", "N"},
        {"with-icons", 0, 0, G_OPTION_ARG_NONE, &withIcons, "Load icons as well", nullptr},
        {nullptr}
    };

    g_autoptr(GError) error = nullptr;
    g_autoptr(GOptionContext) context = g_option_context_new("<subcommand> - AppStream Catalog");

    g_option_context_set_description(
        context,
        "Subcommands:\n"
        "  search [TERM ...]       - Search the catalog, an empty query lists the most popular software.\n"
        "  info ID                 - Show everything known about the software with the given ID.\n"
        "  classify [ID ...]       - Show the desktop compatibility assessment of the given (or all) software.\n"
        "  refresh-stats           - Download new popularity statistics.\n"
        "  status                  - Show the state of the catalog and its caches.\n");

    g_option_context_set_summary(context, "AppStream software catalog client");
    g_option_context_add_main_entries(context, entries, nullptr);
    g_option_context_set_help_enabled(context, TRUE);

    if (!g_option_context_parse(context, &argc, &argv, &error)) {
        std::cerr << "Unable to parse parameters: " << error->message << std::endl;
        return 1;
    }

    if (showHelp) {
        g_autofree gchar *helpText = g_option_context_get_help(context, TRUE, nullptr);
        std::cout << helpText << std::endl;
        return 0;
    }

    if (showVersion) {
        printVersion();
        return 0;
    }

    if (argc < 2) {
        std::cerr << "No subcommand specified!" << std::endl;
        g_autofree gchar *helpText = g_option_context_get_help(context, TRUE, nullptr);
        std::cerr << helpText << std::endl;
        return 1;
    }

    std::vector<std::string> args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i)
        args.emplace_back(argv[i]);

    // globally enable verbose mode, if requested
    if (verbose)
        setVerbose(true);

    CommandOptions options;
    options.loadIcons = withIcons;
    options.limit = limit > 0 ? static_cast<std::size_t>(limit) : 20;
    options.offset = offset > 0 ? static_cast<std::size_t>(offset) : 0;
    options.filters.minDownloads = minDownloads > 0 ? static_cast<std::uint64_t>(minDownloads) : 0;
    if (category)
        options.filters.category = std::string(category);
    if (maxRisk) {
        options.filters.maxRisk = riskLevelFromString(maxRisk);
        if (!options.filters.maxRisk) {
            std::cerr << std::format("Invalid risk level: {}", maxRisk) << std::endl;
            return 1;
        }
    }
    if (risks && !parseRiskList(risks, options.filters.allowedRisks)) {
        std::cerr << std::format("Invalid list of risk levels: {}", risks) << std::endl;
        return 1;
    }
    options.filters.kinds = {AS_COMPONENT_KIND_DESKTOP_APP};
    if (kinds) {
        options.filters.kinds.clear();
        if (!parseKindList(kinds, options.filters.kinds)) {
            std::cerr << std::format("Invalid list of component types: {}", kinds) << std::endl;
            return 1;
        }
    }
    if (sortMode) {
        const auto sort = sortModeFromString(sortMode);
        if (!sort) {
            std::cerr << std::format("Invalid sort order: {}", sortMode) << std::endl;
            return 1;
        }
        options.sort = *sort;
    }

    auto &conf = Config::get();
    const std::string cacheDirStr = cacheDir ? cacheDir : "";
    std::string configFilename;
    if (configFname)
        configFilename = configFname;
    else
        configFilename = fs::path(g_get_user_config_dir()) / "appstream-catalog" / "config.json";

    if (configFname || fs::exists(configFilename)) {
        try {
            conf.loadFromFile(configFilename, cacheDirStr);
        } catch (const std::exception &e) {
            std::cerr << std::format("Unable to load configuration: {}", e.what()) << std::endl;
            return 4;
        }
    } else {
        logDebug("No configuration file found at {}, using defaults.", configFilename);
        if (!cacheDirStr.empty())
            conf.setCacheDir(cacheDirStr);
    }

    int result = 0;
    if (isVerbose()) {
        result = executeCommand(args[1], args, options);
    } else {
        try {
            result = executeCommand(args[1], args, options);
        } catch (const std::exception &e) {
            std::cerr << std::format("Error executing command: {}", e.what()) << std::endl;
            result = 1;
        }
    }

    return result;
}
