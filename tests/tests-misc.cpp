/*
 * Copyright (C) 2025-2026 Matthias Klumpp <matthias@tenstral.net>
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <fstream>
#include <filesystem>
#include <thread>

#include "logging.h"
#include "utils.h"
#include "config.h"
#include "zarchive.h"

using namespace ASCatalog;
using namespace ASCatalog::Utils;

static struct TestSetup {
    TestSetup()
    {
        // Enable verbose logging for tests
        setVerbose(true);
    }
} testSetup;

TEST_CASE("Compressed empty file decompresses to empty string", "[zarchive]")
{
    // gzip-compressed empty file
    std::vector<uint8_t> emptyGz = {
        0x1f, 0x8b, 0x08, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0x65, 0x6d, 0x70,
        0x74, 0x79, 0x00, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    REQUIRE(isCompressedData(emptyGz));
    REQUIRE(decompressData(emptyGz) == "");
}

TEST_CASE("Detecting compressed data", "[zarchive]")
{
    const std::vector<uint8_t> plain = {'<', '?', 'x', 'm', 'l'};
    REQUIRE_FALSE(isCompressedData(plain));
    REQUIRE_FALSE(isCompressedData({}));
    REQUIRE_FALSE(isCompressedData({0x1f}));

    // plain data is passed through
    REQUIRE(decompressData(plain) == "<?xml");

    const auto gz = getFileContents((getTestSamplesDir() / "catalog-basic.xml.gz").string());
    const auto xml = getFileContents((getTestSamplesDir() / "catalog-basic.xml").string());
    REQUIRE(isCompressedData(gz));
    REQUIRE(decompressData(gz) == std::string(xml.begin(), xml.end()));
}

TEST_CASE("Streaming compressed documents", "[zarchive]")
{
    const auto xml = getFileContents((getTestSamplesDir() / "catalog-basic.xml").string());
    const std::string expected(xml.begin(), xml.end());

    auto readAll = [](ArchiveStream &stream) {
        std::string result;
        // small buffer, so we read in many steps
        char buf[64];
        std::size_t len;
        while ((len = stream.read(buf, sizeof(buf))) > 0)
            result.append(buf, len);
        return result;
    };

    SECTION("from a file")
    {
        ArchiveStream stream;
        REQUIRE_FALSE(stream.isOpen());
        stream.open((getTestSamplesDir() / "catalog-basic.xml.gz").string());
        REQUIRE(stream.isOpen());
        REQUIRE(readAll(stream) == expected);

        // reading past the end keeps returning nothing
        char buf[8];
        REQUIRE(stream.read(buf, sizeof(buf)) == 0);
        stream.close();
        REQUIRE_FALSE(stream.isOpen());
    }

    SECTION("uncompressed file")
    {
        ArchiveStream stream;
        stream.open((getTestSamplesDir() / "catalog-basic.xml").string());
        REQUIRE(readAll(stream) == expected);
    }

    SECTION("from memory")
    {
        const auto gz = getFileContents((getTestSamplesDir() / "catalog-basic.xml.gz").string());
        ArchiveStream stream;
        stream.openMemory(gz.data(), gz.size());
        REQUIRE(readAll(stream) == expected);
    }

    SECTION("missing file")
    {
        ArchiveStream stream;
        REQUIRE_THROWS(stream.open((getTestSamplesDir() / "does-not-exist.xml.gz").string()));
    }
}

TEST_CASE("Utils: getFileContents and writeFileAtomic", "[utils]")
{
    const auto tmpDir = fs::temp_directory_path() / ("ascat-misc-" + randomString(6));
    fs::create_directories(tmpDir);
    const auto fname = tmpDir / "data.bin";

    const std::vector<std::uint8_t> data = {0x00, 0x01, 0xFE, 'a', 'b', '\n'};
    writeFileAtomic(fname, data);
    REQUIRE(getFileContents(fname.string()) == data);

    // replacing the file leaves no temporary files behind
    writeFileAtomic(fname, {'x'});
    REQUIRE(getFileContents(fname.string()) == std::vector<std::uint8_t>{'x'});
    std::size_t fileCount = 0;
    for ([[maybe_unused]] const auto &e : fs::directory_iterator(tmpDir))
        fileCount++;
    REQUIRE(fileCount == 1);

    REQUIRE_THROWS_AS(getFileContents((tmpDir / "missing").string()), std::runtime_error);
    REQUIRE(existsAndIsDir(tmpDir.string()));
    REQUIRE_FALSE(existsAndIsDir(fname.string()));

    fs::remove_all(tmpDir);
}

TEST_CASE("Utils: string helpers", "[utils]")
{
    REQUIRE(toLower("Org.KDE.Kate") == "org.kde.kate");
    REQUIRE(trimString("  \tGNOME Calculator \n") == "GNOME Calculator");
    REQUIRE(trimString("   ").empty());
    REQUIRE(joinStrings({"a", "b", "c"}, ", ") == "a, b, c");
    REQUIRE(joinStrings({}, ",").empty());
    REQUIRE(splitWhitespace("  text   editor\tpro ") == std::vector<std::string>{"text", "editor", "pro"});
    REQUIRE(splitWhitespace("   ").empty());

    REQUIRE(isRemote("https://example.org/catalog.xml.gz"));
    REQUIRE(isRemote("http://example.org"));
    REQUIRE_FALSE(isRemote("/usr/share/swcatalog/xml/debian.xml.gz"));
    REQUIRE_FALSE(isRemote("catalog.xml"));

    REQUIRE(filenameFromURI("https://example.org/data/catalog.xml.gz?version=2#top") == "catalog.xml.gz");
    REQUIRE(filenameFromURI("https://example.org/stats/popularity-stats.bin") == "popularity-stats.bin");

    REQUIRE(randomString(12).size() == 12);
    REQUIRE(randomString(12) != randomString(12));
}

TEST_CASE("Forwarding log messages to a handler", "[logging]")
{
    std::vector<std::pair<LogSeverity, std::string>> messages;
    setLogHandler([&](LogSeverity severity, const std::string &msg) {
        messages.emplace_back(severity, msg);
    });

    logInfo("Loaded {} entries", 42);
    logWarning("Something is odd");
    setVerbose(false);
    logDebug("not shown");
    setVerbose(true);
    logDebug("shown: {}", "yes");
    setLogHandler(nullptr);
    logInfo("This goes to stdout again");

    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0].first == LogSeverity::INFO);
    REQUIRE(messages[0].second == "Loaded 42 entries");
    REQUIRE(messages[1].first == LogSeverity::WARNING);
    REQUIRE(messages[2].second == "shown: yes");
    REQUIRE(logSeverityToString(LogSeverity::ERROR) == "ERROR");
}

TEST_CASE("Image size operations", "[utils][imagesize]")
{
    SECTION("ImageSize construction and comparison")
    {
        ImageSize size1(64);
        ImageSize size2(64, 64, 1);
        ImageSize size3(64, 64, 2); // HiDPI
        ImageSize size4(128);

        REQUIRE(size1 == size2);
        REQUIRE(size1 != size3);
        REQUIRE(size1 != size4);
        REQUIRE(size3 != size4);
        REQUIRE(size1 == DefaultIconSize);
    }

    SECTION("ImageSize string representation")
    {
        REQUIRE(ImageSize(64).toString() == "64x64");
        REQUIRE(ImageSize(128, 128, 2).toString() == "128x128@2");

        ImageSize size3("64x64");
        REQUIRE(size3.width == 64);
        REQUIRE(size3.height == 64);
        REQUIRE(size3.scale == 1);

        ImageSize size4("128x128@2");
        REQUIRE(size4.width == 128);
        REQUIRE(size4.height == 128);
        REQUIRE(size4.scale == 2);
        REQUIRE(size4.toInt() == 256);
    }

    SECTION("ImageSize ordering")
    {
        ImageSize small(48);
        ImageSize medium(64);
        ImageSize large(128);
        ImageSize mediumHiDPI(64, 64, 2);

        REQUIRE(small < medium);
        REQUIRE(medium < large);
        REQUIRE(medium < mediumHiDPI); // Same size but higher scale
    }
}

TEST_CASE("Loading the configuration", "[config]")
{
    auto &conf = Config::get();
    const auto samplesDir = fs::absolute(getTestSamplesDir());
    const auto configFile = (samplesDir / "ascat-config.json").string();

    SECTION("values from the sample file")
    {
        conf.loadFromFile(configFile);

        REQUIRE(conf.cacheDir() == fs::path("/tmp/ascat-test-cache"));
        REQUIRE(conf.statsCacheFile() == fs::path("/tmp/ascat-test-cache/popularity-stats.bin"));
        REQUIRE(conf.catalogDownloadDir() == fs::path("/tmp/ascat-test-cache/catalog"));

        // relative paths are resolved against the configuration file
        REQUIRE(conf.catalogSources.size() == 3);
        REQUIRE(conf.catalogSources[0] == (samplesDir / "catalog-basic.xml").string());
        REQUIRE(conf.catalogSources[1] == (samplesDir / "catalog-second.xml").string());
        REQUIRE(conf.catalogSources[2] == "https://example.org/catalog.xml.gz");
        REQUIRE(conf.iconRoots == std::vector<fs::path>{samplesDir / "icons"});
        REQUIRE(conf.iconThemeDirs == std::vector<fs::path>{"/usr/share/icons"});

        REQUIRE(conf.stats.url == "https://example.org/stats/popularity-stats.bin");
        REQUIRE(conf.stats.metadataUrl == "https://example.org/stats/metadata.json");
        REQUIRE(conf.stats.maxAge == std::chrono::days(14));
        REQUIRE(conf.stats.entryMaxAge == std::chrono::days(90));

        REQUIRE(conf.icons.size == ImageSize(128, 128, 2));
        REQUIRE(conf.icons.workers == 8);
        REQUIRE(conf.icons.timeout == std::chrono::seconds(5));

        REQUIRE_FALSE(conf.feature.loadIcons);
        REQUIRE(conf.feature.refreshStats);
        REQUIRE_FALSE(conf.feature.noDownloads);
    }

    SECTION("enforced cache directory")
    {
        conf.loadFromFile(configFile, "/tmp/ascat-other-cache");
        REQUIRE(conf.cacheDir() == fs::path("/tmp/ascat-other-cache"));
        REQUIRE(conf.statsCacheFile() == fs::path("/tmp/ascat-other-cache/popularity-stats.bin"));
    }

    SECTION("paths relative to the configuration file")
    {
        const auto tmpDir = fs::temp_directory_path() / ("ascat-conf-" + randomString(6));
        fs::create_directories(tmpDir);

        const auto relConf = tmpDir / "relative.json";
        {
            std::ofstream f(relConf);
            f << R"({"CacheDir": "cache", "IconThemeDirs": ["themes", "/usr/share/icons"],)"
              << R"( "Stats": {"BundledFile": "data/stats.bin"}})";
        }
        conf.loadFromFile(relConf.string());
        REQUIRE(conf.cacheDir() == tmpDir / "cache");
        REQUIRE(conf.iconThemeDirs == std::vector<fs::path>{tmpDir / "themes", "/usr/share/icons"});
        REQUIRE(conf.stats.bundledFile == tmpDir / "data" / "stats.bin");

        // an empty cache directory keeps the default
        conf.resetDefaults();
        const auto defaultCacheDir = conf.cacheDir();
        const auto emptyConf = tmpDir / "empty-cache.json";
        {
            std::ofstream f(emptyConf);
            f << R"({"CacheDir": ""})";
        }
        conf.loadFromFile(emptyConf.string());
        REQUIRE(conf.cacheDir() == defaultCacheDir);
        REQUIRE(conf.stats.bundledFile.empty());

        fs::remove_all(tmpDir);
    }

    SECTION("features depending on each other")
    {
        const auto tmpDir = fs::temp_directory_path() / ("ascat-conf-" + randomString(6));
        fs::create_directories(tmpDir);

        const auto noNetConf = tmpDir / "nonet.json";
        {
            std::ofstream f(noNetConf);
            f << R"({"Stats": {"Url": "https://example.org/s.bin"}, "Features": {"noDownloads": true}})";
        }
        conf.loadFromFile(noNetConf.string());
        REQUIRE(conf.feature.noDownloads);
        REQUIRE_FALSE(conf.feature.refreshStats);

        // without a statistics URL there is nothing to refresh
        const auto noStatsConf = tmpDir / "nostats.json";
        {
            std::ofstream f(noStatsConf);
            f << R"({"Icons": {"Workers": 0, "Size": "huge"}})";
        }
        conf.loadFromFile(noStatsConf.string());
        REQUIRE_FALSE(conf.feature.refreshStats);
        REQUIRE(conf.feature.loadIcons);
        // invalid values fall back to the defaults
        REQUIRE(conf.icons.workers == IconSettings().workers);
        REQUIRE(conf.icons.size == DefaultIconSize);

        const auto brokenConf = tmpDir / "broken.json";
        {
            std::ofstream f(brokenConf);
            f << "{ this is not json";
        }
        REQUIRE_THROWS_AS(conf.loadFromFile(brokenConf.string()), std::runtime_error);
        REQUIRE_THROWS_AS(conf.loadFromFile((tmpDir / "missing.json").string()), std::runtime_error);

        fs::remove_all(tmpDir);
    }

    conf.resetDefaults();
    REQUIRE(conf.icons.size == DefaultIconSize);
    REQUIRE(conf.feature.loadIcons);
}
