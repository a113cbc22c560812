/*
 * Copyright (C) 2025-2026 Matthias Klumpp <matthias@tenstral.net>
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <atomic>
#include <latch>
#include <thread>
#include <chrono>
#include <format>
#include <future>
#include <filesystem>

#include "utils.h"
#include "logging.h"
#include "catalog.h"
#include "iconloader.h"

using namespace ASCatalog;
using namespace std::chrono_literals;

static struct TestSetup {
    TestSetup()
    {
        setVerbose(true);
    }
} testSetup;

static fs::path iconSamplesDir()
{
    return Utils::getTestSamplesDir() / "icons";
}

static FetchedIcon sampleIcon(const std::string &sizeDir, const std::string &name)
{
    const auto path = iconSamplesDir() / "test-origin" / sizeDir / name;
    return FetchedIcon{Utils::getFileContents(path.string()), path.string()};
}

static IconRequest makeRequest(const std::string &id, AsIconKind kind = AS_ICON_KIND_CACHED)
{
    IconRequest req;
    req.id = id;
    req.origin = "test-origin";
    req.icon.kind = kind;
    req.icon.value = id + ".png";
    req.icon.width = 64;
    req.icon.height = 64;
    return req;
}

/**
 * Serves the good sample icon for every ID starting with "good",
 * and fails for everything else.
 */
class FakeIconFetcher : public IconFetcher
{
public:
    FetchedIcon fetch(const IconRequest &request) override
    {
        fetches++;
        const auto nowActive = ++active;
        auto prevMax = maxActive.load();
        while (nowActive > prevMax && !maxActive.compare_exchange_weak(prevMax, nowActive)) { }

        if (started != nullptr)
            started->count_down();
        if (gate != nullptr)
            gate->wait();
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);

        active--;
        if (!request.id.starts_with("good"))
            throw std::runtime_error(std::format("no icon for {}", request.id));
        return sampleIcon("64x64", "org.example.Good.png");
    }

    std::atomic<int> fetches = 0;
    std::atomic<int> active = 0;
    std::atomic<int> maxActive = 0;
    std::chrono::milliseconds delay{0};
    std::latch *started = nullptr;
    std::latch *gate = nullptr;
};

TEST_CASE("Decoding icon data", "[icons]")
{
    SECTION("image of the right size")
    {
        const auto entry = decodeIconData("org.example.Good", sampleIcon("64x64", "org.example.Good.png"), ImageSize(64));
        REQUIRE(entry.id == "org.example.Good");
        REQUIRE(entry.state == IconState::Ready);
        REQUIRE_FALSE(entry.isPlaceholder());
        REQUIRE(entry.width == 64);
        REQUIRE(entry.height == 64);
        REQUIRE(entry.channels == 4);
        REQUIRE(entry.rowstride >= 64 * 4);
        REQUIRE(entry.pixels.size() >= static_cast<std::size_t>(entry.rowstride) * 63 + 64 * 4);
        REQUIRE(entry.format == "png");
    }

    SECTION("large images are scaled down")
    {
        const auto entry = decodeIconData("org.example.Large", sampleIcon("128x128", "org.example.Large.png"), ImageSize(64));
        REQUIRE(entry.width == 64);
        REQUIRE(entry.height == 64);
    }

    SECTION("small images are not scaled up")
    {
        const auto entry = decodeIconData(
            "org.example.Good",
            sampleIcon("64x64", "org.example.Good.png"),
            ImageSize(64, 64, 2));
        REQUIRE(entry.width == 64);
        REQUIRE(entry.height == 64);
    }

    SECTION("broken image data")
    {
        REQUIRE_THROWS_AS(
            decodeIconData("org.example.Corrupt", sampleIcon("64x64", "org.example.Corrupt.png"), ImageSize(64)),
            std::runtime_error);
        REQUIRE_THROWS_AS(decodeIconData("org.example.Empty", FetchedIcon{{}, "empty.png"}, ImageSize(64)), std::runtime_error);
    }
}

TEST_CASE("Finding icons on disk", "[icons]")
{
    DefaultIconFetcher fetcher({iconSamplesDir()}, {}, ImageSize(64), 5s, false);

    SECTION("cached icon of the requested size")
    {
        const auto path = fetcher.findCachedIcon(makeRequest("org.example.Good"));
        REQUIRE(path.has_value());
        REQUIRE(*path == iconSamplesDir() / "test-origin" / "64x64" / "org.example.Good.png");

        const auto icon = fetcher.fetch(makeRequest("org.example.Good"));
        REQUIRE_FALSE(icon.data.empty());
        REQUIRE(icon.filename == path->string());
    }

    SECTION("cached icon of another size")
    {
        const auto path = fetcher.findCachedIcon(makeRequest("org.example.Large"));
        REQUIRE(path.has_value());
        REQUIRE(*path == iconSamplesDir() / "test-origin" / "128x128" / "org.example.Large.png");
    }

    SECTION("missing icons")
    {
        REQUIRE_FALSE(fetcher.findCachedIcon(makeRequest("org.example.Missing")).has_value());
        REQUIRE_THROWS_AS(fetcher.fetch(makeRequest("org.example.Missing")), std::runtime_error);

        auto otherOrigin = makeRequest("org.example.Good");
        otherOrigin.origin = "other-origin";
        REQUIRE_FALSE(fetcher.findCachedIcon(otherOrigin).has_value());
    }

    SECTION("local icons need an absolute path")
    {
        auto local = makeRequest("org.example.Local", AS_ICON_KIND_LOCAL);
        local.icon.value = (iconSamplesDir() / "test-origin" / "64x64" / "org.example.Good.png").string();
        REQUIRE_FALSE(fetcher.fetch(local).data.empty());

        local.icon.value = "icons/org.example.Good.png";
        REQUIRE_THROWS_AS(fetcher.fetch(local), std::runtime_error);
    }

    SECTION("stock and remote icons")
    {
        // no icon themes configured
        auto stock = makeRequest("org.example.Stock", AS_ICON_KIND_STOCK);
        stock.icon.value = "accessories-calculator";
        REQUIRE_FALSE(fetcher.findStockIcon("accessories-calculator").has_value());
        REQUIRE_THROWS_AS(fetcher.fetch(stock), std::runtime_error);

        // downloads are disabled for this fetcher
        auto remote = makeRequest("org.example.Remote", AS_ICON_KIND_REMOTE);
        remote.icon.value = "https://example.org/icons/remote.png";
        REQUIRE_THROWS_AS(fetcher.fetch(remote), std::runtime_error);
    }
}

TEST_CASE("Icon requests for catalog entries", "[icons]")
{
    CatalogEntry entry;
    entry.id = "org.example.App";
    entry.origin = "test-origin";
    REQUIRE_FALSE(iconRequestForEntry(entry).has_value());

    entry.icon = IconReference{AS_ICON_KIND_CACHED, "org.example.App.png", 64, 64, 1};
    const auto req = iconRequestForEntry(entry);
    REQUIRE(req.has_value());
    REQUIRE(req->id == "org.example.App");
    REQUIRE(req->origin == "test-origin");
    REQUIRE(req->icon == *entry.icon);

    entry.icon->value.clear();
    REQUIRE_FALSE(iconRequestForEntry(entry).has_value());
}

TEST_CASE("Loading icon batches", "[icons]")
{
    auto fetcher = std::make_shared<FakeIconFetcher>();
    IconLoader loader(fetcher, 4);
    REQUIRE(loader.workers() == 4);

    const std::vector<IconRequest> requests = {
        makeRequest("good.one"),
        makeRequest("bad.one"),
        makeRequest("good.two"),
    };

    const auto summary = loader.load(requests);
    REQUIRE(summary.requested == 3);
    REQUIRE(summary.loaded == 2);
    REQUIRE(summary.placeholders == 1);
    REQUIRE(summary.reused == 0);
    REQUIRE(summary.skipped == 0);
    REQUIRE(fetcher->fetches.load() == 3);

    // one failure does not affect the others
    REQUIRE(loader.state("good.one") == IconState::Ready);
    REQUIRE(loader.state("good.two") == IconState::Ready);
    REQUIRE(loader.state("bad.one") == IconState::Placeholder);
    REQUIRE(loader.state("unknown") == IconState::Absent);
    REQUIRE(loader.size() == 3);

    const auto bad = loader.lookup("bad.one");
    REQUIRE(bad != nullptr);
    REQUIRE(bad->isPlaceholder());
    REQUIRE(bad->pixels.empty());
    REQUIRE_FALSE(bad->error.empty());
    REQUIRE(loader.lookup("unknown") == nullptr);

    SECTION("loaded icons are reused")
    {
        const auto again = loader.load(requests);
        REQUIRE(again.reused == 3);
        REQUIRE(again.loaded == 0);
        REQUIRE(fetcher->fetches.load() == 3);
        REQUIRE(loader.lookup("good.one") == loader.lookup("good.one"));
    }

    SECTION("invalidated icons are loaded again")
    {
        const auto before = loader.lookup("good.one");
        loader.invalidate("good.one");
        REQUIRE(loader.state("good.one") == IconState::Absent);
        REQUIRE(loader.lookup("good.one") == nullptr);

        const auto again = loader.load(requests);
        REQUIRE(again.loaded == 1);
        REQUIRE(again.reused == 2);
        REQUIRE(fetcher->fetches.load() == 4);
        REQUIRE(loader.lookup("good.one") != before);
    }

    SECTION("clearing the cache")
    {
        loader.clear();
        REQUIRE(loader.size() == 0);
        REQUIRE(loader.state("bad.one") == IconState::Absent);
    }
}

TEST_CASE("Icon loading respects the worker limit", "[icons]")
{
    auto fetcher = std::make_shared<FakeIconFetcher>();
    fetcher->delay = 10ms;
    IconLoader loader(fetcher, 3);

    std::vector<IconRequest> requests;
    for (int i = 0; i < 24; ++i)
        requests.push_back(makeRequest(std::format("good.{}", i)));

    const auto summary = loader.load(requests);
    REQUIRE(summary.loaded == 24);
    REQUIRE(fetcher->maxActive.load() >= 1);
    REQUIRE(fetcher->maxActive.load() <= 3);
}

TEST_CASE("Cancelled icon batches", "[icons]")
{
    auto fetcher = std::make_shared<FakeIconFetcher>();
    IconLoader loader(fetcher, 2);

    std::stop_source stopSource;
    stopSource.request_stop();

    const auto summary = loader.load({makeRequest("good.one"), makeRequest("good.two")}, stopSource.get_token());
    REQUIRE(summary.requested == 2);
    REQUIRE(summary.skipped == 2);
    REQUIRE(summary.loaded == 0);
    REQUIRE(fetcher->fetches.load() == 0);
    REQUIRE(loader.state("good.one") == IconState::Absent);
    REQUIRE(loader.size() == 0);

    // a later batch still loads them
    const auto later = loader.load({makeRequest("good.one")});
    REQUIRE(later.loaded == 1);
}

TEST_CASE("Loading icons in the background", "[icons]")
{
    auto fetcher = std::make_shared<FakeIconFetcher>();
    std::latch started(1);
    std::latch gate(1);
    fetcher->started = &started;
    fetcher->gate = &gate;

    IconLoader loader(fetcher, 1);

    SECTION("pending icons become ready")
    {
        auto future = loader.loadAsync({makeRequest("good.one")});
        started.wait();
        REQUIRE(loader.state("good.one") == IconState::Pending);

        // requesting it again while it loads does not fetch twice
        auto dup = std::async(std::launch::async, [&]() {
            return loader.load({makeRequest("good.one")});
        });
        const auto dupSummary = dup.get();
        gate.count_down();

        const auto summary = future.get();
        REQUIRE(summary.loaded == 1);
        REQUIRE(dupSummary.reused == 1);
        REQUIRE(fetcher->fetches.load() == 1);
        REQUIRE(loader.state("good.one") == IconState::Ready);
    }

    SECTION("results of a cleared cache are dropped")
    {
        auto future = loader.loadAsync({makeRequest("good.one")});
        started.wait();
        loader.clear();
        gate.count_down();

        const auto summary = future.get();
        REQUIRE(summary.loaded == 1);
        REQUIRE(loader.state("good.one") == IconState::Absent);
        REQUIRE(loader.size() == 0);
    }
}

TEST_CASE("Finished background batches release their threads", "[icons]")
{
    auto fetcher = std::make_shared<FakeIconFetcher>();
    IconLoader loader(fetcher, 2);

    for (int i = 0; i < 50; ++i) {
        auto future = loader.loadAsync({makeRequest(std::format("good.{}", i)), makeRequest(std::format("bad.{}", i))});
        const auto summary = future.get();
        REQUIRE(summary.loaded == 1);
        REQUIRE(summary.placeholders == 1);

        // only the batch just started is still held
        REQUIRE(loader.backgroundBatches() == 1);
    }

    REQUIRE(loader.size() == 100);
    REQUIRE(fetcher->fetches.load() == 100);
}
