/*
 * Copyright (C) 2025-2026 Matthias Klumpp <matthias@tenstral.net>
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include "logging.h"
#include "utils.h"
#include "catalog.h"
#include "catalogparser.h"
#include "compatclassifier.h"

using namespace ASCatalog;

static struct TestSetup {
    TestSetup()
    {
        setVerbose(true);
    }
} testSetup;

static CatalogEntry makeEntry(
    const std::string &id,
    std::vector<std::string> tags,
    std::vector<std::string> hints)
{
    CatalogEntry entry;
    entry.id = id;
    entry.name = id;
    entry.frameworkTags = std::move(tags);
    entry.dependencyHints = std::move(hints);
    return entry;
}

TEST_CASE("Framework detection", "[classifier]")
{
    SECTION("Flatpak runtimes by version")
    {
        REQUIRE(detectFramework(makeEntry("a", {"org.kde.Platform/x86_64/6.7"}, {})) == Framework::Qt6);
        REQUIRE(detectFramework(makeEntry("a", {"org.kde.Platform/x86_64/5.15-23.08"}, {})) == Framework::Qt5);
        REQUIRE(detectFramework(makeEntry("a", {"org.gnome.Platform/x86_64/46"}, {})) == Framework::GTK4);
        REQUIRE(detectFramework(makeEntry("a", {"org.gnome.Platform/x86_64/3.38"}, {})) == Framework::GTK3);
        REQUIRE(detectFramework(makeEntry("a", {"org.freedesktop.Platform/x86_64/23.08"}, {})) == Framework::Native);
    }

    SECTION("toolkit names")
    {
        REQUIRE(detectFramework(makeEntry("a", {"GTK3"}, {})) == Framework::GTK3);
        REQUIRE(detectFramework(makeEntry("a", {"gtk4"}, {})) == Framework::GTK4);
        REQUIRE(detectFramework(makeEntry("a", {}, {"libgtk-3.so.0"})) == Framework::GTK3);
        REQUIRE(detectFramework(makeEntry("a", {"Qt6"}, {})) == Framework::Qt6);
        REQUIRE(detectFramework(makeEntry("a", {}, {"libQt5Widgets.so.5"})) == Framework::Qt5);
        REQUIRE(detectFramework(makeEntry("a", {"Electron"}, {})) == Framework::Electron);
        REQUIRE(detectFramework(makeEntry("a", {}, {"libQt6WebEngineCore.so.6"})) == Framework::QtWebEngine);
    }

    SECTION("precedence")
    {
        // a browser engine beats everything else
        REQUIRE(
            detectFramework(makeEntry("a", {"org.kde.Platform/x86_64/6.7"}, {"libQt6WebEngineCore.so.6"}))
            == Framework::QtWebEngine);
        REQUIRE(detectFramework(makeEntry("a", {"org.freedesktop.Platform/x86_64/23.08", "electron"}, {}))
                == Framework::Electron);
        REQUIRE(detectFramework(makeEntry("a", {"gtk3", "qt6"}, {})) == Framework::Qt6);
        REQUIRE(detectFramework(makeEntry("a", {"gtk3", "gtk4"}, {})) == Framework::GTK4);
        REQUIRE(detectFramework(makeEntry("a", {"org.freedesktop.Platform/x86_64/23.08", "gtk3"}, {}))
                == Framework::GTK3);
    }

    SECTION("no signal")
    {
        REQUIRE(detectFramework(makeEntry("a", {}, {})) == Framework::Unknown);
        REQUIRE(detectFramework(makeEntry("a", {"app/org.example.A/x86_64/stable"}, {"socket=wayland"}))
                == Framework::Unknown);
    }

    SECTION("the deciding signal is reported")
    {
        std::string signal;
        detectFramework(makeEntry("a", {"app/a", "org.kde.Platform/x86_64/6.7"}, {}), &signal);
        REQUIRE(signal == "org.kde.Platform/x86_64/6.7");
    }
}

TEST_CASE("Display server support detection", "[classifier]")
{
    REQUIRE(detectDisplaySupport(makeEntry("a", {}, {"socket=wayland"})) == DisplaySupport::Native);
    REQUIRE(detectDisplaySupport(makeEntry("a", {}, {"socket=wayland", "socket=fallback-x11"}))
            == DisplaySupport::Fallback);
    REQUIRE(detectDisplaySupport(makeEntry("a", {}, {"socket=x11", "socket=wayland"})) == DisplaySupport::Fallback);
    REQUIRE(detectDisplaySupport(makeEntry("a", {}, {"socket=x11"})) == DisplaySupport::X11Only);
    REQUIRE(detectDisplaySupport(makeEntry("a", {}, {"socket=pulseaudio"})) == DisplaySupport::Unknown);
    REQUIRE(detectDisplaySupport(makeEntry("a", {}, {})) == DisplaySupport::Unknown);
}

TEST_CASE("Risk rules", "[classifier]")
{
    struct RuleCase {
        std::vector<std::string> tags;
        std::vector<std::string> hints;
        RiskLevel risk;
        std::string reason;
    };

    const std::vector<RuleCase> cases = {
        {{"gtk4"},                               {"socket=x11"},                       RiskLevel::Critical, "x11-only"                            },
        {{"electron"},                           {"socket=x11"},                       RiskLevel::Critical, "x11-only"                            },
        {{},                                     {"libQt6WebEngineCore.so.6"},         RiskLevel::High,     "browser-embedded-runtime:qtwebengine"},
        {{"electron"},                           {"socket=wayland"},                   RiskLevel::High,     "browser-embedded-runtime:electron"   },
        {{"org.kde.Platform/x86_64/6.7"},        {"socket=wayland"},                   RiskLevel::Medium,   "cross-platform-toolkit:qt6"          },
        {{"org.gnome.Platform/x86_64/46"},       {"socket=wayland", "socket=x11"},     RiskLevel::Medium,   "x11-fallback"                        },
        {{"org.kde.Platform/x86_64/6.7"},        {"socket=wayland", "socket=fallback-x11"}, RiskLevel::Medium, "x11-fallback"                    },
        {{"qt5"},                                {"socket=wayland"},                   RiskLevel::Medium,   "cross-platform-toolkit:qt5"          },
        {{"gtk3"},                               {"socket=wayland"},                   RiskLevel::Low,      "legacy-toolkit-v3:gtk3"              },
        {{"org.gnome.Platform/x86_64/46"},       {"socket=wayland"},                   RiskLevel::Low,      "modern-toolkit-v4:gtk4"              },
        {{"org.freedesktop.Platform/x86_64/23.08"}, {"socket=wayland"},                RiskLevel::Low,      "native-wayland"                      },
    };

    for (const auto &c : cases) {
        const auto entry = makeEntry("org.example.Test", c.tags, c.hints);
        const auto res = classifyEntry(entry);
        INFO("tags: " << Utils::joinStrings(c.tags, ",") << " hints: " << Utils::joinStrings(c.hints, ","));
        CHECK(res.risk == c.risk);
        REQUIRE(!res.reasons.empty());
        CHECK(res.reasons.back() == c.reason);
    }
}

TEST_CASE("Entries without any signal are never rated low", "[classifier]")
{
    const auto noSignal = classifyEntry(makeEntry("org.example.Plain", {}, {}));
    REQUIRE(noSignal.risk == RiskLevel::Medium);
    REQUIRE(noSignal.framework == Framework::Unknown);
    REQUIRE(noSignal.displaySupport == DisplaySupport::Unknown);
    REQUIRE(noSignal.reasons.back() == "unclassified");

    // a known toolkit without display information is not enough either
    const auto gtkOnly = classifyEntry(makeEntry("org.example.Gtk", {"gtk4"}, {}));
    REQUIRE(gtkOnly.risk == RiskLevel::Medium);
    REQUIRE(gtkOnly.reasons.back() == "unclassified");
}

TEST_CASE("Assessment contents", "[classifier]")
{
    const auto res = classifyEntry(makeEntry("org.kde.Test", {"org.kde.Platform/x86_64/6.7"}, {"socket=wayland"}));
    REQUIRE(res.id == "org.kde.Test");
    REQUIRE(res.framework == Framework::Qt6);
    REQUIRE(res.displaySupport == DisplaySupport::Native);
    REQUIRE(res.reasons.size() == 3);
    REQUIRE(res.reasons[0] == "framework:qt6 (org.kde.Platform/x86_64/6.7)");
    REQUIRE(res.reasons[1] == "display:native");
    REQUIRE(res.reasons[2] == "cross-platform-toolkit:qt6");
    REQUIRE(frameworkFamily(res.framework) == FrameworkFamily::CrossPlatformToolkit);
}

TEST_CASE("Classification is deterministic", "[classifier]")
{
    CatalogParser parser;
    parser.parseFile(Utils::getTestSamplesDir() / "catalog-basic.xml");
    const Catalog catalog(parser.takeResult().entries);

    const auto first = classifyCatalog(catalog);
    const auto second = classifyCatalog(catalog);

    // one assessment per entry, in catalog order
    REQUIRE(first.size() == catalog.size());
    for (std::size_t i = 0; i < catalog.size(); ++i) {
        REQUIRE(first[i].id == catalog.entries()[i].id);
        REQUIRE(first[i] == second[i]);
        REQUIRE(first[i] == classifyEntry(catalog.entries()[i]));
    }

    const auto calc = classifyEntry(*catalog.find("org.gnome.Calculator"));
    REQUIRE(calc.framework == Framework::GTK4);
    REQUIRE(calc.displaySupport == DisplaySupport::Fallback);
    REQUIRE(calc.risk == RiskLevel::Medium);

    const auto chat = classifyEntry(*catalog.find("com.example.ChatClient"));
    REQUIRE(chat.risk == RiskLevel::Critical);

    const auto browser = classifyEntry(*catalog.find("com.example.Browser"));
    REQUIRE(browser.framework == Framework::QtWebEngine);
    REQUIRE(browser.risk == RiskLevel::High);
}

TEST_CASE("Enum string conversions", "[classifier]")
{
    REQUIRE(riskLevelToString(RiskLevel::Critical) == "critical");
    REQUIRE(riskLevelFromString("HIGH") == RiskLevel::High);
    REQUIRE(riskLevelFromString("low") == RiskLevel::Low);
    REQUIRE_FALSE(riskLevelFromString("extreme").has_value());
    REQUIRE(frameworkFamilyToString(frameworkFamily(Framework::GTK3)) == "legacy-toolkit-v3");
    REQUIRE(frameworkFamilyToString(frameworkFamily(Framework::Electron)) == "browser-embedded-runtime");
    REQUIRE(displaySupportToString(DisplaySupport::X11Only) == "x11-only");
}
