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

#include "compatclassifier.h"

#include <array>
#include <charconv>
#include <format>
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include "utils.h"

namespace ASCatalog
{

namespace
{

struct ClassificationRule {
    std::optional<DisplaySupport> support;
    std::optional<Framework> framework;
    RiskLevel risk;
    std::string_view reason;
};

/**
 * The ordered rule table, the first matching rule decides the risk.
 * Entries that match no rule at all are rated Medium ("unclassified"):
 * the absence of any signal is no evidence of a well-behaving application.
 */
constexpr std::array<ClassificationRule, 9> ClassificationRules = {{
    {DisplaySupport::X11Only, std::nullopt, RiskLevel::Critical, "x11-only"},
    {std::nullopt, Framework::QtWebEngine, RiskLevel::High, "browser-embedded-runtime:qtwebengine"},
    {std::nullopt, Framework::Electron, RiskLevel::High, "browser-embedded-runtime:electron"},
    {DisplaySupport::Native, Framework::Qt6, RiskLevel::Medium, "cross-platform-toolkit:qt6"},
    {DisplaySupport::Fallback, std::nullopt, RiskLevel::Medium, "x11-fallback"},
    {DisplaySupport::Native, Framework::Qt5, RiskLevel::Medium, "cross-platform-toolkit:qt5"},
    {DisplaySupport::Native, Framework::GTK3, RiskLevel::Low, "legacy-toolkit-v3:gtk3"},
    {DisplaySupport::Native, Framework::GTK4, RiskLevel::Low, "modern-toolkit-v4:gtk4"},
    {DisplaySupport::Native, Framework::Native, RiskLevel::Low, "native-wayland"},
}};

constexpr std::string_view UnclassifiedReason = "unclassified";

bool contains(const std::string &haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string::npos;
}

/**
 * Read the major version of a Flatpak runtime reference like
 * "org.kde.Platform/x86_64/6.7" if `signal` refers to `runtimeName`.
 */
std::optional<int> runtimeMajorVersion(const std::string &signal, std::string_view runtimeName)
{
    const auto pos = signal.find(runtimeName);
    if (pos == std::string::npos)
        return std::nullopt;

    // runtime/arch/branch
    auto rest = std::string_view(signal).substr(pos + runtimeName.size());
    if (rest.empty() || rest.front() != '/')
        return std::nullopt;
    rest.remove_prefix(1);
    const auto archEnd = rest.find('/');
    if (archEnd == std::string_view::npos)
        return std::nullopt;
    const auto branch = rest.substr(archEnd + 1);

    int major = 0;
    const auto [ptr, ec] = std::from_chars(branch.data(), branch.data() + branch.size(), major);
    if (ec != std::errc() || ptr == branch.data())
        return std::nullopt;
    return major;
}

bool isKdeRuntime(const std::string &signal, int major)
{
    for (const auto name : {"org.kde.platform", "org.kde.sdk"}) {
        const auto version = runtimeMajorVersion(signal, name);
        if (version && *version == major)
            return true;
    }
    return false;
}

bool isGnomeRuntime(const std::string &signal, bool modern)
{
    for (const auto name : {"org.gnome.platform", "org.gnome.sdk"}) {
        const auto version = runtimeMajorVersion(signal, name);
        if (!version)
            continue;
        // GNOME moved from 3.38 to 40, which is also where GTK 4 became the default
        if (modern && *version >= 40)
            return true;
        if (!modern && *version == 3)
            return true;
    }
    return false;
}

bool isQt6Signal(const std::string &s)
{
    return contains(s, "qt6") || contains(s, "kde6") || contains(s, "kf6") || isKdeRuntime(s, 6);
}

bool isQt5Signal(const std::string &s)
{
    return contains(s, "qt5") || contains(s, "kde5") || contains(s, "kf5") || isKdeRuntime(s, 5);
}

bool isGtk4Signal(const std::string &s)
{
    return contains(s, "gtk4") || contains(s, "gtk-4") || contains(s, "libadwaita") || isGnomeRuntime(s, true);
}

bool isGtk3Signal(const std::string &s)
{
    return contains(s, "gtk3") || contains(s, "gtk-3") || contains(s, "gtk+-3") || isGnomeRuntime(s, false);
}

bool ruleMatches(const ClassificationRule &rule, Framework framework, DisplaySupport support)
{
    if (rule.support && *rule.support != support)
        return false;
    if (rule.framework && *rule.framework != framework)
        return false;
    return true;
}

} // namespace

std::string_view riskLevelToString(RiskLevel risk) noexcept
{
    switch (risk) {
    case RiskLevel::Low:
        return "low";
    case RiskLevel::Medium:
        return "medium";
    case RiskLevel::High:
        return "high";
    case RiskLevel::Critical:
        return "critical";
    default:
        return "unknown";
    }
}

std::optional<RiskLevel> riskLevelFromString(std::string_view str)
{
    const auto lower = Utils::toLower(str);
    if (lower == "low")
        return RiskLevel::Low;
    if (lower == "medium")
        return RiskLevel::Medium;
    if (lower == "high")
        return RiskLevel::High;
    if (lower == "critical")
        return RiskLevel::Critical;
    return std::nullopt;
}

std::string_view frameworkToString(Framework fw) noexcept
{
    switch (fw) {
    case Framework::Native:
        return "native";
    case Framework::GTK3:
        return "gtk3";
    case Framework::GTK4:
        return "gtk4";
    case Framework::Qt5:
        return "qt5";
    case Framework::Qt6:
        return "qt6";
    case Framework::QtWebEngine:
        return "qtwebengine";
    case Framework::Electron:
        return "electron";
    default:
        return "unknown";
    }
}

std::string_view frameworkFamilyToString(FrameworkFamily family) noexcept
{
    switch (family) {
    case FrameworkFamily::LegacyToolkitV3:
        return "legacy-toolkit-v3";
    case FrameworkFamily::ModernToolkitV4:
        return "modern-toolkit-v4";
    case FrameworkFamily::CrossPlatformToolkit:
        return "cross-platform-toolkit";
    case FrameworkFamily::BrowserEmbeddedRuntime:
        return "browser-embedded-runtime";
    case FrameworkFamily::Native:
        return "native";
    default:
        return "unknown";
    }
}

std::string_view displaySupportToString(DisplaySupport support) noexcept
{
    switch (support) {
    case DisplaySupport::Native:
        return "native";
    case DisplaySupport::Fallback:
        return "fallback";
    case DisplaySupport::X11Only:
        return "x11-only";
    default:
        return "unknown";
    }
}

FrameworkFamily frameworkFamily(Framework fw) noexcept
{
    switch (fw) {
    case Framework::GTK3:
        return FrameworkFamily::LegacyToolkitV3;
    case Framework::GTK4:
        return FrameworkFamily::ModernToolkitV4;
    case Framework::Qt5:
    case Framework::Qt6:
        return FrameworkFamily::CrossPlatformToolkit;
    case Framework::QtWebEngine:
    case Framework::Electron:
        return FrameworkFamily::BrowserEmbeddedRuntime;
    case Framework::Native:
        return FrameworkFamily::Native;
    default:
        return FrameworkFamily::Unknown;
    }
}

Framework detectFramework(const CatalogEntry &entry, std::string *signal)
{
    std::vector<std::string> signals;
    signals.reserve(entry.frameworkTags.size() + entry.dependencyHints.size());
    for (const auto &tag : entry.frameworkTags)
        signals.push_back(Utils::toLower(tag));
    for (const auto &hint : entry.dependencyHints) {
        // socket hints describe the display connection, not the toolkit
        if (hint.starts_with("socket="))
            continue;
        signals.push_back(Utils::toLower(hint));
    }

    using Detector = bool (*)(const std::string &);
    const std::array<std::pair<Framework, Detector>, 7> detectors = {{
        {Framework::QtWebEngine,
         [](const std::string &s) {
             return contains(s, "qtwebengine") || contains(s, "webengine");
         }},
        {Framework::Electron,
         [](const std::string &s) {
             return contains(s, "electron");
         }},
        {Framework::Qt6, isQt6Signal},
        {Framework::Qt5, isQt5Signal},
        {Framework::GTK4, isGtk4Signal},
        {Framework::GTK3, isGtk3Signal},
        {Framework::Native,
         [](const std::string &s) {
             return contains(s, "org.freedesktop.platform");
         }},
    }};

    for (const auto &[framework, detect] : detectors) {
        for (std::size_t i = 0; i < signals.size(); ++i) {
            if (!detect(signals[i]))
                continue;
            if (signal != nullptr)
                *signal = i < entry.frameworkTags.size() ? entry.frameworkTags[i] : signals[i];
            return framework;
        }
    }

    return Framework::Unknown;
}

DisplaySupport detectDisplaySupport(const CatalogEntry &entry)
{
    bool haveWayland = false;
    bool haveX11 = false;
    for (const auto &hint : entry.dependencyHints) {
        if (!hint.starts_with("socket="))
            continue;
        const auto socket = Utils::toLower(Utils::trimString(std::string_view(hint).substr(7)));
        if (socket == "wayland")
            haveWayland = true;
        else if (socket == "x11" || socket == "fallback-x11")
            haveX11 = true;
    }

    if (haveWayland && haveX11)
        return DisplaySupport::Fallback;
    if (haveWayland)
        return DisplaySupport::Native;
    if (haveX11)
        return DisplaySupport::X11Only;
    return DisplaySupport::Unknown;
}

CompatibilityAssessment classifyEntry(const CatalogEntry &entry)
{
    CompatibilityAssessment result;
    result.id = entry.id;

    std::string signal;
    result.framework = detectFramework(entry, &signal);
    result.displaySupport = detectDisplaySupport(entry);

    if (signal.empty())
        result.reasons.push_back(std::format("framework:{}", frameworkToString(result.framework)));
    else
        result.reasons.push_back(std::format("framework:{} ({})", frameworkToString(result.framework), signal));
    result.reasons.push_back(std::format("display:{}", displaySupportToString(result.displaySupport)));

    for (const auto &rule : ClassificationRules) {
        if (!ruleMatches(rule, result.framework, result.displaySupport))
            continue;
        result.risk = rule.risk;
        result.reasons.emplace_back(rule.reason);
        return result;
    }

    result.risk = RiskLevel::Medium;
    result.reasons.emplace_back(UnclassifiedReason);
    return result;
}

std::vector<CompatibilityAssessment> classifyCatalog(const Catalog &catalog)
{
    const auto &entries = catalog.entries();
    std::vector<CompatibilityAssessment> assessments(entries.size());

    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, entries.size()), [&](const tbb::blocked_range<std::size_t> &range) {
            for (std::size_t i = range.begin(); i != range.end(); ++i)
                assessments[i] = classifyEntry(entries[i]);
        });

    return assessments;
}

} // namespace ASCatalog
