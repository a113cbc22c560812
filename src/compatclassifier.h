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
#include <optional>

#include "catalog.h"

namespace ASCatalog
{

enum class RiskLevel {
    Low,
    Medium,
    High,
    Critical
};

enum class Framework {
    Native,
    GTK3,
    GTK4,
    Qt5,
    Qt6,
    QtWebEngine,
    Electron,
    Unknown
};

enum class FrameworkFamily {
    LegacyToolkitV3,
    ModernToolkitV4,
    CrossPlatformToolkit,
    BrowserEmbeddedRuntime,
    Native,
    Unknown
};

enum class DisplaySupport {
    Native,
    Fallback,
    X11Only,
    Unknown
};

/**
 * Desktop compatibility risk of a single catalog entry.
 * Assessments are values: a changed entry gets a new assessment.
 */
struct CompatibilityAssessment {
    std::string id;
    RiskLevel risk = RiskLevel::Medium;
    Framework framework = Framework::Unknown;
    DisplaySupport displaySupport = DisplaySupport::Unknown;

    /* detection diagnostics first, the deciding rule last */
    std::vector<std::string> reasons;

    bool operator==(const CompatibilityAssessment &other) const = default;
};

std::string_view riskLevelToString(RiskLevel risk) noexcept;
std::optional<RiskLevel> riskLevelFromString(std::string_view str);
std::string_view frameworkToString(Framework fw) noexcept;
std::string_view frameworkFamilyToString(FrameworkFamily family) noexcept;
std::string_view displaySupportToString(DisplaySupport support) noexcept;

FrameworkFamily frameworkFamily(Framework fw) noexcept;

/**
 * Find the UI framework of an entry from its framework tags and dependency hints.
 * If `signal` is non-null, it receives the value that decided the result.
 */
Framework detectFramework(const CatalogEntry &entry, std::string *signal = nullptr);

/**
 * Find out how the entry talks to the display server from its socket hints.
 */
DisplaySupport detectDisplaySupport(const CatalogEntry &entry);

/**
 * Classify a single entry. This is a pure function of the entry data.
 */
CompatibilityAssessment classifyEntry(const CatalogEntry &entry);

/**
 * Classify every entry of the catalog in parallel.
 * The assessments are returned in catalog order.
 */
std::vector<CompatibilityAssessment> classifyCatalog(const Catalog &catalog);

} // namespace ASCatalog
