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
#include <vector>
#include <optional>
#include <unordered_map>
#include <cstdint>
#include <appstream.h>

namespace ASCatalog
{

/**
 * Reference to the icon of a catalog entry, as declared in the catalog data.
 */
struct IconReference {
    AsIconKind kind = AS_ICON_KIND_UNKNOWN;

    /* stock icon name, cached icon filename, absolute path or URL, depending on the kind */
    std::string value;

    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t scale = 1;

    bool isValid() const
    {
        return kind != AS_ICON_KIND_UNKNOWN && !value.empty();
    }

    bool operator==(const IconReference &other) const = default;
};

/**
 * One software component from an AppStream catalog.
 *
 * Entries are immutable once parsed, downstream users refer to them
 * by their identifier.
 */
struct CatalogEntry {
    std::string id;
    std::string name;
    std::string summary;
    AsComponentKind kind = AS_COMPONENT_KIND_GENERIC;
    std::string origin;

    /* taken verbatim from the catalog, in document order */
    std::vector<std::string> categories;

    std::vector<std::string> frameworkTags;
    std::vector<std::string> dependencyHints;
    std::optional<IconReference> icon;

    /* UNIX timestamp of the newest release, 0 if the catalog has none */
    std::uint64_t lastRelease = 0;

    /* custom key/value data and other auxiliary fields */
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * An immutable collection of catalog entries with unique identifiers.
 */
class Catalog
{
public:
    /**
     * Create a new catalog. Identifiers must be unique, a duplicate
     * identifier is a programming error and throws std::invalid_argument.
     */
    explicit Catalog(std::vector<CatalogEntry> entries);

    const std::vector<CatalogEntry> &entries() const
    {
        return m_entries;
    }

    std::size_t size() const
    {
        return m_entries.size();
    }

    bool empty() const
    {
        return m_entries.empty();
    }

    /**
     * Find an entry by its identifier, returns nullptr if the catalog has no such entry.
     */
    const CatalogEntry *find(const std::string &id) const;

    bool contains(const std::string &id) const;

private:
    std::vector<CatalogEntry> m_entries;
    std::unordered_map<std::string, std::size_t> m_idIndex;
};

} // namespace ASCatalog
