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

#include "catalog.h"

#include <format>
#include <stdexcept>

namespace ASCatalog
{

Catalog::Catalog(std::vector<CatalogEntry> entries)
    : m_entries(std::move(entries))
{
    m_idIndex.reserve(m_entries.size());
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        const auto [it, inserted] = m_idIndex.emplace(m_entries[i].id, i);
        if (!inserted)
            throw std::invalid_argument(std::format("Duplicate catalog entry identifier: {}", m_entries[i].id));
    }
}

const CatalogEntry *Catalog::find(const std::string &id) const
{
    const auto it = m_idIndex.find(id);
    if (it == m_idIndex.end())
        return nullptr;
    return &m_entries[it->second];
}

bool Catalog::contains(const std::string &id) const
{
    return m_idIndex.contains(id);
}

} // namespace ASCatalog
