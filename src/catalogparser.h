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
#include <unordered_set>
#include <stop_token>
#include <cstdint>

#include "catalog.h"
#include "config.h"

namespace ASCatalog
{

class ArchiveStream;

/**
 * Everything a parser run produced: the entries plus diagnostic counters.
 */
struct ParseResult {
    std::vector<CatalogEntry> entries;

    /* entries dropped because of malformed structure */
    std::size_t skipped = 0;
    /* entries dropped because an earlier document already declared their ID */
    std::size_t duplicates = 0;

    std::size_t documentsRead = 0;
    std::size_t documentsFailed = 0;
    /* documents interrupted by a stop request */
    std::size_t documentsCancelled = 0;
};

/**
 * Outcome of reading a single catalog document.
 */
enum class DocumentStatus {
    Read,
    /* the document could not be opened or stopped being well-formed */
    Failed,
    /* reading was interrupted, the entries read so far are kept */
    Cancelled
};

/**
 * Reads AppStream catalog XML documents into CatalogEntry records.
 *
 * Documents are streamed in chunks, plain or compressed, and only the
 * <component> element currently being looked at is expanded in memory.
 * Broken components are skipped and counted, a document that stops being
 * well-formed keeps whatever was read from it until the error occurred.
 *
 * A parser instance accumulates the results of all documents fed to it,
 * so identifiers stay unique across documents (the first one wins).
 */
class CatalogParser
{
public:
    explicit CatalogParser(const ImageSize &preferredIconSize = DefaultIconSize);

    /**
     * Stop reading new components once a stop is requested on `token`.
     */
    void setStopToken(std::stop_token token);

    /**
     * Parse a catalog file from disk.
     * @return DocumentStatus::Read only if the document was read completely.
     */
    DocumentStatus parseFile(const std::string &fname);

    /**
     * Parse an in-memory catalog document, which may be compressed.
     */
    DocumentStatus parseData(const std::string &data, const std::string &name = "<memory>");

    /**
     * Parse a local file or a remote URL. Remote documents are downloaded
     * to `downloadDir` first.
     */
    DocumentStatus parseSource(const std::string &source, const fs::path &downloadDir);

    const ParseResult &result() const;

    /**
     * Move the accumulated result out of the parser and reset it.
     */
    ParseResult takeResult();

private:
    ImageSize m_iconSize;
    std::stop_token m_stopToken;
    ParseResult m_result;
    std::unordered_set<std::string> m_seenIds;

    DocumentStatus parseStream(ArchiveStream &stream, const std::string &docName);
    void countDocument(DocumentStatus status);
    void addEntry(CatalogEntry &&entry);
};

/**
 * Convenience helper to parse a list of local or remote catalog sources.
 */
ParseResult parseCatalogSources(
    const std::vector<std::string> &sources,
    const fs::path &downloadDir,
    std::stop_token stopToken = {});

} // namespace ASCatalog
