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

#include "catalogparser.h"

#include <algorithm>
#include <cstring>
#include <charconv>
#include <limits>
#include <memory>
#include <optional>
#include <libxml/xmlreader.h>
#include <libxml/tree.h>

#include "downloader.h"
#include "logging.h"
#include "utils.h"
#include "zarchive.h"

namespace ASCatalog
{

namespace
{

struct ReaderContext {
    ArchiveStream *stream;
    std::string docName;
    std::string lastError;
};

int readArchiveCallback(void *context, char *buffer, int len)
{
    auto *ctx = static_cast<ReaderContext *>(context);
    try {
        return static_cast<int>(ctx->stream->read(buffer, static_cast<std::size_t>(len)));
    } catch (const std::exception &e) {
        ctx->lastError = e.what();
        return -1;
    }
}

int closeArchiveCallback(void *)
{
    // the stream is owned and closed by the caller
    return 0;
}

void readerErrorCallback(void *arg, const char *msg, xmlParserSeverities severity, xmlTextReaderLocatorPtr locator)
{
    auto *ctx = static_cast<ReaderContext *>(arg);
    const auto text = Utils::trimString(msg ? msg : "");
    const int line = locator ? xmlTextReaderLocatorLineNumber(locator) : -1;

    if (severity == XML_PARSER_SEVERITY_WARNING || severity == XML_PARSER_SEVERITY_VALIDITY_WARNING) {
        logDebug("{}:{}: {}", ctx->docName, line, text);
        return;
    }
    ctx->lastError = std::format("line {}: {}", line, text);
}

bool nodeNameIs(xmlNodePtr node, const char *name)
{
    return node->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char *>(node->name), name) == 0;
}

std::string getXmlStrAttr(xmlNodePtr elem, const char *name)
{
    if (!elem || !elem->properties)
        return {};

    for (xmlAttrPtr attr = elem->properties; attr; attr = attr->next) {
        // namespaced attributes (xml:lang) are never what we look for here
        if (attr->ns != nullptr)
            continue;
        if (attr->name && std::strcmp(reinterpret_cast<const char *>(attr->name), name) == 0) {
            if (attr->children && attr->children->content)
                return reinterpret_cast<const char *>(attr->children->content);
        }
    }
    return {};
}

std::string getXmlElemText(xmlNodePtr elem)
{
    if (!elem)
        return {};

    xmlChar *content = xmlNodeGetContent(elem);
    if (!content)
        return {};
    std::string text(reinterpret_cast<const char *>(content));
    xmlFree(content);

    return text;
}

bool isUntranslated(xmlNodePtr elem)
{
    return xmlHasNsProp(elem, BAD_CAST "lang", XML_XML_NAMESPACE) == nullptr;
}

std::uint32_t parseDimension(const std::string &value, std::uint32_t fallback)
{
    if (value.empty())
        return fallback;
    std::uint32_t result = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size())
        return fallback;
    return result;
}

int iconKindRank(AsIconKind kind)
{
    switch (kind) {
    case AS_ICON_KIND_CACHED:
        return 0;
    case AS_ICON_KIND_LOCAL:
        return 1;
    case AS_ICON_KIND_REMOTE:
        return 2;
    case AS_ICON_KIND_STOCK:
        return 3;
    default:
        return 4;
    }
}

bool isBetterIcon(const IconReference &candidate, const IconReference &current, std::uint32_t targetSize)
{
    const auto candRank = iconKindRank(candidate.kind);
    const auto curRank = iconKindRank(current.kind);
    if (candRank != curRank)
        return candRank < curRank;

    auto distance = [targetSize](const IconReference &icon) -> std::int64_t {
        if (icon.width == 0)
            return std::numeric_limits<std::int64_t>::max();
        const std::int64_t px = static_cast<std::int64_t>(icon.width) * icon.scale;
        return px > targetSize ? px - targetSize : targetSize - px;
    };
    const auto candDist = distance(candidate);
    const auto curDist = distance(current);
    if (candDist != curDist)
        return candDist < curDist;

    // same distance: the larger image scales down more nicely
    return candidate.width * candidate.scale > current.width * current.scale;
}

bool endsWith(const std::string &str, std::string_view suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> splitListValue(const std::string &value)
{
    std::vector<std::string> parts;
    std::string current;
    for (const char c : value) {
        if (c == ';' || c == ',') {
            auto item = Utils::trimString(current);
            if (!item.empty())
                parts.push_back(std::move(item));
            current.clear();
        } else {
            current += c;
        }
    }
    auto item = Utils::trimString(current);
    if (!item.empty())
        parts.push_back(std::move(item));

    return parts;
}

void readCustomValues(xmlNodePtr customNode, CatalogEntry &entry)
{
    for (xmlNodePtr child = customNode->children; child; child = child->next) {
        if (!nodeNameIs(child, "value"))
            continue;
        const auto key = getXmlStrAttr(child, "key");
        if (key.empty())
            continue;
        const auto value = getXmlElemText(child);
        entry.metadata[key] = value;

        const auto lowerKey = Utils::toLower(key);
        if (endsWith(lowerKey, "toolkit") || endsWith(lowerKey, "framework")) {
            for (auto &tag : splitListValue(value))
                entry.frameworkTags.push_back(std::move(tag));
        } else if (endsWith(lowerKey, "sockets")) {
            for (const auto &socket : splitListValue(value))
                entry.dependencyHints.push_back(std::format("socket={}", socket));
        }
    }
}

void readRelations(xmlNodePtr relNode, CatalogEntry &entry)
{
    for (xmlNodePtr child = relNode->children; child; child = child->next) {
        if (!nodeNameIs(child, "id"))
            continue;
        const auto value = Utils::trimString(getXmlElemText(child));
        if (!value.empty())
            entry.dependencyHints.push_back(value);
    }
}

void readProvides(xmlNodePtr provNode, CatalogEntry &entry)
{
    for (xmlNodePtr child = provNode->children; child; child = child->next) {
        if (!nodeNameIs(child, "library"))
            continue;
        const auto value = Utils::trimString(getXmlElemText(child));
        if (!value.empty())
            entry.dependencyHints.push_back(value);
    }
}

std::uint64_t readNewestRelease(xmlNodePtr releasesNode)
{
    std::uint64_t newest = 0;
    for (xmlNodePtr child = releasesNode->children; child; child = child->next) {
        if (!nodeNameIs(child, "release"))
            continue;

        std::uint64_t timestamp = 0;
        const auto tsStr = getXmlStrAttr(child, "timestamp");
        if (!tsStr.empty()) {
            const auto [ptr, ec] = std::from_chars(tsStr.data(), tsStr.data() + tsStr.size(), timestamp);
            if (ec != std::errc() || ptr != tsStr.data() + tsStr.size())
                timestamp = 0;
        } else {
            const auto date = getXmlStrAttr(child, "date");
            if (!date.empty()) {
                g_autoptr(AsRelease) rel = as_release_new();
                as_release_set_date(rel, date.c_str());
                timestamp = as_release_get_timestamp(rel);
            }
        }
        newest = std::max(newest, timestamp);
    }

    return newest;
}

std::optional<IconReference> readIcon(xmlNodePtr iconNode)
{
    IconReference icon;
    icon.kind = as_icon_kind_from_string(getXmlStrAttr(iconNode, "type").c_str());
    if (icon.kind == AS_ICON_KIND_UNKNOWN)
        return std::nullopt;

    icon.value = Utils::trimString(getXmlElemText(iconNode));
    icon.width = parseDimension(getXmlStrAttr(iconNode, "width"), 0);
    icon.height = parseDimension(getXmlStrAttr(iconNode, "height"), icon.width);
    icon.scale = parseDimension(getXmlStrAttr(iconNode, "scale"), 1);
    if (icon.scale == 0)
        icon.scale = 1;

    if (!icon.isValid())
        return std::nullopt;
    return icon;
}

/**
 * Read a single <component> subtree.
 * Returns std::nullopt and sets `error` if the component is malformed.
 */
std::optional<CatalogEntry> parseComponent(
    xmlNodePtr cptNode,
    const std::string &origin,
    std::uint32_t iconTargetSize,
    std::string &error)
{
    CatalogEntry entry;
    entry.origin = origin;

    const auto typeStr = getXmlStrAttr(cptNode, "type");
    if (!typeStr.empty()) {
        entry.kind = as_component_kind_from_string(typeStr.c_str());
        if (entry.kind == AS_COMPONENT_KIND_UNKNOWN) {
            error = std::format("unknown component type '{}'", typeStr);
            return std::nullopt;
        }
    }

    bool haveName = false;
    bool haveSummary = false;
    for (xmlNodePtr node = cptNode->children; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE)
            continue;

        if (nodeNameIs(node, "id")) {
            entry.id = Utils::trimString(getXmlElemText(node));
        } else if (nodeNameIs(node, "name")) {
            if (!haveName && isUntranslated(node)) {
                entry.name = Utils::trimString(getXmlElemText(node));
                haveName = true;
            }
        } else if (nodeNameIs(node, "summary")) {
            if (!haveSummary && isUntranslated(node)) {
                entry.summary = Utils::trimString(getXmlElemText(node));
                haveSummary = true;
            }
        } else if (nodeNameIs(node, "categories")) {
            for (xmlNodePtr cat = node->children; cat; cat = cat->next) {
                if (!nodeNameIs(cat, "category"))
                    continue;
                auto value = getXmlElemText(cat);
                if (!value.empty())
                    entry.categories.push_back(std::move(value));
            }
        } else if (nodeNameIs(node, "icon")) {
            auto icon = readIcon(node);
            if (icon && (!entry.icon || isBetterIcon(*icon, *entry.icon, iconTargetSize)))
                entry.icon = std::move(icon);
        } else if (nodeNameIs(node, "bundle")) {
            const auto bundleType = getXmlStrAttr(node, "type");
            const auto bundleId = Utils::trimString(getXmlElemText(node));
            for (const auto &tag : {getXmlStrAttr(node, "runtime"), getXmlStrAttr(node, "sdk"), bundleId}) {
                if (!tag.empty())
                    entry.frameworkTags.push_back(tag);
            }
            if (!bundleType.empty())
                entry.metadata[std::format("bundle:{}", bundleType)] = bundleId;
        } else if (nodeNameIs(node, "custom")) {
            readCustomValues(node, entry);
        } else if (nodeNameIs(node, "requires") || nodeNameIs(node, "recommends")) {
            readRelations(node, entry);
        } else if (nodeNameIs(node, "provides")) {
            readProvides(node, entry);
        } else if (nodeNameIs(node, "releases")) {
            entry.lastRelease = std::max(entry.lastRelease, readNewestRelease(node));
        } else if (nodeNameIs(node, "pkgname") || nodeNameIs(node, "project_license")) {
            entry.metadata[reinterpret_cast<const char *>(node->name)] = Utils::trimString(getXmlElemText(node));
        }
    }

    if (entry.id.empty()) {
        error = "component has no ID";
        return std::nullopt;
    }
    if (!haveName || entry.name.empty()) {
        error = std::format("component '{}' has no name", entry.id);
        return std::nullopt;
    }

    return entry;
}

} // namespace

CatalogParser::CatalogParser(const ImageSize &preferredIconSize)
    : m_iconSize(preferredIconSize)
{
}

void CatalogParser::setStopToken(std::stop_token token)
{
    m_stopToken = std::move(token);
}

const ParseResult &CatalogParser::result() const
{
    return m_result;
}

ParseResult CatalogParser::takeResult()
{
    ParseResult res = std::move(m_result);
    m_result = ParseResult();
    m_seenIds.clear();
    return res;
}

void CatalogParser::addEntry(CatalogEntry &&entry)
{
    if (!m_seenIds.insert(entry.id).second) {
        logDebug("Ignoring duplicate component '{}' from origin '{}'", entry.id, entry.origin);
        m_result.duplicates++;
        return;
    }
    m_result.entries.push_back(std::move(entry));
}

DocumentStatus CatalogParser::parseStream(ArchiveStream &stream, const std::string &docName)
{
    ReaderContext ctx{&stream, docName, {}};

    std::unique_ptr<xmlTextReader, decltype(&xmlFreeTextReader)> reader(
        xmlReaderForIO(
            readArchiveCallback,
            closeArchiveCallback,
            &ctx,
            docName.c_str(),
            nullptr,
            XML_PARSE_NONET | XML_PARSE_NOBLANKS),
        xmlFreeTextReader);
    if (!reader) {
        logError("Unable to create XML reader for catalog {}", docName);
        return DocumentStatus::Failed;
    }
    xmlTextReaderSetErrorHandler(reader.get(), readerErrorCallback, &ctx);

    const auto iconTargetSize = m_iconSize.toInt();
    std::string origin;
    std::size_t componentNo = 0;

    int ret = xmlTextReaderRead(reader.get());
    while (ret == 1) {
        if (m_stopToken.stop_requested()) {
            logDebug("Stopped reading catalog {} on request", docName);
            return DocumentStatus::Cancelled;
        }
        if (xmlTextReaderNodeType(reader.get()) != XML_READER_TYPE_ELEMENT) {
            ret = xmlTextReaderRead(reader.get());
            continue;
        }

        const auto localName = reinterpret_cast<const char *>(xmlTextReaderConstLocalName(reader.get()));
        const int depth = xmlTextReaderDepth(reader.get());

        if (depth == 0 && std::strcmp(localName, "components") == 0) {
            xmlChar *originAttr = xmlTextReaderGetAttribute(reader.get(), BAD_CAST "origin");
            if (originAttr != nullptr) {
                origin = reinterpret_cast<const char *>(originAttr);
                xmlFree(originAttr);
            }
        } else if (depth <= 1 && std::strcmp(localName, "component") == 0) {
            componentNo++;
            xmlNodePtr node = xmlTextReaderExpand(reader.get());
            if (node == nullptr) {
                // the document broke inside of this component
                m_result.skipped++;
                ret = -1;
                break;
            }

            std::string error;
            auto entry = parseComponent(node, origin, iconTargetSize, error);
            if (entry) {
                addEntry(std::move(*entry));
            } else {
                logWarning("Skipping malformed component #{} in {}: {}", componentNo, docName, error);
                m_result.skipped++;
            }

            ret = xmlTextReaderNext(reader.get());
            continue;
        }

        ret = xmlTextReaderRead(reader.get());
    }

    if (ret < 0) {
        logError(
            "Catalog {} is not well-formed, stopped after {} component(s): {}",
            docName,
            componentNo,
            ctx.lastError.empty() ? "unknown error" : ctx.lastError);
        return DocumentStatus::Failed;
    }

    return DocumentStatus::Read;
}

void CatalogParser::countDocument(DocumentStatus status)
{
    switch (status) {
    case DocumentStatus::Read:
        m_result.documentsRead++;
        break;
    case DocumentStatus::Failed:
        m_result.documentsFailed++;
        break;
    case DocumentStatus::Cancelled:
        m_result.documentsCancelled++;
        break;
    }
}

DocumentStatus CatalogParser::parseFile(const std::string &fname)
{
    ArchiveStream stream;
    try {
        stream.open(fname);
    } catch (const std::exception &e) {
        logError("Unable to open catalog {}: {}", fname, e.what());
        m_result.documentsFailed++;
        return DocumentStatus::Failed;
    }

    logDebug("Reading catalog {}", fname);
    const auto status = parseStream(stream, fname);
    countDocument(status);
    return status;
}

DocumentStatus CatalogParser::parseData(const std::string &data, const std::string &name)
{
    ArchiveStream stream;
    try {
        stream.openMemory(reinterpret_cast<const std::uint8_t *>(data.data()), data.size());
    } catch (const std::exception &e) {
        logError("Unable to read catalog data {}: {}", name, e.what());
        m_result.documentsFailed++;
        return DocumentStatus::Failed;
    }

    const auto status = parseStream(stream, name);
    countDocument(status);
    return status;
}

DocumentStatus CatalogParser::parseSource(const std::string &source, const fs::path &downloadDir)
{
    if (!Utils::isRemote(source))
        return parseFile(source);

    const auto dest = downloadDir / Utils::filenameFromURI(source);
    try {
        fs::create_directories(downloadDir);
        Downloader::get().downloadFile(source, dest.string());
    } catch (const std::exception &e) {
        if (!fs::exists(dest)) {
            logError("Unable to download catalog {}: {}", source, e.what());
            m_result.documentsFailed++;
            return DocumentStatus::Failed;
        }
        logWarning("Unable to download catalog {}, using previously downloaded copy: {}", source, e.what());
    }

    return parseFile(dest.string());
}

ParseResult parseCatalogSources(
    const std::vector<std::string> &sources,
    const fs::path &downloadDir,
    std::stop_token stopToken)
{
    CatalogParser parser(Config::get().icons.size);
    parser.setStopToken(stopToken);
    for (const auto &source : sources) {
        if (stopToken.stop_requested())
            break;
        parser.parseSource(source, downloadDir);
    }

    const auto &res = parser.result();
    logInfo(
        "Read {} catalog entries from {} document(s) ({} skipped, {} duplicates, {} failed, {} cancelled documents)",
        res.entries.size(),
        res.documentsRead,
        res.skipped,
        res.duplicates,
        res.documentsFailed,
        res.documentsCancelled);

    return parser.takeResult();
}

} // namespace ASCatalog
