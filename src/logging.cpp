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

#include "logging.h"

#include <atomic>
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <syncstream>

namespace ASCatalog
{

// helper to avoid the "static initialization order fiasco"
static std::atomic_bool &verboseFlag() noexcept
{
    static std::atomic_bool flag{false};
    return flag;
}

static std::atomic<std::shared_ptr<const LogHandler>> &logHandlerSlot() noexcept
{
    static std::atomic<std::shared_ptr<const LogHandler>> slot;
    return slot;
}

void setVerbose(bool verbose) noexcept
{
    verboseFlag().store(verbose, std::memory_order_relaxed);
}

bool isVerbose() noexcept
{
    return verboseFlag().load(std::memory_order_relaxed);
}

void setLogHandler(LogHandler handler)
{
    if (handler)
        logHandlerSlot().store(std::make_shared<const LogHandler>(std::move(handler)));
    else
        logHandlerSlot().store(nullptr);
}

std::string_view logSeverityToString(LogSeverity severity) noexcept
{
    switch (severity) {
    case LogSeverity::DEBUG:
        return "DEBUG";
    case LogSeverity::INFO:
        return "INFO";
    case LogSeverity::WARNING:
        return "WARNING";
    case LogSeverity::ERROR:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

void logMessageImpl(LogSeverity severity, const std::string &message)
{
    const auto handler = logHandlerSlot().load();
    if (handler) {
        (*handler)(severity, message);
        return;
    }

    // warnings and errors go to stderr, so they are not mixed into command output
    auto &stream = severity >= LogSeverity::WARNING ? std::cerr : std::cout;
    std::osyncstream sync_out{stream};

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream time_stream;
    time_stream << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

    sync_out << time_stream.str() << " - " << logSeverityToString(severity) << ": " << message << '\n';
}

void printSectionBox(std::string_view title)
{
    const auto hline_count = 10 + title.length();

    std::string output;
    output.reserve(64 + hline_count * 6);

    output += "\n┌";
    for (size_t i = 0; i < hline_count; ++i)
        output += "─";
    output += "┐\n│  ";
    output += title;
    output += std::string(8, ' ');
    output += "│\n└";
    for (size_t i = 0; i < hline_count; ++i)
        output += "─";
    output += "┘\n";

    std::cout.write(output.data(), output.size());
    std::cout.flush();
}

} // namespace ASCatalog
