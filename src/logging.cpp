/*
 * Copyright (C) 2025 The debhost developers
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
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <syncstream>

namespace DebHost
{

static std::atomic_bool &verboseFlag() noexcept
{
    static std::atomic_bool flag{false};
    return flag;
}

void setVerbose(bool verbose) noexcept
{
    verboseFlag().store(verbose, std::memory_order_relaxed);
}

bool isVerbose() noexcept
{
    return verboseFlag().load(std::memory_order_relaxed);
}

static constexpr std::string_view severityName(LogSeverity severity) noexcept
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
    }
    return "UNKNOWN";
}

void logMessageImpl(LogSeverity severity, const std::string &message)
{
    std::osyncstream out{std::clog};

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " - " << severityName(severity) << ": " << message << '\n';
}

static void printTextbox(
    std::string_view title,
    std::string_view tl,
    std::string_view hline,
    std::string_view tr,
    std::string_view vline,
    std::string_view bl,
    std::string_view br)
{
    const auto width = title.length() + 10;

    std::string rule;
    rule.reserve(width * hline.length());
    for (std::size_t i = 0; i < width; ++i)
        rule += hline;

    std::osyncstream out{std::clog};
    out << '\n' << tl << rule << tr << '\n';
    out << vline << "  " << title << std::string(8, ' ') << vline << '\n';
    out << bl << rule << br << '\n';
}

void printHeaderBox(std::string_view title)
{
    printTextbox(title, "╔", "═", "╗", "║", "╚", "╝");
}

void printSectionBox(std::string_view title)
{
    printTextbox(title, "┌", "─", "┐", "│", "└", "┘");
}

} // namespace DebHost
