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

#pragma once

#include <string>
#include <string_view>
#include <format>

namespace DebHost
{

enum class LogSeverity {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

void setVerbose(bool verbose) noexcept;
bool isVerbose() noexcept;

// Writes one formatted log line to stderr, stdout is reserved for command output
void logMessageImpl(LogSeverity severity, const std::string &message);

template<typename... Args>
void logMessage(LogSeverity severity, std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) > 0)
        logMessageImpl(severity, std::vformat(fmt, std::make_format_args(args...)));
    else
        logMessageImpl(severity, std::string{fmt});
}

template<typename... Args>
inline void logDebug(std::string_view fmt, Args &&...args)
{
    if (isVerbose())
        logMessage(LogSeverity::DEBUG, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void logInfo(std::string_view fmt, Args &&...args)
{
    logMessage(LogSeverity::INFO, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void logWarning(std::string_view fmt, Args &&...args)
{
    logMessage(LogSeverity::WARNING, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void logError(std::string_view fmt, Args &&...args)
{
    logMessage(LogSeverity::ERROR, fmt, std::forward<Args>(args)...);
}

/**
 * Print a prominent box with a title, used to mark the start of a command.
 */
void printHeaderBox(std::string_view title);

/**
 * Print a smaller box with a title, used to mark a step within a command.
 */
void printSectionBox(std::string_view title);

} // namespace DebHost
