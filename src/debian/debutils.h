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

namespace DebHost
{

/**
 * Compare two Debian-style version numbers
 * ([epoch:]upstream_version[-debian_revision]) the way dpkg does.
 *
 * Returns: a negative value if a < b, zero if equal, a positive value otherwise.
 */
int compareVersions(std::string_view a, std::string_view b);

/**
 * Check whether a string is usable as a Debian version number.
 */
bool isValidVersion(std::string_view version);

/**
 * Check whether a string is a valid Debian package name.
 */
bool isValidPackageName(std::string_view name);

} // namespace DebHost
