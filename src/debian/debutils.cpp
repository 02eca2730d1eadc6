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

#include "debutils.h"

#include <cctype>

namespace DebHost
{

/**
 * Sort weight of a non-digit character, following dpkg/lib/dpkg/version.c:
 * '~' sorts before everything, even the end of a part, letters sort
 * before all other characters.
 */
static int order(int c)
{
    if (std::isdigit(c))
        return 0;
    else if (std::isalpha(c))
        return c;
    else if (c == '~')
        return -1;
    else if (c)
        return c + 256;

    return 0;
}

/**
 * Compare one version part, e.g. the upstream version. The part is split
 * into alternating non-digit and digit runs which are compared in turn.
 */
static int cmpFragment(std::string_view a, std::string_view b)
{
    std::size_t i = 0;
    std::size_t j = 0;

    auto at = [](std::string_view s, std::size_t pos) -> int {
        return pos < s.size() ? static_cast<unsigned char>(s[pos]) : 0;
    };

    while (i < a.size() || j < b.size()) {
        int firstDiff = 0;

        while ((i < a.size() && !std::isdigit(at(a, i))) || (j < b.size() && !std::isdigit(at(b, j)))) {
            const int ac = order(at(a, i));
            const int bc = order(at(b, j));

            if (ac != bc)
                return ac - bc;
            ++i;
            ++j;
        }

        while (at(a, i) == '0')
            ++i;
        while (at(b, j) == '0')
            ++j;

        while (std::isdigit(at(a, i)) && std::isdigit(at(b, j))) {
            if (!firstDiff)
                firstDiff = at(a, i) - at(b, j);
            ++i;
            ++j;
        }

        if (std::isdigit(at(a, i)))
            return 1;
        if (std::isdigit(at(b, j)))
            return -1;
        if (firstDiff)
            return firstDiff;
    }

    return 0;
}

namespace
{
struct VersionParts {
    std::string_view epoch;
    std::string_view upstream;
    std::string_view revision;
};
} // namespace

static VersionParts splitVersion(std::string_view v)
{
    VersionParts parts;

    const auto colon = v.find(':');
    if (colon != std::string_view::npos) {
        parts.epoch = v.substr(0, colon);
        v.remove_prefix(colon + 1);
    }

    const auto dash = v.rfind('-');
    if (dash != std::string_view::npos) {
        parts.upstream = v.substr(0, dash);
        parts.revision = v.substr(dash + 1);
    } else {
        parts.upstream = v;
    }

    return parts;
}

int compareVersions(std::string_view a, std::string_view b)
{
    const auto va = splitVersion(a);
    const auto vb = splitVersion(b);

    // a missing epoch equals epoch zero, and leading zeros are insignificant
    int res = cmpFragment(va.epoch, vb.epoch);
    if (res != 0)
        return res;

    res = cmpFragment(va.upstream, vb.upstream);
    if (res != 0)
        return res;

    return cmpFragment(va.revision, vb.revision);
}

bool isValidVersion(std::string_view version)
{
    if (version.empty())
        return false;

    const auto parts = splitVersion(version);
    for (const char c : parts.epoch) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }

    if (parts.upstream.empty() || !std::isdigit(static_cast<unsigned char>(parts.upstream.front())))
        return false;

    for (const char c : version) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '+' && c != '-' && c != '~' && c != ':')
            return false;
    }

    return true;
}

bool isValidPackageName(std::string_view name)
{
    if (name.size() < 2 || !std::isalnum(static_cast<unsigned char>(name.front())))
        return false;

    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::islower(uc) || std::isdigit(uc)) && c != '+' && c != '-' && c != '.')
            return false;
    }

    return true;
}

} // namespace DebHost
