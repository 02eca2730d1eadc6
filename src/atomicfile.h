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

#include <cstdint>
#include <string_view>
#include <vector>
#include <filesystem>

namespace DebHost
{

namespace fs = std::filesystem;

/**
 * A file that only appears at its target path once it was written completely.
 *
 * Data goes to a temporary file next to the target, which is synced and
 * renamed over the target by commit(). If the object is destroyed without
 * a successful commit(), the temporary file is removed and the target
 * is left untouched.
 */
class AtomicFile
{
public:
    explicit AtomicFile(const fs::path &target);
    ~AtomicFile();

    AtomicFile(const AtomicFile &) = delete;
    AtomicFile &operator=(const AtomicFile &) = delete;

    void write(const void *data, std::size_t len);
    void write(std::string_view data);
    void write(const std::vector<std::uint8_t> &data);

    void commit();

    const fs::path &target() const
    {
        return m_target;
    }

    const fs::path &tmpPath() const
    {
        return m_tmpPath;
    }

private:
    fs::path m_target;
    fs::path m_tmpPath;
    int m_fd;
    bool m_committed;

    void discard() noexcept;
};

/**
 * Replace the contents of `target` atomically.
 */
void writeFileAtomically(const fs::path &target, std::string_view data);
void writeFileAtomically(const fs::path &target, const std::vector<std::uint8_t> &data);

} // namespace DebHost
