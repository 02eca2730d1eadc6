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

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DebHost
{

/**
 * One paragraph of Debian RFC822-style control data.
 *
 * Fields keep the order they were added in. Names are compared
 * without regard to case, and multi-line values are stored exactly
 * as written, including the leading whitespace of continuation lines.
 */
class ControlStanza
{
public:
    using Field = std::pair<std::string, std::string>;

    ControlStanza() = default;

    bool empty() const
    {
        return m_fields.empty();
    }

    std::size_t size() const
    {
        return m_fields.size();
    }

    const std::vector<Field> &fields() const
    {
        return m_fields;
    }

    bool hasField(std::string_view name) const;
    std::optional<std::string> field(std::string_view name) const;
    std::string readField(std::string_view name, const std::string &defaultValue = "") const;

    /**
     * Append a new field. Throws ParseError if a field with
     * the same name exists already.
     */
    void append(const std::string &name, const std::string &value);

    /**
     * Remove all fields with this name. Returns true if anything was removed.
     */
    bool remove(std::string_view name);

    /**
     * Render the stanza as "Name: value" lines, each terminated by a
     * newline, with no trailing blank line.
     */
    std::string render() const;

private:
    std::vector<Field> m_fields;
};

/**
 * Parser for Debian's RFC822-style metadata, reading a sequence
 * of stanzas separated by blank lines.
 */
class TagFile
{
public:
    TagFile();

    /**
     * Load text and position the reader on the first stanza.
     * Malformed input is reported as ParseError.
     */
    void load(std::string_view data);

    void first();

    bool nextSection();

    bool eof() const;

    const ControlStanza &currentStanza() const
    {
        return m_currentBlock;
    }

    std::string readField(std::string_view fieldName, const std::string &defaultValue = "") const;

    bool hasField(std::string_view fieldName) const;

private:
    std::vector<std::string> m_content;
    std::size_t m_pos;
    std::size_t m_nextPos;
    ControlStanza m_currentBlock;

    void readCurrentBlockData();
};

/**
 * Parse text which must contain exactly one control stanza.
 */
ControlStanza parseControlStanza(std::string_view text);

} // namespace DebHost
