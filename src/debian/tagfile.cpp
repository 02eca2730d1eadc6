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

#include "tagfile.h"

#include <algorithm>
#include <format>

#include "../errors.h"
#include "../utils.h"

namespace DebHost
{

bool ControlStanza::hasField(std::string_view name) const
{
    return std::ranges::any_of(m_fields, [&](const Field &f) {
        return Utils::equalsIgnoreCase(f.first, name);
    });
}

std::optional<std::string> ControlStanza::field(std::string_view name) const
{
    for (const auto &[key, value] : m_fields) {
        if (Utils::equalsIgnoreCase(key, name))
            return value;
    }
    return std::nullopt;
}

std::string ControlStanza::readField(std::string_view name, const std::string &defaultValue) const
{
    return field(name).value_or(defaultValue);
}

void ControlStanza::append(const std::string &name, const std::string &value)
{
    if (hasField(name))
        throw ParseError(std::format("Duplicate field '{}' in control stanza", name));
    m_fields.emplace_back(name, value);
}

bool ControlStanza::remove(std::string_view name)
{
    const auto removed = std::erase_if(m_fields, [&](const Field &f) {
        return Utils::equalsIgnoreCase(f.first, name);
    });
    return removed > 0;
}

std::string ControlStanza::render() const
{
    std::string out;
    for (const auto &[name, value] : m_fields) {
        out += name;
        out += ':';
        // a value may consist of continuation lines only
        if (!value.empty() && value.front() != '\n')
            out += ' ';
        out += value;
        out += '\n';
    }
    return out;
}

static bool isBlankLine(const std::string &line)
{
    return line.find_first_not_of(" \t") == std::string::npos;
}

TagFile::TagFile()
    : m_pos(0),
      m_nextPos(0)
{
}

void TagFile::load(std::string_view data)
{
    std::string text;
    text.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        // normalize CRLF line endings
        if (data[i] == '\r' && (i + 1 == data.size() || data[i + 1] == '\n'))
            continue;
        text += data[i];
    }

    m_content = Utils::splitString(text, '\n');
    first();
}

void TagFile::first()
{
    m_pos = 0;
    readCurrentBlockData();
}

void TagFile::readCurrentBlockData()
{
    m_currentBlock = ControlStanza();
    const auto clen = m_content.size();

    // skip separators and comments ahead of the stanza
    auto i = m_pos;
    while (i < clen && (isBlankLine(m_content[i]) || m_content[i].starts_with('#')))
        i++;
    m_pos = i;

    std::string fieldName;
    std::string fieldData;
    for (; i < clen; i++) {
        const auto &line = m_content[i];
        if (isBlankLine(line))
            break;
        if (line.starts_with('#'))
            continue;

        if (line.starts_with(' ') || line.starts_with('\t')) {
            if (fieldName.empty())
                throw ParseError(std::format("Continuation line without a preceding field (line {})", i + 1));
            fieldData += '\n';
            fieldData += Utils::rtrimString(line);
            continue;
        }

        if (!fieldName.empty())
            m_currentBlock.append(fieldName, fieldData);

        const auto separatorIndex = line.find(':');
        if (separatorIndex == std::string::npos || separatorIndex == 0)
            throw ParseError(std::format("Malformed control line {}: '{}'", i + 1, line));

        fieldName = line.substr(0, separatorIndex);
        if (fieldName.find_first_of(" \t") != std::string::npos)
            throw ParseError(std::format("Invalid field name '{}' (line {})", fieldName, i + 1));
        fieldData = Utils::trimString(std::string_view(line).substr(separatorIndex + 1));
    }

    if (!fieldName.empty())
        m_currentBlock.append(fieldName, fieldData);

    m_nextPos = i;
}

bool TagFile::nextSection()
{
    if (m_nextPos >= m_content.size()) {
        m_pos = m_content.size();
        m_currentBlock = ControlStanza();
        return false;
    }

    m_pos = m_nextPos;
    readCurrentBlockData();
    return !m_currentBlock.empty();
}

bool TagFile::eof() const
{
    return m_pos >= m_content.size();
}

std::string TagFile::readField(std::string_view fieldName, const std::string &defaultValue) const
{
    return m_currentBlock.readField(fieldName, defaultValue);
}

bool TagFile::hasField(std::string_view fieldName) const
{
    return m_currentBlock.hasField(fieldName);
}

ControlStanza parseControlStanza(std::string_view text)
{
    TagFile tf;
    tf.load(text);
    if (tf.currentStanza().empty())
        throw ParseError("No control data found");

    auto stanza = tf.currentStanza();
    if (tf.nextSection())
        throw ParseError("Expected a single control stanza, but found more than one");

    return stanza;
}

} // namespace DebHost
