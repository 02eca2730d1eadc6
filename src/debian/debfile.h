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
#include <string>
#include <vector>

#include "tagfile.h"

namespace DebHost
{

/**
 * Read access to the metadata of a Debian binary package (.deb)
 * held in memory.
 */
class DebFile
{
public:
    /**
     * The data is referenced, not copied, and must outlive this object.
     */
    explicit DebFile(const std::vector<std::uint8_t> &data);

    /**
     * Check the ar container and locate its members.
     * Called implicitly by the other accessors.
     */
    void open();

    const std::string &controlMemberName() const
    {
        return m_controlMember;
    }

    const std::string &dataMemberName() const
    {
        return m_dataMember;
    }

    /**
     * The raw text of the control file.
     */
    std::string readControlText();

    /**
     * The parsed control stanza, with all required fields present and valid.
     */
    ControlStanza readControlInformation();

private:
    const std::vector<std::uint8_t> &m_data;
    bool m_opened;
    std::string m_controlMember;
    std::string m_dataMember;

    void verifyDataMember();
};

} // namespace DebHost
