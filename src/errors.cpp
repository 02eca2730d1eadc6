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

#include "errors.h"

#include <format>

namespace DebHost
{

RepoError::RepoError(const std::string &message)
    : m_message(message)
{
}

const char *RepoError::what() const noexcept
{
    return m_message.c_str();
}

DuplicatePackage::DuplicatePackage(const std::string &name, const std::string &version, const std::string &arch)
    : RepoError(std::format("Package {}/{}/{} already exists in the catalog", name, version, arch)),
      m_name(name),
      m_version(version),
      m_arch(arch)
{
}

} // namespace DebHost
