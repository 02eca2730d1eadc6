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

#include <exception>
#include <string>

namespace DebHost
{

/**
 * Base class of all errors raised by the repository core.
 */
class RepoError : public std::exception
{
public:
    explicit RepoError(const std::string &message);
    const char *what() const noexcept override;

private:
    std::string m_message;
};

/**
 * The artifact container or its control data is malformed,
 * or a required control field is missing.
 * Nothing was persisted.
 */
class ParseError : public RepoError
{
public:
    using RepoError::RepoError;
};

/**
 * A package with the same name, version and architecture is already
 * in the catalog. The catalog was left unchanged.
 */
class DuplicatePackage : public RepoError
{
public:
    DuplicatePackage(const std::string &name, const std::string &version, const std::string &arch);

    const std::string &name() const
    {
        return m_name;
    }

    const std::string &version() const
    {
        return m_version;
    }

    const std::string &architecture() const
    {
        return m_arch;
    }

private:
    std::string m_name;
    std::string m_version;
    std::string m_arch;
};

/**
 * I/O, download or database failure while storing an artifact or
 * writing to the catalog. The operation may be retried.
 */
class StorageError : public RepoError
{
public:
    using RepoError::RepoError;
};

/**
 * Rebuilding the repository indices failed. The previously
 * published indices are untouched.
 */
class GenerationError : public RepoError
{
public:
    using RepoError::RepoError;
};

} // namespace DebHost
