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
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

struct sqlite3;

namespace DebHost
{

namespace fs = std::filesystem;

/**
 * A cataloged package artifact, one row of the catalog.
 * Rows are created once and never modified afterwards.
 */
struct PackageRecord {
    std::string name;
    std::string version;
    std::string architecture;
    std::string control;
    std::uint64_t size = 0;
    std::string filepath;
    std::vector<std::uint8_t> md5;
    std::vector<std::uint8_t> descriptionMd5;
    std::vector<std::uint8_t> sha1;
    std::vector<std::uint8_t> sha256;

    /**
     * Human-readable identifier, name/version/architecture.
     */
    std::string id() const;
};

/**
 * A consistent, read-only view of the catalog.
 *
 * All reads through one snapshot observe the same catalog state, even
 * while other connections commit new packages. The snapshot holds a read
 * transaction until it is destroyed.
 */
class CatalogSnapshot
{
public:
    ~CatalogSnapshot();

    CatalogSnapshot(const CatalogSnapshot &) = delete;
    CatalogSnapshot &operator=(const CatalogSnapshot &) = delete;

    std::vector<PackageRecord> list(const std::string &architecture) const;
    std::vector<std::string> architectures() const;
    std::size_t count() const;

private:
    friend class Catalog;
    CatalogSnapshot(sqlite3 *db, std::unique_lock<std::mutex> lock);

    sqlite3 *m_db;
    std::unique_lock<std::mutex> m_lock;
};

/**
 * Transactional store of all packages known to the repository.
 *
 * The unique (version, name, architecture) index is what keeps concurrent
 * uploads of the same package from both succeeding, whether they run in
 * this process or another one.
 */
class Catalog
{
public:
    Catalog();
    ~Catalog();

    Catalog(const Catalog &) = delete;
    Catalog &operator=(const Catalog &) = delete;

    void open(const fs::path &dbPath);
    void close();
    bool isOpen() const;

    /**
     * Add a new package. Throws DuplicatePackage if a package with the same
     * name, version and architecture exists, StorageError on database failure.
     * The catalog is unchanged in both cases.
     */
    void insert(const PackageRecord &record);

    /**
     * All packages of an architecture, ordered by name and Debian version.
     */
    std::vector<PackageRecord> list(const std::string &architecture);

    std::vector<std::string> architectures();
    std::size_t count();

    std::optional<PackageRecord> getPackage(
        const std::string &name,
        const std::string &version,
        const std::string &architecture);
    bool exists(const std::string &name, const std::string &version, const std::string &architecture);

    std::unique_ptr<CatalogSnapshot> snapshot();

private:
    fs::path m_dbPath;
    sqlite3 *m_db;
    sqlite3 *m_readDb;
    std::mutex m_mutex;
    std::mutex m_readMutex;
};

} // namespace DebHost
