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

#include "catalog.h"

#include <algorithm>
#include <format>

#include <sqlite3.h>

#include "errors.h"
#include "logging.h"
#include "debian/debutils.h"

namespace DebHost
{

static constexpr const char *CATALOG_SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS packages (
    name TEXT NOT NULL,
    version TEXT NOT NULL,
    architecture TEXT NOT NULL,
    control TEXT NOT NULL,
    size INTEGER NOT NULL,
    filepath TEXT NOT NULL,
    md5 BLOB NOT NULL,
    description_md5 BLOB NOT NULL,
    sha1 BLOB NOT NULL,
    sha256 BLOB NOT NULL
) STRICT;
CREATE UNIQUE INDEX IF NOT EXISTS avoid_dupes ON packages (version, name, architecture);
CREATE INDEX IF NOT EXISTS by_arch ON packages (architecture);
)SQL";

static constexpr const char *PACKAGE_COLUMNS =
    "name, version, architecture, control, size, filepath, md5, description_md5, sha1, sha256";

static constexpr int BUSY_TIMEOUT_MS = 10000;

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

static std::string sqliteErrorMessage(sqlite3 *db, int rc)
{
    if (db)
        return sqlite3_errmsg(db);
    return sqlite3_errstr(rc);
}

static void checkError(sqlite3 *db, int rc, const std::string &what)
{
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return;
    throw StorageError(std::format("Catalog: {} failed: {}", what, sqliteErrorMessage(db, rc)));
}

static void execSql(sqlite3 *db, const char *sql, const std::string &what)
{
    char *err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StorageError(std::format("Catalog: {} failed: {}", what, msg));
    }
}

static StatementPtr prepare(sqlite3 *db, const std::string &sql)
{
    sqlite3_stmt *stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    StatementPtr ptr(stmt, sqlite3_finalize);
    checkError(db, rc, "preparing statement");
    return ptr;
}

static void bindText(sqlite3_stmt *stmt, int idx, const std::string &value)
{
    checkError(
        sqlite3_db_handle(stmt),
        sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "binding text");
}

static void bindBlob(sqlite3_stmt *stmt, int idx, const std::vector<std::uint8_t> &value)
{
    // an empty vector has no data pointer, which SQLite would store as NULL
    static const std::uint8_t empty = 0;
    const void *data = value.empty() ? &empty : value.data();
    checkError(
        sqlite3_db_handle(stmt),
        sqlite3_bind_blob(stmt, idx, data, static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "binding blob");
}

static std::string columnText(sqlite3_stmt *stmt, int col)
{
    const auto text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
    const auto len = sqlite3_column_bytes(stmt, col);
    return text ? std::string(text, static_cast<std::size_t>(len)) : std::string();
}

static std::vector<std::uint8_t> columnBlob(sqlite3_stmt *stmt, int col)
{
    const auto data = static_cast<const std::uint8_t *>(sqlite3_column_blob(stmt, col));
    const auto len = sqlite3_column_bytes(stmt, col);
    if (!data)
        return {};
    return std::vector<std::uint8_t>(data, data + len);
}

static PackageRecord readRecord(sqlite3_stmt *stmt)
{
    PackageRecord rec;
    rec.name = columnText(stmt, 0);
    rec.version = columnText(stmt, 1);
    rec.architecture = columnText(stmt, 2);
    rec.control = columnText(stmt, 3);
    rec.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
    rec.filepath = columnText(stmt, 5);
    rec.md5 = columnBlob(stmt, 6);
    rec.descriptionMd5 = columnBlob(stmt, 7);
    rec.sha1 = columnBlob(stmt, 8);
    rec.sha256 = columnBlob(stmt, 9);
    return rec;
}

/**
 * Write transaction which is rolled back unless committed.
 */
class WriteTransaction
{
public:
    explicit WriteTransaction(sqlite3 *db)
        : m_db(db),
          m_done(false)
    {
        execSql(m_db, "BEGIN IMMEDIATE;", "starting transaction");
    }

    ~WriteTransaction()
    {
        if (m_done)
            return;
        const int rc = sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
            logWarning("Catalog: rollback failed: {}", sqliteErrorMessage(m_db, rc));
    }

    void commit()
    {
        execSql(m_db, "COMMIT;", "committing transaction");
        m_done = true;
    }

private:
    sqlite3 *m_db;
    bool m_done;
};

static sqlite3 *openConnection(const fs::path &dbPath, int flags)
{
    sqlite3 *db = nullptr;
    const int rc = sqlite3_open_v2(dbPath.c_str(), &db, flags | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const auto msg = sqliteErrorMessage(db, rc);
        sqlite3_close(db);
        throw StorageError(std::format("Unable to open catalog database '{}': {}", dbPath.string(), msg));
    }

    const int brc = sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);
    if (brc != SQLITE_OK) {
        const auto msg = sqliteErrorMessage(db, brc);
        sqlite3_close(db);
        throw StorageError(std::format("Unable to configure catalog database: {}", msg));
    }

    return db;
}

static void sortRecords(std::vector<PackageRecord> &records)
{
    std::ranges::sort(records, [](const PackageRecord &a, const PackageRecord &b) {
        if (a.name != b.name)
            return a.name < b.name;
        const auto cmp = compareVersions(a.version, b.version);
        if (cmp != 0)
            return cmp < 0;
        return a.version < b.version;
    });
}

static std::vector<PackageRecord> listPackages(sqlite3 *db, const std::string &architecture)
{
    auto stmt = prepare(
        db, std::format("SELECT {} FROM packages WHERE architecture = ?1 ORDER BY name, version", PACKAGE_COLUMNS));
    bindText(stmt.get(), 1, architecture);

    std::vector<PackageRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        records.push_back(readRecord(stmt.get()));
    checkError(db, rc, "listing packages");

    sortRecords(records);
    return records;
}

static std::vector<std::string> listArchitectures(sqlite3 *db)
{
    auto stmt = prepare(db, "SELECT DISTINCT architecture FROM packages ORDER BY architecture");

    std::vector<std::string> arches;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        arches.push_back(columnText(stmt.get(), 0));
    checkError(db, rc, "listing architectures");

    return arches;
}

static std::size_t countPackages(sqlite3 *db)
{
    auto stmt = prepare(db, "SELECT count(*) FROM packages");
    const int rc = sqlite3_step(stmt.get());
    checkError(db, rc, "counting packages");
    return rc == SQLITE_ROW ? static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0)) : 0;
}

std::string PackageRecord::id() const
{
    return std::format("{}/{}/{}", name, version, architecture);
}

CatalogSnapshot::CatalogSnapshot(sqlite3 *db, std::unique_lock<std::mutex> lock)
    : m_db(db),
      m_lock(std::move(lock))
{
    execSql(m_db, "BEGIN DEFERRED;", "starting read transaction");

    // a deferred transaction only pins its view on the first read
    try {
        countPackages(m_db);
    } catch (const StorageError &) {
        const int rc = sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
            logWarning("Catalog: unable to abort read transaction: {}", sqliteErrorMessage(m_db, rc));
        throw;
    }
}

CatalogSnapshot::~CatalogSnapshot()
{
    const int rc = sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
        logWarning("Catalog: unable to finish read transaction: {}", sqliteErrorMessage(m_db, rc));
}

std::vector<PackageRecord> CatalogSnapshot::list(const std::string &architecture) const
{
    return listPackages(m_db, architecture);
}

std::vector<std::string> CatalogSnapshot::architectures() const
{
    return listArchitectures(m_db);
}

std::size_t CatalogSnapshot::count() const
{
    return countPackages(m_db);
}

Catalog::Catalog()
    : m_db(nullptr),
      m_readDb(nullptr)
{
}

Catalog::~Catalog()
{
    close();
}

void Catalog::open(const fs::path &dbPath)
{
    std::scoped_lock lock(m_mutex, m_readMutex);
    if (m_db)
        throw StorageError(std::format("Catalog is already open at '{}'", m_dbPath.string()));

    try {
        if (dbPath.has_parent_path())
            fs::create_directories(dbPath.parent_path());
    } catch (const fs::filesystem_error &e) {
        throw StorageError(std::format("Unable to create catalog directory: {}", e.what()));
    }

    m_db = openConnection(dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    try {
        execSql(m_db, "PRAGMA journal_mode=WAL;", "enabling WAL journal");
        execSql(m_db, "PRAGMA synchronous=NORMAL;", "configuring synchronous mode");
        execSql(m_db, CATALOG_SCHEMA, "creating schema");
        m_readDb = openConnection(dbPath, SQLITE_OPEN_READWRITE);
        execSql(m_readDb, "PRAGMA query_only=ON;", "configuring read connection");
    } catch (const StorageError &) {
        sqlite3_close(m_readDb);
        m_readDb = nullptr;
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }

    m_dbPath = dbPath;
    logDebug("Opened catalog database {}", dbPath.string());
}

void Catalog::close()
{
    std::scoped_lock lock(m_mutex, m_readMutex);
    if (m_readDb) {
        sqlite3_close(m_readDb);
        m_readDb = nullptr;
    }
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

bool Catalog::isOpen() const
{
    return m_db != nullptr;
}

void Catalog::insert(const PackageRecord &record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db)
        throw StorageError("Catalog is not open");

    WriteTransaction tx(m_db);

    auto stmt = prepare(
        m_db,
        std::format(
            "INSERT INTO packages ({}) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)", PACKAGE_COLUMNS));
    bindText(stmt.get(), 1, record.name);
    bindText(stmt.get(), 2, record.version);
    bindText(stmt.get(), 3, record.architecture);
    bindText(stmt.get(), 4, record.control);
    checkError(m_db, sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(record.size)), "binding size");
    bindText(stmt.get(), 6, record.filepath);
    bindBlob(stmt.get(), 7, record.md5);
    bindBlob(stmt.get(), 8, record.descriptionMd5);
    bindBlob(stmt.get(), 9, record.sha1);
    bindBlob(stmt.get(), 10, record.sha256);

    const int rc = sqlite3_step(stmt.get());
    // only the unique key means duplicate, other constraint failures are storage errors
    if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(m_db) == SQLITE_CONSTRAINT_UNIQUE)
        throw DuplicatePackage(record.name, record.version, record.architecture);
    checkError(m_db, rc, std::format("inserting {}", record.id()));

    stmt.reset();
    tx.commit();
    logDebug("Added {} to the catalog", record.id());
}

std::unique_ptr<CatalogSnapshot> Catalog::snapshot()
{
    std::unique_lock<std::mutex> lock(m_readMutex);
    if (!m_readDb)
        throw StorageError("Catalog is not open");

    return std::unique_ptr<CatalogSnapshot>(new CatalogSnapshot(m_readDb, std::move(lock)));
}

std::vector<PackageRecord> Catalog::list(const std::string &architecture)
{
    return snapshot()->list(architecture);
}

std::vector<std::string> Catalog::architectures()
{
    return snapshot()->architectures();
}

std::size_t Catalog::count()
{
    return snapshot()->count();
}

std::optional<PackageRecord> Catalog::getPackage(
    const std::string &name,
    const std::string &version,
    const std::string &architecture)
{
    std::lock_guard<std::mutex> lock(m_readMutex);
    if (!m_readDb)
        throw StorageError("Catalog is not open");

    auto stmt = prepare(
        m_readDb,
        std::format(
            "SELECT {} FROM packages WHERE name = ?1 AND version = ?2 AND architecture = ?3", PACKAGE_COLUMNS));
    bindText(stmt.get(), 1, name);
    bindText(stmt.get(), 2, version);
    bindText(stmt.get(), 3, architecture);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW)
        return readRecord(stmt.get());
    checkError(m_readDb, rc, "looking up package");

    return std::nullopt;
}

bool Catalog::exists(const std::string &name, const std::string &version, const std::string &architecture)
{
    return getPackage(name, version, architecture).has_value();
}

} // namespace DebHost
