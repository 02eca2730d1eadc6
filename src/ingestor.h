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

#include "catalog.h"

namespace DebHost
{

class ArtifactStore;
class Downloader;

enum class IngestStatus {
    Added,
    AlreadyPresent
};

struct IngestResult {
    IngestStatus status = IngestStatus::Added;
    PackageRecord record;
};

/**
 * Turns uploaded package artifacts into stored files and catalog rows.
 *
 * An ingestion either completes fully or leaves the catalog unchanged.
 * Artifacts stored in the pool before a failed catalog insert stay in
 * place, their location only depends on their own content.
 */
class Ingestor
{
public:
    Ingestor(Catalog &catalog, ArtifactStore &store);

    /**
     * Ingest a package from its raw bytes. @origin is only used for messages.
     *
     * Throws ParseError for invalid packages, StorageError if the artifact
     * could not be stored or cataloged and DuplicatePackage if the package
     * is already known (unless existing packages are ignored).
     */
    IngestResult ingest(const std::vector<std::uint8_t> &data, const std::string &origin);

    /**
     * Ingest a package from a local file or a remote URL.
     */
    IngestResult ingestFile(const std::string &pathOrUrl);

    /**
     * Ingest every *.deb file below a local directory, in path order.
     * Stops at the first package that can not be ingested.
     */
    std::vector<IngestResult> ingestDirectory(const std::string &dir);

    /**
     * Ingest a file, URL or directory.
     */
    std::vector<IngestResult> ingestPath(const std::string &pathOrUrl);

    bool ignoreExisting() const;
    void setIgnoreExisting(bool ignore);

    /**
     * Only accept packages built for this architecture (or "all").
     * An empty value accepts any architecture.
     */
    void setExpectedArchitecture(const std::string &arch);

    void setDownloader(Downloader *downloader);

private:
    Catalog &m_catalog;
    ArtifactStore &m_store;
    bool m_ignoreExisting;
    std::string m_expectedArch;
    Downloader *m_downloader;
};

} // namespace DebHost
