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

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <tbb/task_arena.h>

#include "config.h"
#include "catalog.h"
#include "artifactstore.h"
#include "ingestor.h"
#include "indexgenerator.h"

namespace DebHost
{

/**
 * Class orchestrating package ingestion and
 * the publication of repository indices.
 */
class Engine
{
public:
    Engine();
    explicit Engine(const Config &conf);
    ~Engine() = default;

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    bool ignoreExisting() const;
    void setIgnoreExisting(bool v);

    /**
     * Ingest the given local files or URLs into the catalog.
     * Stops at the first package that fails.
     */
    std::vector<IngestResult> ingest(const std::vector<std::string> &files);

    /**
     * Regenerate the indices of all architectures.
     */
    GenerationResult regenerate();
    GenerationResult regenerate(std::chrono::system_clock::time_point timestamp);

    /**
     * Ingest a single package built for @arch and regenerate
     * the repository layout afterwards.
     */
    IngestResult processFile(const std::string &arch, const std::string &fname);

    /**
     * Print the catalog contents of one or all architectures.
     */
    void printCatalog(const std::string &arch = "");

    Catalog &catalog();
    IndexGenerator &generator();

    /**
     * Time to stamp generated indices with: SOURCE_DATE_EPOCH if set,
     * the current time otherwise.
     */
    static std::chrono::system_clock::time_point generationTimestamp();

private:
    const Config *m_conf;
    bool m_ignoreExisting;

    std::unique_ptr<Catalog> m_catalog;
    std::unique_ptr<ArtifactStore> m_store;
    std::unique_ptr<IndexGenerator> m_generator;
    std::unique_ptr<tbb::task_arena> m_taskArena;

    void logVersionInfo();
};

} // namespace DebHost
