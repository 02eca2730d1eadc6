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

#include "engine.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <thread>

#include "defines.h"
#include "errors.h"
#include "logging.h"
#include "utils.h"

namespace DebHost
{

Engine::Engine()
    : Engine(Config::get())
{
}

Engine::Engine(const Config &conf)
    : m_conf(&conf),
      m_ignoreExisting(false)
{
    if (!m_conf->isValid())
        throw std::runtime_error("The configuration is incomplete, can not continue!");

    // rendering and compression run per architecture, leave some cores for the compressors themselves
    const auto numCPU = std::max(1u, std::thread::hardware_concurrency());
    const auto maxThreads = std::max(1L, std::lround(numCPU * 0.75));
    m_taskArena = std::make_unique<tbb::task_arena>(static_cast<int>(maxThreads));

    m_catalog = std::make_unique<Catalog>();
    m_catalog->open(m_conf->databasePath());

    m_store = std::make_unique<ArtifactStore>(m_conf->repositoryRoot, m_conf->storageRetries);
    m_generator = std::make_unique<IndexGenerator>(*m_conf);
}

bool Engine::ignoreExisting() const
{
    return m_ignoreExisting;
}

void Engine::setIgnoreExisting(bool v)
{
    m_ignoreExisting = v;
}

Catalog &Engine::catalog()
{
    return *m_catalog;
}

IndexGenerator &Engine::generator()
{
    return *m_generator;
}

void Engine::logVersionInfo()
{
    logInfo("{} {}, catalog: {}", DEBHOST_PROJECT_NAME, DEBHOST_VERSION, m_conf->databasePath().string());
}

std::chrono::system_clock::time_point Engine::generationTimestamp()
{
    const char *epochStr = std::getenv("SOURCE_DATE_EPOCH");
    if (epochStr == nullptr || epochStr[0] == '\0')
        return std::chrono::system_clock::now();

    try {
        std::size_t pos = 0;
        const auto epoch = std::stoll(epochStr, &pos);
        if (pos != std::string_view(epochStr).size() || epoch < 0)
            throw std::invalid_argument("trailing data");
        return std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
    } catch (const std::logic_error &) {
        logWarning("Ignoring invalid SOURCE_DATE_EPOCH value '{}'", epochStr);
    }

    return std::chrono::system_clock::now();
}

std::vector<IngestResult> Engine::ingest(const std::vector<std::string> &files)
{
    printHeaderBox("Ingesting packages");
    logVersionInfo();

    Ingestor ingestor(*m_catalog, *m_store);
    ingestor.setIgnoreExisting(m_ignoreExisting);

    std::vector<IngestResult> results;
    for (const auto &fname : files) {
        auto pathResults = ingestor.ingestPath(fname);
        results.insert(
            results.end(), std::make_move_iterator(pathResults.begin()), std::make_move_iterator(pathResults.end()));
    }

    const auto added = static_cast<std::size_t>(std::ranges::count_if(results, [](const IngestResult &r) {
        return r.status == IngestStatus::Added;
    }));
    logInfo("Ingested {} package(s), {} already present", added, results.size() - added);
    return results;
}

GenerationResult Engine::regenerate()
{
    return regenerate(generationTimestamp());
}

GenerationResult Engine::regenerate(std::chrono::system_clock::time_point timestamp)
{
    printHeaderBox(std::format("Regenerating {}", m_conf->release.suite));
    logVersionInfo();

    GenerationResult result;
    m_taskArena->execute([&] {
        result = m_generator->generate(*m_catalog, timestamp);
    });

    return result;
}

IngestResult Engine::processFile(const std::string &arch, const std::string &fname)
{
    printHeaderBox(std::format("Processing {} ({})", Utils::filenameFromURI(fname), arch));
    logVersionInfo();

    Ingestor ingestor(*m_catalog, *m_store);
    ingestor.setIgnoreExisting(m_ignoreExisting);
    ingestor.setExpectedArchitecture(arch);
    auto result = ingestor.ingestFile(fname);

    printSectionBox(std::format("Regenerating {}", m_conf->release.suite));
    const auto timestamp = generationTimestamp();
    m_taskArena->execute([&] {
        m_generator->generate(*m_catalog, timestamp);
    });

    return result;
}

void Engine::printCatalog(const std::string &arch)
{
    const auto snap = m_catalog->snapshot();

    std::vector<std::string> arches;
    if (arch.empty())
        arches = snap->architectures();
    else
        arches.push_back(arch);

    for (const auto &a : arches) {
        for (const auto &rec : snap->list(a))
            std::cout << std::format(
                "{} {} {} {} {}", rec.name, rec.version, rec.architecture, rec.size, rec.filepath)
                      << std::endl;
    }
}

} // namespace DebHost
