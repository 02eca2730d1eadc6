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
#include <filesystem>
#include <memory>
#include <mutex>

#include "utils.h"

namespace DebHost
{

/**
 * Metadata written to the header of the Release file.
 */
struct ReleaseInfo {
    std::string origin = "debhost";
    std::string label = "debhost";
    std::string suite = "stable";
    std::string codename;
    std::string version;
    std::string description;
};

/**
 * Repository features that can be toggled by the user.
 */
struct RepoFeatures {
    bool compressIndices = true;
    bool signRelease = true;
};

/**
 * The configuration of a hosted repository.
 */
class Config
{
public:
    Config();
    ~Config() = default;

    /**
     * Process-wide instance, used by the command-line tool.
     * Library code receives its configuration explicitly.
     */
    static Config &get();

    fs::path repositoryRoot;
    ReleaseInfo release;
    std::string component = "main";
    std::vector<std::string> architectures;
    RepoFeatures feature;

    std::string signingKey;
    std::int64_t validForSeconds = 0;
    std::uint32_t storageRetries = 3;
    std::string caInfo;

    void loadFromFile(const std::string &fname, const std::string &enforcedWorkspaceDir = "");
    void loadFromString(const std::string &jsonData, const fs::path &baseDir);

    bool isValid() const;

    fs::path workspaceDir() const;
    void setWorkspaceDir(const fs::path &dir);

    fs::path databasePath() const;
    void setDatabasePath(const fs::path &path);

    /**
     * The codename written to Release, falls back to the suite name.
     */
    std::string codename() const;

    /**
     * Whether Release files should be signed with gpg.
     */
    bool signingEnabled() const;

    Config(const Config &) = delete;
    Config &operator=(const Config &) = delete;

private:
    static std::unique_ptr<Config> instance_;
    static std::once_flag initialized_;

    fs::path m_workspaceDir;
    fs::path m_databasePath;
};

} // namespace DebHost
