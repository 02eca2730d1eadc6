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

#include "config.h"

#include <fstream>
#include <sstream>
#include <format>
#include <stdexcept>

#include <libfyaml.h>

#include "logging.h"

namespace DebHost
{

std::unique_ptr<Config> Config::instance_;
std::once_flag Config::initialized_;

Config::Config()
    : m_workspaceDir(fs::current_path())
{
}

Config &Config::get()
{
    std::call_once(initialized_, []() {
        instance_ = std::make_unique<Config>();
    });
    return *instance_;
}

static std::string readFileToString(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error(std::format("Could not open file: {}", filename));

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static fy_document *parseJsonDocument(const std::string &jsonData)
{
    fy_parse_cfg cfg = {};
    cfg.flags = FYPCF_JSON_FORCE;

    auto fyp = fy_parser_create(&cfg);
    if (!fyp)
        throw std::runtime_error("Failed to create JSON parser");

    if (fy_parser_set_string(fyp, jsonData.c_str(), jsonData.length()) != 0) {
        fy_parser_destroy(fyp);
        throw std::runtime_error("Failed to set parser input");
    }

    auto fyd = fy_parse_load_document(fyp);
    fy_parser_destroy(fyp);

    if (!fyd)
        throw std::runtime_error("Failed to parse JSON document");

    return fyd;
}

static std::string getNodeStringValue(fy_node *node)
{
    if (!node || fy_node_get_type(node) != FYNT_SCALAR)
        return "";

    size_t len = 0;
    const char *value = fy_node_get_scalar(node, &len);
    return value ? std::string(value, len) : "";
}

static std::int64_t getNodeIntValue(fy_node *node, const std::string &key, std::int64_t defaultValue)
{
    if (!node)
        return defaultValue;

    const auto value = getNodeStringValue(node);
    try {
        std::size_t pos = 0;
        const auto result = std::stoll(value, &pos);
        if (pos != value.size())
            throw std::invalid_argument(value);
        return result;
    } catch (const std::logic_error &) {
        throw std::runtime_error(std::format("Configuration key '{}' must be an integer, got '{}'", key, value));
    }
}

static bool getNodeBoolValue(fy_node *node, bool defaultValue)
{
    if (!node || fy_node_get_type(node) != FYNT_SCALAR)
        return defaultValue;

    const auto value = getNodeStringValue(node);
    return value == "true" || value == "1" || value == "yes";
}

static std::vector<std::string> getNodeArrayValues(fy_node *node)
{
    std::vector<std::string> result;

    if (!node || fy_node_get_type(node) != FYNT_SEQUENCE)
        return result;

    fy_node *item;
    void *iter = nullptr;
    while ((item = fy_node_sequence_iterate(node, &iter)) != nullptr) {
        auto value = getNodeStringValue(item);
        if (!value.empty())
            result.push_back(value);
    }

    return result;
}

static fy_node *getNodeByKey(fy_node *mapping, const std::string &key)
{
    if (!mapping || fy_node_get_type(mapping) != FYNT_MAPPING)
        return nullptr;

    fy_node_pair *pair;
    void *iter = nullptr;
    while ((pair = fy_node_mapping_iterate(mapping, &iter)) != nullptr) {
        if (getNodeStringValue(fy_node_pair_key(pair)) == key)
            return fy_node_pair_value(pair);
    }

    return nullptr;
}

static std::string getStringByKey(fy_node *mapping, const std::string &key, const std::string &defaultValue)
{
    auto node = getNodeByKey(mapping, key);
    return node ? getNodeStringValue(node) : defaultValue;
}

/**
 * Names used as path components of the published tree must
 * be plain, non-empty tokens.
 */
static void ensurePathToken(const std::string &value, const std::string &what)
{
    if (value.empty() || value == "." || value == ".."
        || value.find_first_of("/ \t\n") != std::string::npos)
        throw std::runtime_error(std::format("Invalid {} in configuration: '{}'", what, value));
}

void Config::loadFromFile(const std::string &fname, const std::string &enforcedWorkspaceDir)
{
    const auto jsonData = readFileToString(fname);

    auto baseDir = fs::path(fname).parent_path();
    if (baseDir.empty())
        baseDir = fs::current_path();

    loadFromString(jsonData, fs::absolute(baseDir));

    // allow overriding the workspace location
    if (!enforcedWorkspaceDir.empty())
        setWorkspaceDir(enforcedWorkspaceDir);
}

void Config::loadFromString(const std::string &jsonData, const fs::path &baseDir)
{
    std::unique_ptr<fy_document, decltype(&fy_document_destroy)> document(
        parseJsonDocument(jsonData), fy_document_destroy);

    auto root = fy_document_root(document.get());
    if (!root || fy_node_get_type(root) != FYNT_MAPPING)
        throw std::runtime_error("Invalid JSON configuration file");

    auto resolve = [&baseDir](const std::string &p) {
        fs::path path(p);
        return path.is_absolute() ? path : (baseDir / path).lexically_normal();
    };

    auto repoRootNode = getNodeByKey(root, "RepositoryRoot");
    if (!repoRootNode)
        throw std::runtime_error("RepositoryRoot is required in configuration");
    repositoryRoot = resolve(getNodeStringValue(repoRootNode));

    const auto workspace = getStringByKey(root, "WorkspaceDir", "");
    m_workspaceDir = workspace.empty() ? baseDir : resolve(workspace);

    const auto dbPath = getStringByKey(root, "DatabasePath", "");
    m_databasePath = dbPath.empty() ? fs::path() : resolve(dbPath);

    auto releaseNode = getNodeByKey(root, "Release");
    if (releaseNode && fy_node_get_type(releaseNode) == FYNT_MAPPING) {
        release.origin = getStringByKey(releaseNode, "Origin", release.origin);
        release.label = getStringByKey(releaseNode, "Label", release.label);
        release.suite = getStringByKey(releaseNode, "Suite", release.suite);
        release.codename = getStringByKey(releaseNode, "Codename", release.codename);
        release.version = getStringByKey(releaseNode, "Version", release.version);
        release.description = getStringByKey(releaseNode, "Description", release.description);
    }
    ensurePathToken(release.suite, "suite name");
    if (!release.codename.empty())
        ensurePathToken(release.codename, "codename");

    component = getStringByKey(root, "Component", component);
    ensurePathToken(component, "component name");

    architectures = getNodeArrayValues(getNodeByKey(root, "Architectures"));
    for (const auto &arch : architectures)
        ensurePathToken(arch, "architecture");

    signingKey = getStringByKey(root, "SignWith", "");
    caInfo = getStringByKey(root, "CAInfo", "");

    validForSeconds = getNodeIntValue(getNodeByKey(root, "ValidFor"), "ValidFor", 0);
    if (validForSeconds < 0)
        throw std::runtime_error("ValidFor must not be negative");

    const auto retries = getNodeIntValue(getNodeByKey(root, "StorageRetries"), "StorageRetries", storageRetries);
    if (retries < 0 || retries > 32)
        throw std::runtime_error(std::format("StorageRetries must be between 0 and 32, got {}", retries));
    storageRetries = static_cast<std::uint32_t>(retries);

    auto featuresNode = getNodeByKey(root, "Features");
    if (featuresNode && fy_node_get_type(featuresNode) == FYNT_MAPPING) {
        fy_node_pair *pair;
        void *iter = nullptr;
        while ((pair = fy_node_mapping_iterate(featuresNode, &iter)) != nullptr) {
            const auto featureId = getNodeStringValue(fy_node_pair_key(pair));
            const auto featureValue = getNodeBoolValue(fy_node_pair_value(pair), false);

            if (featureId == "compressIndices")
                feature.compressIndices = featureValue;
            else if (featureId == "signRelease")
                feature.signRelease = featureValue;
            else
                logWarning("Unknown feature flag '{}' in configuration, ignoring it.", featureId);
        }
    }

    if (feature.signRelease && signingKey.empty())
        logDebug("No signing key configured, Release files will not be signed.");
    if (!feature.signRelease && !signingKey.empty())
        logWarning("A signing key is set, but the `signRelease` feature is disabled. Release files will be unsigned.");
}

bool Config::isValid() const
{
    return !repositoryRoot.empty() && !release.suite.empty() && !component.empty();
}

fs::path Config::workspaceDir() const
{
    return m_workspaceDir;
}

void Config::setWorkspaceDir(const fs::path &dir)
{
    m_workspaceDir = fs::absolute(dir);
}

fs::path Config::databasePath() const
{
    if (!m_databasePath.empty())
        return m_databasePath;
    return m_workspaceDir / "db" / "catalog.db";
}

void Config::setDatabasePath(const fs::path &path)
{
    m_databasePath = path;
}

std::string Config::codename() const
{
    return release.codename.empty() ? release.suite : release.codename;
}

bool Config::signingEnabled() const
{
    return feature.signRelease && !signingKey.empty();
}

} // namespace DebHost
