//*****************************************************************************
// Copyright 2025 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//*****************************************************************************
#pragma once

#include <optional>
#include <string>

#include <rapidjson/document.h>

#include "status.hpp"
#include "versionentry.hpp"

namespace nexus {

/**
 * @brief In-memory view of the registry file mapping (model name, commit hash)
 * to a storage location, plus the per-model latest pointer.
 *
 * The whole file is loaded at once and written back as a full rewrite.
 * Mutations only touch memory until save() is called.
 */
class ArtifactRegistry {
public:
    explicit ArtifactRegistry(const std::string& registryPath);

    static std::string defaultPath(const std::string& projectRoot);

    /**
     * @brief Replaces in-memory state with the file contents.
     * Missing file results in an empty registry.
     *
     * @return REGISTRY_CORRUPT when file does not describe a valid registry
     */
    Status load();

    /**
     * @brief Writes whole in-memory state to the registry file, creating parent directories
     */
    Status save() const;

    /**
     * @brief Fails with REGISTRY_NOT_INITIALIZED if the registry file does not exist
     */
    Status requireExists() const;

    bool fileExists() const;

    const std::string& getRegistryPath() const {
        return registryPath;
    }

    const models_map_t& getModels() const {
        return models;
    }

    const latest_map_t& getLatestPointers() const {
        return latest;
    }

    bool hasModel(const std::string& modelName) const;

    const VersionEntry* findVersion(const std::string& modelName, const std::string& commitHash) const;

    std::optional<std::string> getLatest(const std::string& modelName) const;

    void putVersion(const std::string& modelName, const VersionEntry& entry);

    void setLatestPointer(const std::string& modelName, const std::string& commitHash);

    void clear();

    bool operator==(const ArtifactRegistry& rhs) const {
        return models == rhs.models && latest == rhs.latest;
    }

    Status parse(rapidjson::Document& document);

    std::string serialize() const;

private:
    std::string registryPath;
    models_map_t models;
    latest_map_t latest;
};

}  // namespace nexus
