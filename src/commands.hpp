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
#include <ostream>
#include <string>
#include <vector>

#include "listing.hpp"
#include "status.hpp"

namespace nexus {
class ArtifactRegistry;
class SourceControlGate;
class StorageBackend;

/**
 * @brief Uploads model file tagged with current commit and registers it as latest.
 * Registry is saved only after the upload succeeded.
 *
 * @param registry loaded registry
 * @param storage
 * @param gate refuses dirty working trees
 * @param modelPath
 * @param modelName
 * @param out user facing progress messages
 * @return Status
 */
Status storeModel(ArtifactRegistry& registry, StorageBackend& storage, SourceControlGate& gate,
    const std::string& modelPath, const std::string& modelName, std::ostream& out);

/**
 * @brief Resolves selector and downloads the artifact to outputPath. Never modifies registry.
 */
Status loadModel(const ArtifactRegistry& registry, StorageBackend& storage,
    const std::string& selector, const std::optional<std::string>& modelName,
    const std::string& outputPath, std::ostream& out);

Status listModels(const ArtifactRegistry& registry, std::ostream& out);

Status rollbackModel(ArtifactRegistry& registry, const std::string& commitHash, const std::string& modelName, std::ostream& out);

/**
 * @brief Renders records sorted by model name then timestamp
 */
std::string formatModelTable(std::vector<VersionRecord> records);

}  // namespace nexus
