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

#include <cstdint>
#include <string>

#include "status.hpp"

namespace nexus {
class ArtifactRegistry;

/**
 * @brief Records an uploaded artifact and advances the model latest pointer to it.
 * Re-registering the same (model, commit) pair overwrites the previous entry.
 * Changes stay in memory until ArtifactRegistry::save().
 *
 * @return INVALID_ARGUMENT when model name or commit hash is empty
 */
Status registerVersion(ArtifactRegistry& registry,
    const std::string& modelName,
    const std::string& commitHash,
    const std::string& storageLocation,
    uint64_t fileSizeBytes,
    const std::string& fileExtension);

Status registerVersion(ArtifactRegistry& registry,
    const std::string& modelName,
    const std::string& commitHash,
    const std::string& storageLocation,
    uint64_t fileSizeBytes,
    const std::string& fileExtension,
    const std::string& timestamp);

}  // namespace nexus
