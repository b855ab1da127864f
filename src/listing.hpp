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
#include <vector>

#include "status.hpp"

namespace nexus {
class ArtifactRegistry;

struct VersionRecord {
    std::string modelName;
    std::string commitHash;
    std::string storageLocation;
    uint64_t fileSizeBytes = 0;
    std::string timestamp;
    bool isLatest = false;
};

/**
 * @brief Flattens the registry into one record per version, in registry iteration order
 */
Status listAll(const ArtifactRegistry& registry, std::vector<VersionRecord>* records);

}  // namespace nexus
