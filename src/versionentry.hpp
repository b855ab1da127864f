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
#include <map>
#include <string>

namespace nexus {

/**
 * @brief One registered artifact of a model, keyed by the commit it was built from
 */
struct VersionEntry {
    std::string commitHash;
    std::string storageLocation;
    uint64_t fileSizeBytes = 0;
    std::string fileExtension;
    std::string timestamp;

    bool operator==(const VersionEntry& rhs) const {
        return commitHash == rhs.commitHash &&
               storageLocation == rhs.storageLocation &&
               fileSizeBytes == rhs.fileSizeBytes &&
               fileExtension == rhs.fileExtension &&
               timestamp == rhs.timestamp;
    }
    bool operator!=(const VersionEntry& rhs) const {
        return !(*this == rhs);
    }
};

// commit hash -> entry
using model_versions_map_t = std::map<std::string, VersionEntry>;
// model name -> versions
using models_map_t = std::map<std::string, model_versions_map_t>;
// model name -> commit hash
using latest_map_t = std::map<std::string, std::string>;

}  // namespace nexus
