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
#include "listing.hpp"

#include <utility>

#include "artifactregistry.hpp"

namespace nexus {

Status listAll(const ArtifactRegistry& registry, std::vector<VersionRecord>* records) {
    records->clear();
    for (const auto& [modelName, versions] : registry.getModels()) {
        auto latest = registry.getLatest(modelName);
        for (const auto& [commitHash, entry] : versions) {
            VersionRecord record;
            record.modelName = modelName;
            record.commitHash = commitHash;
            record.storageLocation = entry.storageLocation;
            record.fileSizeBytes = entry.fileSizeBytes;
            record.timestamp = entry.timestamp;
            record.isLatest = latest.has_value() && *latest == commitHash;
            records->push_back(std::move(record));
        }
    }
    return StatusCode::OK;
}

}  // namespace nexus
