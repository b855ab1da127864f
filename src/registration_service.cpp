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
#include "registration_service.hpp"

#include "artifactregistry.hpp"
#include "logging.hpp"
#include "timeutils.hpp"

namespace nexus {

Status registerVersion(ArtifactRegistry& registry,
    const std::string& modelName,
    const std::string& commitHash,
    const std::string& storageLocation,
    uint64_t fileSizeBytes,
    const std::string& fileExtension) {
    return registerVersion(registry, modelName, commitHash, storageLocation, fileSizeBytes, fileExtension, currentTimestamp());
}

Status registerVersion(ArtifactRegistry& registry,
    const std::string& modelName,
    const std::string& commitHash,
    const std::string& storageLocation,
    uint64_t fileSizeBytes,
    const std::string& fileExtension,
    const std::string& timestamp) {
    if (modelName.empty()) {
        return Status(StatusCode::INVALID_ARGUMENT, "model name must not be empty");
    }
    if (commitHash.empty()) {
        return Status(StatusCode::INVALID_ARGUMENT, "commit hash must not be empty");
    }
    if (registry.findVersion(modelName, commitHash) != nullptr) {
        SPDLOG_LOGGER_INFO(registry_logger, "Overwriting existing entry of model: {} commit: {}", modelName, commitHash);
    }
    VersionEntry entry;
    entry.commitHash = commitHash;
    entry.storageLocation = storageLocation;
    entry.fileSizeBytes = fileSizeBytes;
    entry.fileExtension = fileExtension;
    entry.timestamp = timestamp;
    registry.putVersion(modelName, entry);
    registry.setLatestPointer(modelName, commitHash);
    SPDLOG_LOGGER_DEBUG(registry_logger, "Registered model: {} commit: {} location: {} size: {}",
        modelName, commitHash, storageLocation, fileSizeBytes);
    return StatusCode::OK;
}

}  // namespace nexus
