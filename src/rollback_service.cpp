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
#include "rollback_service.hpp"

#include "artifactregistry.hpp"
#include "logging.hpp"

namespace nexus {

Status setLatest(ArtifactRegistry& registry, const std::string& modelName, const std::string& commitHash) {
    auto status = registry.requireExists();
    if (!status.ok()) {
        return status;
    }
    if (!registry.hasModel(modelName)) {
        SPDLOG_LOGGER_ERROR(registry_logger, "Model: {} not found in registry", modelName);
        return Status(StatusCode::MODEL_NAME_MISSING, "Model '" + modelName + "' not found in metadata.");
    }
    if (registry.findVersion(modelName, commitHash) == nullptr) {
        SPDLOG_LOGGER_ERROR(registry_logger, "Commit hash: {} not found for model: {}", commitHash, modelName);
        return Status(StatusCode::MODEL_VERSION_MISSING, "Commit hash '" + commitHash + "' not found for model '" + modelName + "'.");
    }
    auto previous = registry.getLatest(modelName);
    registry.setLatestPointer(modelName, commitHash);
    SPDLOG_LOGGER_INFO(registry_logger, "Model: {} latest changed from: {} to: {}", modelName, previous.value_or("<none>"), commitHash);
    return StatusCode::OK;
}

}  // namespace nexus
