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
#include "resolution_service.hpp"

#include "artifactregistry.hpp"
#include "logging.hpp"

namespace nexus {

const std::string LATEST_SELECTOR = "latest";

Status resolveStorageLocation(const ArtifactRegistry& registry,
    const std::string& selector,
    const std::optional<std::string>& modelName,
    std::optional<std::string>* location) {
    *location = std::nullopt;
    auto status = registry.requireExists();
    if (!status.ok()) {
        return status;
    }
    if (selector.empty()) {
        return Status(StatusCode::INVALID_ARGUMENT, "commit hash must not be empty");
    }
    const bool hasModelName = modelName.has_value() && !modelName->empty();
    std::string commitHash = selector;
    if (selector == LATEST_SELECTOR) {
        if (!hasModelName) {
            return Status(StatusCode::INVALID_ARGUMENT, "Model name is required when using 'latest' commit hash");
        }
        auto latest = registry.getLatest(*modelName);
        if (!latest) {
            SPDLOG_LOGGER_DEBUG(registry_logger, "No latest pointer for model: {}", *modelName);
            return StatusCode::OK;
        }
        commitHash = *latest;
    }
    if (hasModelName) {
        const VersionEntry* entry = registry.findVersion(*modelName, commitHash);
        if (entry != nullptr) {
            *location = entry->storageLocation;
        }
    } else {
        for (const auto& [name, versions] : registry.getModels()) {
            auto it = versions.find(commitHash);
            if (it != versions.end()) {
                SPDLOG_LOGGER_DEBUG(registry_logger, "Commit hash: {} resolved under model: {}", commitHash, name);
                *location = it->second.storageLocation;
                break;
            }
        }
    }
    if (!location->has_value()) {
        SPDLOG_LOGGER_DEBUG(registry_logger, "Selector: {} did not match any registered version", selector);
    }
    return StatusCode::OK;
}

}  // namespace nexus
