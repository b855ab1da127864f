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

#include "status.hpp"

namespace nexus {
class ArtifactRegistry;

extern const std::string LATEST_SELECTOR;

/**
 * @brief Translates a selector (commit hash or "latest") into a storage location.
 *
 * Without a model name an explicit hash is looked up across models in registry
 * iteration order and the first match wins.
 * Unknown names or hashes are not errors: location is set to std::nullopt.
 *
 * @param location result, std::nullopt when nothing matches
 * @return REGISTRY_NOT_INITIALIZED when the registry file does not exist,
 * INVALID_ARGUMENT for an empty selector or "latest" without a model name
 */
Status resolveStorageLocation(const ArtifactRegistry& registry,
    const std::string& selector,
    const std::optional<std::string>& modelName,
    std::optional<std::string>* location);

}  // namespace nexus
