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

#include <string>

#include "status.hpp"

namespace nexus {
class ArtifactRegistry;

/**
 * @brief Points the model latest pointer at an already registered commit.
 * Registry is left untouched on failure. Changes stay in memory until save().
 *
 * @return REGISTRY_NOT_INITIALIZED, MODEL_NAME_MISSING or MODEL_VERSION_MISSING
 */
Status setLatest(ArtifactRegistry& registry, const std::string& modelName, const std::string& commitHash);

}  // namespace nexus
