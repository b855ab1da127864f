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

#include <memory>
#include <string>

#include "status.hpp"

namespace nexus {
class ArtifactRegistry;
class ModelBackend;
class StorageBackend;

/**
 * @brief Loads model artifacts into an executable backend. Backend is selected
 * by the artifact file extension.
 */
class ModelLoader {
public:
    /**
     * @brief Extensions of model formats recognised but not executable by this server
     */
    static bool isUnsupportedFormat(const std::string& extension);

    /**
     * @brief Loads model artifact from local disk
     *
     * @return FILE_INVALID, MODEL_FORMAT_UNSUPPORTED or MODEL_DEFINITION_INVALID
     */
    static Status loadFromPath(const std::string& path, std::unique_ptr<ModelBackend>* model);

    /**
     * @brief Resolves (modelName, selector) in the registry, downloads the artifact
     * to a temporary directory and loads it. Temporary files are removed afterwards.
     *
     * @param resolvedLocation optional, set to the storage location that was loaded
     */
    static Status loadFromRegistry(const ArtifactRegistry& registry,
        StorageBackend& storage,
        const std::string& modelName,
        const std::string& selector,
        std::unique_ptr<ModelBackend>* model,
        std::string* resolvedLocation = nullptr);
};

}  // namespace nexus
