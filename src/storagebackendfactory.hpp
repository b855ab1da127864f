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
#include "storagebackend.hpp"

namespace nexus {

struct StorageSettings {
    StorageProvider provider = StorageProvider::S3;
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;
    std::string localRoot;
};

/**
 * @brief Creates the storage backend variant selected by settings.provider
 *
 * @return CONFIG_BUCKET_MISSING when the provider needs a bucket (or local root) that is not set
 */
Status createStorageBackend(const StorageSettings& settings, std::unique_ptr<StorageBackend>* backend);

}  // namespace nexus
