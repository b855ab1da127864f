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
struct StorageSettings;

/**
 * @brief Reads storage settings from .nexusrc in the project root.
 *
 * Missing file keeps defaults (s3 provider, no bucket). NEXUS_PROVIDER, NEXUS_BUCKET
 * and AWS_REGION environment variables override file values.
 *
 * @return CONFIG_FILE_INVALID, CONFIG_PROVIDER_INVALID or CONFIG_BUCKET_MISSING
 */
Status loadControlPlaneConfig(const std::string& projectRoot, StorageSettings* settings);

Status parseControlPlaneConfig(const std::string& contents, StorageSettings* settings);

}  // namespace nexus
