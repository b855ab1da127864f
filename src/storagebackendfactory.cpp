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
#include "storagebackendfactory.hpp"

#include <exception>

#include "gcsstoragebackend.hpp"
#include "localstoragebackend.hpp"
#include "logging.hpp"
#include "s3storagebackend.hpp"

namespace nexus {

Status createStorageBackend(const StorageSettings& settings, std::unique_ptr<StorageBackend>* backend) {
    switch (settings.provider) {
    case StorageProvider::S3:
        if (settings.bucket.empty()) {
            return Status(StatusCode::CONFIG_BUCKET_MISSING, "s3 provider requires bucket");
        }
        *backend = std::make_unique<S3StorageBackend>(settings.bucket, settings.region, settings.endpoint);
        return StatusCode::OK;
    case StorageProvider::GCS:
        if (settings.bucket.empty()) {
            return Status(StatusCode::CONFIG_BUCKET_MISSING, "gcs provider requires bucket");
        }
        try {
            *backend = std::make_unique<GCSStorageBackend>(settings.bucket);
        } catch (const std::exception& e) {
            SPDLOG_LOGGER_ERROR(gcs_logger, "Failed to create GCS client: {}", e.what());
            return Status(StatusCode::GCS_INVALID_ACCESS, e.what());
        }
        return StatusCode::OK;
    case StorageProvider::LOCAL:
        if (settings.localRoot.empty()) {
            return Status(StatusCode::CONFIG_BUCKET_MISSING, "local provider requires local root directory");
        }
        *backend = std::make_unique<LocalStorageBackend>(settings.localRoot);
        return StatusCode::OK;
    }
    return StatusCode::CONFIG_PROVIDER_INVALID;
}

}  // namespace nexus
