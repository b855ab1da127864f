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
#include "storagebackend.hpp"

#include "filesystem.hpp"
#include "stringutils.hpp"

namespace nexus {

const std::string StorageBackend::S3_URL_PREFIX = "s3://";

const std::string StorageBackend::GCS_URL_PREFIX = "gs://";

const std::string StorageBackend::DEFAULT_EXTENSION = "bin";

std::string toString(StorageProvider provider) {
    switch (provider) {
    case StorageProvider::S3:
        return "s3";
    case StorageProvider::GCS:
        return "gcs";
    case StorageProvider::LOCAL:
        return "local";
    }
    return "unknown";
}

Status parseStorageProvider(const std::string& name, StorageProvider* provider) {
    const std::string lowered = toLower(name);
    if (lowered == "s3") {
        *provider = StorageProvider::S3;
    } else if (lowered == "gcs") {
        *provider = StorageProvider::GCS;
    } else if (lowered == "local") {
        *provider = StorageProvider::LOCAL;
    } else {
        return Status(StatusCode::CONFIG_PROVIDER_INVALID, name);
    }
    return StatusCode::OK;
}

std::string StorageBackend::buildStorageLocation(const std::string& modelName, const std::string& commitHash, const std::string& fileExtension) {
    return modelName + "/" + commitHash + "." + (fileExtension.empty() ? DEFAULT_EXTENSION : fileExtension);
}

bool StorageBackend::isLocationValid(const std::string& location) {
    return !location.empty() && !FileSystem::isAbsolutePath(location) && !FileSystem::isPathEscaped(location);
}

}  // namespace nexus
