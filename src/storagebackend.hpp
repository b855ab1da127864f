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

enum class StorageProvider {
    S3,
    GCS,
    LOCAL
};

std::string toString(StorageProvider provider);

/**
 * @brief Parses provider name, case insensitive
 *
 * @return CONFIG_PROVIDER_INVALID for unknown names
 */
Status parseStorageProvider(const std::string& name, StorageProvider* provider);

/**
 * @brief Moves artifact bytes between local disk and a bucket-like object store.
 * Locations are keys relative to the configured bucket.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() {}

    /**
     * @brief Uploads local file under given location, replacing existing object
     *
     * @param localPath
     * @param location
     * @return Status
     */
    virtual Status upload(const std::string& localPath, const std::string& location) = 0;

    /**
     * @brief Downloads object to local path, creating parent directories of the destination
     *
     * @param location
     * @param localPath
     * @return Status
     */
    virtual Status download(const std::string& location, const std::string& localPath) = 0;

    /**
     * @brief Checks if object exists
     *
     * @param location
     * @param exists
     * @return Status
     */
    virtual Status exists(const std::string& location, bool* exists) = 0;

    /**
     * @brief Full URI of the location, for display only
     */
    virtual std::string describe(const std::string& location) const = 0;

    /**
     * @brief Builds "{model}/{commit}.{extension}", extension falls back to "bin"
     */
    static std::string buildStorageLocation(const std::string& modelName, const std::string& commitHash, const std::string& fileExtension);

    static bool isLocationValid(const std::string& location);

    static const std::string S3_URL_PREFIX;

    static const std::string GCS_URL_PREFIX;

    static const std::string DEFAULT_EXTENSION;
};

}  // namespace nexus
