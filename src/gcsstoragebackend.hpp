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

#include "google/cloud/storage/client.h"

#include "storagebackend.hpp"

namespace nexus {

class GCSStorageBackend : public StorageBackend {
public:
    /**
     * @brief Uses GoogleDefaultCredentials when GOOGLE_APPLICATION_CREDENTIALS is set, anonymous access otherwise
     */
    explicit GCSStorageBackend(const std::string& bucket);

    GCSStorageBackend(const std::string& bucket, const google::cloud::storage::ClientOptions& options);

    virtual ~GCSStorageBackend();

    Status upload(const std::string& localPath, const std::string& location) override;

    Status download(const std::string& location, const std::string& localPath) override;

    Status exists(const std::string& location, bool* exists) override;

    std::string describe(const std::string& location) const override;

private:
    StatusCode mapError(const google::cloud::Status& status, StatusCode fallback) const;

    std::string bucket_;

    google::cloud::storage::Client client_;
};

}  // namespace nexus
