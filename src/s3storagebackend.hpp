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

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

#include "storagebackend.hpp"

namespace nexus {

class S3StorageBackend : public StorageBackend {
public:
    /**
     * @brief Initializes AWS SDK and creates S3 client for the bucket
     *
     * @param bucket
     * @param region
     * @param endpoint optional endpoint override for S3 compatible stores, enables path style addressing
     */
    S3StorageBackend(const std::string& bucket, const std::string& region, const std::string& endpoint);

    ~S3StorageBackend();

    Status upload(const std::string& localPath, const std::string& location) override;

    Status download(const std::string& location, const std::string& localPath) override;

    Status exists(const std::string& location, bool* exists) override;

    std::string describe(const std::string& location) const override;

private:
    template <typename ErrorT>
    StatusCode mapError(const ErrorT& error, StatusCode fallback) const;

    Aws::SDKOptions options_;

    std::string bucket_;

    std::unique_ptr<Aws::S3::S3Client> client_;
};

}  // namespace nexus
