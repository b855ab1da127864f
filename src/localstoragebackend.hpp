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

#include "storagebackend.hpp"

namespace nexus {

/**
 * @brief Directory on local disk acting as a bucket
 */
class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::string& rootPath);

    Status upload(const std::string& localPath, const std::string& location) override;

    Status download(const std::string& location, const std::string& localPath) override;

    Status exists(const std::string& location, bool* exists) override;

    std::string describe(const std::string& location) const override;

private:
    std::string objectPath(const std::string& location) const;

    std::string rootPath;
};

}  // namespace nexus
