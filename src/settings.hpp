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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nexus {

enum class CommandType {
    UNKNOWN,
    STORE,
    LOAD,
    LIST,
    ROLLBACK
};

struct CommandSettingsImpl {
    CommandType command = CommandType::UNKNOWN;
    std::string projectRoot;
    std::string logLevel = "WARNING";
    std::string logPath;
    // store: path of model file; load: output path
    std::string filePath;
    // store, rollback: model name; load: optional --model-name
    std::optional<std::string> modelName;
    // load: commit hash or "latest"; rollback: commit hash
    std::string commitHash;
};

struct ServerSettingsImpl {
    uint32_t port = 8000;
    std::string bindAddress = "0.0.0.0";
    uint32_t restWorkers = 8;
    std::string logLevel = "INFO";
    std::string logPath;
    std::string modelPath;
    std::string modelName;
    std::string modelVersion = "latest";
    std::string provider = "local";
    std::string s3Bucket;
    std::string awsRegion = "us-east-1";
    std::string s3Endpoint;
    std::string gcsBucket;
    std::string localRoot;
    std::string registryPath = ".nexus_meta.json";
    uint32_t maxBatchSize = 32;
    uint32_t batchTimeoutMs = 50;
};

}  // namespace nexus
