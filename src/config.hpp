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
#include <string>

#include "settings.hpp"
#include "status.hpp"

namespace nexus {
struct StorageSettings;

/**
     * @brief Validated configuration of nexus_server
     */
class Config {
    ServerSettingsImpl serverSettings;

public:
    Config() = default;

    /**
         * @brief Takes over settings prepared by the command line parser and validates them
         *
         * @return true when settings are valid
         */
    bool parse(ServerSettingsImpl*);

    /**
         * @brief Validate passed arguments
         *
         * @return bool
         */
    bool validate();

    /**
         * @brief checks if input is a proper hostname or IP address value
         *
         * @return bool
         */
    static bool check_hostname_or_ip(const std::string& input);

    /**
         * @brief Storage settings for loading the model from the registry
         *
         * @return CONFIG_PROVIDER_INVALID, CONFIG_BUCKET_MISSING
         */
    Status storageSettings(StorageSettings* settings) const;

    /**
         * @brief Model is resolved through registry and storage instead of local path
         */
    bool loadsFromRegistry() const;

    const ServerSettingsImpl& getServerSettings() const { return serverSettings; }
    uint32_t port() const { return serverSettings.port; }
    const std::string& bindAddress() const { return serverSettings.bindAddress; }
    uint32_t restWorkers() const { return serverSettings.restWorkers; }
    const std::string& logLevel() const { return serverSettings.logLevel; }
    const std::string& logPath() const { return serverSettings.logPath; }
    const std::string& modelPath() const { return serverSettings.modelPath; }
    const std::string& modelName() const { return serverSettings.modelName; }
    const std::string& modelVersion() const { return serverSettings.modelVersion; }
    const std::string& provider() const { return serverSettings.provider; }
    const std::string& registryPath() const { return serverSettings.registryPath; }
    uint32_t maxBatchSize() const { return serverSettings.maxBatchSize; }
    uint32_t batchTimeoutMs() const { return serverSettings.batchTimeoutMs; }
};
}  // namespace nexus
