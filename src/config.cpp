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
#include "config.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <regex>
#include <string>
#include <vector>

#include <netdb.h>
#include <sys/socket.h>

#include "storagebackend.hpp"
#include "storagebackendfactory.hpp"
#include "stringutils.hpp"

namespace nexus {

const uint32_t MAX_PORT_NUMBER = std::numeric_limits<uint16_t>::max();
const uint32_t MAX_REST_WORKERS = 10'000;

bool Config::parse(ServerSettingsImpl* settings) {
    this->serverSettings = *settings;
    return validate();
}

static bool is_ipv6(const std::string& s) {
    addrinfo hints{};
    hints.ai_family = AF_INET6;
    hints.ai_flags = AI_NUMERICHOST;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(s.c_str(), nullptr, &hints, &res);
    if (res) {
        freeaddrinfo(res);
    }
    return rc == 0;
}

bool Config::check_hostname_or_ip(const std::string& input) {
    if (input.size() > 255) {
        return false;
    }
    bool all_numeric = true;
    for (char c : input) {
        if (c == '.' || c == ':') {
            continue;
        }
        if (!::isxdigit(c)) {
            all_numeric = false;
        }
    }
    if (all_numeric) {
        static const std::regex valid_ipv4_regex("^(([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])\\.){3}([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])$");
        return std::regex_match(input, valid_ipv4_regex) || is_ipv6(input);
    } else {
        static const std::regex valid_hostname_regex("^(([a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9\\-]*[a-zA-Z0-9])\\.)*([A-Za-z0-9]|[A-Za-z0-9][A-Za-z0-9\\-]*[A-Za-z0-9])$");
        return std::regex_match(input, valid_hostname_regex);
    }
}

bool Config::validate() {
    if (port() == 0 || port() > MAX_PORT_NUMBER) {
        std::cerr << "port number out of range from 1 to " << MAX_PORT_NUMBER << std::endl;
        return false;
    }
    if (!check_hostname_or_ip(bindAddress())) {
        std::cerr << "host has invalid format: proper hostname or IP address expected." << std::endl;
        return false;
    }
    if (restWorkers() < 1 || restWorkers() > MAX_REST_WORKERS) {
        std::cerr << "rest_workers count should be from 1 to " << MAX_REST_WORKERS << std::endl;
        return false;
    }
    if (maxBatchSize() < 1) {
        std::cerr << "max_batch_size should be at least 1" << std::endl;
        return false;
    }
    StorageProvider parsedProvider;
    if (!parseStorageProvider(provider(), &parsedProvider).ok()) {
        std::cerr << "provider should be one of: s3, gcs, local" << std::endl;
        return false;
    }
    static const std::vector<std::string> logLevels{"TRACE", "DEBUG", "INFO", "WARNING", "ERROR"};
    if (std::find(logLevels.begin(), logLevels.end(), logLevel()) == logLevels.end()) {
        std::cerr << "log_level should be one of: TRACE, DEBUG, INFO, WARNING, ERROR" << std::endl;
        return false;
    }
    if (modelVersion().empty()) {
        std::cerr << "model_version cannot be empty" << std::endl;
        return false;
    }
    return true;
}

bool Config::loadsFromRegistry() const {
    return modelPath().empty() && !modelName().empty();
}

Status Config::storageSettings(StorageSettings* settings) const {
    auto status = parseStorageProvider(provider(), &settings->provider);
    if (!status.ok()) {
        return status;
    }
    settings->region = serverSettings.awsRegion;
    settings->endpoint = serverSettings.s3Endpoint;
    switch (settings->provider) {
    case StorageProvider::S3:
        settings->bucket = serverSettings.s3Bucket;
        break;
    case StorageProvider::GCS:
        settings->bucket = serverSettings.gcsBucket;
        break;
    case StorageProvider::LOCAL:
        settings->localRoot = serverSettings.localRoot;
        break;
    }
    if (settings->provider == StorageProvider::LOCAL ? settings->localRoot.empty() : settings->bucket.empty()) {
        return Status(StatusCode::CONFIG_BUCKET_MISSING, toString(settings->provider));
    }
    return StatusCode::OK;
}

}  // namespace nexus
