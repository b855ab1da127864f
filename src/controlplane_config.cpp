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
#include "controlplane_config.hpp"

#include <cstdlib>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "filesystem.hpp"
#include "logging.hpp"
#include "schema.hpp"
#include "storagebackendfactory.hpp"
#include "version.hpp"

namespace nexus {

static void overrideFromEnv(const char* name, std::string* value) {
    const char* env = std::getenv(name);
    if (env != nullptr && env[0] != '\0') {
        SPDLOG_DEBUG("Using {} from environment", name);
        *value = env;
    }
}

Status parseControlPlaneConfig(const std::string& contents, StorageSettings* settings) {
    rapidjson::Document configJson;
    rapidjson::ParseResult parseResult = configJson.Parse(contents.c_str(), contents.size());
    if (!parseResult) {
        SPDLOG_ERROR("Configuration file is not a valid JSON file. Error: {}",
            rapidjson::GetParseError_En(parseResult.Code()));
        return Status(StatusCode::CONFIG_FILE_INVALID, rapidjson::GetParseError_En(parseResult.Code()));
    }
    auto status = validateJsonAgainstSchema(configJson, CONTROL_PLANE_CONFIG_SCHEMA.c_str(), true);
    if (!status.ok()) {
        return Status(StatusCode::CONFIG_FILE_INVALID, status.string());
    }
    auto it = configJson.FindMember("provider");
    if (it != configJson.MemberEnd()) {
        auto providerStatus = parseStorageProvider(it->value.GetString(), &settings->provider);
        if (!providerStatus.ok()) {
            return providerStatus;
        }
    }
    it = configJson.FindMember("bucket");
    if (it != configJson.MemberEnd())
        settings->bucket = it->value.GetString();
    it = configJson.FindMember("region");
    if (it != configJson.MemberEnd())
        settings->region = it->value.GetString();
    it = configJson.FindMember("endpoint");
    if (it != configJson.MemberEnd())
        settings->endpoint = it->value.GetString();
    it = configJson.FindMember("local_root");
    if (it != configJson.MemberEnd())
        settings->localRoot = it->value.GetString();
    return StatusCode::OK;
}

Status loadControlPlaneConfig(const std::string& projectRoot, StorageSettings* settings) {
    const std::string configPath = projectRoot.empty() ? CONTROL_PLANE_CONFIG_FILE_NAME : FileSystem::joinPath({projectRoot, CONTROL_PLANE_CONFIG_FILE_NAME});
    bool exists = false;
    auto status = FileSystem::fileExists(configPath, &exists);
    if (status != StatusCode::OK) {
        return status;
    }
    if (exists) {
        std::string contents;
        auto readStatus = FileSystem::readTextFile(configPath, &contents);
        if (readStatus != StatusCode::OK) {
            return Status(StatusCode::CONFIG_FILE_INVALID, configPath);
        }
        auto parseStatus = parseControlPlaneConfig(contents, settings);
        if (!parseStatus.ok()) {
            SPDLOG_ERROR("Failed to load configuration file: {}", configPath);
            return parseStatus;
        }
        SPDLOG_DEBUG("Loaded configuration file: {}", configPath);
    } else {
        SPDLOG_DEBUG("Configuration file: {} not found. Using defaults", configPath);
    }

    std::string provider;
    overrideFromEnv("NEXUS_PROVIDER", &provider);
    if (!provider.empty()) {
        auto providerStatus = parseStorageProvider(provider, &settings->provider);
        if (!providerStatus.ok()) {
            return providerStatus;
        }
    }
    overrideFromEnv("NEXUS_BUCKET", &settings->bucket);
    overrideFromEnv("AWS_REGION", &settings->region);

    if (settings->provider != StorageProvider::LOCAL && settings->bucket.empty()) {
        return Status(StatusCode::CONFIG_BUCKET_MISSING, "set bucket in " + configPath);
    }
    if (settings->provider == StorageProvider::LOCAL && settings->localRoot.empty()) {
        return Status(StatusCode::CONFIG_BUCKET_MISSING, "set local_root in " + configPath);
    }
    if (!settings->localRoot.empty() && !FileSystem::isAbsolutePath(settings->localRoot) && !projectRoot.empty()) {
        settings->localRoot = FileSystem::joinPath({projectRoot, settings->localRoot});
    }
    return StatusCode::OK;
}

}  // namespace nexus
