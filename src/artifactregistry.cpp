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
#include "artifactregistry.hpp"

#include <utility>

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "filesystem.hpp"
#include "logging.hpp"
#include "schema.hpp"
#include "version.hpp"

namespace nexus {

ArtifactRegistry::ArtifactRegistry(const std::string& registryPath) :
    registryPath(registryPath) {}

std::string ArtifactRegistry::defaultPath(const std::string& projectRoot) {
    if (projectRoot.empty()) {
        return REGISTRY_FILE_NAME;
    }
    return FileSystem::joinPath({projectRoot, REGISTRY_FILE_NAME});
}

bool ArtifactRegistry::fileExists() const {
    bool exists = false;
    if (FileSystem::fileExists(registryPath, &exists) != StatusCode::OK) {
        return false;
    }
    return exists;
}

Status ArtifactRegistry::requireExists() const {
    if (!fileExists()) {
        SPDLOG_LOGGER_DEBUG(registry_logger, "Registry file does not exist: {}", registryPath);
        return StatusCode::REGISTRY_NOT_INITIALIZED;
    }
    return StatusCode::OK;
}

Status ArtifactRegistry::load() {
    if (!fileExists()) {
        SPDLOG_LOGGER_DEBUG(registry_logger, "Registry file: {} not found. Starting with empty registry", registryPath);
        clear();
        return StatusCode::OK;
    }
    std::string contents;
    auto status = FileSystem::readTextFile(registryPath, &contents);
    if (status != StatusCode::OK) {
        SPDLOG_LOGGER_ERROR(registry_logger, "Failed to read registry file: {}", registryPath);
        return status;
    }
    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse(contents.c_str(), contents.size());
    if (!parseResult) {
        SPDLOG_LOGGER_ERROR(registry_logger, "Registry file: {} is not a valid JSON file. Error: {}",
            registryPath, rapidjson::GetParseError_En(parseResult.Code()));
        return Status(StatusCode::REGISTRY_CORRUPT,
            std::string("Failed to parse metadata file: ") + rapidjson::GetParseError_En(parseResult.Code()));
    }
    return parse(document);
}

Status ArtifactRegistry::parse(rapidjson::Document& document) {
    auto status = validateJsonAgainstSchema(document, REGISTRY_SCHEMA.c_str(), true);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(registry_logger, "Registry file: {} is not in valid registry format", registryPath);
        return Status(StatusCode::REGISTRY_CORRUPT, status.string());
    }

    models_map_t parsedModels;
    latest_map_t parsedLatest;
    auto modelsIt = document.FindMember("models");
    if (modelsIt != document.MemberEnd()) {
        for (const auto& model : modelsIt->value.GetObject()) {
            const std::string modelName = model.name.GetString();
            auto& versions = parsedModels[modelName];
            for (const auto& version : model.value.GetObject()) {
                VersionEntry entry;
                entry.commitHash = version.name.GetString();
                entry.storageLocation = version.value["storage_uri"].GetString();
                entry.fileSizeBytes = version.value["file_size"].GetUint64();
                entry.fileExtension = version.value["file_extension"].GetString();
                entry.timestamp = version.value["timestamp"].GetString();
                const std::string recordedHash = version.value["commit_hash"].GetString();
                if (recordedHash != entry.commitHash) {
                    SPDLOG_LOGGER_WARN(registry_logger, "Model: {} version key: {} does not match recorded commit hash: {}. Using the key",
                        modelName, entry.commitHash, recordedHash);
                }
                versions.emplace(entry.commitHash, std::move(entry));
            }
        }
    }
    auto latestIt = document.FindMember("latest");
    if (latestIt != document.MemberEnd()) {
        for (const auto& pointer : latestIt->value.GetObject()) {
            const std::string modelName = pointer.name.GetString();
            const std::string commitHash = pointer.value.GetString();
            auto modelIt = parsedModels.find(modelName);
            if (modelIt == parsedModels.end() || modelIt->second.count(commitHash) == 0) {
                SPDLOG_LOGGER_ERROR(registry_logger, "Latest pointer of model: {} references unknown commit hash: {}", modelName, commitHash);
                return Status(StatusCode::REGISTRY_CORRUPT,
                    "latest pointer of model '" + modelName + "' references unknown commit hash '" + commitHash + "'");
            }
            parsedLatest.emplace(modelName, commitHash);
        }
    }
    models = std::move(parsedModels);
    latest = std::move(parsedLatest);
    SPDLOG_LOGGER_DEBUG(registry_logger, "Loaded registry: {} with {} models", registryPath, models.size());
    return StatusCode::OK;
}

std::string ArtifactRegistry::serialize() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    writer.StartObject();
    writer.Key("models");
    writer.StartObject();
    for (const auto& [modelName, versions] : models) {
        writer.Key(modelName.c_str(), static_cast<rapidjson::SizeType>(modelName.size()));
        writer.StartObject();
        for (const auto& [commitHash, entry] : versions) {
            writer.Key(commitHash.c_str(), static_cast<rapidjson::SizeType>(commitHash.size()));
            writer.StartObject();
            writer.Key("storage_uri");
            writer.String(entry.storageLocation.c_str(), static_cast<rapidjson::SizeType>(entry.storageLocation.size()));
            writer.Key("commit_hash");
            writer.String(commitHash.c_str(), static_cast<rapidjson::SizeType>(commitHash.size()));
            writer.Key("file_size");
            writer.Uint64(entry.fileSizeBytes);
            writer.Key("file_extension");
            writer.String(entry.fileExtension.c_str(), static_cast<rapidjson::SizeType>(entry.fileExtension.size()));
            writer.Key("timestamp");
            writer.String(entry.timestamp.c_str(), static_cast<rapidjson::SizeType>(entry.timestamp.size()));
            writer.EndObject();
        }
        writer.EndObject();
    }
    writer.EndObject();
    writer.Key("latest");
    writer.StartObject();
    for (const auto& [modelName, commitHash] : latest) {
        writer.Key(modelName.c_str(), static_cast<rapidjson::SizeType>(modelName.size()));
        writer.String(commitHash.c_str(), static_cast<rapidjson::SizeType>(commitHash.size()));
    }
    writer.EndObject();
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

Status ArtifactRegistry::save() const {
    SPDLOG_LOGGER_DEBUG(registry_logger, "Saving registry: {}", registryPath);
    auto status = FileSystem::createFileOverwrite(registryPath, serialize());
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(registry_logger, "Failed to save registry: {} - {}", registryPath, status.string());
    }
    return status;
}

bool ArtifactRegistry::hasModel(const std::string& modelName) const {
    auto it = models.find(modelName);
    return it != models.end() && !it->second.empty();
}

const VersionEntry* ArtifactRegistry::findVersion(const std::string& modelName, const std::string& commitHash) const {
    auto modelIt = models.find(modelName);
    if (modelIt == models.end()) {
        return nullptr;
    }
    auto versionIt = modelIt->second.find(commitHash);
    if (versionIt == modelIt->second.end()) {
        return nullptr;
    }
    return &versionIt->second;
}

std::optional<std::string> ArtifactRegistry::getLatest(const std::string& modelName) const {
    auto it = latest.find(modelName);
    if (it == latest.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ArtifactRegistry::putVersion(const std::string& modelName, const VersionEntry& entry) {
    models[modelName][entry.commitHash] = entry;
}

void ArtifactRegistry::setLatestPointer(const std::string& modelName, const std::string& commitHash) {
    latest[modelName] = commitHash;
}

void ArtifactRegistry::clear() {
    models.clear();
    latest.clear();
}

}  // namespace nexus
