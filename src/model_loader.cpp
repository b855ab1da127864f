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
#include "model_loader.hpp"

#include <optional>
#include <set>
#include <utility>

#include "artifactregistry.hpp"
#include "filesystem.hpp"
#include "linear_model_backend.hpp"
#include "logging.hpp"
#include "model_backend.hpp"
#include "resolution_service.hpp"
#include "storagebackend.hpp"
#include "stringutils.hpp"

namespace nexus {

namespace {
class TemporaryDirectoryGuard {
    std::string path;

public:
    explicit TemporaryDirectoryGuard(std::string path) :
        path(std::move(path)) {}
    ~TemporaryDirectoryGuard() {
        if (FileSystem::deleteFileFolder(path) != StatusCode::OK) {
            SPDLOG_LOGGER_WARN(gateway_logger, "Failed to remove temporary directory: {}", path);
        }
    }
};
}  // namespace

bool ModelLoader::isUnsupportedFormat(const std::string& extension) {
    static const std::set<std::string> unsupported{"pkl", "pickle", "pt", "pth"};
    return unsupported.count(toLower(extension)) > 0;
}

Status ModelLoader::loadFromPath(const std::string& path, std::unique_ptr<ModelBackend>* model) {
    bool isFile = false;
    auto sc = FileSystem::isRegularFile(path, &isFile);
    if (sc != StatusCode::OK || !isFile) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Model file not found: {}", path);
        return Status(StatusCode::FILE_INVALID, "Model file not found: " + path);
    }
    const std::string extension = FileSystem::getFileExtension(path);
    if (isUnsupportedFormat(extension)) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Model format .{} cannot be executed: {}", extension, path);
        return Status(StatusCode::MODEL_FORMAT_UNSUPPORTED, "." + extension);
    }
    std::string contents;
    sc = FileSystem::readTextFile(path, &contents);
    if (sc != StatusCode::OK) {
        return Status(sc, path);
    }
    auto status = parseModelDefinition(contents, model);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Failed to load model from {}: {}", path, status.string());
        return status;
    }
    SPDLOG_LOGGER_INFO(gateway_logger, "Loaded {} model from {}", (*model)->getType(), path);
    return StatusCode::OK;
}

Status ModelLoader::loadFromRegistry(const ArtifactRegistry& registry,
    StorageBackend& storage,
    const std::string& modelName,
    const std::string& selector,
    std::unique_ptr<ModelBackend>* model,
    std::string* resolvedLocation) {
    std::optional<std::string> location;
    auto status = resolveStorageLocation(registry, selector, modelName, &location);
    if (!status.ok()) {
        return status;
    }
    if (!location) {
        if (selector == LATEST_SELECTOR) {
            return Status(StatusCode::MODEL_NAME_MISSING, "No latest model found for model name: " + modelName);
        }
        return Status(StatusCode::MODEL_VERSION_MISSING, "Model artifact not found for commit hash: " + selector);
    }
    SPDLOG_LOGGER_INFO(gateway_logger, "Resolved model {} version {} to {}", modelName, selector, storage.describe(*location));

    std::string tempDir;
    auto sc = FileSystem::createTempPath(&tempDir);
    if (sc != StatusCode::OK) {
        return sc;
    }
    TemporaryDirectoryGuard guard(tempDir);
    std::string extension = FileSystem::getFileExtension(*location);
    const std::string localPath = FileSystem::joinPath({tempDir, "model." + (extension.empty() ? StorageBackend::DEFAULT_EXTENSION : extension)});
    status = storage.download(*location, localPath);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Failed to download model artifact {}: {}", *location, status.string());
        return status;
    }
    status = loadFromPath(localPath, model);
    if (!status.ok()) {
        return status;
    }
    if (resolvedLocation != nullptr) {
        *resolvedLocation = *location;
    }
    return StatusCode::OK;
}

}  // namespace nexus
