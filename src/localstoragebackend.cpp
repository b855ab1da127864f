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
#include "localstoragebackend.hpp"

#include "filesystem.hpp"
#include "logging.hpp"

namespace nexus {

LocalStorageBackend::LocalStorageBackend(const std::string& rootPath) :
    rootPath(rootPath) {
    SPDLOG_LOGGER_TRACE(storage_logger, "LocalStorageBackend ctor with root: {}", rootPath);
}

std::string LocalStorageBackend::objectPath(const std::string& location) const {
    return FileSystem::joinPath({rootPath, location});
}

std::string LocalStorageBackend::describe(const std::string& location) const {
    return objectPath(location);
}

Status LocalStorageBackend::upload(const std::string& localPath, const std::string& location) {
    if (!isLocationValid(location)) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Invalid storage location: {}", location);
        return Status(StatusCode::PATH_INVALID, location);
    }
    bool isFile = false;
    auto status = FileSystem::isRegularFile(localPath, &isFile);
    if (status != StatusCode::OK || !isFile) {
        SPDLOG_LOGGER_ERROR(storage_logger, "File to upload does not exist: {}", localPath);
        return Status(StatusCode::FILE_INVALID, localPath);
    }
    status = FileSystem::copyFile(localPath, objectPath(location));
    if (status != StatusCode::OK) {
        return Status(StatusCode::LOCAL_STORAGE_COPY_FAILED, localPath + " -> " + objectPath(location));
    }
    SPDLOG_LOGGER_DEBUG(storage_logger, "Uploaded {} to {}", localPath, objectPath(location));
    return StatusCode::OK;
}

Status LocalStorageBackend::download(const std::string& location, const std::string& localPath) {
    if (!isLocationValid(location)) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Invalid storage location: {}", location);
        return Status(StatusCode::PATH_INVALID, location);
    }
    bool found = false;
    auto status = exists(location, &found);
    if (!status.ok()) {
        return status;
    }
    if (!found) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Object not found: {}", objectPath(location));
        return Status(StatusCode::LOCAL_STORAGE_FILE_NOT_FOUND, objectPath(location));
    }
    auto copyStatus = FileSystem::copyFile(objectPath(location), localPath);
    if (copyStatus != StatusCode::OK) {
        return Status(StatusCode::LOCAL_STORAGE_COPY_FAILED, objectPath(location) + " -> " + localPath);
    }
    SPDLOG_LOGGER_DEBUG(storage_logger, "Downloaded {} to {}", objectPath(location), localPath);
    return StatusCode::OK;
}

Status LocalStorageBackend::exists(const std::string& location, bool* exists) {
    *exists = false;
    if (!isLocationValid(location)) {
        return Status(StatusCode::PATH_INVALID, location);
    }
    return FileSystem::isRegularFile(objectPath(location), exists);
}

}  // namespace nexus
