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
#include "gcsstoragebackend.hpp"

#include <cstdlib>
#include <stdexcept>

#include "filesystem.hpp"
#include "logging.hpp"

namespace nexus {

namespace gcs = google::cloud::storage;

namespace {

gcs::ClientOptions createDefaultOrAnonymousClientOptions() {
    if (std::getenv("GOOGLE_APPLICATION_CREDENTIALS") == nullptr) {
        auto credentials = gcs::oauth2::CreateAnonymousCredentials();
        if (!credentials) {
            SPDLOG_LOGGER_ERROR(gcs_logger, "Unable to create anonymous GCS credentials");
            throw std::runtime_error("Unable to create anonymous GCS credentials");
        }
        return gcs::ClientOptions(credentials);
    }
    auto credentials = gcs::oauth2::GoogleDefaultCredentials();
    if (!credentials) {
        SPDLOG_LOGGER_ERROR(gcs_logger, "Unable to create default GCS credentials: {}", credentials.status().message());
        throw std::runtime_error("Unable to create default GCS credentials");
    }
    return gcs::ClientOptions(*credentials);
}

}  // namespace

GCSStorageBackend::GCSStorageBackend(const std::string& bucket) :
    bucket_(bucket),
    client_{createDefaultOrAnonymousClientOptions()} {
    SPDLOG_LOGGER_TRACE(gcs_logger, "GCSStorageBackend default ctor bucket: {}", bucket);
}

GCSStorageBackend::GCSStorageBackend(const std::string& bucket, const gcs::ClientOptions& options) :
    bucket_(bucket),
    client_{options, gcs::StrictIdempotencyPolicy()} {
    SPDLOG_LOGGER_TRACE(gcs_logger, "GCSStorageBackend ctor with custom options bucket: {}", bucket);
}

GCSStorageBackend::~GCSStorageBackend() { SPDLOG_LOGGER_TRACE(gcs_logger, "GCSStorageBackend dtor"); }

std::string GCSStorageBackend::describe(const std::string& location) const {
    return GCS_URL_PREFIX + bucket_ + "/" + location;
}

StatusCode GCSStorageBackend::mapError(const google::cloud::Status& status, StatusCode fallback) const {
    switch (status.code()) {
    case google::cloud::StatusCode::kNotFound:
        return StatusCode::GCS_FILE_NOT_FOUND;
    case google::cloud::StatusCode::kPermissionDenied:
    case google::cloud::StatusCode::kUnauthenticated:
        return StatusCode::GCS_INVALID_ACCESS;
    case google::cloud::StatusCode::kInvalidArgument:
        return StatusCode::GCS_FILE_INVALID;
    default:
        return fallback;
    }
}

Status GCSStorageBackend::upload(const std::string& localPath, const std::string& location) {
    if (!isLocationValid(location)) {
        SPDLOG_LOGGER_ERROR(gcs_logger, "Invalid GCS object name: {}", location);
        return Status(StatusCode::GCS_FILE_INVALID, location);
    }
    SPDLOG_LOGGER_DEBUG(gcs_logger, "Uploading {} to {}", localPath, describe(location));
    google::cloud::StatusOr<gcs::ObjectMetadata> metadata = client_.UploadFile(localPath, bucket_, location);
    if (!metadata) {
        SPDLOG_LOGGER_ERROR(gcs_logger, "Failed to upload {} to {}: {}", localPath, describe(location), metadata.status().message());
        return Status(mapError(metadata.status(), StatusCode::GCS_FAILED_PUT_OBJECT), metadata.status().message());
    }
    SPDLOG_LOGGER_TRACE(gcs_logger, "Uploaded {} (bytes={})", describe(location), metadata->size());
    return StatusCode::OK;
}

Status GCSStorageBackend::download(const std::string& location, const std::string& localPath) {
    if (!isLocationValid(location)) {
        SPDLOG_LOGGER_ERROR(gcs_logger, "Invalid GCS object name: {}", location);
        return Status(StatusCode::GCS_FILE_INVALID, location);
    }
    auto dirStatus = FileSystem::createParentDirectories(localPath);
    if (dirStatus != StatusCode::OK) {
        return dirStatus;
    }
    SPDLOG_LOGGER_DEBUG(gcs_logger, "Downloading {} to {}", describe(location), localPath);
    google::cloud::Status status = client_.DownloadToFile(bucket_, location, localPath);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(gcs_logger, "Failed to download {}: {}", describe(location), status.message());
        return Status(mapError(status, StatusCode::GCS_FAILED_GET_OBJECT), status.message());
    }
    return StatusCode::OK;
}

Status GCSStorageBackend::exists(const std::string& location, bool* exists) {
    *exists = false;
    if (!isLocationValid(location)) {
        return Status(StatusCode::GCS_FILE_INVALID, location);
    }
    google::cloud::StatusOr<gcs::ObjectMetadata> metadata = client_.GetObjectMetadata(bucket_, location);
    if (metadata) {
        *exists = true;
        return StatusCode::OK;
    }
    auto code = mapError(metadata.status(), StatusCode::GCS_METADATA_FAIL);
    if (code == StatusCode::GCS_FILE_NOT_FOUND) {
        SPDLOG_LOGGER_TRACE(gcs_logger, "Object {} does not exist", describe(location));
        return StatusCode::OK;
    }
    SPDLOG_LOGGER_ERROR(gcs_logger, "Failed to check object {}: {}", describe(location), metadata.status().message());
    return Status(code, metadata.status().message());
}

}  // namespace nexus
