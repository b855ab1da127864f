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
#include "s3storagebackend.hpp"

#include <fstream>

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include "filesystem.hpp"
#include "logging.hpp"
#include "stringutils.hpp"

namespace nexus {

static const char* ALLOCATION_TAG = "nexus";

S3StorageBackend::S3StorageBackend(const std::string& bucket, const std::string& region, const std::string& endpoint) :
    bucket_(bucket) {
    Aws::InitAPI(options_);
    Aws::Client::ClientConfiguration config;
    if (!region.empty()) {
        config.region = region;
    }
    bool useVirtualAddressing = true;
    if (!endpoint.empty()) {
        std::string host = endpoint;
        if (startsWith(endpoint, "http://")) {
            config.scheme = Aws::Http::Scheme::HTTP;
            host = endpoint.substr(std::string("http://").size());
        } else if (startsWith(endpoint, "https://")) {
            config.scheme = Aws::Http::Scheme::HTTPS;
            host = endpoint.substr(std::string("https://").size());
        }
        config.endpointOverride = host;
        useVirtualAddressing = false;
    }
    client_ = std::make_unique<Aws::S3::S3Client>(config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        useVirtualAddressing);
    SPDLOG_LOGGER_TRACE(s3_logger, "S3StorageBackend ctor bucket: {} region: {} endpoint: {}", bucket, region, endpoint);
}

S3StorageBackend::~S3StorageBackend() {
    client_.reset();
    Aws::ShutdownAPI(options_);
    SPDLOG_LOGGER_TRACE(s3_logger, "S3StorageBackend dtor");
}

std::string S3StorageBackend::describe(const std::string& location) const {
    return S3_URL_PREFIX + bucket_ + "/" + location;
}

template <typename ErrorT>
StatusCode S3StorageBackend::mapError(const ErrorT& error, StatusCode fallback) const {
    switch (error.GetErrorType()) {
    case Aws::S3::S3Errors::NO_SUCH_BUCKET:
        return StatusCode::S3_BUCKET_NOT_FOUND;
    case Aws::S3::S3Errors::NO_SUCH_KEY:
    case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
        return StatusCode::S3_FILE_NOT_FOUND;
    case Aws::S3::S3Errors::ACCESS_DENIED:
    case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
    case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
    case Aws::S3::S3Errors::MISSING_AUTHENTICATION_TOKEN:
        return StatusCode::S3_INVALID_ACCESS;
    default:
        break;
    }
    if (error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
        return StatusCode::S3_FILE_NOT_FOUND;
    }
    if (error.GetResponseCode() == Aws::Http::HttpResponseCode::FORBIDDEN ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::UNAUTHORIZED) {
        return StatusCode::S3_INVALID_ACCESS;
    }
    return fallback;
}

Status S3StorageBackend::upload(const std::string& localPath, const std::string& location) {
    if (!isLocationValid(location)) {
        SPDLOG_LOGGER_ERROR(s3_logger, "Invalid S3 object key: {}", location);
        return Status(StatusCode::S3_FILE_INVALID, location);
    }
    auto body = Aws::MakeShared<Aws::FStream>(ALLOCATION_TAG, localPath.c_str(), std::ios_base::in | std::ios_base::binary);
    if (!body->good()) {
        SPDLOG_LOGGER_ERROR(s3_logger, "Unable to open file for upload: {}", localPath);
        return Status(StatusCode::FILE_INVALID, localPath);
    }
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket_.c_str());
    request.SetKey(location.c_str());
    request.SetBody(body);
    SPDLOG_LOGGER_DEBUG(s3_logger, "Uploading {} to {}", localPath, describe(location));
    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        SPDLOG_LOGGER_ERROR(s3_logger, "Failed to upload {} to {}: {}", localPath, describe(location), std::string(error.GetMessage().c_str()));
        return Status(mapError(error, StatusCode::S3_FAILED_PUT_OBJECT), std::string(error.GetMessage().c_str()));
    }
    return StatusCode::OK;
}

Status S3StorageBackend::download(const std::string& location, const std::string& localPath) {
    if (!isLocationValid(location)) {
        SPDLOG_LOGGER_ERROR(s3_logger, "Invalid S3 object key: {}", location);
        return Status(StatusCode::S3_FILE_INVALID, location);
    }
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket_.c_str());
    request.SetKey(location.c_str());
    SPDLOG_LOGGER_DEBUG(s3_logger, "Downloading {} to {}", describe(location), localPath);
    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        SPDLOG_LOGGER_ERROR(s3_logger, "Failed to download {}: {}", describe(location), std::string(error.GetMessage().c_str()));
        return Status(mapError(error, StatusCode::S3_FAILED_GET_OBJECT), std::string(error.GetMessage().c_str()));
    }
    auto status = FileSystem::writeStreamToFile(outcome.GetResult().GetBody(), localPath);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(s3_logger, "Unable to store {} in {}", describe(location), localPath);
        return status;
    }
    return StatusCode::OK;
}

Status S3StorageBackend::exists(const std::string& location, bool* exists) {
    *exists = false;
    if (!isLocationValid(location)) {
        return Status(StatusCode::S3_FILE_INVALID, location);
    }
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(bucket_.c_str());
    request.SetKey(location.c_str());
    auto outcome = client_->HeadObject(request);
    if (outcome.IsSuccess()) {
        *exists = true;
        return StatusCode::OK;
    }
    auto code = mapError(outcome.GetError(), StatusCode::S3_METADATA_FAIL);
    if (code == StatusCode::S3_FILE_NOT_FOUND) {
        SPDLOG_LOGGER_TRACE(s3_logger, "Object {} does not exist", describe(location));
        return StatusCode::OK;
    }
    SPDLOG_LOGGER_ERROR(s3_logger, "Failed to check object {}: {}", describe(location), std::string(outcome.GetError().GetMessage().c_str()));
    return Status(code, std::string(outcome.GetError().GetMessage().c_str()));
}

}  // namespace nexus
