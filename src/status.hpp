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

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace nexus {

enum class StatusCode {
    OK, /*!< Success */

    PATH_INVALID,             /*!< The provided path is invalid or doesn't exists */
    FILE_INVALID,             /*!< File not found or cannot open */
    FILESYSTEM_ERROR,         /*!< Underlaying filesystem error */
    JSON_INVALID,             /*!< The file/content is not valid json */
    JSON_SERIALIZATION_ERROR, /*!< Data serialization to json format failed */
    INVALID_ARGUMENT,         /*!< Required argument is empty or malformed */
    INTERNAL_ERROR,

    // Artifact registry
    REGISTRY_NOT_INITIALIZED, /*!< Registry file does not exist yet */
    REGISTRY_CORRUPT,         /*!< Registry file exists but does not describe a valid registry */
    MODEL_NAME_MISSING,       /*!< Model with requested name has no registered versions */
    MODEL_VERSION_MISSING,    /*!< Commit hash is not a registered version of the model */

    // Control plane configuration
    CONFIG_FILE_INVALID,     /*!< Config file cannot be parsed */
    CONFIG_PROVIDER_INVALID, /*!< Unsupported storage provider */
    CONFIG_BUCKET_MISSING,   /*!< Bucket required by provider is not set */
    OPTIONS_USAGE_ERROR,

    // Source control
    GIT_NOT_A_REPOSITORY,
    GIT_FAILED_TO_READ_HEAD,
    GIT_FAILED_TO_READ_STATUS,
    GIT_REPOSITORY_DIRTY,

    // Local storage
    LOCAL_STORAGE_FILE_NOT_FOUND,
    LOCAL_STORAGE_COPY_FAILED,

    // S3
    S3_BUCKET_NOT_FOUND, /*!< S3 Bucket not found  */
    S3_INVALID_ACCESS,
    S3_FILE_NOT_FOUND,
    S3_FILE_INVALID,
    S3_FAILED_GET_OBJECT,
    S3_FAILED_PUT_OBJECT,
    S3_METADATA_FAIL,

    // GCS
    GCS_BUCKET_NOT_FOUND,
    GCS_INVALID_ACCESS,
    GCS_FILE_NOT_FOUND,
    GCS_FILE_INVALID,
    GCS_FAILED_GET_OBJECT,
    GCS_FAILED_PUT_OBJECT,
    GCS_METADATA_FAIL,

    // Model backend
    MODEL_NOT_LOADED,
    MODEL_FORMAT_UNSUPPORTED,
    MODEL_DEFINITION_INVALID,
    INVALID_INPUT_FORMAT, /*!< Prediction input is not a numeric array */
    INVALID_INPUT_SIZE,   /*!< Prediction input length does not match the model */
    PREDICTION_FAILED,

    // REST handler
    REST_NOT_FOUND,          /*!< Requested REST resource not found */
    REST_INVALID_URL,        /*!< Malformed REST request url */
    REST_UNSUPPORTED_METHOD, /*!< Request sent with unsupported method */

    // REST parse
    REST_BODY_IS_NOT_AN_OBJECT,   /*!< REST body should be JSON object */
    REST_REQUESTS_NOT_AN_ARRAY,   /*!< Batch body must carry a requests array */
    REST_NO_DATA_FOUND,           /*!< Single prediction body lacks data */
    REST_REQUEST_ID_MISSING,      /*!< Batch item lacks an id */
    REST_SERIALIZATION_ERROR,

    // Server start
    FAILED_TO_START_REST_SERVER,
    SERVER_ALREADY_STARTED,

    STATUS_CODE_END
};

class Status {
    StatusCode code;
    std::unique_ptr<std::string> message;

    static const std::unordered_map<StatusCode, std::string> statusMessageMap;

    void appendDetails(const std::string& details) {
        ensureMessageAllocated();
        *this->message += " - " + details;
    }

public:
    void ensureMessageAllocated() {
        if (nullptr == message) {
            message = std::make_unique<std::string>();
        }
    }

    Status(StatusCode code = StatusCode::OK) :
        code(code) {
        if (code == StatusCode::OK) {
            return;
        }
        auto it = statusMessageMap.find(code);
        if (it != statusMessageMap.end())
            this->message = std::make_unique<std::string>(it->second);
        else
            this->message = std::make_unique<std::string>("Undefined error");
    }

    Status(StatusCode code, const std::string& details) :
        Status(code) {
        appendDetails(details);
    }

    Status(const Status& rhs) :
        code(rhs.code),
        message(rhs.message != nullptr ? std::make_unique<std::string>(*(rhs.message)) : nullptr) {}

    Status(Status&& rhs) = default;

    Status& operator=(const Status& rhs) {
        this->code = rhs.code;
        this->message = (rhs.message != nullptr ? std::make_unique<std::string>(*rhs.message) : nullptr);
        return *this;
    }

    Status& operator=(Status&&) = default;

    bool ok() const {
        return code == StatusCode::OK;
    }

    StatusCode getCode() const {
        return this->code;
    }

    bool operator==(const Status& status) const {
        return this->code == status.code;
    }

    bool operator!=(const Status& status) const {
        return this->code != status.code;
    }

    const std::string& string() const {
        return this->message ? *this->message : statusMessageMap.at(code);
    }
    operator const std::string&() const {
        return this->string();
    }
};
}  // namespace nexus
