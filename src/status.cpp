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
#include "status.hpp"

namespace nexus {

const std::unordered_map<StatusCode, std::string> Status::statusMessageMap = {
    {StatusCode::OK, ""},

    {StatusCode::PATH_INVALID, "The provided path is invalid or doesn't exists"},
    {StatusCode::FILE_INVALID, "File not found or cannot open"},
    {StatusCode::FILESYSTEM_ERROR, "Error during filesystem operation"},
    {StatusCode::JSON_INVALID, "The file is not valid json"},
    {StatusCode::JSON_SERIALIZATION_ERROR, "Data serialization to json format failed"},
    {StatusCode::INVALID_ARGUMENT, "Invalid argument"},
    {StatusCode::INTERNAL_ERROR, "Internal server error"},

    {StatusCode::REGISTRY_NOT_INITIALIZED, "Model metadata file (.nexus_meta.json) not found. Store a model first to initialize it"},
    {StatusCode::REGISTRY_CORRUPT, "Model metadata file is corrupted"},
    {StatusCode::MODEL_NAME_MISSING, "Model not found in metadata"},
    {StatusCode::MODEL_VERSION_MISSING, "Commit hash not found for model"},

    {StatusCode::CONFIG_FILE_INVALID, "Configuration file cannot be parsed"},
    {StatusCode::CONFIG_PROVIDER_INVALID, "Unsupported storage provider. Supported providers: s3, gcs, local"},
    {StatusCode::CONFIG_BUCKET_MISSING, "Bucket name is not configured"},
    {StatusCode::OPTIONS_USAGE_ERROR, "Options validation error"},

    {StatusCode::GIT_NOT_A_REPOSITORY, "Not a git repository"},
    {StatusCode::GIT_FAILED_TO_READ_HEAD, "Failed to read git HEAD commit"},
    {StatusCode::GIT_FAILED_TO_READ_STATUS, "Failed to read git working tree status"},
    {StatusCode::GIT_REPOSITORY_DIRTY, "Git repository has uncommitted changes. Please commit or stash your changes before storing a model"},

    {StatusCode::LOCAL_STORAGE_FILE_NOT_FOUND, "Local storage object not found"},
    {StatusCode::LOCAL_STORAGE_COPY_FAILED, "Local storage copy failed"},

    {StatusCode::S3_BUCKET_NOT_FOUND, "S3 Bucket not found"},
    {StatusCode::S3_INVALID_ACCESS, "S3 Invalid access rights"},
    {StatusCode::S3_FILE_NOT_FOUND, "S3 File or directory not found"},
    {StatusCode::S3_FILE_INVALID, "S3 File path is invalid"},
    {StatusCode::S3_FAILED_GET_OBJECT, "S3 Failed to get object from path"},
    {StatusCode::S3_FAILED_PUT_OBJECT, "S3 Failed to upload object"},
    {StatusCode::S3_METADATA_FAIL, "S3 metadata failure"},

    {StatusCode::GCS_BUCKET_NOT_FOUND, "GCS Bucket not found"},
    {StatusCode::GCS_INVALID_ACCESS, "GCS Invalid access rights"},
    {StatusCode::GCS_FILE_NOT_FOUND, "GCS File or directory not found"},
    {StatusCode::GCS_FILE_INVALID, "GCS File path is invalid"},
    {StatusCode::GCS_FAILED_GET_OBJECT, "GCS Failed to get object from path"},
    {StatusCode::GCS_FAILED_PUT_OBJECT, "GCS Failed to upload object"},
    {StatusCode::GCS_METADATA_FAIL, "GCS metadata failure"},

    {StatusCode::MODEL_NOT_LOADED, "Model not loaded"},
    {StatusCode::MODEL_FORMAT_UNSUPPORTED, "Unsupported model file format"},
    {StatusCode::MODEL_DEFINITION_INVALID, "Model definition is invalid"},
    {StatusCode::INVALID_INPUT_FORMAT, "Invalid input format. Expected an array of numbers"},
    {StatusCode::INVALID_INPUT_SIZE, "Invalid input size"},
    {StatusCode::PREDICTION_FAILED, "Prediction failed"},

    {StatusCode::REST_NOT_FOUND, "Requested REST resource not found"},
    {StatusCode::REST_INVALID_URL, "Invalid request URL"},
    {StatusCode::REST_UNSUPPORTED_METHOD, "Unsupported method"},

    {StatusCode::REST_BODY_IS_NOT_AN_OBJECT, "Request body should be JSON object"},
    {StatusCode::REST_REQUESTS_NOT_AN_ARRAY, "Field requests must be an array"},
    {StatusCode::REST_NO_DATA_FOUND, "Missing 'data' field in request"},
    {StatusCode::REST_REQUEST_ID_MISSING, "Missing 'id' field in request"},
    {StatusCode::REST_SERIALIZATION_ERROR, "Response serialization failed"},

    {StatusCode::FAILED_TO_START_REST_SERVER, "Failed to start REST server"},
    {StatusCode::SERVER_ALREADY_STARTED, "Server was already started"},
};
}  // namespace nexus
