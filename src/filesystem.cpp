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
#include "filesystem.hpp"

#include <stdlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include "logging.hpp"

namespace nexus {

StatusCode FileSystem::createTempPath(std::string* local_path) {
    if (!local_path) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Target path variable for createTempPath not set.");
        return StatusCode::FILESYSTEM_ERROR;
    }
    std::string file_template = "/tmp/nexusXXXXXX";
    char* tmp_folder = mkdtemp(const_cast<char*>(file_template.c_str()));
    if (tmp_folder == nullptr) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Failed to create local temp folder: {} {}", file_template, strerror(errno));
        return StatusCode::FILESYSTEM_ERROR;
    }
    std::error_code ec;
    fs::permissions(tmp_folder,
        fs::perms::others_all | fs::perms::group_all,
        fs::perm_options::remove, ec);
    if (ec) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Failed to restrict permissions of temp folder: {} {}", tmp_folder, ec.message());
        return StatusCode::FILESYSTEM_ERROR;
    }

    *local_path = std::string(tmp_folder);

    return StatusCode::OK;
}

std::string FileSystem::getFileExtension(const std::string& path) {
    std::string extension = fs::path(path).extension().string();
    if (!extension.empty() && extension[0] == '.') {
        extension.erase(0, 1);
    }
    return extension;
}

StatusCode FileSystem::fileExists(const std::string& path, bool* exists) {
    try {
        *exists = fs::exists(path);
    } catch (fs::filesystem_error& e) {
        SPDLOG_LOGGER_DEBUG(storage_logger, "Couldn't access path {}", e.what());
        return StatusCode::PATH_INVALID;
    }
    return StatusCode::OK;
}

StatusCode FileSystem::isRegularFile(const std::string& path, bool* isFile) {
    try {
        *isFile = fs::is_regular_file(path);
    } catch (fs::filesystem_error& e) {
        SPDLOG_LOGGER_DEBUG(storage_logger, "Couldn't access path {}", e.what());
        return StatusCode::PATH_INVALID;
    }
    return StatusCode::OK;
}

StatusCode FileSystem::getFileSize(const std::string& path, uint64_t* size) {
    try {
        *size = static_cast<uint64_t>(fs::file_size(path));
    } catch (fs::filesystem_error& e) {
        SPDLOG_LOGGER_DEBUG(storage_logger, "Couldn't read file size {}", e.what());
        return StatusCode::FILE_INVALID;
    }
    return StatusCode::OK;
}

StatusCode FileSystem::readTextFile(const std::string& path, std::string* contents) {
    if (isPathEscaped(path)) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Path {} escape with .. is forbidden.", path);
        return StatusCode::PATH_INVALID;
    }
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input) {
        SPDLOG_LOGGER_DEBUG(storage_logger, "Couldn't access path {}", path);
        return StatusCode::PATH_INVALID;
    }

    input.seekg(0, std::ios::end);
    contents->resize(input.tellg());
    input.seekg(0, std::ios::beg);
    input.read(&(*contents)[0], contents->size());
    input.close();

    return StatusCode::OK;
}

StatusCode FileSystem::createParentDirectories(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return StatusCode::OK;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Failed to create directory: {} {}", parent.string(), ec.message());
        return StatusCode::PATH_INVALID;
    }
    return StatusCode::OK;
}

Status FileSystem::createFileOverwrite(const std::string& filePath, const std::string& contents) {
    SPDLOG_LOGGER_DEBUG(storage_logger, "Creating file {}", filePath);
    auto status = createParentDirectories(filePath);
    if (status != StatusCode::OK) {
        return status;
    }
    const std::string tmpPath = filePath + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc | std::ofstream::binary);
        if (!file.is_open()) {
            SPDLOG_LOGGER_ERROR(storage_logger, "Unable to open file: {}", tmpPath);
            return StatusCode::FILE_INVALID;
        }
        file << contents;
        file.flush();
        file.close();
        if (!file.good()) {
            SPDLOG_LOGGER_ERROR(storage_logger, "Unable to write file: {}", tmpPath);
            std::error_code ec;
            fs::remove(tmpPath, ec);
            return StatusCode::FILE_INVALID;
        }
    }
    std::error_code ec;
    fs::rename(tmpPath, filePath, ec);
    if (ec) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Unable to replace file: {} {}", filePath, ec.message());
        fs::remove(tmpPath, ec);
        return Status(StatusCode::FILESYSTEM_ERROR, filePath);
    }
    return StatusCode::OK;
}

Status FileSystem::writeStreamToFile(std::istream& input, const std::string& filePath) {
    auto status = createParentDirectories(filePath);
    if (status != StatusCode::OK) {
        return status;
    }
    std::ofstream output(filePath, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Unable to open destination file: {}", filePath);
        return Status(StatusCode::FILE_INVALID, filePath);
    }
    auto written = std::copy(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>(), std::ostreambuf_iterator<char>(output));
    output.close();
    if (written.failed() || output.fail() || input.bad()) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Unable to write destination file: {}", filePath);
        return Status(StatusCode::FILE_INVALID, filePath);
    }
    return StatusCode::OK;
}

StatusCode FileSystem::copyFile(const std::string& source, const std::string& destination) {
    auto status = createParentDirectories(destination);
    if (status != StatusCode::OK) {
        return status;
    }
    std::error_code ec;
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Failed to copy {} to {}: {}", source, destination, ec.message());
        return StatusCode::FILESYSTEM_ERROR;
    }
    return StatusCode::OK;
}

StatusCode FileSystem::deleteFileFolder(const std::string& path) {
    SPDLOG_LOGGER_DEBUG(storage_logger, "Deleting local file or folder {}", path);
    std::error_code errorCode;
    if (!fs::remove_all(path, errorCode)) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Unable to remove local path: {} {}", path, errorCode.message());
        return StatusCode::FILE_INVALID;
    }
    return StatusCode::OK;
}

}  // namespace nexus
