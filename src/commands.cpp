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
#include "commands.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <fmt/format.h>

#include "artifactregistry.hpp"
#include "filesystem.hpp"
#include "libgit2.hpp"
#include "logging.hpp"
#include "registration_service.hpp"
#include "resolution_service.hpp"
#include "rollback_service.hpp"
#include "sourcecontrolgate.hpp"
#include "storagebackend.hpp"
#include "version.hpp"

namespace nexus {

static const char* COMMIT_REMINDER = "Please git commit and git push the updated " REGISTRY_FILE_NAME " file.";

Status storeModel(ArtifactRegistry& registry, StorageBackend& storage, SourceControlGate& gate,
    const std::string& modelPath, const std::string& modelName, std::ostream& out) {
    if (modelName.empty()) {
        return Status(StatusCode::INVALID_ARGUMENT, "model name must not be empty");
    }
    bool exists = false;
    auto fsStatus = FileSystem::fileExists(modelPath, &exists);
    if (fsStatus != StatusCode::OK || !exists) {
        return Status(StatusCode::FILE_INVALID, "Model file not found: " + modelPath);
    }
    bool isFile = false;
    fsStatus = FileSystem::isRegularFile(modelPath, &isFile);
    if (fsStatus != StatusCode::OK || !isFile) {
        return Status(StatusCode::FILE_INVALID, "Path is not a file: " + modelPath);
    }

    bool clean = false;
    auto status = gate.isClean(&clean);
    if (!status.ok()) {
        return status;
    }
    if (!clean) {
        std::vector<std::string> files;
        status = gate.getUncommittedFiles(&files);
        if (!status.ok()) {
            return status;
        }
        return Status(StatusCode::GIT_REPOSITORY_DIRTY, GitRepository::dirtyMessage(files));
    }
    std::string commitHash;
    status = gate.getCurrentCommitHash(&commitHash);
    if (!status.ok()) {
        return status;
    }
    out << "Current commit hash: " << commitHash << std::endl;

    uint64_t fileSize = 0;
    fsStatus = FileSystem::getFileSize(modelPath, &fileSize);
    if (fsStatus != StatusCode::OK) {
        return Status(fsStatus, modelPath);
    }
    std::string extension = FileSystem::getFileExtension(modelPath);
    if (extension.empty()) {
        extension = StorageBackend::DEFAULT_EXTENSION;
    }
    const std::string location = StorageBackend::buildStorageLocation(modelName, commitHash, extension);

    out << "Uploading model to " << storage.describe(location) << " ..." << std::endl;
    status = storage.upload(modelPath, location);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(storage_logger, "Upload of {} failed, registry left unchanged", modelPath);
        return status;
    }

    status = registerVersion(registry, modelName, commitHash, location, fileSize, extension);
    if (!status.ok()) {
        return status;
    }
    status = registry.save();
    if (!status.ok()) {
        return status;
    }
    out << "\u2713 Model artifact stored successfully!" << std::endl;
    out << "Storage URI: " << location << std::endl;
    out << std::endl
        << COMMIT_REMINDER << std::endl;
    return StatusCode::OK;
}

Status loadModel(const ArtifactRegistry& registry, StorageBackend& storage,
    const std::string& selector, const std::optional<std::string>& modelName,
    const std::string& outputPath, std::ostream& out) {
    std::optional<std::string> location;
    auto status = resolveStorageLocation(registry, selector, modelName, &location);
    if (!status.ok()) {
        return status;
    }
    if (!location) {
        if (selector == LATEST_SELECTOR) {
            return Status(StatusCode::MODEL_NAME_MISSING, "No latest model found for model name: " + modelName.value_or(""));
        }
        return Status(StatusCode::MODEL_VERSION_MISSING, "Model artifact not found for commit hash: " + selector);
    }
    out << "Downloading model from " << storage.describe(*location) << " ..." << std::endl;
    status = storage.download(*location, outputPath);
    if (!status.ok()) {
        return status;
    }
    out << "\u2713 Model artifact from commit " << selector << " successfully loaded to " << outputPath << std::endl;
    return StatusCode::OK;
}

std::string formatModelTable(std::vector<VersionRecord> records) {
    std::sort(records.begin(), records.end(), [](const VersionRecord& lhs, const VersionRecord& rhs) {
        if (lhs.modelName != rhs.modelName) {
            return lhs.modelName < rhs.modelName;
        }
        return lhs.timestamp < rhs.timestamp;
    });
    const std::vector<std::string> headers{"Model Name", "Commit Hash", "Storage URI", "Size", "Timestamp", "Latest"};
    std::vector<std::vector<std::string>> rows;
    for (const auto& record : records) {
        const double sizeMb = static_cast<double>(record.fileSizeBytes) / (1024.0 * 1024.0);
        rows.push_back({record.modelName,
            record.commitHash,
            record.storageLocation,
            fmt::format("{:.2f} MB", sizeMb),
            record.timestamp.substr(0, 19),
            record.isLatest ? "\u2713" : ""});
    }
    std::vector<size_t> widths;
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    auto renderRow = [&widths](const std::vector<std::string>& cells) {
        std::string line;
        for (size_t i = 0; i < cells.size(); ++i) {
            line += fmt::format("{:<{}}", cells[i], widths[i]);
            if (i + 1 < cells.size()) {
                line += "  ";
            }
        }
        while (!line.empty() && line.back() == ' ') {
            line.pop_back();
        }
        return line + "\n";
    };
    std::string table = "Stored Model Artifacts\n";
    table += renderRow(headers);
    size_t separatorWidth = 0;
    for (size_t width : widths) {
        separatorWidth += width;
    }
    separatorWidth += 2 * (widths.size() - 1);
    table += std::string(separatorWidth, '-') + "\n";
    for (const auto& row : rows) {
        table += renderRow(row);
    }
    return table;
}

Status listModels(const ArtifactRegistry& registry, std::ostream& out) {
    auto status = registry.requireExists();
    if (!status.ok()) {
        return status;
    }
    std::vector<VersionRecord> records;
    status = listAll(registry, &records);
    if (!status.ok()) {
        return status;
    }
    if (records.empty()) {
        out << "No model artifacts found." << std::endl;
        return StatusCode::OK;
    }
    out << formatModelTable(std::move(records));
    return StatusCode::OK;
}

Status rollbackModel(ArtifactRegistry& registry, const std::string& commitHash, const std::string& modelName, std::ostream& out) {
    auto status = setLatest(registry, modelName, commitHash);
    if (!status.ok()) {
        return status;
    }
    status = registry.save();
    if (!status.ok()) {
        return status;
    }
    out << "\u2713 Rolled back model '" << modelName << "' to commit " << commitHash << std::endl;
    out << std::endl
        << COMMIT_REMINDER << std::endl;
    return StatusCode::OK;
}

}  // namespace nexus
