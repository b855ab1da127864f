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
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "artifactregistry.hpp"
#include "cli_parser.hpp"
#include "commands.hpp"
#include "controlplane_config.hpp"
#include "libgit2.hpp"
#include "logging.hpp"
#include "nexus_exit_codes.hpp"
#include "settings.hpp"
#include "status.hpp"
#include "storagebackendfactory.hpp"
#include "version.hpp"

using namespace nexus;

static int reportFailure(const Status& status) {
    std::cerr << "Error: " << status.string() << std::endl;
    return NEXUS_EX_FAILURE;
}

static Status runCommand(const CommandSettingsImpl& settings) {
    ArtifactRegistry registry(ArtifactRegistry::defaultPath(settings.projectRoot));
    auto status = registry.load();
    if (!status.ok()) {
        return status;
    }
    if (settings.command == CommandType::LIST) {
        return listModels(registry, std::cout);
    }
    if (settings.command == CommandType::ROLLBACK) {
        return rollbackModel(registry, settings.commitHash, settings.modelName.value_or(""), std::cout);
    }

    StorageSettings storageSettings;
    status = loadControlPlaneConfig(settings.projectRoot, &storageSettings);
    if (!status.ok()) {
        return status;
    }
    std::unique_ptr<StorageBackend> storage;
    status = createStorageBackend(storageSettings, &storage);
    if (!status.ok()) {
        return status;
    }
    if (settings.command == CommandType::LOAD) {
        return loadModel(registry, *storage, settings.commitHash, settings.modelName, settings.filePath, std::cout);
    }

    std::unique_ptr<GitRepository> repository;
    status = GitRepository::open(settings.projectRoot, &repository);
    if (!status.ok()) {
        return status;
    }
    return storeModel(registry, *storage, *repository, settings.filePath, settings.modelName.value_or(""), std::cout);
}

int main(int argc, char** argv) {
    CommandSettingsImpl settings;
    try {
        CLIParser parser;
        parser.parse(argc, argv);
        parser.prepare(&settings);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return NEXUS_EX_USAGE;
    }
    if (settings.projectRoot.empty()) {
        std::error_code ec;
        settings.projectRoot = std::filesystem::current_path(ec).string();
        if (ec) {
            std::cerr << "Error: cannot determine current directory: " << ec.message() << std::endl;
            return NEXUS_EX_FAILURE;
        }
    }
    try {
        configure_logger(settings.logLevel, settings.logPath, ConsoleStream::STDERR);
        SPDLOG_DEBUG("{} {} project root: {}", PROJECT_NAME, PROJECT_VERSION, settings.projectRoot);
        auto status = runCommand(settings);
        if (!status.ok()) {
            return reportFailure(status);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return NEXUS_EX_FAILURE;
    }
    return NEXUS_EX_OK;
}
