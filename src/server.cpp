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
#include "server.hpp"

#include <signal.h>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "artifactregistry.hpp"
#include "cli_parser.hpp"
#include "cpphttplib_http_server.hpp"
#include "http_rest_api_handler.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "model_backend.hpp"
#include "model_loader.hpp"
#include "nexus_exit_codes.hpp"
#include "request_batcher.hpp"
#include "status.hpp"
#include "storagebackend.hpp"
#include "storagebackendfactory.hpp"
#include "version.hpp"

namespace nexus {
namespace {
volatile sig_atomic_t shutdown_request = 0;
}

static void logConfig(const Config& config) {
    std::string project_name(PROJECT_NAME);
    std::string project_version(PROJECT_VERSION);
    SPDLOG_INFO(project_name + " " + project_version);
    SPDLOG_DEBUG("CLI parameters passed to nexus_server");
    SPDLOG_DEBUG("model_path: {}", config.modelPath());
    SPDLOG_DEBUG("model_name: {}", config.modelName());
    SPDLOG_DEBUG("model_version: {}", config.modelVersion());
    SPDLOG_DEBUG("registry_path: {}", config.registryPath());
    SPDLOG_DEBUG("provider: {}", config.provider());
    SPDLOG_DEBUG("REST port: {}", config.port());
    SPDLOG_DEBUG("REST bind address: {}", config.bindAddress());
    SPDLOG_DEBUG("REST workers: {}", config.restWorkers());
    SPDLOG_DEBUG("max_batch_size: {}", config.maxBatchSize());
    SPDLOG_DEBUG("batch_timeout_ms: {}", config.batchTimeoutMs());
    SPDLOG_DEBUG("log level: {}", config.logLevel());
    SPDLOG_DEBUG("log path: {}", config.logPath());
}

static void onInterrupt(int status) {
    shutdown_request = 1;
}

static void onTerminate(int status) {
    shutdown_request = 1;
}

static void installSignalHandlers() {
    static struct sigaction sigIntHandler;
    sigIntHandler.sa_handler = onInterrupt;
    sigemptyset(&sigIntHandler.sa_mask);
    sigIntHandler.sa_flags = 0;
    sigaction(SIGINT, &sigIntHandler, NULL);

    static struct sigaction sigTermHandler;
    sigTermHandler.sa_handler = onTerminate;
    sigemptyset(&sigTermHandler.sa_mask);
    sigTermHandler.sa_flags = 0;
    sigaction(SIGTERM, &sigTermHandler, NULL);
}

void Server::setShutdownRequest(int i) {
    shutdown_request = i;
}

int Server::getShutdownStatus() {
    return shutdown_request;
}

Server::Server() = default;

Server::~Server() {
    this->shutdown();
}

bool Server::isModelLoaded() const {
    return gateway != nullptr && gateway->isModelLoaded();
}

static int statusToExitCode(const Status& status) {
    if (status.ok()) {
        return NEXUS_EX_OK;
    } else if (status == StatusCode::OPTIONS_USAGE_ERROR) {
        return NEXUS_EX_USAGE;
    }
    return NEXUS_EX_FAILURE;
}

int Server::start(int argc, char** argv) {
    installSignalHandlers();
    try {
        ServerCLIParser parser;
        ServerSettingsImpl serverSettings;
        parser.parse(argc, argv);
        parser.prepare(&serverSettings);

        Config parsedConfig;
        if (!parsedConfig.parse(&serverSettings)) {
            return statusToExitCode(StatusCode::OPTIONS_USAGE_ERROR);
        }
        Status ret = start(parsedConfig);
        if (!ret.ok()) {
            shutdown();
            return statusToExitCode(ret);
        }
        while (!shutdown_request) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        SPDLOG_INFO("Shutting down {}", PROJECT_NAME);
        shutdown();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return NEXUS_EX_USAGE;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Exception; {}", e.what());
        return NEXUS_EX_FAILURE;
    }
    return NEXUS_EX_OK;
}

Status Server::loadModel(const Config& config, std::unique_ptr<ModelBackend>* model) {
    if (!config.modelPath().empty()) {
        SPDLOG_INFO("Loading model from local path: {}", config.modelPath());
        return ModelLoader::loadFromPath(config.modelPath(), model);
    }
    if (!config.loadsFromRegistry()) {
        SPDLOG_WARN("No model configured. Server will start without model.");
        SPDLOG_WARN("Set model_path or (model_name with registry and storage settings) to load a model.");
        return StatusCode::MODEL_NOT_LOADED;
    }
    StorageSettings storageSettings;
    auto status = config.storageSettings(&storageSettings);
    if (!status.ok()) {
        return status;
    }
    std::unique_ptr<StorageBackend> storage;
    status = createStorageBackend(storageSettings, &storage);
    if (!status.ok()) {
        return status;
    }
    ArtifactRegistry registry(config.registryPath());
    status = registry.load();
    if (!status.ok()) {
        return status;
    }
    return ModelLoader::loadFromRegistry(registry, *storage, config.modelName(), config.modelVersion(), model);
}

Status Server::start(const Config& config) {
    std::unique_lock<std::mutex> lock{this->startMtx, std::defer_lock};
    if (!lock.try_lock()) {
        SPDLOG_ERROR("Cannot start {} - server is already starting", PROJECT_NAME);
        return StatusCode::SERVER_ALREADY_STARTED;
    }
    if (httpServer != nullptr) {
        SPDLOG_ERROR("Cannot start {} - server is already live", PROJECT_NAME);
        return StatusCode::SERVER_ALREADY_STARTED;
    }
    this->config = config;
    configure_logger(config.logLevel(), config.logPath());
    logConfig(config);

    gateway = std::make_unique<InferenceGateway>(config.maxBatchSize());
    std::unique_ptr<ModelBackend> model;
    auto status = loadModel(config, &model);
    if (status.ok()) {
        gateway->setModel(std::move(model));
        SPDLOG_INFO("Model loaded successfully");
    } else {
        SPDLOG_ERROR("Model not loaded, serving in degraded mode: {}", status.string());
    }

    auto* gatewayPtr = gateway.get();
    batcher = std::make_unique<RequestBatcher>(config.maxBatchSize(), std::chrono::milliseconds(config.batchTimeoutMs()),
        [gatewayPtr](const std::vector<prediction_input_t>& inputs) {
            std::vector<PredictionResult> results;
            auto status = gatewayPtr->predictInputs(inputs, &results);
            if (!status.ok()) {
                results.assign(inputs.size(), PredictionResult(status));
            }
            return results;
        });
    batcher->start();

    ServingInfo info;
    info.modelName = config.modelName();
    info.modelVersion = config.modelVersion();
    info.provider = config.provider();
    info.maxBatchSize = config.maxBatchSize();
    info.batchTimeoutMs = config.batchTimeoutMs();
    handler = std::make_shared<HttpRestApiHandler>(*gateway, batcher.get(), std::move(info));

    httpServer = createAndStartHttpServer(config.bindAddress(), config.port(), config.restWorkers(), handler);
    if (httpServer == nullptr) {
        return Status(StatusCode::FAILED_TO_START_REST_SERVER, config.bindAddress() + ":" + std::to_string(config.port()));
    }
    return StatusCode::OK;
}

void Server::shutdown() {
    if (httpServer != nullptr) {
        httpServer->terminate();
        httpServer.reset();
    }
    if (batcher != nullptr) {
        batcher->stop();
        batcher.reset();
    }
    handler.reset();
    gateway.reset();
}

}  // namespace nexus
