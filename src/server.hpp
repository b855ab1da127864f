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
#include <mutex>
#include <string>

#include "config.hpp"
#include "inference_gateway.hpp"

namespace nexus {
class CppHttpLibHttpServer;
class HttpRestApiHandler;
class ModelBackend;
class RequestBatcher;
class Status;

class Server {
    mutable std::mutex startMtx;
    Config config;
    std::unique_ptr<InferenceGateway> gateway;
    std::unique_ptr<RequestBatcher> batcher;
    std::shared_ptr<HttpRestApiHandler> handler;
    std::unique_ptr<CppHttpLibHttpServer> httpServer;

public:
    Server();
    virtual ~Server();

    /**
     * @brief Parses command line, starts serving and blocks until SIGINT or SIGTERM
     *
     * @return process exit code
     */
    int start(int argc, char** argv);

    /**
     * @brief Loads the configured model and starts the REST server. Failure to load
     * the model is not fatal, the server starts in degraded mode.
     */
    Status start(const Config& config);

    void shutdown();

    bool isModelLoaded() const;

    const InferenceGateway* getGateway() const {
        return gateway.get();
    }

    void setShutdownRequest(int i);
    int getShutdownStatus();

    /**
     * @brief Loads model from local path or from the registry and storage, per config
     */
    static Status loadModel(const Config& config, std::unique_ptr<ModelBackend>* model);
};
}  // namespace nexus
