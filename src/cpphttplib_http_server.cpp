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
#include "cpphttplib_http_server.hpp"

#include <chrono>
#include <utility>

#include <httplib.h>

#include "logging.hpp"

namespace nexus {

const size_t CppHttpLibHttpServer::MAX_PAYLOAD_BYTES = 64 * 1024 * 1024;

CppHttpLibHttpServer::CppHttpLibHttpServer(size_t numWorkers, int port, const std::string& address) :
    numWorkers(numWorkers),
    port(port),
    address(address),
    server(std::make_unique<httplib::Server>()) {
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Creating thread pool ({} threads)", numWorkers);
    server->new_task_queue = [numWorkers] {
        return new httplib::ThreadPool(numWorkers);
    };
    server->set_payload_max_length(MAX_PAYLOAD_BYTES);
}

CppHttpLibHttpServer::~CppHttpLibHttpServer() {
    terminate();
}

void CppHttpLibHttpServer::registerRequestDispatcher(request_dispatcher_t dispatcher) {
    this->dispatcher = std::move(dispatcher);
}

void CppHttpLibHttpServer::dispatch(const httplib::Request& req, httplib::Response& res) {
    auto start = std::chrono::steady_clock::now();
    dispatcher(req, res);
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    SPDLOG_LOGGER_DEBUG(gateway_logger, "{} {} handled with status {} in {} ms", req.method, req.path, res.status, duration.count() / 1000.f);
}

bool CppHttpLibHttpServer::startAcceptingRequests() {
    if (server == nullptr || !dispatcher) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "REST server cannot start without a request dispatcher");
        return false;
    }
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res);
    };
    server->Get(R"(/.*)", handler);
    server->Post(R"(/.*)", handler);

    listener = std::thread([this] {
        SPDLOG_LOGGER_DEBUG(gateway_logger, "Starting to listen on {}:{}", address, port);
        server->listen(address, port);
        SPDLOG_LOGGER_DEBUG(gateway_logger, "Stopped listening on {}:{}", address, port);
    });

    server->wait_until_ready();
    if (!server->is_running()) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Failed to bind REST server to {}:{}", address, port);
        terminate();
        return false;
    }

    SPDLOG_LOGGER_INFO(gateway_logger, "REST server listening on {}:{} with {} threads", address, port, numWorkers);
    return true;
}

bool CppHttpLibHttpServer::isRunning() const {
    return server != nullptr && server->is_running();
}

void CppHttpLibHttpServer::terminate() {
    if (server == nullptr) {
        return;
    }
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Shutting down REST server on {}:{}", address, port);
    server->stop();
    if (listener.joinable()) {
        listener.join();
    }
    server.reset();
}

}  // namespace nexus
