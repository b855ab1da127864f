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

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace nexus {

using request_dispatcher_t = std::function<void(const httplib::Request& req, httplib::Response& res)>;

/**
 * @brief cpp-httplib listener running on its own thread with a fixed worker pool.
 * Every GET and POST request is forwarded to the registered dispatcher.
 */
class CppHttpLibHttpServer {
    const size_t numWorkers;
    const int port;
    const std::string address;
    std::unique_ptr<httplib::Server> server{nullptr};
    std::thread listener;
    request_dispatcher_t dispatcher;

    void dispatch(const httplib::Request& req, httplib::Response& res);

public:
    // upper bound for a single request body, batch requests included
    static const size_t MAX_PAYLOAD_BYTES;

    CppHttpLibHttpServer(size_t numWorkers, int port, const std::string& address);
    ~CppHttpLibHttpServer();

    void registerRequestDispatcher(request_dispatcher_t dispatcher);
    bool startAcceptingRequests();
    bool isRunning() const;
    void terminate();
};

}  // namespace nexus
