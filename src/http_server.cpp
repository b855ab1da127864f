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
#include "http_server.hpp"

#include <string>
#include <unordered_map>
#include <utility>

#include <httplib.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "http_rest_api_handler.hpp"
#include "logging.hpp"
#include "status.hpp"

namespace nexus {

HTTPStatusCode http(const Status& status) {
    const std::unordered_map<StatusCode, HTTPStatusCode> httpStatusMap = {
        {StatusCode::OK, HTTPStatusCode::OK},

        // REST handler failure
        {StatusCode::REST_INVALID_URL, HTTPStatusCode::NOT_FOUND},
        {StatusCode::REST_UNSUPPORTED_METHOD, HTTPStatusCode::METHOD_NA},
        {StatusCode::REST_NOT_FOUND, HTTPStatusCode::NOT_FOUND},

        // REST parser failure
        {StatusCode::REST_BODY_IS_NOT_AN_OBJECT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_REQUESTS_NOT_AN_ARRAY, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_DATA_FOUND, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_REQUEST_ID_MISSING, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_SERIALIZATION_ERROR, HTTPStatusCode::ERROR},

        // Prediction
        {StatusCode::MODEL_NOT_LOADED, HTTPStatusCode::SERVICE_UNAV},
        {StatusCode::INVALID_INPUT_FORMAT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::INVALID_INPUT_SIZE, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::PREDICTION_FAILED, HTTPStatusCode::ERROR},
        {StatusCode::INTERNAL_ERROR, HTTPStatusCode::ERROR},
    };
    auto it = httpStatusMap.find(status.getCode());
    if (it != httpStatusMap.end()) {
        return it->second;
    } else {
        return HTTPStatusCode::ERROR;
    }
}

std::unique_ptr<CppHttpLibHttpServer> createAndStartHttpServer(const std::string& address, int port, int num_threads, std::shared_ptr<HttpRestApiHandler> handler) {
    auto server = std::make_unique<CppHttpLibHttpServer>(num_threads, port, address);
    server->registerRequestDispatcher([handler](const httplib::Request& req, httplib::Response& res) {
        SPDLOG_LOGGER_DEBUG(gateway_logger, "Processing HTTP request: {} {} body: {} bytes",
            req.method,
            req.path,
            req.body.size());

        std::string output;
        const auto status = handler->processRequest(req.method, req.path, req.body, &output);
        if (!status.ok() && output.empty()) {
            rapidjson::StringBuffer buffer;
            rapidjson::Writer<rapidjson::StringBuffer> errorWriter(buffer);
            errorWriter.StartObject();
            errorWriter.String("error");
            errorWriter.String(status.string().c_str());
            errorWriter.EndObject();
            output = buffer.GetString();
        }
        const auto http_status = http(status);
        if (http_status != HTTPStatusCode::OK) {
            SPDLOG_LOGGER_DEBUG(gateway_logger, "Processing HTTP/REST request failed: {} {}. Reason: {}",
                req.method,
                req.path,
                status.string());
        }
        res.status = static_cast<int>(http_status);
        res.set_content(output, "application/json");
    });
    if (!server->startAcceptingRequests()) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Failed to start REST server on {}:{}", address, port);
        return nullptr;
    }
    return server;
}

}  // namespace nexus
