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

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

#include "inference_gateway.hpp"
#include "status.hpp"

namespace nexus {
class RequestBatcher;

enum RequestType { Health,
    Ready,
    Predict,
    PredictBatch,
    Info };

struct HttpRequestComponents {
    RequestType type;
    std::string_view http_method;
};

/**
 * @brief Model and batching configuration reported by /health and /info
 */
struct ServingInfo {
    std::string modelName;
    std::string modelVersion;
    std::string provider;
    uint32_t maxBatchSize = 32;
    uint32_t batchTimeoutMs = 50;
};

class HttpRestApiHandler {
public:
    static const std::string healthRegexExp;
    static const std::string readyRegexExp;
    static const std::string predictBatchRegexExp;
    static const std::string predictRegexExp;
    static const std::string infoRegexExp;

    /**
     * @brief Construct a new HttpRest Api Handler
     *
     * @param gateway
     * @param batcher optional, single predictions are evaluated directly when null
     * @param info
     */
    HttpRestApiHandler(const InferenceGateway& gateway, RequestBatcher* batcher, ServingInfo info);

    Status parseRequestComponents(HttpRequestComponents& components,
        const std::string_view http_method,
        const std::string& request_path);

    /**
     * @brief Process Request
     *
     * @param http_method
     * @param request_path
     * @param request_body
     * @param response JSON body, also filled for some failures (e.g. not ready)
     *
     * @return StatusCode
     */
    Status processRequest(
        const std::string_view http_method,
        const std::string_view request_path,
        const std::string& request_body,
        std::string* response);

    Status processHealthRequest(std::string& response);
    Status processReadyRequest(std::string& response);
    Status processPredictRequest(const std::string& request_body, std::string& response);
    Status processPredictBatchRequest(const std::string& request_body, std::string& response);
    Status processInfoRequest(std::string& response);

    /**
     * @brief Reads a JSON array of numbers
     *
     * @return INVALID_INPUT_FORMAT for anything else
     */
    static Status parseInput(const rapidjson::Value& data, prediction_input_t* input);

private:
    const std::regex healthRegex;
    const std::regex readyRegex;
    const std::regex predictBatchRegex;
    const std::regex predictRegex;
    const std::regex infoRegex;

    const InferenceGateway& gateway;
    RequestBatcher* batcher;
    const ServingInfo info;
};

}  // namespace nexus
