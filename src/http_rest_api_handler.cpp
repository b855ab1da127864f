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
#include "http_rest_api_handler.hpp"

#include <cmath>
#include <future>
#include <utility>

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "logging.hpp"
#include "request_batcher.hpp"
#include "version.hpp"

namespace nexus {

// rapidjson Writer cannot serialize inf or nan, such results are reported as item errors
static PredictionResult rejectNonFinite(PredictionResult result) {
    if (result.ok() && !std::isfinite(result.value)) {
        return PredictionResult(Status(StatusCode::PREDICTION_FAILED, "result is not a finite number"));
    }
    return result;
}

const std::string HttpRestApiHandler::healthRegexExp = R"((.?)\/health(\?(.*))?)";
const std::string HttpRestApiHandler::readyRegexExp = R"((.?)\/ready(\?(.*))?)";
const std::string HttpRestApiHandler::predictBatchRegexExp = R"((.?)\/predict\/batch\/?)";
const std::string HttpRestApiHandler::predictRegexExp = R"((.?)\/predict\/?)";
const std::string HttpRestApiHandler::infoRegexExp = R"((.?)\/info(\?(.*))?)";

HttpRestApiHandler::HttpRestApiHandler(const InferenceGateway& gateway, RequestBatcher* batcher, ServingInfo info) :
    healthRegex(healthRegexExp),
    readyRegex(readyRegexExp),
    predictBatchRegex(predictBatchRegexExp),
    predictRegex(predictRegexExp),
    infoRegex(infoRegexExp),
    gateway(gateway),
    batcher(batcher),
    info(std::move(info)) {}

static void writeOptionalString(rapidjson::Writer<rapidjson::StringBuffer>& writer, const std::string& value) {
    if (value.empty()) {
        writer.Null();
    } else {
        writer.String(value.c_str());
    }
}

Status HttpRestApiHandler::parseRequestComponents(HttpRequestComponents& components,
    const std::string_view http_method,
    const std::string& request_path) {
    std::smatch sm;
    components.http_method = http_method;
    bool isGet = http_method == "GET";
    bool isPost = http_method == "POST";

    if (std::regex_match(request_path, sm, healthRegex)) {
        components.type = Health;
    } else if (std::regex_match(request_path, sm, readyRegex)) {
        components.type = Ready;
    } else if (std::regex_match(request_path, sm, infoRegex)) {
        components.type = Info;
    } else if (std::regex_match(request_path, sm, predictBatchRegex)) {
        components.type = PredictBatch;
    } else if (std::regex_match(request_path, sm, predictRegex)) {
        components.type = Predict;
    } else {
        return StatusCode::REST_NOT_FOUND;
    }
    if (components.type == Predict || components.type == PredictBatch) {
        return isPost ? StatusCode::OK : StatusCode::REST_UNSUPPORTED_METHOD;
    }
    return isGet ? StatusCode::OK : StatusCode::REST_UNSUPPORTED_METHOD;
}

Status HttpRestApiHandler::processRequest(
    const std::string_view http_method,
    const std::string_view request_path,
    const std::string& request_body,
    std::string* response) {
    std::string request_path_str(request_path);
    HttpRequestComponents components;
    auto status = parseRequestComponents(components, http_method, request_path_str);
    if (!status.ok()) {
        SPDLOG_LOGGER_DEBUG(gateway_logger, "Cannot route {} {}: {}", http_method, request_path_str, status.string());
        return status;
    }
    response->clear();
    switch (components.type) {
    case Health:
        return processHealthRequest(*response);
    case Ready:
        return processReadyRequest(*response);
    case Info:
        return processInfoRequest(*response);
    case Predict:
        return processPredictRequest(request_body, *response);
    case PredictBatch:
        return processPredictBatchRequest(request_body, *response);
    }
    return StatusCode::REST_NOT_FOUND;
}

Status HttpRestApiHandler::processHealthRequest(std::string& response) {
    const bool loaded = gateway.isModelLoaded();
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.String("status");
    writer.String(loaded ? "healthy" : "degraded");
    writer.String("model_loaded");
    writer.Bool(loaded);
    writer.String("model_name");
    writeOptionalString(writer, info.modelName);
    writer.String("model_version");
    writeOptionalString(writer, info.modelVersion);
    writer.EndObject();
    response = buffer.GetString();
    return StatusCode::OK;
}

Status HttpRestApiHandler::processReadyRequest(std::string& response) {
    bool isReady = gateway.isModelLoaded();
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Requested Server readiness state: {}", isReady);
    if (!isReady) {
        return StatusCode::MODEL_NOT_LOADED;
    }
    response = R"({"status":"ready"})";
    return StatusCode::OK;
}

Status HttpRestApiHandler::parseInput(const rapidjson::Value& data, prediction_input_t* input) {
    if (!data.IsArray()) {
        return StatusCode::INVALID_INPUT_FORMAT;
    }
    input->clear();
    input->reserve(data.Size());
    for (const auto& value : data.GetArray()) {
        if (!value.IsNumber()) {
            return StatusCode::INVALID_INPUT_FORMAT;
        }
        input->push_back(value.GetDouble());
    }
    return StatusCode::OK;
}

static Status parseBody(const std::string& request_body, rapidjson::Document& doc) {
    if (doc.Parse(request_body.c_str()).HasParseError()) {
        SPDLOG_LOGGER_DEBUG(gateway_logger, "Request body is not valid JSON: {}", rapidjson::GetParseError_En(doc.GetParseError()));
        return Status(StatusCode::REST_BODY_IS_NOT_AN_OBJECT, rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        return StatusCode::REST_BODY_IS_NOT_AN_OBJECT;
    }
    return StatusCode::OK;
}

Status HttpRestApiHandler::processPredictRequest(const std::string& request_body, std::string& response) {
    if (!gateway.isModelLoaded()) {
        return StatusCode::MODEL_NOT_LOADED;
    }
    rapidjson::Document doc;
    auto status = parseBody(request_body, doc);
    if (!status.ok()) {
        return status;
    }
    auto dataIt = doc.FindMember("data");
    if (dataIt == doc.MemberEnd() || dataIt->value.IsNull()) {
        return StatusCode::REST_NO_DATA_FOUND;
    }
    prediction_input_t input;
    status = parseInput(dataIt->value, &input);
    if (!status.ok()) {
        return status;
    }

    PredictionResult result;
    if (batcher != nullptr) {
        result = batcher->submit(std::move(input)).get();
    } else {
        std::vector<PredictionResult> results;
        status = gateway.predictInputs({input}, &results);
        if (!status.ok()) {
            return status;
        }
        result = std::move(results.front());
    }
    result = rejectNonFinite(std::move(result));
    if (!result.ok()) {
        SPDLOG_LOGGER_DEBUG(gateway_logger, "Single prediction failed: {}", result.status.string());
        return result.status;
    }
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.String("result");
    writer.Double(result.value);
    writer.EndObject();
    response = buffer.GetString();
    return StatusCode::OK;
}

Status HttpRestApiHandler::processPredictBatchRequest(const std::string& request_body, std::string& response) {
    if (!gateway.isModelLoaded()) {
        return StatusCode::MODEL_NOT_LOADED;
    }
    rapidjson::Document doc;
    auto status = parseBody(request_body, doc);
    if (!status.ok()) {
        return status;
    }
    auto requestsIt = doc.FindMember("requests");
    if (requestsIt == doc.MemberEnd() || !requestsIt->value.IsArray()) {
        return StatusCode::REST_REQUESTS_NOT_AN_ARRAY;
    }

    std::vector<BatchItem> items;
    items.reserve(requestsIt->value.Size());
    for (const auto& request : requestsIt->value.GetArray()) {
        BatchItem item;
        if (!request.IsObject()) {
            item.status = StatusCode::REST_BODY_IS_NOT_AN_OBJECT;
            items.push_back(std::move(item));
            continue;
        }
        auto idIt = request.FindMember("id");
        if (idIt != request.MemberEnd() && idIt->value.IsString()) {
            item.id = idIt->value.GetString();
        } else {
            item.status = StatusCode::REST_REQUEST_ID_MISSING;
            items.push_back(std::move(item));
            continue;
        }
        auto dataIt = request.FindMember("data");
        if (dataIt == request.MemberEnd() || dataIt->value.IsNull()) {
            item.status = StatusCode::REST_NO_DATA_FOUND;
        } else {
            item.status = parseInput(dataIt->value, &item.input);
        }
        items.push_back(std::move(item));
    }

    std::vector<PredictionResult> results;
    status = gateway.predictBatch(items, &results);
    if (!status.ok()) {
        return status;
    }
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Batch prediction of {} items finished", items.size());

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.String("responses");
    writer.StartArray();
    for (size_t i = 0; i < items.size(); ++i) {
        results[i] = rejectNonFinite(std::move(results[i]));
        writer.StartObject();
        writer.String("id");
        writer.String(items[i].id.c_str());
        if (results[i].ok()) {
            writer.String("result");
            writer.Double(results[i].value);
        } else {
            writer.String("error");
            writer.String(results[i].status.string().c_str());
        }
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
    response = buffer.GetString();
    return StatusCode::OK;
}

Status HttpRestApiHandler::processInfoRequest(std::string& response) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.String("server");
    writer.String(PROJECT_NAME);
    writer.String("version");
    writer.String(PROJECT_VERSION);
    writer.String("model_loaded");
    writer.Bool(gateway.isModelLoaded());
    writer.String("config");
    writer.StartObject();
    writer.String("model_name");
    writeOptionalString(writer, info.modelName);
    writer.String("model_version");
    writeOptionalString(writer, info.modelVersion);
    writer.String("provider");
    writer.String(info.provider.c_str());
    writer.String("max_batch_size");
    writer.Uint(info.maxBatchSize);
    writer.String("batch_timeout_ms");
    writer.Uint(info.batchTimeoutMs);
    writer.EndObject();
    writer.String("batcher");
    writer.StartObject();
    BatcherStatistics statistics;
    if (batcher != nullptr) {
        statistics = batcher->getStatistics();
    }
    writer.String("total_requests");
    writer.Uint64(statistics.totalRequests);
    writer.String("total_batches");
    writer.Uint64(statistics.totalBatches);
    writer.String("avg_batch_size");
    writer.Double(statistics.averageBatchSize);
    writer.EndObject();
    writer.EndObject();
    response = buffer.GetString();
    return StatusCode::OK;
}

}  // namespace nexus
