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
#include "linear_model_backend.hpp"

#include <numeric>
#include <utility>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "logging.hpp"
#include "schema.hpp"

namespace nexus {

const std::string LinearModelBackend::TYPE = "linear";
const std::string SumModelBackend::TYPE = "sum";

LinearModelBackend::LinearModelBackend(std::vector<double> weights, double bias) :
    weights(std::move(weights)),
    bias(bias) {}

std::vector<PredictionResult> LinearModelBackend::predictBatch(const std::vector<prediction_input_t>& inputs) const {
    std::vector<PredictionResult> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        if (input.size() != weights.size()) {
            results.emplace_back(Status(StatusCode::INVALID_INPUT_SIZE,
                "expected " + std::to_string(weights.size()) + " values, got " + std::to_string(input.size())));
            continue;
        }
        results.push_back(finitePredictionResult(std::inner_product(input.begin(), input.end(), weights.begin(), bias)));
    }
    return results;
}

std::vector<PredictionResult> SumModelBackend::predictBatch(const std::vector<prediction_input_t>& inputs) const {
    std::vector<PredictionResult> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        results.push_back(finitePredictionResult(std::accumulate(input.begin(), input.end(), 0.0)));
    }
    return results;
}

Status parseModelDefinition(const std::string& contents, std::unique_ptr<ModelBackend>* backend) {
    rapidjson::Document doc;
    if (doc.Parse(contents.c_str()).HasParseError()) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Model definition is not valid JSON: {} at offset {}",
            rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset());
        return Status(StatusCode::MODEL_DEFINITION_INVALID, rapidjson::GetParseError_En(doc.GetParseError()));
    }
    auto status = validateJsonAgainstSchema(doc, MODEL_DEFINITION_SCHEMA.c_str(), true);
    if (!status.ok()) {
        return Status(StatusCode::MODEL_DEFINITION_INVALID, status.string());
    }
    const std::string type = doc["type"].GetString();
    if (type == SumModelBackend::TYPE) {
        *backend = std::make_unique<SumModelBackend>();
        return StatusCode::OK;
    }
    if (!doc.HasMember("weights")) {
        return Status(StatusCode::MODEL_DEFINITION_INVALID, "linear model requires weights");
    }
    std::vector<double> weights;
    for (const auto& weight : doc["weights"].GetArray()) {
        weights.push_back(weight.GetDouble());
    }
    double bias = doc.HasMember("bias") ? doc["bias"].GetDouble() : 0.0;
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Parsed linear model with {} weights and bias {}", weights.size(), bias);
    *backend = std::make_unique<LinearModelBackend>(std::move(weights), bias);
    return StatusCode::OK;
}

}  // namespace nexus
