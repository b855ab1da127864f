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
#include "inference_gateway.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <utility>

#include "logging.hpp"

namespace nexus {

InferenceGateway::InferenceGateway(uint32_t maxBatchSize) :
    maxBatchSize(std::max<uint32_t>(maxBatchSize, 1)) {}

void InferenceGateway::setModel(std::shared_ptr<const ModelBackend> model) {
    std::unique_lock<std::shared_mutex> lock(modelMtx);
    this->model = std::move(model);
}

bool InferenceGateway::isModelLoaded() const {
    std::shared_lock<std::shared_mutex> lock(modelMtx);
    return model != nullptr;
}

std::shared_ptr<const ModelBackend> InferenceGateway::getModel() const {
    std::shared_lock<std::shared_mutex> lock(modelMtx);
    return model;
}

Status InferenceGateway::predictBatch(const std::vector<BatchItem>& items, std::vector<PredictionResult>* results) const {
    auto currentModel = getModel();
    if (currentModel == nullptr) {
        return StatusCode::MODEL_NOT_LOADED;
    }
    results->clear();
    results->resize(items.size());

    std::vector<size_t> validIndexes;
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].status.ok()) {
            validIndexes.push_back(i);
        } else {
            (*results)[i] = PredictionResult(items[i].status);
        }
    }

    // each chunk writes only to the result slots of its own items
    std::vector<std::pair<std::vector<size_t>, std::future<std::vector<PredictionResult>>>> chunks;
    for (size_t begin = 0; begin < validIndexes.size(); begin += maxBatchSize) {
        const size_t end = std::min<size_t>(begin + maxBatchSize, validIndexes.size());
        std::vector<size_t> chunkIndexes(validIndexes.begin() + begin, validIndexes.begin() + end);
        std::vector<prediction_input_t> inputs;
        inputs.reserve(chunkIndexes.size());
        for (size_t index : chunkIndexes) {
            inputs.push_back(items[index].input);
        }
        auto future = std::async(std::launch::async, [currentModel, inputs = std::move(inputs)]() {
            return currentModel->predictBatch(inputs);
        });
        chunks.emplace_back(std::move(chunkIndexes), std::move(future));
    }
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Batch of {} items split into {} chunks", items.size(), chunks.size());

    for (auto& [chunkIndexes, future] : chunks) {
        std::vector<PredictionResult> chunkResults;
        try {
            chunkResults = future.get();
        } catch (const std::exception& e) {
            SPDLOG_LOGGER_ERROR(gateway_logger, "Model execution failed: {}", e.what());
            chunkResults.clear();
            for (size_t i = 0; i < chunkIndexes.size(); ++i) {
                chunkResults.emplace_back(Status(StatusCode::PREDICTION_FAILED, e.what()));
            }
        }
        if (chunkResults.size() != chunkIndexes.size()) {
            SPDLOG_LOGGER_ERROR(gateway_logger, "Model returned {} results for {} inputs", chunkResults.size(), chunkIndexes.size());
            for (size_t index : chunkIndexes) {
                (*results)[index] = PredictionResult(Status(StatusCode::PREDICTION_FAILED, "result count mismatch"));
            }
            continue;
        }
        for (size_t i = 0; i < chunkIndexes.size(); ++i) {
            (*results)[chunkIndexes[i]] = std::move(chunkResults[i]);
        }
    }
    return StatusCode::OK;
}

Status InferenceGateway::predictInputs(const std::vector<prediction_input_t>& inputs, std::vector<PredictionResult>* results) const {
    std::vector<BatchItem> items;
    items.reserve(inputs.size());
    for (const auto& input : inputs) {
        items.push_back(BatchItem{"", input, StatusCode::OK});
    }
    return predictBatch(items, results);
}

}  // namespace nexus
