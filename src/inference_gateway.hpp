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
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "model_backend.hpp"
#include "status.hpp"

namespace nexus {

struct BatchItem {
    std::string id;
    prediction_input_t input;
    // not OK when the item could not be parsed, it is answered with this error without evaluation
    Status status;
};

/**
 * @brief Runs batch predictions against the currently loaded model.
 * Batches larger than maxBatchSize are split into chunks evaluated concurrently,
 * results always come back in input order.
 */
class InferenceGateway {
    const uint32_t maxBatchSize;
    mutable std::shared_mutex modelMtx;
    std::shared_ptr<const ModelBackend> model;

public:
    explicit InferenceGateway(uint32_t maxBatchSize);

    void setModel(std::shared_ptr<const ModelBackend> model);

    bool isModelLoaded() const;

    uint32_t getMaxBatchSize() const {
        return maxBatchSize;
    }

    /**
     * @brief Evaluates items, results[i] answers items[i]. Item failures are
     * reported in the item result only.
     *
     * @return MODEL_NOT_LOADED when no model is loaded
     */
    Status predictBatch(const std::vector<BatchItem>& items, std::vector<PredictionResult>* results) const;

    Status predictInputs(const std::vector<prediction_input_t>& inputs, std::vector<PredictionResult>* results) const;

private:
    std::shared_ptr<const ModelBackend> getModel() const;
};

}  // namespace nexus
