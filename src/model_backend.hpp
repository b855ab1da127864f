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

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "status.hpp"

namespace nexus {

using prediction_input_t = std::vector<double>;

struct PredictionResult {
    Status status;
    double value = 0.0;

    PredictionResult() = default;
    explicit PredictionResult(double value) :
        value(value) {}
    explicit PredictionResult(Status status) :
        status(std::move(status)) {}

    bool ok() const {
        return status.ok();
    }
};

/**
 * @brief Wraps a computed value, overflow to inf or nan fails the item
 */
inline PredictionResult finitePredictionResult(double value) {
    if (!std::isfinite(value)) {
        return PredictionResult(Status(StatusCode::PREDICTION_FAILED, "result is not a finite number"));
    }
    return PredictionResult(value);
}

/**
 * @brief Executes a loaded model. Implementations must be safe to call
 * from several threads at once.
 */
class ModelBackend {
public:
    virtual ~ModelBackend() = default;

    virtual const std::string& getType() const = 0;

    /**
     * @brief Evaluates every input independently. Result i belongs to input i,
     * a failing input does not affect the others.
     */
    virtual std::vector<PredictionResult> predictBatch(const std::vector<prediction_input_t>& inputs) const = 0;

    PredictionResult predictSingle(const prediction_input_t& input) const {
        return predictBatch({input}).front();
    }
};

}  // namespace nexus
