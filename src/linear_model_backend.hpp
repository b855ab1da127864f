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
#include <string>
#include <vector>

#include "model_backend.hpp"

namespace nexus {

/**
 * @brief Dot product of input with weights plus bias
 */
class LinearModelBackend : public ModelBackend {
    std::vector<double> weights;
    double bias;

public:
    static const std::string TYPE;

    LinearModelBackend(std::vector<double> weights, double bias);

    const std::string& getType() const override {
        return TYPE;
    }
    std::vector<PredictionResult> predictBatch(const std::vector<prediction_input_t>& inputs) const override;
};

/**
 * @brief Sum of all input values
 */
class SumModelBackend : public ModelBackend {
public:
    static const std::string TYPE;

    const std::string& getType() const override {
        return TYPE;
    }
    std::vector<PredictionResult> predictBatch(const std::vector<prediction_input_t>& inputs) const override;
};

/**
 * @brief Builds a backend from JSON model definition
 * {"type": "linear", "weights": [...], "bias": b} or {"type": "sum"}
 *
 * @return MODEL_DEFINITION_INVALID when contents do not describe a supported model
 */
Status parseModelDefinition(const std::string& contents, std::unique_ptr<ModelBackend>* backend);

}  // namespace nexus
