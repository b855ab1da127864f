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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "model_backend.hpp"
#include "threadsafequeue.hpp"

namespace nexus {

struct BatcherStatistics {
    uint64_t totalRequests = 0;
    uint64_t totalBatches = 0;
    double averageBatchSize = 0.0;
};

/**
 * @brief Collects single prediction requests into batches of up to maxBatchSize,
 * or whatever arrived within batchTimeout after the first request.
 * Each caller gets the result computed for its own input.
 */
class RequestBatcher {
public:
    using process_fn_t = std::function<std::vector<PredictionResult>(const std::vector<prediction_input_t>&)>;

    RequestBatcher(uint32_t maxBatchSize, std::chrono::milliseconds batchTimeout, process_fn_t processFn);
    ~RequestBatcher();

    void start();
    void stop();

    /**
     * @brief Queues input for the next batch. Future is resolved once the batch was processed.
     */
    std::future<PredictionResult> submit(prediction_input_t input);

    BatcherStatistics getStatistics() const;

private:
    struct PendingRequest {
        prediction_input_t input;
        std::promise<PredictionResult> promise;
    };

    void batchLoop();
    std::vector<std::unique_ptr<PendingRequest>> collectBatch();
    void processBatch(std::vector<std::unique_ptr<PendingRequest>>& batch);

    const uint32_t maxBatchSize;
    const std::chrono::milliseconds batchTimeout;
    process_fn_t processFn;

    ThreadSafeQueue<std::unique_ptr<PendingRequest>> requests;
    std::atomic<bool> finishRequested{false};
    std::thread worker;

    mutable std::mutex statisticsMtx;
    BatcherStatistics statistics;
};

}  // namespace nexus
