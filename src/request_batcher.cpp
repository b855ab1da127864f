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
#include "request_batcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "logging.hpp"

namespace nexus {

// how long the idle worker waits for a first request before checking for shutdown
static const uint32_t IDLE_POLL_MICROSECONDS = 100 * 1000;

RequestBatcher::RequestBatcher(uint32_t maxBatchSize, std::chrono::milliseconds batchTimeout, process_fn_t processFn) :
    maxBatchSize(std::max<uint32_t>(maxBatchSize, 1)),
    batchTimeout(batchTimeout),
    processFn(std::move(processFn)) {}

RequestBatcher::~RequestBatcher() {
    stop();
}

void RequestBatcher::start() {
    if (worker.joinable()) {
        return;
    }
    finishRequested = false;
    worker = std::thread(&RequestBatcher::batchLoop, this);
    SPDLOG_LOGGER_INFO(gateway_logger, "Batcher started with max batch size: {} timeout: {} ms", maxBatchSize, batchTimeout.count());
}

void RequestBatcher::stop() {
    if (!worker.joinable()) {
        return;
    }
    finishRequested = true;
    worker.join();
    SPDLOG_LOGGER_INFO(gateway_logger, "Batcher stopped");
}

std::future<PredictionResult> RequestBatcher::submit(prediction_input_t input) {
    auto request = std::make_unique<PendingRequest>();
    request->input = std::move(input);
    auto future = request->promise.get_future();
    requests.push(std::move(request));
    return future;
}

void RequestBatcher::batchLoop() {
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Batcher worker thread started");
    while (true) {
        auto batch = collectBatch();
        if (!batch.empty()) {
            processBatch(batch);
            continue;
        }
        if (finishRequested) {
            break;
        }
    }
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Batcher worker thread exits");
}

std::vector<std::unique_ptr<RequestBatcher::PendingRequest>> RequestBatcher::collectBatch() {
    return requests.pullBatch(maxBatchSize, IDLE_POLL_MICROSECONDS,
        std::chrono::duration_cast<std::chrono::microseconds>(batchTimeout));
}

void RequestBatcher::processBatch(std::vector<std::unique_ptr<PendingRequest>>& batch) {
    SPDLOG_LOGGER_DEBUG(gateway_logger, "Processing batch of size: {}", batch.size());
    std::vector<prediction_input_t> inputs;
    inputs.reserve(batch.size());
    for (auto& request : batch) {
        inputs.push_back(std::move(request->input));
    }
    std::vector<PredictionResult> results;
    try {
        results = processFn(inputs);
    } catch (const std::exception& e) {
        SPDLOG_LOGGER_ERROR(gateway_logger, "Batch processing failed: {}", e.what());
        results.assign(batch.size(), PredictionResult(Status(StatusCode::PREDICTION_FAILED, e.what())));
    }
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i < results.size()) {
            batch[i]->promise.set_value(std::move(results[i]));
        } else {
            batch[i]->promise.set_value(PredictionResult(Status(StatusCode::PREDICTION_FAILED, "response not found for request")));
        }
    }

    std::lock_guard<std::mutex> lock(statisticsMtx);
    statistics.totalRequests += batch.size();
    statistics.totalBatches++;
    statistics.averageBatchSize = static_cast<double>(statistics.totalRequests) / static_cast<double>(statistics.totalBatches);
}

BatcherStatistics RequestBatcher::getStatistics() const {
    std::lock_guard<std::mutex> lock(statisticsMtx);
    return statistics;
}

}  // namespace nexus
