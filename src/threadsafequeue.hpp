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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace nexus {

/**
 * @brief Blocking FIFO shared between request handler threads and the batch worker.
 */
template <typename T>
class ThreadSafeQueue {
public:
    using clock_t = std::chrono::steady_clock;

    void push(T element) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            elements.push(std::move(element));
        }
        signal.notify_one();
    }

    std::optional<T> tryPull(const uint32_t waitDurationMicroseconds) {
        return tryPullUntil(clock_t::now() + std::chrono::microseconds(waitDurationMicroseconds));
    }

    std::optional<T> tryPullUntil(const clock_t::time_point deadline) {
        std::unique_lock<std::mutex> lock(mtx);
        if (!signal.wait_until(lock, deadline, [this]() { return !elements.empty(); })) {
            return std::nullopt;
        }
        return popFront();
    }

    /**
     * @brief Waits up to firstWaitMicroseconds for a first element, then keeps
     * collecting until maxCount elements are gathered or gatherWindow elapses
     * from the moment the first one was taken. Empty result means nothing arrived.
     */
    std::vector<T> pullBatch(const size_t maxCount, const uint32_t firstWaitMicroseconds, const std::chrono::microseconds gatherWindow) {
        std::vector<T> batch;
        if (maxCount == 0) {
            return batch;
        }
        auto first = tryPull(firstWaitMicroseconds);
        if (!first) {
            return batch;
        }
        batch.push_back(std::move(first.value()));
        const auto deadline = clock_t::now() + gatherWindow;
        std::unique_lock<std::mutex> lock(mtx);
        while (batch.size() < maxCount) {
            if (elements.empty() &&
                !signal.wait_until(lock, deadline, [this]() { return !elements.empty(); })) {
                break;
            }
            batch.push_back(popFront());
        }
        return batch;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx);
        return elements.size();
    }

private:
    // mtx must be held
    T popFront() {
        T element = std::move(elements.front());
        elements.pop();
        return element;
    }

    std::mutex mtx;
    std::queue<T> elements;
    std::condition_variable signal;
};
}  // namespace nexus
