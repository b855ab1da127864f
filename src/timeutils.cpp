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
#include "timeutils.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace nexus {

std::string formatTimestamp(const std::chrono::system_clock::time_point& timePoint) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    std::tm localTime{};
    localtime_r(&seconds, &localTime);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timePoint.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}", localTime, micros);
}

std::string currentTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

}  // namespace nexus
