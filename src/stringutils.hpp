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
#include <optional>
#include <string>
#include <vector>

namespace nexus {

std::string joins(const std::vector<std::string>& listOfStrings, const std::string& delimiter);

/**
 * @brief Removes leading and trailing whitespace in place
 */
void trim(std::string& str);

bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Converts a decimal string to uint32, surrounding whitespace allowed
 *
 * @return std::nullopt for signs, trailing garbage or values above uint32 range
 */
std::optional<uint32_t> stou32(const std::string& input);

std::string toLower(const std::string& input);

}  // namespace nexus
