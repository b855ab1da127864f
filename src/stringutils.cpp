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
#include "stringutils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace nexus {

std::string joins(const std::vector<std::string>& listOfStrings, const std::string& delimiter) {
    std::stringstream ss;
    auto it = listOfStrings.cbegin();
    if (it == listOfStrings.end()) {
        return "";
    }
    for (; it != (listOfStrings.end() - 1); ++it) {
        ss << *it << delimiter;
    }
    ss << *it;
    return ss.str();
}

void trim(std::string& str) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    str.erase(std::find_if(str.rbegin(), str.rend(), notSpace).base(), str.end());
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), notSpace));
}

bool startsWith(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), str.begin());
}

std::optional<uint32_t> stou32(const std::string& input) {
    std::string str = input;
    trim(str);
    if (str.empty() || !std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        uint64_t val = std::stoull(str);
        if (val > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        return {static_cast<uint32_t>(val)};
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string toLower(const std::string& input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace nexus
