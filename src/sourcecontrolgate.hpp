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

#include <string>
#include <vector>

#include "status.hpp"

namespace nexus {

/**
 * @brief Source of the commit identifier artifacts are tagged with
 */
class SourceControlGate {
public:
    virtual ~SourceControlGate() {}

    /**
     * @brief Short (12 hex characters) identifier of the checked out commit
     */
    virtual Status getCurrentCommitHash(std::string* commitHash) = 0;

    virtual Status isClean(bool* clean) = 0;

    virtual Status getUncommittedFiles(std::vector<std::string>* files) = 0;
};

}  // namespace nexus
