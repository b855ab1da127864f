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

#include <git2.h>

#include "sourcecontrolgate.hpp"

namespace nexus {
class Status;

struct Libgit2InitGuard {
    int status;
    std::string errMsg;
    Libgit2InitGuard();
    ~Libgit2InitGuard();
};

/**
 * @brief Working tree opened with libgit2. Modified or staged tracked files make
 * the tree dirty, the registry file included. Untracked files do not.
 */
class GitRepository : public SourceControlGate {
    struct ConstructorTag {
        explicit ConstructorTag() = default;
    };

public:
    static const size_t SHORT_HASH_LENGTH = 12;

    static Status open(const std::string& path, std::unique_ptr<GitRepository>* repository);

    GitRepository(ConstructorTag, std::unique_ptr<Libgit2InitGuard> guard, git_repository* repo);

    ~GitRepository();

    Status getCurrentCommitHash(std::string* commitHash) override;

    Status isClean(bool* clean) override;

    Status getUncommittedFiles(std::vector<std::string>* files) override;

    /**
     * @brief Builds the message listing uncommitted files, used when refusing to store
     */
    static std::string dirtyMessage(const std::vector<std::string>& files);

private:
    std::unique_ptr<Libgit2InitGuard> guard;
    git_repository* repo = nullptr;
};

}  // namespace nexus
