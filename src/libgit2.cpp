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
#include "libgit2.hpp"

#include <algorithm>
#include <utility>

#include "logging.hpp"
#include "status.hpp"
#include "stringutils.hpp"

namespace nexus {

static std::string lastGitError() {
    const git_error* err = git_error_last();
    return err ? std::string(err->message) : std::string("unknown failure");
}

Libgit2InitGuard::Libgit2InitGuard() {
    SPDLOG_LOGGER_DEBUG(git_logger, "Initializing libgit2");
    this->status = git_libgit2_init();
    if (this->status < 0) {
        errMsg = lastGitError();
    }
}

Libgit2InitGuard::~Libgit2InitGuard() {
    SPDLOG_LOGGER_DEBUG(git_logger, "Shutdown libgit2");
    git_libgit2_shutdown();
}

GitRepository::GitRepository(ConstructorTag, std::unique_ptr<Libgit2InitGuard> guard, git_repository* repo) :
    guard(std::move(guard)),
    repo(repo) {}

GitRepository::~GitRepository() {
    if (repo != nullptr) {
        git_repository_free(repo);
    }
}

Status GitRepository::open(const std::string& path, std::unique_ptr<GitRepository>* repository) {
    auto guard = std::make_unique<Libgit2InitGuard>();
    if (guard->status < 0) {
        SPDLOG_LOGGER_ERROR(git_logger, "Failed to init libgit2: {}", guard->errMsg);
        return Status(StatusCode::INTERNAL_ERROR, guard->errMsg);
    }
    git_repository* repo = nullptr;
    int error = git_repository_open_ext(&repo, path.c_str(), 0, nullptr);
    if (error < 0) {
        SPDLOG_LOGGER_ERROR(git_logger, "Not a Git repository: {} - {}", path, lastGitError());
        return Status(StatusCode::GIT_NOT_A_REPOSITORY, path);
    }
    if (git_repository_is_bare(repo)) {
        git_repository_free(repo);
        SPDLOG_LOGGER_ERROR(git_logger, "Repository: {} is bare", path);
        return Status(StatusCode::GIT_NOT_A_REPOSITORY, path + " is a bare repository");
    }
    SPDLOG_LOGGER_DEBUG(git_logger, "Opened git repository with working tree: {}", git_repository_workdir(repo));
    *repository = std::make_unique<GitRepository>(ConstructorTag{}, std::move(guard), repo);
    return StatusCode::OK;
}

Status GitRepository::getCurrentCommitHash(std::string* commitHash) {
    git_oid oid;
    int error = git_reference_name_to_id(&oid, repo, "HEAD");
    if (error < 0) {
        SPDLOG_LOGGER_ERROR(git_logger, "Failed to get commit hash: {}", lastGitError());
        return Status(StatusCode::GIT_FAILED_TO_READ_HEAD, lastGitError());
    }
    char buffer[GIT_OID_HEXSZ + 1] = {0};
    git_oid_tostr(buffer, sizeof(buffer), &oid);
    *commitHash = std::string(buffer).substr(0, SHORT_HASH_LENGTH);
    SPDLOG_LOGGER_DEBUG(git_logger, "Current commit: {}", *commitHash);
    return StatusCode::OK;
}

Status GitRepository::getUncommittedFiles(std::vector<std::string>* files) {
    files->clear();
    git_status_options options = GIT_STATUS_OPTIONS_INIT;
    options.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    options.flags = GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    git_status_list* statusList = nullptr;
    int error = git_status_list_new(&statusList, repo, &options);
    if (error < 0) {
        SPDLOG_LOGGER_ERROR(git_logger, "Failed to read repository status: {}", lastGitError());
        return Status(StatusCode::GIT_FAILED_TO_READ_STATUS, lastGitError());
    }
    const size_t count = git_status_list_entrycount(statusList);
    for (size_t i = 0; i < count; ++i) {
        const git_status_entry* entry = git_status_byindex(statusList, i);
        if (entry == nullptr || entry->status == GIT_STATUS_CURRENT || (entry->status & GIT_STATUS_IGNORED)) {
            continue;
        }
        const char* filePath = nullptr;
        if (entry->index_to_workdir != nullptr) {
            filePath = entry->index_to_workdir->old_file.path;
        } else if (entry->head_to_index != nullptr) {
            filePath = entry->head_to_index->new_file.path;
        }
        if (filePath == nullptr) {
            continue;
        }
        std::string file(filePath);
        if (std::find(files->begin(), files->end(), file) == files->end()) {
            files->push_back(std::move(file));
        }
    }
    git_status_list_free(statusList);
    return StatusCode::OK;
}

Status GitRepository::isClean(bool* clean) {
    std::vector<std::string> files;
    auto status = getUncommittedFiles(&files);
    if (!status.ok()) {
        return status;
    }
    *clean = files.empty();
    return StatusCode::OK;
}

std::string GitRepository::dirtyMessage(const std::vector<std::string>& files) {
    return "Uncommitted files: " + joins(files, ", ");
}

}  // namespace nexus
