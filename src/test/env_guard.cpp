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
#include "env_guard.hpp"

#include <stdlib.h>

#include "../logging.hpp"

void SetEnvironmentVar(const std::string& var, const std::string& val) {
    SPDLOG_INFO("Setting environment variable: {} to: {}", var, val);
    ::setenv(var.c_str(), val.c_str(), 1);
}

void UnSetEnvironmentVar(const std::string& var) {
    SPDLOG_INFO("Unsetting environment variable: {}", var);
    ::unsetenv(var.c_str());
}

EnvGuard::EnvGuard() {
    SPDLOG_TRACE("EnvGuardConstructor");
}

void EnvGuard::remember(const std::string& name) {
    if (originalValues.find(name) != originalValues.end()) {
        return;
    }
    const char* currentVal = std::getenv(name.c_str());
    if (currentVal) {
        SPDLOG_TRACE("Var:{} is set to value:{}", name, currentVal);
        originalValues[name] = std::string(currentVal);
    } else {
        SPDLOG_TRACE("Var:{} was not set", name);
        originalValues[name] = std::nullopt;
    }
}

void EnvGuard::set(const std::string& name, const std::string& value) {
    remember(name);
    SetEnvironmentVar(name, value);
}

void EnvGuard::unset(const std::string& name) {
    remember(name);
    UnSetEnvironmentVar(name);
}

void EnvGuard::unsetServerEnvironment() {
    for (const char* name : {"PORT", "HOST", "REST_WORKERS", "LOG_LEVEL", "LOG_PATH", "MAX_BATCH_SIZE", "BATCH_TIMEOUT_MS",
             "MODEL_PATH", "MODEL_NAME", "MODEL_VERSION", "REGISTRY_PATH", "PROVIDER", "S3_BUCKET", "AWS_REGION",
             "S3_ENDPOINT", "GCS_BUCKET", "LOCAL_STORAGE_ROOT"}) {
        unset(name);
    }
}

void EnvGuard::unsetControlPlaneEnvironment() {
    for (const char* name : {"NEXUS_PROVIDER", "NEXUS_BUCKET", "AWS_REGION"}) {
        unset(name);
    }
}

EnvGuard::~EnvGuard() {
    SPDLOG_TRACE("EnvGuardDestructor");
    for (auto& [k, v] : originalValues) {
        if (v.has_value()) {
            SetEnvironmentVar(k, v.value());
        } else {
            UnSetEnvironmentVar(k);
        }
    }
}
