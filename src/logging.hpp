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

#include <fmt/ranges.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace nexus {

extern std::shared_ptr<spdlog::logger> registry_logger;
extern std::shared_ptr<spdlog::logger> storage_logger;
extern std::shared_ptr<spdlog::logger> s3_logger;
extern std::shared_ptr<spdlog::logger> gcs_logger;
extern std::shared_ptr<spdlog::logger> git_logger;
extern std::shared_ptr<spdlog::logger> gateway_logger;

enum class ConsoleStream {
    STDOUT,
    STDERR
};

spdlog::sink_ptr create_console_sink(ConsoleStream stream);

// the nexus CLI logs to stderr so that stdout carries only command output
void configure_logger(const std::string& log_level, const std::string& log_path, ConsoleStream console = ConsoleStream::STDOUT);

}  // namespace nexus
