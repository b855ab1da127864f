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
#include "logging.hpp"

#include <vector>

namespace nexus {

std::shared_ptr<spdlog::logger> registry_logger = std::make_shared<spdlog::logger>("registry");
std::shared_ptr<spdlog::logger> storage_logger = std::make_shared<spdlog::logger>("storage");
std::shared_ptr<spdlog::logger> s3_logger = std::make_shared<spdlog::logger>("s3");
std::shared_ptr<spdlog::logger> gcs_logger = std::make_shared<spdlog::logger>("gcs");
std::shared_ptr<spdlog::logger> git_logger = std::make_shared<spdlog::logger>("git");
std::shared_ptr<spdlog::logger> gateway_logger = std::make_shared<spdlog::logger>("gateway");
const std::string default_pattern = "[%Y-%m-%d %T.%f][%t][%n][%l][%s:%#] %v";

static void set_log_level(const std::string& log_level, std::shared_ptr<spdlog::logger> logger) {
    logger->set_level(spdlog::level::info);
    if (!log_level.empty()) {
        if (log_level == "DEBUG") {
            logger->set_level(spdlog::level::debug);
            logger->flush_on(spdlog::level::debug);
        } else if (log_level == "ERROR") {
            logger->set_level(spdlog::level::err);
            logger->flush_on(spdlog::level::err);
        } else if (log_level == "WARNING") {
            logger->set_level(spdlog::level::warn);
            logger->flush_on(spdlog::level::warn);
        } else if (log_level == "TRACE") {
            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::trace);
        }
    }
}

static void register_loggers(const std::string& log_level, std::vector<spdlog::sink_ptr> sinks) {
    auto serving_logger = std::make_shared<spdlog::logger>("serving", begin(sinks), end(sinks));
    serving_logger->set_pattern(default_pattern);
    const std::vector<std::shared_ptr<spdlog::logger>> loggers{
        registry_logger, storage_logger, s3_logger, gcs_logger, git_logger, gateway_logger};
    for (auto& logger : loggers) {
        logger->set_pattern(default_pattern);
        for (auto& sink : sinks) {
            logger->sinks().push_back(sink);
        }
        set_log_level(log_level, logger);
    }
    set_log_level(log_level, serving_logger);
    spdlog::set_default_logger(serving_logger);
}

spdlog::sink_ptr create_console_sink(ConsoleStream stream) {
    if (stream == ConsoleStream::STDERR) {
        return std::make_shared<spdlog::sinks::stderr_sink_st>();
    }
    return std::make_shared<spdlog::sinks::stdout_sink_st>();
}

void configure_logger(const std::string& log_level, const std::string& log_path, ConsoleStream console) {
    static bool wasRun = false;
    if (wasRun) {
        SPDLOG_WARN("Tried to configure loggers twice. Keeping previous settings.");
        return;
    }
    wasRun = true;
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(create_console_sink(console));
    if (!log_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path));
    }
    register_loggers(log_level, sinks);
}

}  // namespace nexus
