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
#include "cli_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "nexus_exit_codes.hpp"
#include "settings.hpp"
#include "stringutils.hpp"
#include "version.hpp"

namespace nexus {

static void printVersion() {
    std::cout << PROJECT_NAME << " " << PROJECT_VERSION << std::endl;
}

void CLIParser::parse(int argc, char** argv) {
    try {
        options = std::make_unique<cxxopts::Options>(argv[0], "Model artifact versioning tied to git commits");

        // clang-format off
        options->add_options()
            ("h, help",
                "Show this help message and exit")
            ("version",
                "Show binary version")
            ("project_root",
                "Project root holding .nexusrc and .nexus_meta.json. Default: current directory",
                cxxopts::value<std::string>(),
                "PROJECT_ROOT")
            ("log_level",
                "log level - one of TRACE, DEBUG, INFO, WARNING, ERROR",
                cxxopts::value<std::string>()->default_value("WARNING"), "LOG_LEVEL")
            ("log_path",
                "Optional path to the log file",
                cxxopts::value<std::string>(), "LOG_PATH")
            ("n, model-name",
                "Model name. Required by load when using latest",
                cxxopts::value<std::string>(),
                "MODEL_NAME")
            ("command",
                "One of: store, load, list, rollback",
                cxxopts::value<std::string>())
            ("args",
                "Command arguments",
                cxxopts::value<std::vector<std::string>>());
        // clang-format on

        options->parse_positional({"command", "args"});
        options->positional_help(
            "<command> [ARGS]\n\n"
            "  store <model_path> <model_name>              Upload model file tagged with current commit\n"
            "  load <commit_hash|latest> <output_path>     Download model artifact\n"
            "  list                                          List stored model artifacts\n"
            "  rollback <commit_hash> <model_name>          Point latest at an earlier commit\n");

        result = std::make_unique<cxxopts::ParseResult>(options->parse(argc, argv));

        if (result->count("version")) {
            printVersion();
            exit(NEXUS_EX_OK);
        }

        if (result->count("help") || result->arguments().size() == 0) {
            std::cout << options->help() << std::endl;
            exit(NEXUS_EX_OK);
        }
    } catch (const std::exception& e) {
        std::cerr << "error parsing options: " << e.what() << std::endl;
        exit(NEXUS_EX_USAGE);
    }
}

void CLIParser::prepare(CommandSettingsImpl* settings) {
    if (nullptr == result) {
        throw std::logic_error("Tried to prepare command settings without parse result");
    }
    if (result->count("project_root"))
        settings->projectRoot = result->operator[]("project_root").as<std::string>();
    settings->logLevel = result->operator[]("log_level").as<std::string>();
    if (result->count("log_path"))
        settings->logPath = result->operator[]("log_path").as<std::string>();
    if (result->count("model-name"))
        settings->modelName = result->operator[]("model-name").as<std::string>();

    if (!result->count("command")) {
        throw std::invalid_argument("Missing command. Use one of: store, load, list, rollback");
    }
    const std::string command = result->operator[]("command").as<std::string>();
    std::vector<std::string> args;
    if (result->count("args"))
        args = result->operator[]("args").as<std::vector<std::string>>();

    auto expectArgs = [&command, &args](size_t count, const std::string& usage) {
        if (args.size() != count) {
            throw std::invalid_argument("Wrong number of arguments for " + command + ". Usage: nexus " + usage);
        }
    };
    if (command == "store") {
        expectArgs(2, "store <model_path> <model_name>");
        settings->command = CommandType::STORE;
        settings->filePath = args[0];
        settings->modelName = args[1];
    } else if (command == "load") {
        expectArgs(2, "load <commit_hash|latest> <output_path> [--model-name NAME]");
        settings->command = CommandType::LOAD;
        settings->commitHash = args[0];
        settings->filePath = args[1];
    } else if (command == "list") {
        expectArgs(0, "list");
        settings->command = CommandType::LIST;
    } else if (command == "rollback") {
        expectArgs(2, "rollback <commit_hash> <model_name>");
        settings->command = CommandType::ROLLBACK;
        settings->commitHash = args[0];
        settings->modelName = args[1];
    } else {
        throw std::invalid_argument("Unknown command: " + command + ". Use one of: store, load, list, rollback");
    }
}

void ServerCLIParser::parse(int argc, char** argv) {
    try {
        options = std::make_unique<cxxopts::Options>(argv[0], PROJECT_NAME);

        // clang-format off
        options->add_options()
            ("h, help",
                "Show this help message and exit")
            ("version",
                "Show binary version")
            ("port",
                "REST server port. Env: PORT. Default: 8000",
                cxxopts::value<uint32_t>(),
                "PORT")
            ("host",
                "Network interface address to bind to. Env: HOST. Default: 0.0.0.0",
                cxxopts::value<std::string>(),
                "HOST")
            ("rest_workers",
                "Number of worker threads in REST server. Env: REST_WORKERS. Default: 8",
                cxxopts::value<uint32_t>(),
                "REST_WORKERS")
            ("log_level",
                "serving log level - one of TRACE, DEBUG, INFO, WARNING, ERROR. Env: LOG_LEVEL",
                cxxopts::value<std::string>(), "LOG_LEVEL")
            ("log_path",
                "Optional path to the log file",
                cxxopts::value<std::string>(), "LOG_PATH")
            ("max_batch_size",
                "Maximum number of items evaluated in one model call. Env: MAX_BATCH_SIZE. Default: 32",
                cxxopts::value<uint32_t>(),
                "MAX_BATCH_SIZE")
            ("batch_timeout_ms",
                "Time single requests wait for companions before a batch is evaluated. Env: BATCH_TIMEOUT_MS. Default: 50",
                cxxopts::value<uint32_t>(),
                "BATCH_TIMEOUT_MS");

        options->add_options("model")
            ("model_path",
                "Local path of the model artifact. Env: MODEL_PATH",
                cxxopts::value<std::string>(), "MODEL_PATH")
            ("model_name",
                "Model name to resolve in the registry. Env: MODEL_NAME",
                cxxopts::value<std::string>(), "MODEL_NAME")
            ("model_version",
                "Commit hash or latest. Env: MODEL_VERSION. Default: latest",
                cxxopts::value<std::string>(), "MODEL_VERSION")
            ("registry_path",
                "Path of the registry file. Env: REGISTRY_PATH. Default: .nexus_meta.json",
                cxxopts::value<std::string>(), "REGISTRY_PATH");

        options->add_options("storage")
            ("provider",
                "Storage provider - one of s3, gcs, local. Env: PROVIDER. Default: local",
                cxxopts::value<std::string>(), "PROVIDER")
            ("s3_bucket",
                "S3 bucket. Env: S3_BUCKET",
                cxxopts::value<std::string>(), "S3_BUCKET")
            ("aws_region",
                "AWS region. Env: AWS_REGION. Default: us-east-1",
                cxxopts::value<std::string>(), "AWS_REGION")
            ("s3_endpoint",
                "Endpoint of S3 compatible storage. Env: S3_ENDPOINT",
                cxxopts::value<std::string>(), "S3_ENDPOINT")
            ("gcs_bucket",
                "GCS bucket. Env: GCS_BUCKET",
                cxxopts::value<std::string>(), "GCS_BUCKET")
            ("local_root",
                "Directory acting as bucket for local provider. Env: LOCAL_STORAGE_ROOT",
                cxxopts::value<std::string>(), "LOCAL_STORAGE_ROOT");
        // clang-format on

        result = std::make_unique<cxxopts::ParseResult>(options->parse(argc, argv));

        if (result->count("version")) {
            printVersion();
            exit(NEXUS_EX_OK);
        }

        if (result->count("help")) {
            std::cout << options->help({"", "model", "storage"}) << std::endl;
            exit(NEXUS_EX_OK);
        }
    } catch (const std::exception& e) {
        std::cerr << "error parsing options: " << e.what() << std::endl;
        exit(NEXUS_EX_USAGE);
    }
}

void ServerCLIParser::prepareString(const std::string& option, const char* envName, std::string* value) {
    if (result->count(option)) {
        *value = result->operator[](option).as<std::string>();
        return;
    }
    const char* env = envName ? std::getenv(envName) : nullptr;
    if (env != nullptr && env[0] != '\0') {
        *value = env;
    }
}

void ServerCLIParser::prepareUint(const std::string& option, const char* envName, uint32_t* value) {
    if (result->count(option)) {
        *value = result->operator[](option).as<uint32_t>();
        return;
    }
    const char* env = envName ? std::getenv(envName) : nullptr;
    if (env != nullptr && env[0] != '\0') {
        auto parsed = stou32(env);
        if (!parsed) {
            throw std::invalid_argument(std::string("Invalid value of environment variable ") + envName + ": " + env);
        }
        *value = parsed.value();
    }
}

void ServerCLIParser::prepare(ServerSettingsImpl* settings) {
    if (nullptr == result) {
        throw std::logic_error("Tried to prepare server settings without parse result");
    }
    prepareUint("port", "PORT", &settings->port);
    prepareString("host", "HOST", &settings->bindAddress);
    prepareUint("rest_workers", "REST_WORKERS", &settings->restWorkers);
    prepareString("log_level", "LOG_LEVEL", &settings->logLevel);
    // LOG_LEVEL is commonly given lowercase, e.g. info
    std::transform(settings->logLevel.begin(), settings->logLevel.end(), settings->logLevel.begin(),
        [](unsigned char c) { return std::toupper(c); });
    if (settings->logLevel == "WARN")
        settings->logLevel = "WARNING";
    prepareString("log_path", nullptr, &settings->logPath);
    prepareUint("max_batch_size", "MAX_BATCH_SIZE", &settings->maxBatchSize);
    prepareUint("batch_timeout_ms", "BATCH_TIMEOUT_MS", &settings->batchTimeoutMs);

    prepareString("model_path", "MODEL_PATH", &settings->modelPath);
    prepareString("model_name", "MODEL_NAME", &settings->modelName);
    prepareString("model_version", "MODEL_VERSION", &settings->modelVersion);
    prepareString("registry_path", "REGISTRY_PATH", &settings->registryPath);

    prepareString("provider", "PROVIDER", &settings->provider);
    prepareString("s3_bucket", "S3_BUCKET", &settings->s3Bucket);
    prepareString("aws_region", "AWS_REGION", &settings->awsRegion);
    prepareString("s3_endpoint", "S3_ENDPOINT", &settings->s3Endpoint);
    prepareString("gcs_bucket", "GCS_BUCKET", &settings->gcsBucket);
    prepareString("local_root", "LOCAL_STORAGE_ROOT", &settings->localRoot);
}

}  // namespace nexus
