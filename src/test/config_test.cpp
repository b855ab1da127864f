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
#include <optional>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../cli_parser.hpp"
#include "../config.hpp"
#include "../settings.hpp"
#include "../status.hpp"
#include "../storagebackendfactory.hpp"
#include "env_guard.hpp"

using namespace nexus;
using namespace testing;

class CommandCLIParserTest : public ::testing::Test {
protected:
    CommandSettingsImpl prepare(int argc, const char** argv) {
        CLIParser parser;
        parser.parse(argc, const_cast<char**>(argv));
        CommandSettingsImpl settings;
        parser.prepare(&settings);
        return settings;
    }
};

TEST_F(CommandCLIParserTest, Store) {
    const char* argv[] = {"nexus", "store", "models/churn.pkl", "churn"};
    auto settings = prepare(4, argv);
    EXPECT_EQ(settings.command, CommandType::STORE);
    EXPECT_EQ(settings.filePath, "models/churn.pkl");
    EXPECT_EQ(settings.modelName, std::optional<std::string>("churn"));
    EXPECT_EQ(settings.logLevel, "WARNING");
    EXPECT_TRUE(settings.projectRoot.empty());
}

TEST_F(CommandCLIParserTest, LoadWithModelName) {
    const char* argv[] = {"nexus", "load", "latest", "out/model.pkl", "--model-name", "churn"};
    auto settings = prepare(6, argv);
    EXPECT_EQ(settings.command, CommandType::LOAD);
    EXPECT_EQ(settings.commitHash, "latest");
    EXPECT_EQ(settings.filePath, "out/model.pkl");
    EXPECT_EQ(settings.modelName, std::optional<std::string>("churn"));
}

TEST_F(CommandCLIParserTest, LoadByHashWithoutModelName) {
    const char* argv[] = {"nexus", "load", "a1b2c3d4e5f6", "out.pkl"};
    auto settings = prepare(4, argv);
    EXPECT_EQ(settings.commitHash, "a1b2c3d4e5f6");
    EXPECT_EQ(settings.modelName, std::nullopt);
}

TEST_F(CommandCLIParserTest, ListAndRollback) {
    const char* listArgv[] = {"nexus", "list", "--project_root", "/work/project"};
    auto settings = prepare(4, listArgv);
    EXPECT_EQ(settings.command, CommandType::LIST);
    EXPECT_EQ(settings.projectRoot, "/work/project");

    const char* rollbackArgv[] = {"nexus", "rollback", "a1b2c3d4e5f6", "churn", "--log_level", "DEBUG"};
    settings = prepare(6, rollbackArgv);
    EXPECT_EQ(settings.command, CommandType::ROLLBACK);
    EXPECT_EQ(settings.commitHash, "a1b2c3d4e5f6");
    EXPECT_EQ(settings.modelName, std::optional<std::string>("churn"));
    EXPECT_EQ(settings.logLevel, "DEBUG");
}

TEST_F(CommandCLIParserTest, WrongUsage) {
    const char* missingArg[] = {"nexus", "store", "model.pkl"};
    EXPECT_THROW(prepare(3, missingArg), std::invalid_argument);
    const char* extraArg[] = {"nexus", "list", "everything"};
    EXPECT_THROW(prepare(3, extraArg), std::invalid_argument);
    const char* unknown[] = {"nexus", "push", "a", "b"};
    EXPECT_THROW(prepare(4, unknown), std::invalid_argument);
    const char* noCommand[] = {"nexus", "--log_level", "INFO"};
    EXPECT_THROW(prepare(3, noCommand), std::invalid_argument);
}

class ServerCLIParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        envGuard.unsetServerEnvironment();
    }
    ServerSettingsImpl prepare(int argc, const char** argv) {
        ServerCLIParser parser;
        parser.parse(argc, const_cast<char**>(argv));
        ServerSettingsImpl settings;
        parser.prepare(&settings);
        return settings;
    }
    EnvGuard envGuard;
};

TEST_F(ServerCLIParserTest, Defaults) {
    const char* argv[] = {"nexus_server"};
    auto settings = prepare(1, argv);
    EXPECT_EQ(settings.port, 8000u);
    EXPECT_EQ(settings.bindAddress, "0.0.0.0");
    EXPECT_EQ(settings.restWorkers, 8u);
    EXPECT_EQ(settings.logLevel, "INFO");
    EXPECT_EQ(settings.modelVersion, "latest");
    EXPECT_EQ(settings.provider, "local");
    EXPECT_EQ(settings.registryPath, ".nexus_meta.json");
    EXPECT_EQ(settings.maxBatchSize, 32u);
    EXPECT_EQ(settings.batchTimeoutMs, 50u);
}

TEST_F(ServerCLIParserTest, EnvironmentFallback) {
    envGuard.set("PORT", "9001");
    envGuard.set("MODEL_NAME", "churn");
    envGuard.set("MODEL_VERSION", "a1b2c3d4e5f6");
    envGuard.set("PROVIDER", "s3");
    envGuard.set("S3_BUCKET", "models");
    envGuard.set("LOG_LEVEL", "debug");
    envGuard.set("MAX_BATCH_SIZE", "16");
    const char* argv[] = {"nexus_server"};
    auto settings = prepare(1, argv);
    EXPECT_EQ(settings.port, 9001u);
    EXPECT_EQ(settings.modelName, "churn");
    EXPECT_EQ(settings.modelVersion, "a1b2c3d4e5f6");
    EXPECT_EQ(settings.provider, "s3");
    EXPECT_EQ(settings.s3Bucket, "models");
    EXPECT_EQ(settings.logLevel, "DEBUG");
    EXPECT_EQ(settings.maxBatchSize, 16u);
}

TEST_F(ServerCLIParserTest, FlagsWinOverEnvironment) {
    envGuard.set("PORT", "9001");
    envGuard.set("LOG_LEVEL", "warn");
    const char* argv[] = {"nexus_server", "--port", "9100", "--model_path", "/models/scorer.json"};
    auto settings = prepare(5, argv);
    EXPECT_EQ(settings.port, 9100u);
    EXPECT_EQ(settings.modelPath, "/models/scorer.json");
    EXPECT_EQ(settings.logLevel, "WARNING");
}

TEST_F(ServerCLIParserTest, InvalidNumericEnvironment) {
    envGuard.set("REST_WORKERS", "many");
    const char* argv[] = {"nexus_server"};
    EXPECT_THROW(prepare(1, argv), std::invalid_argument);
}

class ServerConfigTest : public ::testing::Test {
protected:
    ServerSettingsImpl settings;
};

TEST_F(ServerConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.parse(&settings));
    EXPECT_FALSE(config.loadsFromRegistry());
}

TEST_F(ServerConfigTest, InvalidValues) {
    {
        auto invalid = settings;
        invalid.port = 0;
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.port = 70000;
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.bindAddress = "not an address";
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.restWorkers = 0;
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.maxBatchSize = 0;
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.provider = "azure";
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.logLevel = "VERBOSE";
        EXPECT_FALSE(Config().parse(&invalid));
    }
    {
        auto invalid = settings;
        invalid.modelVersion = "";
        EXPECT_FALSE(Config().parse(&invalid));
    }
}

TEST_F(ServerConfigTest, HostnameOrIp) {
    EXPECT_TRUE(Config::check_hostname_or_ip("0.0.0.0"));
    EXPECT_TRUE(Config::check_hostname_or_ip("127.0.0.1"));
    EXPECT_TRUE(Config::check_hostname_or_ip("::1"));
    EXPECT_TRUE(Config::check_hostname_or_ip("localhost"));
    EXPECT_TRUE(Config::check_hostname_or_ip("model-server.internal"));
    EXPECT_FALSE(Config::check_hostname_or_ip("256.0.0.1"));
    EXPECT_FALSE(Config::check_hostname_or_ip("-bad-.host"));
}

TEST_F(ServerConfigTest, RegistrySelection) {
    settings.modelName = "churn";
    Config config;
    ASSERT_TRUE(config.parse(&settings));
    EXPECT_TRUE(config.loadsFromRegistry());

    settings.modelPath = "/models/churn.json";
    ASSERT_TRUE(config.parse(&settings));
    EXPECT_FALSE(config.loadsFromRegistry());
}

TEST_F(ServerConfigTest, StorageSettingsPerProvider) {
    settings.provider = "s3";
    settings.s3Bucket = "s3-models";
    settings.gcsBucket = "gcs-models";
    settings.awsRegion = "eu-central-1";
    Config config;
    ASSERT_TRUE(config.parse(&settings));
    StorageSettings storage;
    ASSERT_EQ(config.storageSettings(&storage), StatusCode::OK);
    EXPECT_EQ(storage.provider, StorageProvider::S3);
    EXPECT_EQ(storage.bucket, "s3-models");
    EXPECT_EQ(storage.region, "eu-central-1");

    settings.provider = "gcs";
    ASSERT_TRUE(config.parse(&settings));
    StorageSettings gcsStorage;
    ASSERT_EQ(config.storageSettings(&gcsStorage), StatusCode::OK);
    EXPECT_EQ(gcsStorage.bucket, "gcs-models");

    settings.provider = "local";
    ASSERT_TRUE(config.parse(&settings));
    StorageSettings localStorage;
    EXPECT_EQ(config.storageSettings(&localStorage), StatusCode::CONFIG_BUCKET_MISSING);
    settings.localRoot = "/var/lib/nexus";
    ASSERT_TRUE(config.parse(&settings));
    ASSERT_EQ(config.storageSettings(&localStorage), StatusCode::OK);
    EXPECT_EQ(localStorage.localRoot, "/var/lib/nexus");
}
