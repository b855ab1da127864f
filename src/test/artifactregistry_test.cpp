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
#include <filesystem>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../artifactregistry.hpp"
#include "../registration_service.hpp"
#include "../status.hpp"
#include "test_with_temp_dir.hpp"

using namespace nexus;
using namespace testing;

static const char* VALID_REGISTRY = R"({
  "models": {
    "churn": {
      "a1b2c3d4e5f6": {
        "storage_uri": "churn/a1b2c3d4e5f6.pkl",
        "commit_hash": "a1b2c3d4e5f6",
        "file_size": 1048576,
        "file_extension": "pkl",
        "timestamp": "2024-01-15T10:30:00.123456"
      }
    }
  },
  "latest": {
    "churn": "a1b2c3d4e5f6"
  }
})";

class ArtifactRegistryTest : public TestWithTempDir {
protected:
    void SetUp() override {
        TestWithTempDir::SetUp();
        registryPath = projectRegistryPath();
        filesToPrintInCaseOfFailure.emplace_back(".nexus_meta.json");
    }
    std::string registryPath;
};

TEST_F(ArtifactRegistryTest, DefaultPathIsInProjectRoot) {
    EXPECT_EQ(ArtifactRegistry::defaultPath("/project"), "/project/.nexus_meta.json");
    EXPECT_EQ(ArtifactRegistry::defaultPath(""), ".nexus_meta.json");
}

TEST_F(ArtifactRegistryTest, MissingFileLoadsEmptyRegistry) {
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registry.load(), StatusCode::OK);
    EXPECT_TRUE(registry.getModels().empty());
    EXPECT_TRUE(registry.getLatestPointers().empty());
    EXPECT_FALSE(registry.fileExists());
    EXPECT_EQ(registry.requireExists(), StatusCode::REGISTRY_NOT_INITIALIZED);
}

TEST_F(ArtifactRegistryTest, LoadValidFile) {
    createFile(registryPath, VALID_REGISTRY);
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registry.load(), StatusCode::OK);
    EXPECT_EQ(registry.requireExists(), StatusCode::OK);
    ASSERT_TRUE(registry.hasModel("churn"));
    const VersionEntry* entry = registry.findVersion("churn", "a1b2c3d4e5f6");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->storageLocation, "churn/a1b2c3d4e5f6.pkl");
    EXPECT_EQ(entry->fileSizeBytes, 1048576u);
    EXPECT_EQ(entry->fileExtension, "pkl");
    EXPECT_EQ(entry->timestamp, "2024-01-15T10:30:00.123456");
    EXPECT_EQ(registry.getLatest("churn"), std::optional<std::string>("a1b2c3d4e5f6"));
    EXPECT_EQ(registry.getLatest("other"), std::nullopt);
}

TEST_F(ArtifactRegistryTest, EmptyObjectIsValidEmptyRegistry) {
    createFile(registryPath, "{}");
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registry.load(), StatusCode::OK);
    EXPECT_TRUE(registry.getModels().empty());
    EXPECT_EQ(registry.requireExists(), StatusCode::OK);
}

TEST_F(ArtifactRegistryTest, UnparsableFileIsCorrupt) {
    createFile(registryPath, "{ \"models\": ");
    ArtifactRegistry registry(registryPath);
    auto status = registry.load();
    EXPECT_EQ(status, StatusCode::REGISTRY_CORRUPT);
    EXPECT_THAT(status.string(), HasSubstr("Failed to parse metadata file"));
}

TEST_F(ArtifactRegistryTest, WrongShapeIsCorrupt) {
    createFile(registryPath, R"({"models": {"churn": {"abc": {"storage_uri": "churn/abc.pkl"}}}})");
    ArtifactRegistry registry(registryPath);
    EXPECT_EQ(registry.load(), StatusCode::REGISTRY_CORRUPT);

    createFile(registryPath, R"({"models": [], "latest": {}})");
    EXPECT_EQ(registry.load(), StatusCode::REGISTRY_CORRUPT);
}

TEST_F(ArtifactRegistryTest, DanglingLatestPointerIsCorrupt) {
    createFile(registryPath, R"({
  "models": {
    "churn": {
      "abc": {"storage_uri": "churn/abc.pkl", "commit_hash": "abc", "file_size": 1, "file_extension": "pkl", "timestamp": "t"}
    }
  },
  "latest": {"churn": "def"}
})");
    ArtifactRegistry registry(registryPath);
    EXPECT_EQ(registry.load(), StatusCode::REGISTRY_CORRUPT);
}

TEST_F(ArtifactRegistryTest, FailedLoadKeepsPreviousState) {
    createFile(registryPath, VALID_REGISTRY);
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registry.load(), StatusCode::OK);
    createFile(registryPath, "not json");
    EXPECT_EQ(registry.load(), StatusCode::REGISTRY_CORRUPT);
    EXPECT_TRUE(registry.hasModel("churn"));
}

TEST_F(ArtifactRegistryTest, SaveThenLoadReproducesRegistry) {
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registerVersion(registry, "churn", "h1", "churn/h1.pkl", 1048576, "pkl", "2024-01-15T10:30:00.000001"), StatusCode::OK);
    ASSERT_EQ(registerVersion(registry, "churn", "h2", "churn/h2.pkl", 2097152, "pkl", "2024-01-16T10:30:00.000001"), StatusCode::OK);
    ASSERT_EQ(registerVersion(registry, "fraud", "h3", "fraud/h3.bin", 10, "bin", "2024-01-17T10:30:00.000001"), StatusCode::OK);
    ASSERT_EQ(registry.save(), StatusCode::OK);
    EXPECT_FALSE(std::filesystem::exists(registryPath + ".tmp"));

    ArtifactRegistry reloaded(registryPath);
    ASSERT_EQ(reloaded.load(), StatusCode::OK);
    EXPECT_TRUE(reloaded == registry);
    EXPECT_EQ(reloaded.getLatest("churn"), std::optional<std::string>("h2"));
}

TEST_F(ArtifactRegistryTest, SerializedFileUsesTwoSpaceIndentAndStableKeys) {
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registerVersion(registry, "churn", "h1", "churn/h1.pkl", 5, "pkl", "2024-01-15T10:30:00.000001"), StatusCode::OK);
    ASSERT_EQ(registry.save(), StatusCode::OK);
    const std::string contents = readFile(registryPath);
    EXPECT_THAT(contents, StartsWith("{\n  \"models\": {\n    \"churn\": {"));
    EXPECT_THAT(contents, HasSubstr("\"storage_uri\": \"churn/h1.pkl\""));
    EXPECT_THAT(contents, HasSubstr("\"commit_hash\": \"h1\""));
    EXPECT_THAT(contents, HasSubstr("\"file_size\": 5"));
    EXPECT_THAT(contents, HasSubstr("\"file_extension\": \"pkl\""));
    EXPECT_THAT(contents, HasSubstr("\"latest\": {\n    \"churn\": \"h1\"\n  }"));
    EXPECT_THAT(contents, EndsWith("}\n"));
}

TEST_F(ArtifactRegistryTest, SaveCreatesParentDirectories) {
    ArtifactRegistry registry(directoryPath + "/nested/dir/.nexus_meta.json");
    ASSERT_EQ(registerVersion(registry, "m", "h", "m/h.bin", 1, "bin"), StatusCode::OK);
    ASSERT_EQ(registry.save(), StatusCode::OK);
    EXPECT_TRUE(registry.fileExists());
}

TEST_F(ArtifactRegistryTest, KeyWinsOverMismatchedRecordedHash) {
    createFile(registryPath, R"({
  "models": {
    "churn": {
      "abc": {"storage_uri": "churn/abc.pkl", "commit_hash": "zzz", "file_size": 1, "file_extension": "pkl", "timestamp": "t"}
    }
  },
  "latest": {"churn": "abc"}
})");
    ArtifactRegistry registry(registryPath);
    ASSERT_EQ(registry.load(), StatusCode::OK);
    const VersionEntry* entry = registry.findVersion("churn", "abc");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->commitHash, "abc");
}
