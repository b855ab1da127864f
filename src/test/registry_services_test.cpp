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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../artifactregistry.hpp"
#include "../listing.hpp"
#include "../registration_service.hpp"
#include "../resolution_service.hpp"
#include "../rollback_service.hpp"
#include "../status.hpp"
#include "test_with_temp_dir.hpp"

using namespace nexus;
using namespace testing;

class RegistryServicesTest : public TestWithTempDir {
protected:
    void SetUp() override {
        TestWithTempDir::SetUp();
        registry = std::make_unique<ArtifactRegistry>(projectRegistryPath());
    }
    void registerTwoChurnVersions() {
        ASSERT_EQ(registerVersion(*registry, "churn", "h1", "churn/h1.pkl", 1048576, "pkl", "2024-01-15T10:30:00.000001"), StatusCode::OK);
        ASSERT_EQ(registerVersion(*registry, "churn", "h2", "churn/h2.pkl", 2097152, "pkl", "2024-01-16T10:30:00.000001"), StatusCode::OK);
    }
    std::optional<std::string> resolve(const std::string& selector, const std::optional<std::string>& modelName = std::nullopt) {
        std::optional<std::string> location;
        EXPECT_EQ(resolveStorageLocation(*registry, selector, modelName, &location), StatusCode::OK);
        return location;
    }
    std::unique_ptr<ArtifactRegistry> registry;
};

TEST_F(RegistryServicesTest, RegisterSetsEntryAndLatest) {
    ASSERT_EQ(registerVersion(*registry, "churn", "a1b2c3d4e5f6", "churn/a1b2c3d4e5f6.pkl", 42, "pkl"), StatusCode::OK);
    const VersionEntry* entry = registry->findVersion("churn", "a1b2c3d4e5f6");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->commitHash, "a1b2c3d4e5f6");
    EXPECT_EQ(entry->storageLocation, "churn/a1b2c3d4e5f6.pkl");
    EXPECT_EQ(entry->fileSizeBytes, 42u);
    EXPECT_EQ(entry->fileExtension, "pkl");
    EXPECT_FALSE(entry->timestamp.empty());
    EXPECT_EQ(registry->getLatest("churn"), std::optional<std::string>("a1b2c3d4e5f6"));
}

TEST_F(RegistryServicesTest, RegisterDoesNotTouchFile) {
    ASSERT_EQ(registerVersion(*registry, "churn", "h1", "churn/h1.pkl", 1, "pkl"), StatusCode::OK);
    EXPECT_FALSE(registry->fileExists());
}

TEST_F(RegistryServicesTest, ReRegisteringSameKeyOverwrites) {
    ASSERT_EQ(registerVersion(*registry, "churn", "h1", "churn/h1.pkl", 1, "pkl"), StatusCode::OK);
    ASSERT_EQ(registerVersion(*registry, "churn", "h1", "churn/h1.joblib", 2, "joblib"), StatusCode::OK);
    ASSERT_EQ(registry->getModels().at("churn").size(), 1u);
    EXPECT_EQ(registry->findVersion("churn", "h1")->storageLocation, "churn/h1.joblib");
    EXPECT_EQ(registry->findVersion("churn", "h1")->fileSizeBytes, 2u);
    EXPECT_EQ(registry->getLatest("churn"), std::optional<std::string>("h1"));
}

TEST_F(RegistryServicesTest, RegisterAdvancesLatestOnlyForItsModel) {
    registerTwoChurnVersions();
    ASSERT_EQ(registerVersion(*registry, "fraud", "h9", "fraud/h9.bin", 1, "bin"), StatusCode::OK);
    EXPECT_EQ(registry->getLatest("churn"), std::optional<std::string>("h2"));
    EXPECT_EQ(registry->getLatest("fraud"), std::optional<std::string>("h9"));
}

TEST_F(RegistryServicesTest, RegisterRejectsEmptyKeys) {
    EXPECT_EQ(registerVersion(*registry, "", "h1", "x", 1, "pkl"), StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(registerVersion(*registry, "churn", "", "x", 1, "pkl"), StatusCode::INVALID_ARGUMENT);
    EXPECT_TRUE(registry->getModels().empty());
    EXPECT_TRUE(registry->getLatestPointers().empty());
}

TEST_F(RegistryServicesTest, ResolveExplicitHash) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    EXPECT_EQ(resolve("h1"), std::optional<std::string>("churn/h1.pkl"));
    EXPECT_EQ(resolve("h1", std::string("churn")), std::optional<std::string>("churn/h1.pkl"));
}

TEST_F(RegistryServicesTest, ResolveLatestMatchesLatestHash) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    auto viaLatest = resolve(LATEST_SELECTOR, std::string("churn"));
    ASSERT_TRUE(viaLatest.has_value());
    EXPECT_EQ(viaLatest, resolve(registry->getLatest("churn").value(), std::string("churn")));
    EXPECT_EQ(*viaLatest, "churn/h2.pkl");
}

TEST_F(RegistryServicesTest, ResolveLatestWithoutModelIsInvalid) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    std::optional<std::string> location;
    EXPECT_EQ(resolveStorageLocation(*registry, LATEST_SELECTOR, std::nullopt, &location), StatusCode::INVALID_ARGUMENT);
}

TEST_F(RegistryServicesTest, ResolveEmptySelectorIsInvalid) {
    ASSERT_EQ(registry->save(), StatusCode::OK);
    std::optional<std::string> location;
    EXPECT_EQ(resolveStorageLocation(*registry, "", std::string("churn"), &location), StatusCode::INVALID_ARGUMENT);
}

TEST_F(RegistryServicesTest, ResolveMissesAreNotErrors) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    EXPECT_EQ(resolve(LATEST_SELECTOR, std::string("unknown")), std::nullopt);
    EXPECT_EQ(resolve("h3"), std::nullopt);
    EXPECT_EQ(resolve("h1", std::string("unknown")), std::nullopt);
    EXPECT_EQ(resolve("h3", std::string("churn")), std::nullopt);
}

TEST_F(RegistryServicesTest, ResolveSharedHashWithoutModelPicksFirstModelInOrder) {
    ASSERT_EQ(registerVersion(*registry, "zeta", "shared", "zeta/shared.bin", 1, "bin"), StatusCode::OK);
    ASSERT_EQ(registerVersion(*registry, "alpha", "shared", "alpha/shared.bin", 1, "bin"), StatusCode::OK);
    ASSERT_EQ(registry->save(), StatusCode::OK);
    EXPECT_EQ(resolve("shared"), std::optional<std::string>("alpha/shared.bin"));
    EXPECT_EQ(resolve("shared", std::string("zeta")), std::optional<std::string>("zeta/shared.bin"));
}

TEST_F(RegistryServicesTest, ResolveRequiresRegistryFile) {
    registerTwoChurnVersions();
    std::optional<std::string> location = std::string("stale");
    EXPECT_EQ(resolveStorageLocation(*registry, "h1", std::string("churn"), &location), StatusCode::REGISTRY_NOT_INITIALIZED);
    EXPECT_EQ(location, std::nullopt);
    EXPECT_EQ(resolveStorageLocation(*registry, LATEST_SELECTOR, std::string("churn"), &location), StatusCode::REGISTRY_NOT_INITIALIZED);
    ASSERT_EQ(registry->save(), StatusCode::OK);
    EXPECT_EQ(resolve("h1", std::string("churn")), std::optional<std::string>("churn/h1.pkl"));
}

TEST_F(RegistryServicesTest, RollbackRequiresRegistryFile) {
    registerTwoChurnVersions();
    EXPECT_EQ(setLatest(*registry, "churn", "h1"), StatusCode::REGISTRY_NOT_INITIALIZED);
    EXPECT_EQ(registry->getLatest("churn"), std::optional<std::string>("h2"));
}

TEST_F(RegistryServicesTest, RollbackMovesOnlyLatestPointer) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    const auto modelsBefore = registry->getModels();
    ASSERT_EQ(setLatest(*registry, "churn", "h1"), StatusCode::OK);
    EXPECT_EQ(registry->getLatest("churn"), std::optional<std::string>("h1"));
    EXPECT_EQ(registry->getModels(), modelsBefore);
    EXPECT_EQ(resolve(LATEST_SELECTOR, std::string("churn")), std::optional<std::string>("churn/h1.pkl"));
}

TEST_F(RegistryServicesTest, RollbackToUnknownHashLeavesRegistryUnchanged) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    auto status = setLatest(*registry, "churn", "h3");
    EXPECT_EQ(status, StatusCode::MODEL_VERSION_MISSING);
    EXPECT_THAT(status.string(), HasSubstr("Commit hash 'h3' not found for model 'churn'."));
    EXPECT_EQ(registry->getLatest("churn"), std::optional<std::string>("h2"));
}

TEST_F(RegistryServicesTest, RollbackUnknownModel) {
    registerTwoChurnVersions();
    ASSERT_EQ(registry->save(), StatusCode::OK);
    auto status = setLatest(*registry, "fraud", "h1");
    EXPECT_EQ(status, StatusCode::MODEL_NAME_MISSING);
    EXPECT_THAT(status.string(), HasSubstr("Model 'fraud' not found in metadata."));
}

TEST_F(RegistryServicesTest, ListMarksLatestVersion) {
    registerTwoChurnVersions();
    std::vector<VersionRecord> records;
    ASSERT_EQ(listAll(*registry, &records), StatusCode::OK);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].modelName, "churn");
    EXPECT_EQ(records[0].commitHash, "h1");
    EXPECT_EQ(records[0].fileSizeBytes, 1048576u);
    EXPECT_FALSE(records[0].isLatest);
    EXPECT_EQ(records[1].commitHash, "h2");
    EXPECT_EQ(records[1].storageLocation, "churn/h2.pkl");
    EXPECT_EQ(records[1].fileSizeBytes, 2097152u);
    EXPECT_EQ(records[1].timestamp, "2024-01-16T10:30:00.000001");
    EXPECT_TRUE(records[1].isLatest);
}

TEST_F(RegistryServicesTest, ListEmptyRegistry) {
    std::vector<VersionRecord> records{VersionRecord{}};
    ASSERT_EQ(listAll(*registry, &records), StatusCode::OK);
    EXPECT_TRUE(records.empty());
}
