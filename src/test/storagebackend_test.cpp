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
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../controlplane_config.hpp"
#include "../localstoragebackend.hpp"
#include "../status.hpp"
#include "../storagebackend.hpp"
#include "../storagebackendfactory.hpp"
#include "env_guard.hpp"
#include "test_with_temp_dir.hpp"

using namespace nexus;
using namespace testing;

TEST(StorageBackend, BuildStorageLocation) {
    EXPECT_EQ(StorageBackend::buildStorageLocation("churn", "a1b2c3d4e5f6", "pkl"), "churn/a1b2c3d4e5f6.pkl");
    EXPECT_EQ(StorageBackend::buildStorageLocation("churn", "a1b2c3d4e5f6", ""), "churn/a1b2c3d4e5f6.bin");
}

TEST(StorageBackend, LocationValidation) {
    EXPECT_TRUE(StorageBackend::isLocationValid("churn/abc.pkl"));
    EXPECT_FALSE(StorageBackend::isLocationValid(""));
    EXPECT_FALSE(StorageBackend::isLocationValid("/etc/passwd"));
    EXPECT_FALSE(StorageBackend::isLocationValid("../outside.bin"));
}

TEST(StorageBackend, ParseProvider) {
    StorageProvider provider = StorageProvider::LOCAL;
    EXPECT_EQ(parseStorageProvider("s3", &provider), StatusCode::OK);
    EXPECT_EQ(provider, StorageProvider::S3);
    EXPECT_EQ(parseStorageProvider("GCS", &provider), StatusCode::OK);
    EXPECT_EQ(provider, StorageProvider::GCS);
    EXPECT_EQ(parseStorageProvider("Local", &provider), StatusCode::OK);
    EXPECT_EQ(provider, StorageProvider::LOCAL);
    EXPECT_EQ(parseStorageProvider("azure", &provider), StatusCode::CONFIG_PROVIDER_INVALID);
    EXPECT_EQ(provider, StorageProvider::LOCAL);
    EXPECT_EQ(toString(StorageProvider::GCS), "gcs");
}

TEST(StorageBackendFactory, MissingBucketIsRejected) {
    std::unique_ptr<StorageBackend> backend;
    StorageSettings settings;
    settings.provider = StorageProvider::S3;
    EXPECT_EQ(createStorageBackend(settings, &backend), StatusCode::CONFIG_BUCKET_MISSING);
    settings.provider = StorageProvider::GCS;
    EXPECT_EQ(createStorageBackend(settings, &backend), StatusCode::CONFIG_BUCKET_MISSING);
    settings.provider = StorageProvider::LOCAL;
    EXPECT_EQ(createStorageBackend(settings, &backend), StatusCode::CONFIG_BUCKET_MISSING);
    EXPECT_EQ(backend, nullptr);
}

TEST(StorageBackendFactory, CreatesLocalBackend) {
    std::unique_ptr<StorageBackend> backend;
    StorageSettings settings;
    settings.provider = StorageProvider::LOCAL;
    settings.localRoot = "/tmp/nexus_bucket";
    ASSERT_EQ(createStorageBackend(settings, &backend), StatusCode::OK);
    ASSERT_NE(backend, nullptr);
    EXPECT_NE(dynamic_cast<LocalStorageBackend*>(backend.get()), nullptr);
    EXPECT_EQ(backend->describe("churn/abc.pkl"), "/tmp/nexus_bucket/churn/abc.pkl");
}

class LocalStorageBackendTest : public TestWithTempDir {
protected:
    void SetUp() override {
        TestWithTempDir::SetUp();
        bucketPath = directoryPath + "/bucket";
        backend = std::make_unique<LocalStorageBackend>(bucketPath);
        modelPath = directoryPath + "/model.pkl";
        createFile(modelPath, "model-bytes");
    }
    std::string bucketPath;
    std::string modelPath;
    std::unique_ptr<LocalStorageBackend> backend;
};

TEST_F(LocalStorageBackendTest, UploadThenDownload) {
    bool exists = true;
    ASSERT_EQ(backend->exists("churn/abc.pkl", &exists), StatusCode::OK);
    EXPECT_FALSE(exists);

    ASSERT_EQ(backend->upload(modelPath, "churn/abc.pkl"), StatusCode::OK);
    ASSERT_EQ(backend->exists("churn/abc.pkl", &exists), StatusCode::OK);
    EXPECT_TRUE(exists);
    EXPECT_EQ(readFile(bucketPath + "/churn/abc.pkl"), "model-bytes");

    const std::string outputPath = directoryPath + "/out/nested/model.pkl";
    ASSERT_EQ(backend->download("churn/abc.pkl", outputPath), StatusCode::OK);
    EXPECT_EQ(readFile(outputPath), "model-bytes");
}

TEST_F(LocalStorageBackendTest, UploadReplacesExistingObject) {
    ASSERT_EQ(backend->upload(modelPath, "churn/abc.pkl"), StatusCode::OK);
    createFile(modelPath, "retrained");
    ASSERT_EQ(backend->upload(modelPath, "churn/abc.pkl"), StatusCode::OK);
    EXPECT_EQ(readFile(bucketPath + "/churn/abc.pkl"), "retrained");
}

TEST_F(LocalStorageBackendTest, DownloadMissingObject) {
    auto status = backend->download("churn/missing.pkl", directoryPath + "/out.pkl");
    EXPECT_EQ(status, StatusCode::LOCAL_STORAGE_FILE_NOT_FOUND);
}

TEST_F(LocalStorageBackendTest, UploadOfDirectoryFails) {
    EXPECT_EQ(backend->upload(directoryPath, "churn/abc.pkl"), StatusCode::FILE_INVALID);
    EXPECT_EQ(backend->upload(directoryPath + "/missing.pkl", "churn/abc.pkl"), StatusCode::FILE_INVALID);
}

TEST_F(LocalStorageBackendTest, EscapingLocationsAreRejected) {
    EXPECT_EQ(backend->upload(modelPath, "../escaped.pkl"), StatusCode::PATH_INVALID);
    EXPECT_EQ(backend->download("../escaped.pkl", directoryPath + "/out.pkl"), StatusCode::PATH_INVALID);
}

class ControlPlaneConfigTest : public TestWithTempDir {
protected:
    void SetUp() override {
        TestWithTempDir::SetUp();
        envGuard.unsetControlPlaneEnvironment();
    }
    EnvGuard envGuard;
};

TEST_F(ControlPlaneConfigTest, MissingFileRequiresBucket) {
    StorageSettings settings;
    auto status = loadControlPlaneConfig(directoryPath, &settings);
    EXPECT_EQ(status, StatusCode::CONFIG_BUCKET_MISSING);
    EXPECT_EQ(settings.provider, StorageProvider::S3);
}

TEST_F(ControlPlaneConfigTest, ReadsFileValues) {
    createFile(directoryPath + "/.nexusrc", R"({"provider": "s3", "bucket": "models", "region": "eu-west-1", "endpoint": "http://minio:9000"})");
    StorageSettings settings;
    ASSERT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::OK);
    EXPECT_EQ(settings.provider, StorageProvider::S3);
    EXPECT_EQ(settings.bucket, "models");
    EXPECT_EQ(settings.region, "eu-west-1");
    EXPECT_EQ(settings.endpoint, "http://minio:9000");
}

TEST_F(ControlPlaneConfigTest, DefaultRegion) {
    createFile(directoryPath + "/.nexusrc", R"({"bucket": "models"})");
    StorageSettings settings;
    ASSERT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::OK);
    EXPECT_EQ(settings.region, "us-east-1");
}

TEST_F(ControlPlaneConfigTest, EnvironmentOverridesFile) {
    createFile(directoryPath + "/.nexusrc", R"({"provider": "s3", "bucket": "models", "region": "eu-west-1"})");
    envGuard.set("NEXUS_PROVIDER", "gcs");
    envGuard.set("NEXUS_BUCKET", "other-bucket");
    envGuard.set("AWS_REGION", "us-west-2");
    StorageSettings settings;
    ASSERT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::OK);
    EXPECT_EQ(settings.provider, StorageProvider::GCS);
    EXPECT_EQ(settings.bucket, "other-bucket");
    EXPECT_EQ(settings.region, "us-west-2");
}

TEST_F(ControlPlaneConfigTest, InvalidProviderFromEnvironment) {
    createFile(directoryPath + "/.nexusrc", R"({"bucket": "models"})");
    envGuard.set("NEXUS_PROVIDER", "ftp");
    StorageSettings settings;
    EXPECT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::CONFIG_PROVIDER_INVALID);
}

TEST_F(ControlPlaneConfigTest, InvalidFileContents) {
    StorageSettings settings;
    createFile(directoryPath + "/.nexusrc", "{bucket");
    EXPECT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::CONFIG_FILE_INVALID);
    createFile(directoryPath + "/.nexusrc", R"({"bucket": 5})");
    EXPECT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::CONFIG_FILE_INVALID);
    createFile(directoryPath + "/.nexusrc", R"({"bucket": "models", "unknown": "x"})");
    EXPECT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::CONFIG_FILE_INVALID);
    createFile(directoryPath + "/.nexusrc", R"({"provider": "ftp", "bucket": "models"})");
    EXPECT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::CONFIG_PROVIDER_INVALID);
}

TEST_F(ControlPlaneConfigTest, RelativeLocalRootIsResolvedAgainstProjectRoot) {
    createFile(directoryPath + "/.nexusrc", R"({"provider": "local", "local_root": "artifacts"})");
    StorageSettings settings;
    ASSERT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::OK);
    EXPECT_EQ(settings.provider, StorageProvider::LOCAL);
    EXPECT_EQ(settings.localRoot, directoryPath + "/artifacts");
}

TEST_F(ControlPlaneConfigTest, LocalProviderRequiresRoot) {
    createFile(directoryPath + "/.nexusrc", R"({"provider": "local"})");
    StorageSettings settings;
    EXPECT_EQ(loadControlPlaneConfig(directoryPath, &settings), StatusCode::CONFIG_BUCKET_MISSING);
}
