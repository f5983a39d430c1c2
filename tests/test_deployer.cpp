// =============================================================================
// Unit tests for Deployer (probe, push, verify, retry)
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "deployer.hpp"
#include "fake_transport.hpp"

using namespace mirrorhub;
using namespace mirrorhub::fake;

static const char* REMOTE = "/data/local/tmp/scrcpy-server.jar";
static const char* STAMP = "/data/local/tmp/scrcpy-server.jar.version";

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class DeployerTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_ = factory_.addDevice("SER1");
        auto link = DeviceLink::connect(factory_, "SER1", fastConfig().link);
        ASSERT_TRUE(link.is_ok()) << link.error().describe();
        link_ = link.value();

        artifact_.version = "2.6.1";
        artifact_.bytes.assign(256, 0x5A);
        artifact_.remote_path = REMOTE;
    }

    FakeTransportFactory factory_;
    std::shared_ptr<FakeDevice> device_;
    std::shared_ptr<DeviceLink> link_;
    HelperArtifact artifact_;
    Deployer deployer_;
};

TEST_F(DeployerTest, FirstDeployPushesAndStamps) {
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    EXPECT_EQ(deployer_.pushCount(), 1);
    EXPECT_EQ(device_->push_count.load(), 1);

    auto file = device_->file(REMOTE);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->size(), 256u);
    EXPECT_EQ(device_->file(STAMP).value_or(""), "2.6.1");
}

TEST_F(DeployerTest, MatchingCopyIsNotPushedAgain) {
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    EXPECT_EQ(deployer_.pushCount(), 1);
    EXPECT_EQ(device_->push_count.load(), 1);
}

TEST_F(DeployerTest, VersionChangeForcesPush) {
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    artifact_.version = "2.7";
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    EXPECT_EQ(deployer_.pushCount(), 2);
    EXPECT_EQ(device_->file(STAMP).value_or(""), "2.7");
}

TEST_F(DeployerTest, CorruptPushIsRetried) {
    device_->corrupt_pushes = 1;
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    EXPECT_EQ(deployer_.pushCount(), 2);
    EXPECT_EQ(device_->file(REMOTE)->size(), 256u);
}

TEST_F(DeployerTest, RepeatedCorruptionFails) {
    device_->corrupt_pushes = Deployer::MAX_PUSH_ATTEMPTS;
    auto r = deployer_.deploy(*link_, artifact_);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeployFailed);
    EXPECT_NE(r.error().message.find("mismatch"), std::string::npos);
    EXPECT_EQ(deployer_.pushCount(), Deployer::MAX_PUSH_ATTEMPTS);
}

TEST_F(DeployerTest, RejectsPathOutsideTmp) {
    artifact_.remote_path = "/system/bin/scrcpy-server.jar";
    auto r = deployer_.deploy(*link_, artifact_);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeployFailed);
    EXPECT_EQ(device_->push_count.load(), 0);
}

TEST_F(DeployerTest, ClosedLinkFailsDeploy) {
    link_->close();
    auto r = deployer_.deploy(*link_, artifact_);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeployFailed);
}

TEST_F(DeployerTest, RemoveDeletesHelperAndStamp) {
    ASSERT_TRUE(deployer_.deploy(*link_, artifact_).is_ok());
    ASSERT_TRUE(deployer_.remove(*link_, REMOTE).is_ok());
    EXPECT_FALSE(device_->file(REMOTE).has_value());
    EXPECT_FALSE(device_->file(STAMP).has_value());

    auto bad = deployer_.remove(*link_, "/system/x.jar");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code, ErrorCode::PermissionDenied);
}

// ---------------------------------------------------------------------------
// Probe parsing
// ---------------------------------------------------------------------------
TEST(DeployProbeTest, ParsesSizeAndVersion) {
    DeployProbe p = parseDeployProbe("size=1234\r\nversion=2.6.1\n");
    EXPECT_TRUE(p.present);
    EXPECT_EQ(p.size, 1234u);
    EXPECT_EQ(p.version, "2.6.1");
}

TEST(DeployProbeTest, MissingFile) {
    DeployProbe p = parseDeployProbe("size=\nversion=\n");
    EXPECT_FALSE(p.present);
    EXPECT_TRUE(p.version.empty());

    EXPECT_FALSE(parseDeployProbe("").present);
    EXPECT_FALSE(parseDeployProbe("size=abc\n").present);
}

// ---------------------------------------------------------------------------
// loadArtifact
// ---------------------------------------------------------------------------
TEST(LoadArtifactTest, ReadsLocalFile) {
    const char* path = "__mirrorhub_test_helper.jar";
    {
        std::ofstream f(path, std::ios::binary);
        f << "PK\x03\x04 helper bytes";
    }
    auto r = loadArtifact(path, "2.6.1", REMOTE);
    ASSERT_TRUE(r.is_ok()) << r.error().describe();
    EXPECT_EQ(r.value()->version, "2.6.1");
    EXPECT_EQ(r.value()->remote_path, REMOTE);
    EXPECT_EQ(r.value()->bytes.size(), 17u);
    std::remove(path);
}

TEST(LoadArtifactTest, Errors) {
    auto missing = loadArtifact("__no_such_helper.jar", "2.6.1", REMOTE);
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code, ErrorCode::DeployFailed);

    auto bad_version = loadArtifact("__no_such_helper.jar", "2.6 && reboot", REMOTE);
    ASSERT_TRUE(bad_version.is_err());
    EXPECT_EQ(bad_version.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(bad_version.error().field, "version");

    auto bad_path = loadArtifact("__no_such_helper.jar", "2.6.1", "/system/app.jar");
    ASSERT_TRUE(bad_path.is_err());
    EXPECT_EQ(bad_path.error().field, "remote_path");
}
