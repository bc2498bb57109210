/**
 * @file test_sandbox_settings.cpp
 * @brief Unit tests for sandbox settings and docker argument building
 */

#include <gtest/gtest.h>
#include <psgui/sandbox/sandbox_settings.hpp>

#include <algorithm>

using namespace psgui;
using namespace psgui::sandbox;

class SandboxSettingsTest : public ::testing::Test {
protected:
    static bool contains(const std::vector<std::string>& args, const std::string& value) {
        return std::find(args.begin(), args.end(), value) != args.end();
    }
};

// =============================================================================
// Settings
// =============================================================================

TEST_F(SandboxSettingsTest, DefaultsFillUnsetFields) {
    core::ManagedSandboxConfig config;
    SandboxSettings settings = resolveSettings(config);

    EXPECT_EQ(settings.port, core::DEFAULT_SANDBOX_PORT);
    EXPECT_EQ(settings.image, core::DEFAULT_SANDBOX_IMAGE);
    EXPECT_EQ(settings.bind_address, core::DEFAULT_SANDBOX_BIND);
    EXPECT_TRUE(settings.data_dir.empty());
}

TEST_F(SandboxSettingsTest, OverridesKept) {
    core::ManagedSandboxConfig config;
    config.port = 9100;
    config.image = "example/emulator:1";
    config.bind_address = "0.0.0.0";
    config.data_dir = "/tmp/pubsub";

    SandboxSettings settings = resolveSettings(config);
    EXPECT_EQ(settings.port, 9100);
    EXPECT_EQ(settings.image, "example/emulator:1");
    EXPECT_EQ(settings.bind_address, "0.0.0.0");
    EXPECT_EQ(settings.data_dir, "/tmp/pubsub");
}

TEST_F(SandboxSettingsTest, InstanceNameDerivedFromProfile) {
    EXPECT_EQ(instanceName("dev"), "pubsub-gui-emulator-dev");
    EXPECT_EQ(instanceName("dev"), instanceName("dev"));
    EXPECT_NE(instanceName("a"), instanceName("b"));
}

// =============================================================================
// Launch Arguments
// =============================================================================

TEST_F(SandboxSettingsTest, LoopbackPublishByDefault) {
    SandboxSettings settings;
    settings.port = 8090;
    auto args = buildLaunchArgs("pubsub-gui-emulator-x", settings);

    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[0], "run");
    EXPECT_TRUE(contains(args, "--rm"));
    EXPECT_TRUE(contains(args, "pubsub-gui-emulator-x"));
    EXPECT_TRUE(contains(args, "127.0.0.1:8090:8085"));
    EXPECT_TRUE(contains(args, "--host-port=0.0.0.0:8085"));
    EXPECT_TRUE(contains(args, settings.image));
    EXPECT_FALSE(contains(args, "-v"));
}

TEST_F(SandboxSettingsTest, AllInterfacesOnlyWhenRequested) {
    SandboxSettings settings;
    settings.bind_address = "0.0.0.0";
    auto args = buildLaunchArgs("n", settings);

    EXPECT_TRUE(contains(args, "8085:8085"));
    EXPECT_FALSE(contains(args, "127.0.0.1:8085:8085"));
}

TEST_F(SandboxSettingsTest, DataDirMounted) {
    SandboxSettings settings;
    settings.data_dir = "/var/lib/pubsub";
    auto args = buildLaunchArgs("n", settings);

    EXPECT_TRUE(contains(args, "-v"));
    EXPECT_TRUE(contains(args, "/var/lib/pubsub:/data"));
    EXPECT_TRUE(contains(args, "--data-dir=/data"));
}

TEST_F(SandboxSettingsTest, ImagePrecedesEmulatorCommand) {
    SandboxSettings settings;
    auto args = buildLaunchArgs("n", settings);

    auto image = std::find(args.begin(), args.end(), settings.image);
    auto gcloud = std::find(args.begin(), args.end(), "gcloud");
    ASSERT_NE(image, args.end());
    ASSERT_NE(gcloud, args.end());
    EXPECT_LT(image, gcloud);
}

// =============================================================================
// Port Mapping
// =============================================================================

TEST_F(SandboxSettingsTest, ParsesLoopbackMapping) {
    std::string bind;
    EXPECT_TRUE(parsePortMapping("8085/tcp=127.0.0.1:8085", 8085, bind));
    EXPECT_EQ(bind, "127.0.0.1");
}

TEST_F(SandboxSettingsTest, ParsesAllInterfacesMapping) {
    std::string bind;
    EXPECT_TRUE(parsePortMapping("8085/tcp=0.0.0.0:9000 8085/tcp=:::9000", 9000, bind));
    EXPECT_EQ(bind, "0.0.0.0");
}

TEST_F(SandboxSettingsTest, RejectsOtherHostPort) {
    std::string bind;
    EXPECT_FALSE(parsePortMapping("8085/tcp=127.0.0.1:8085", 9000, bind));
    EXPECT_FALSE(parsePortMapping("", 8085, bind));
    EXPECT_FALSE(parsePortMapping("9999/tcp=127.0.0.1:8085", 8085, bind));
}

TEST_F(SandboxSettingsTest, NormalizeBindAddr) {
    EXPECT_EQ(normalizeBindAddr("", "127.0.0.1"), "127.0.0.1");
    EXPECT_EQ(normalizeBindAddr("0.0.0.0", "127.0.0.1"), "0.0.0.0");
}

TEST_F(SandboxSettingsTest, ExpectedImageFallsBackToDefault) {
    SandboxSettings settings;
    settings.image.clear();
    EXPECT_EQ(expectedImage(settings), core::DEFAULT_SANDBOX_IMAGE);

    settings.image = "example/emulator:2";
    EXPECT_EQ(expectedImage(settings), "example/emulator:2");

    core::ManagedSandboxConfig config;
    EXPECT_EQ(expectedImage(resolveSettings(config)), core::DEFAULT_SANDBOX_IMAGE);
}
