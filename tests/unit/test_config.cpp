/**
 * @file test_config.cpp
 * @brief Command-line parsing for the headless monitor and its mapping
 *        onto a connection profile
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <psgui/app/config.hpp>

#include <string>
#include <vector>

using namespace psgui;
using namespace psgui::app;
using ::testing::ElementsAre;

class ConfigTest : public ::testing::Test {
protected:
    // argv[0] is "psgui"; the strings live in args_ for the parse call
    Config parse(std::vector<std::string> args) {
        args_ = std::move(args);
        args_.insert(args_.begin(), "psgui");

        std::vector<char*> argv;
        for (std::string& a : args_) {
            argv.push_back(&a[0]);
        }
        argv.push_back(nullptr);
        return parseArgs(static_cast<int>(args_.size()), argv.data());
    }

private:
    std::vector<std::string> args_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.profile_id, "default");
    EXPECT_EQ(config.auth_method, "ADC");
    EXPECT_FALSE(config.sandbox);
    EXPECT_EQ(config.sandbox_port, 8085);
    EXPECT_EQ(config.sandbox_image, "google/cloud-sdk:emulators");
    EXPECT_EQ(config.sandbox_bind, "127.0.0.1");
    EXPECT_EQ(config.buffer_size, 500u);
    EXPECT_TRUE(config.auto_ack);
    EXPECT_EQ(config.close_timeout_ms, 2000);
    EXPECT_EQ(config.stop_timeout_ms, 5000);
    EXPECT_EQ(config.sandbox_ready_timeout_ms, 35000);
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.error.empty());
}

// =============================================================================
// CLI Parsing
// =============================================================================

TEST_F(ConfigTest, NoArguments) {
    Config config = parse({});
    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.subscriptions.empty());
}

TEST_F(ConfigTest, HelpFlag) {
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"--help"}).error.empty());
}

TEST_F(ConfigTest, ConnectionOptions) {
    Config config = parse({"--profile", "dev", "--project", "my-proj",
                           "--auth", "ServiceAccount", "--credentials", "/keys/sa.json",
                           "--emulator-host", "localhost:8681"});
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.profile_id, "dev");
    EXPECT_EQ(config.project_id, "my-proj");
    EXPECT_EQ(config.auth_method, "ServiceAccount");
    EXPECT_EQ(config.credentials_path, "/keys/sa.json");
    EXPECT_EQ(config.emulator_host, "localhost:8681");
}

TEST_F(ConfigTest, SandboxOptions) {
    Config config = parse({"--sandbox", "--sandbox-port", "9090", "--sandbox-bind", "0.0.0.0",
                           "--sandbox-data-dir", "/tmp/ps", "--sandbox-keep",
                           "--sandbox-ready-timeout", "1000"});
    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.sandbox);
    EXPECT_TRUE(config.sandbox_keep);
    EXPECT_EQ(config.sandbox_port, 9090);
    EXPECT_EQ(config.sandbox_bind, "0.0.0.0");
    EXPECT_EQ(config.sandbox_data_dir, "/tmp/ps");
    EXPECT_EQ(config.sandbox_ready_timeout_ms, 1000);
}

TEST_F(ConfigTest, RepeatableOptions) {
    Config config = parse({"--subscription", "a", "--subscription", "b",
                           "--attr", "k=v", "--attr", "empty="});
    EXPECT_THAT(config.subscriptions, ElementsAre("a", "b"));
    ASSERT_EQ(config.publish_attributes.size(), 2u);
    EXPECT_EQ(config.publish_attributes.at("k"), "v");
    EXPECT_EQ(config.publish_attributes.at("empty"), "");
}

TEST_F(ConfigTest, MonitorOptions) {
    Config config = parse({"--buffer-size", "50", "--auto-ack", "false",
                           "--close-timeout", "100", "--stop-timeout", "200",
                           "--log-level", "DEBUG"});
    EXPECT_EQ(config.buffer_size, 50u);
    EXPECT_FALSE(config.auto_ack);
    EXPECT_EQ(config.close_timeout_ms, 100);
    EXPECT_EQ(config.stop_timeout_ms, 200);
    EXPECT_EQ(config.log_level, "DEBUG");
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, MissingValue) {
    Config config = parse({"--project"});
    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("requires a value"));
}

TEST_F(ConfigTest, UnknownOption) {
    Config config = parse({"--frobnicate", "1"});
    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("unknown option"));
}

TEST_F(ConfigTest, InvalidNumber) {
    Config config = parse({"--sandbox-port", "eighty"});
    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("invalid number"));
}

TEST_F(ConfigTest, InvalidBoolAndAuth) {
    EXPECT_FALSE(parse({"--auto-ack", "maybe"}).error.empty());
    EXPECT_FALSE(parse({"--auth", "kerberos"}).error.empty());
    EXPECT_FALSE(parse({"--attr", "novalue"}).error.empty());
    EXPECT_FALSE(parse({"--attr", "=v"}).error.empty());
}

// =============================================================================
// Log Level Parsing
// =============================================================================

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("TRACE"), utils::LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("WARN"), utils::LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("OFF"), utils::LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("loud"), utils::LogLevel::INFO);
}

// =============================================================================
// Profile Construction
// =============================================================================

TEST_F(ConfigTest, ProfileForProductionService) {
    core::ConnectionProfile profile = toProfile(parse({"--project", "p"}));
    EXPECT_TRUE(profile.validate().ok());
    EXPECT_EQ(profile.effectiveEmulatorMode(), core::EmulatorMode::Off);
    EXPECT_EQ(profile.auth_method, core::AuthMethod::ADC);
}

TEST_F(ConfigTest, ProfileForExternalEmulator) {
    core::ConnectionProfile profile = toProfile(parse({"--project", "p", "--emulator-host", "h:1"}));
    EXPECT_EQ(profile.effectiveEmulatorMode(), core::EmulatorMode::External);
    EXPECT_EQ(profile.effectiveEmulatorHost(), "h:1");
}

TEST_F(ConfigTest, ProfileForManagedSandbox) {
    core::ConnectionProfile profile =
        toProfile(parse({"--project", "p", "--sandbox", "--sandbox-port", "9000", "--sandbox-keep"}));
    EXPECT_TRUE(profile.validate().ok());
    EXPECT_EQ(profile.effectiveEmulatorMode(), core::EmulatorMode::Managed);
    EXPECT_EQ(profile.effectiveEmulatorHost(), "127.0.0.1:9000");
    ASSERT_TRUE(profile.managed_sandbox.has_value());
    EXPECT_FALSE(profile.managed_sandbox->auto_stop);
    EXPECT_TRUE(profile.managed_sandbox->auto_start);
}

TEST_F(ConfigTest, ProfileCarriesCredentialsForAuthMethod) {
    core::ConnectionProfile sa =
        toProfile(parse({"--project", "p", "--auth", "ServiceAccount", "--credentials", "k.json"}));
    EXPECT_EQ(sa.service_account_path, "k.json");
    EXPECT_TRUE(sa.validate().ok());

    core::ConnectionProfile oauth = toProfile(parse({"--project", "p", "--auth", "OAuth"}));
    EXPECT_FALSE(oauth.validate().ok());
}
