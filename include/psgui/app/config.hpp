/**
 * @file config.hpp
 * @brief psgui headless monitor configuration and CLI parsing
 */

#pragma once

#include "psgui/core/profile.hpp"
#include "psgui/utils/logger.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace psgui {
namespace app {

/**
 * @brief Monitor configuration structure
 */
struct Config {
    // Connection profile
    std::string profile_id = "default";
    std::string project_id;
    std::string auth_method = "ADC";
    std::string credentials_path;               ///< Service account key or OAuth authorized-user file
    std::string emulator_host;                  ///< External emulator host:port

    // Managed sandbox
    bool sandbox = false;
    int sandbox_port = core::DEFAULT_SANDBOX_PORT;
    std::string sandbox_image = core::DEFAULT_SANDBOX_IMAGE;
    std::string sandbox_bind = core::DEFAULT_SANDBOX_BIND;
    std::string sandbox_data_dir;
    bool sandbox_keep = false;                  ///< Leave the instance running on exit

    // Monitoring
    std::vector<std::string> subscriptions;
    size_t buffer_size = 500;
    bool auto_ack = true;

    // Publishing
    std::string publish_topic;
    std::string publish_data;
    std::map<std::string, std::string> publish_attributes;

    // Timeouts
    int64_t close_timeout_ms = 2000;
    int64_t stop_timeout_ms = 5000;
    int64_t sandbox_ready_timeout_ms = 35000;

    std::string log_level = "INFO";
    bool help = false;
    std::string error;                          ///< Set when parsing failed
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "psgui - Pub/Sub subscription monitor\n\n"
              << "Usage: " << program_name << " --project <id> [OPTIONS]\n\n"
              << "Connection Options:\n"
              << "  --profile <id>           Profile identifier (default: default)\n"
              << "  --project <id>           Project ID (required)\n"
              << "  --auth <method>          ADC, ServiceAccount or OAuth (default: ADC)\n"
              << "  --credentials <path>     Key file for ServiceAccount, authorized-user file for OAuth\n"
              << "  --emulator-host <h:p>    Use an already running emulator\n"
              << "\nManaged Emulator Options:\n"
              << "  --sandbox                Run a local emulator container for this profile\n"
              << "  --sandbox-port <port>    Host port (default: 8085)\n"
              << "  --sandbox-image <image>  Image (default: google/cloud-sdk:emulators)\n"
              << "  --sandbox-bind <addr>    127.0.0.1 or 0.0.0.0 (default: 127.0.0.1)\n"
              << "  --sandbox-data-dir <dir> Host directory for persisted emulator data\n"
              << "  --sandbox-keep           Leave the emulator running on exit\n"
              << "  --sandbox-ready-timeout <ms> Readiness wait on connect (default: 35000)\n"
              << "\nMonitor Options:\n"
              << "  --subscription <id>      Subscription to monitor (repeatable)\n"
              << "  --buffer-size <n>        Messages kept per subscription (default: 500)\n"
              << "  --auto-ack <bool>        Acknowledge received messages (default: true)\n"
              << "  --close-timeout <ms>     Bound on closing a client (default: 2000)\n"
              << "  --stop-timeout <ms>      Bound on stopping a stream (default: 5000)\n"
              << "\nPublish Options:\n"
              << "  --publish-topic <id>     Publish one message to this topic after connecting\n"
              << "  --publish-data <text>    Payload of the published message\n"
              << "  --attr <key=value>       Attribute of the published message (repeatable)\n"
              << "\n  --log-level <level>      TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --help                   Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --project my-project --subscription orders-sub\n"
              << "  " << program_name << " --project local --sandbox --subscription test-sub --auto-ack false\n";
}

namespace detail {

inline bool parseBool(const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set (and error, if any) when the
 *         program should print usage instead of running
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--sandbox") == 0) {
            config.sandbox = true;
            continue;
        }
        if (std::strcmp(arg, "--sandbox-keep") == 0) {
            config.sandbox_keep = true;
            continue;
        }

        if (i + 1 >= argc) {
            return fail(std::string("option ") + arg + " requires a value");
        }

        const std::string value = argv[++i];

        try {
            if (std::strcmp(arg, "--profile") == 0) {
                config.profile_id = value;
            } else if (std::strcmp(arg, "--project") == 0) {
                config.project_id = value;
            } else if (std::strcmp(arg, "--auth") == 0) {
                core::AuthMethod method;
                if (!core::parseAuthMethod(value, method)) {
                    return fail("unknown auth method: " + value);
                }
                config.auth_method = value;
            } else if (std::strcmp(arg, "--credentials") == 0) {
                config.credentials_path = value;
            } else if (std::strcmp(arg, "--emulator-host") == 0) {
                config.emulator_host = value;
            } else if (std::strcmp(arg, "--sandbox-port") == 0) {
                config.sandbox_port = std::stoi(value);
            } else if (std::strcmp(arg, "--sandbox-image") == 0) {
                config.sandbox_image = value;
            } else if (std::strcmp(arg, "--sandbox-bind") == 0) {
                config.sandbox_bind = value;
            } else if (std::strcmp(arg, "--sandbox-data-dir") == 0) {
                config.sandbox_data_dir = value;
            } else if (std::strcmp(arg, "--sandbox-ready-timeout") == 0) {
                config.sandbox_ready_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--subscription") == 0) {
                config.subscriptions.push_back(value);
            } else if (std::strcmp(arg, "--buffer-size") == 0) {
                config.buffer_size = std::stoul(value);
            } else if (std::strcmp(arg, "--auto-ack") == 0) {
                if (!detail::parseBool(value, config.auto_ack)) {
                    return fail("invalid boolean for --auto-ack: " + value);
                }
            } else if (std::strcmp(arg, "--close-timeout") == 0) {
                config.close_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--stop-timeout") == 0) {
                config.stop_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--publish-topic") == 0) {
                config.publish_topic = value;
            } else if (std::strcmp(arg, "--publish-data") == 0) {
                config.publish_data = value;
            } else if (std::strcmp(arg, "--attr") == 0) {
                auto eq = value.find('=');
                if (eq == std::string::npos || eq == 0) {
                    return fail("attribute must be key=value: " + value);
                }
                config.publish_attributes[value.substr(0, eq)] = value.substr(eq + 1);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                return fail(std::string("unknown option ") + arg);
            }
        } catch (const std::exception&) {
            return fail(std::string("invalid number for ") + arg + ": " + value);
        }
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum (INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    return utils::Logger::parseLevel(level_str);
}

/**
 * @brief Build the connection profile described by @p config.
 */
inline core::ConnectionProfile toProfile(const Config& config) {
    core::ConnectionProfile profile;
    profile.id = config.profile_id;
    profile.name = config.profile_id;
    profile.project_id = config.project_id;

    core::AuthMethod method = core::AuthMethod::ADC;
    if (core::parseAuthMethod(config.auth_method, method)) {
        profile.auth_method = method;
    }
    if (profile.auth_method == core::AuthMethod::ServiceAccount) {
        profile.service_account_path = config.credentials_path;
    } else if (profile.auth_method == core::AuthMethod::OAuth) {
        profile.oauth_credentials_path = config.credentials_path;
    }

    if (config.sandbox) {
        profile.emulator_mode = core::EmulatorMode::Managed;
        core::ManagedSandboxConfig sandbox = core::ManagedSandboxConfig::defaults();
        sandbox.port = config.sandbox_port;
        sandbox.image = config.sandbox_image;
        sandbox.bind_address = config.sandbox_bind;
        sandbox.data_dir = config.sandbox_data_dir;
        sandbox.auto_stop = !config.sandbox_keep;
        profile.managed_sandbox = sandbox;
    } else if (!config.emulator_host.empty()) {
        profile.emulator_mode = core::EmulatorMode::External;
        profile.emulator_host = config.emulator_host;
    }
    return profile;
}

}  // namespace app
}  // namespace psgui
