/**
 * @file sandbox_settings.cpp
 * @brief Sandbox settings resolution and docker argument building.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/sandbox/sandbox_settings.hpp"

#include <sstream>

namespace psgui {
namespace sandbox {

SandboxSettings resolveSettings(const core::ManagedSandboxConfig& config) {
    SandboxSettings settings;
    if (config.port != 0) {
        settings.port = config.port;
    }
    if (!config.image.empty()) {
        settings.image = config.image;
    }
    if (!config.bind_address.empty()) {
        settings.bind_address = config.bind_address;
    }
    settings.data_dir = config.data_dir;
    return settings;
}

std::string instanceName(const std::string& profile_id) {
    return std::string(SANDBOX_NAME_PREFIX) + profile_id;
}

std::vector<std::string> buildLaunchArgs(const std::string& name,
                                         const SandboxSettings& settings) {
    std::vector<std::string> args = {"run", "--rm", "--name", name};

    const std::string containerPort = std::to_string(SANDBOX_CONTAINER_PORT);
    const std::string hostPort = std::to_string(settings.port);

    // LAN exposure only when explicitly requested
    args.push_back("-p");
    if (settings.bind_address == "0.0.0.0") {
        args.push_back(hostPort + ":" + containerPort);
    } else {
        args.push_back("127.0.0.1:" + hostPort + ":" + containerPort);
    }

    if (!settings.data_dir.empty()) {
        args.push_back("-v");
        args.push_back(settings.data_dir + ":/data");
    }

    args.push_back(settings.image);
    for (const char* part : {"gcloud", "beta", "emulators", "pubsub", "start"}) {
        args.push_back(part);
    }
    args.push_back("--host-port=0.0.0.0:" + containerPort);

    if (!settings.data_dir.empty()) {
        args.push_back("--data-dir=/data");
    }
    return args;
}

bool parsePortMapping(const std::string& mapping, int expected_port, std::string& bind_addr) {
    const std::string prefix = std::to_string(SANDBOX_CONTAINER_PORT) + "/tcp=";
    const std::string suffix = ":" + std::to_string(expected_port);

    std::istringstream fields(mapping);
    std::string entry;
    while (fields >> entry) {
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string hostPort = entry.substr(prefix.size());
        if (hostPort.find('=') != std::string::npos) {
            continue;
        }
        if (hostPort.size() < suffix.size() ||
            hostPort.compare(hostPort.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        // Everything before the last colon is the bind address (may be IPv6)
        size_t lastColon = hostPort.rfind(':');
        if (lastColon != std::string::npos && lastColon > 0) {
            bind_addr = hostPort.substr(0, lastColon);
        } else {
            bind_addr = "0.0.0.0";
        }
        return true;
    }
    return false;
}

std::string expectedImage(const SandboxSettings& settings) {
    return settings.image.empty() ? std::string(core::DEFAULT_SANDBOX_IMAGE) : settings.image;
}

std::string normalizeBindAddr(const std::string& addr, const std::string& default_addr) {
    return addr.empty() ? default_addr : addr;
}

}  // namespace sandbox
}  // namespace psgui
