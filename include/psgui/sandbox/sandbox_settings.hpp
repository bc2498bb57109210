/**
 * @file sandbox_settings.hpp
 * @brief Effective sandbox settings and the container command line.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/profile.hpp"
#include "psgui/sandbox/export.hpp"

#include <string>
#include <vector>

namespace psgui {
namespace sandbox {

/// Port the emulator listens on inside the container
constexpr int SANDBOX_CONTAINER_PORT = 8085;

/// Prefix of every container name psgui creates
constexpr const char* SANDBOX_NAME_PREFIX = "pubsub-gui-emulator-";

/**
 * @brief ManagedSandboxConfig with every default applied.
 */
struct PSGUI_SANDBOX_API SandboxSettings {
    int port = core::DEFAULT_SANDBOX_PORT;
    std::string image = core::DEFAULT_SANDBOX_IMAGE;
    std::string bind_address = core::DEFAULT_SANDBOX_BIND;
    std::string data_dir;

    bool operator==(const SandboxSettings& other) const {
        return port == other.port && image == other.image &&
               bind_address == other.bind_address && data_dir == other.data_dir;
    }
};

/**
 * @brief Apply defaults over @p config (port 0, empty image/bind are defaulted).
 */
PSGUI_SANDBOX_API SandboxSettings resolveSettings(const core::ManagedSandboxConfig& config);

/**
 * @brief Deterministic container name for a profile.
 */
PSGUI_SANDBOX_API std::string instanceName(const std::string& profile_id);

/**
 * @brief Arguments for `docker` that launch the emulator in the foreground.
 *
 * The host port is published on loopback unless the bind address is 0.0.0.0.
 */
PSGUI_SANDBOX_API std::vector<std::string> buildLaunchArgs(const std::string& name,
                                                           const SandboxSettings& settings);

/**
 * @brief Find the host binding of the container port in `docker inspect` output.
 *
 * @param mapping Space separated "8085/tcp=<hostIp>:<hostPort>" entries
 * @param expected_port Host port that must be published
 * @param bind_addr Set to the host IP of the matching entry ("0.0.0.0" when absent)
 * @return true if an entry for @p expected_port was found
 */
PSGUI_SANDBOX_API bool parsePortMapping(const std::string& mapping, int expected_port,
                                        std::string& bind_addr);

/**
 * @brief Image reference a running instance must carry to be reused.
 */
PSGUI_SANDBOX_API std::string expectedImage(const SandboxSettings& settings);

/**
 * @brief @p addr, or @p default_addr when @p addr is empty.
 */
PSGUI_SANDBOX_API std::string normalizeBindAddr(const std::string& addr,
                                                const std::string& default_addr);

}  // namespace sandbox
}  // namespace psgui
