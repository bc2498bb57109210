/**
 * @file profile.hpp
 * @brief Connection profiles and managed sandbox settings.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"
#include "psgui/core/status.hpp"

#include <optional>
#include <string>

namespace psgui {
namespace core {

// Sandbox defaults
constexpr int DEFAULT_SANDBOX_PORT = 8085;
constexpr const char* DEFAULT_SANDBOX_IMAGE = "google/cloud-sdk:emulators";
constexpr const char* DEFAULT_SANDBOX_BIND = "127.0.0.1";

/// Public endpoint of the managed service
constexpr const char* DEFAULT_SERVICE_ENDPOINT = "pubsub.googleapis.com:443";

enum class AuthMethod {
    ADC,             ///< Application Default Credentials
    ServiceAccount,  ///< Service account JSON key file
    OAuth            ///< Authorized-user credentials file from an OAuth flow
};

enum class EmulatorMode {
    Off,       ///< Talk to the real service
    External,  ///< Emulator run by the user at emulator_host
    Managed    ///< Emulator container started and stopped by psgui
};

PSGUI_CORE_API const char* authMethodName(AuthMethod method);
PSGUI_CORE_API bool parseAuthMethod(const std::string& name, AuthMethod& out);

PSGUI_CORE_API const char* emulatorModeName(EmulatorMode mode);
PSGUI_CORE_API bool parseEmulatorMode(const std::string& name, EmulatorMode& out);

/**
 * @brief Settings of a psgui-managed sandbox. Zero/empty fields take defaults.
 */
struct PSGUI_CORE_API ManagedSandboxConfig {
    int port = 0;                ///< Host port (0 = DEFAULT_SANDBOX_PORT)
    std::string image;           ///< Container image (empty = DEFAULT_SANDBOX_IMAGE)
    bool auto_start = true;      ///< Start on connect
    bool auto_stop = true;       ///< Stop on shutdown
    std::string bind_address;    ///< "127.0.0.1" or "0.0.0.0" (empty = loopback)
    std::string data_dir;        ///< Host directory mounted for persistence (optional)

    static ManagedSandboxConfig defaults();
};

/**
 * @brief A saved connection target.
 */
struct PSGUI_CORE_API ConnectionProfile {
    std::string id;
    std::string name;
    std::string project_id;
    AuthMethod auth_method = AuthMethod::ADC;
    std::string service_account_path;
    std::string oauth_credentials_path;

    /// Unset for profiles that predate explicit modes; see effectiveEmulatorMode()
    std::optional<EmulatorMode> emulator_mode;
    std::string emulator_host;
    std::optional<ManagedSandboxConfig> managed_sandbox;

    /**
     * @brief Check required fields and mode-specific settings.
     * @return INVALID_ARGUMENT with a user facing message on failure.
     */
    Status validate() const;

    /**
     * @brief Explicit mode, or External when only emulator_host is set, else Off.
     */
    EmulatorMode effectiveEmulatorMode() const;

    /**
     * @brief host:port the client should dial for the emulator, empty when Off.
     *
     * A managed sandbox bound to 0.0.0.0 is still dialled on loopback.
     */
    std::string effectiveEmulatorHost() const;

    /**
     * @brief Managed settings with defaults applied when none were given.
     */
    ManagedSandboxConfig sandboxConfig() const;
};

}  // namespace core
}  // namespace psgui
