/**
 * @file profile.cpp
 * @brief ConnectionProfile validation and emulator resolution.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/profile.hpp"

#include <cctype>

namespace psgui {
namespace core {

namespace {

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

Status invalid(const std::string& message) {
    return Status(ErrorCode::INVALID_ARGUMENT, message);
}

}  // namespace

const char* authMethodName(AuthMethod method) {
    switch (method) {
        case AuthMethod::ADC:            return "ADC";
        case AuthMethod::ServiceAccount: return "ServiceAccount";
        case AuthMethod::OAuth:          return "OAuth";
    }
    return "unknown";
}

bool parseAuthMethod(const std::string& name, AuthMethod& out) {
    if (name == "ADC") { out = AuthMethod::ADC; return true; }
    if (name == "ServiceAccount") { out = AuthMethod::ServiceAccount; return true; }
    if (name == "OAuth") { out = AuthMethod::OAuth; return true; }
    return false;
}

const char* emulatorModeName(EmulatorMode mode) {
    switch (mode) {
        case EmulatorMode::Off:      return "off";
        case EmulatorMode::External: return "external";
        case EmulatorMode::Managed:  return "managed";
    }
    return "unknown";
}

bool parseEmulatorMode(const std::string& name, EmulatorMode& out) {
    if (name == "off") { out = EmulatorMode::Off; return true; }
    if (name == "external") { out = EmulatorMode::External; return true; }
    if (name == "managed") { out = EmulatorMode::Managed; return true; }
    return false;
}

ManagedSandboxConfig ManagedSandboxConfig::defaults() {
    ManagedSandboxConfig config;
    config.port = DEFAULT_SANDBOX_PORT;
    config.image = DEFAULT_SANDBOX_IMAGE;
    config.bind_address = DEFAULT_SANDBOX_BIND;
    return config;
}

Status ConnectionProfile::validate() const {
    if (isBlank(id)) {
        return invalid("profile ID cannot be empty");
    }
    if (isBlank(name)) {
        return invalid("profile name cannot be empty");
    }
    if (isBlank(project_id)) {
        return invalid("project ID cannot be empty");
    }
    if (auth_method == AuthMethod::ServiceAccount && isBlank(service_account_path)) {
        return invalid("service account path required when using ServiceAccount auth method");
    }
    if (auth_method == AuthMethod::OAuth && isBlank(oauth_credentials_path)) {
        return invalid("OAuth credentials path required when using OAuth auth method");
    }

    EmulatorMode mode = effectiveEmulatorMode();
    if (mode == EmulatorMode::External && isBlank(emulator_host)) {
        return invalid("emulator host required when using external emulator mode");
    }
    if (mode == EmulatorMode::Managed && managed_sandbox) {
        if (managed_sandbox->port < 0 || managed_sandbox->port > 65535) {
            return invalid("managed emulator port must be 0 (default) or between 1 and 65535");
        }
        const std::string& bind = managed_sandbox->bind_address;
        if (!bind.empty() && bind != "127.0.0.1" && bind != "0.0.0.0") {
            return invalid("managed emulator bind address must be '127.0.0.1' or '0.0.0.0'");
        }
    }
    return Status::OK();
}

EmulatorMode ConnectionProfile::effectiveEmulatorMode() const {
    if (emulator_mode) {
        return *emulator_mode;
    }
    return emulator_host.empty() ? EmulatorMode::Off : EmulatorMode::External;
}

std::string ConnectionProfile::effectiveEmulatorHost() const {
    switch (effectiveEmulatorMode()) {
        case EmulatorMode::Off:
            return "";
        case EmulatorMode::External:
            return emulator_host;
        case EmulatorMode::Managed: {
            ManagedSandboxConfig cfg = sandboxConfig();
            // The container is always reachable on loopback
            return std::string(DEFAULT_SANDBOX_BIND) + ":" + std::to_string(cfg.port);
        }
    }
    return "";
}

ManagedSandboxConfig ConnectionProfile::sandboxConfig() const {
    ManagedSandboxConfig cfg = managed_sandbox ? *managed_sandbox : ManagedSandboxConfig::defaults();
    if (cfg.port == 0) cfg.port = DEFAULT_SANDBOX_PORT;
    if (cfg.image.empty()) cfg.image = DEFAULT_SANDBOX_IMAGE;
    if (cfg.bind_address.empty()) cfg.bind_address = DEFAULT_SANDBOX_BIND;
    return cfg;
}

}  // namespace core
}  // namespace psgui
