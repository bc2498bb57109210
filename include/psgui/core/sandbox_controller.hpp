/**
 * @file sandbox_controller.hpp
 * @brief What ConnectionManager needs from the sandbox lifecycle.
 *
 * Implemented by sandbox::SandboxProcessManager.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"
#include "psgui/core/profile.hpp"
#include "psgui/core/status.hpp"

#include <chrono>
#include <string>

namespace psgui {
namespace core {

class PSGUI_CORE_API SandboxController {
public:
    virtual ~SandboxController() = default;

    /**
     * @brief Ensure the sandbox for @p profile_id is running or starting.
     */
    virtual Status start(const std::string& profile_id,
                         const ManagedSandboxConfig& config) = 0;

    /**
     * @brief Block until the sandbox leaves the starting state.
     * @return OK once it accepts connections.
     */
    virtual Status waitUntilReady(const std::string& profile_id,
                                  std::chrono::milliseconds timeout) = 0;

    virtual Status stop(const std::string& profile_id) = 0;
};

}  // namespace core
}  // namespace psgui
