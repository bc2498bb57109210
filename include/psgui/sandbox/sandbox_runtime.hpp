/**
 * @file sandbox_runtime.hpp
 * @brief Process-control capability the sandbox manager drives.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/status.hpp"
#include "psgui/sandbox/export.hpp"
#include "psgui/sandbox/sandbox_settings.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace psgui {
namespace sandbox {

/**
 * @class RunningProcess
 * @brief A launched foreground sandbox process.
 */
class PSGUI_SANDBOX_API RunningProcess {
public:
    virtual ~RunningProcess() = default;

    /**
     * @brief Block until the process exits.
     * @return OK on a clean exit, PROCESS_EXITED with a description otherwise.
     */
    virtual core::Status wait() = 0;

    /**
     * @brief Ask the process to shut down. Safe to call after it exited.
     */
    virtual void terminate() = 0;

    /**
     * @brief Kill the process outright. Safe to call after it exited.
     */
    virtual void kill() = 0;
};

/**
 * @class SandboxRuntime
 * @brief Container runtime operations used by SandboxProcessManager.
 */
class PSGUI_SANDBOX_API SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;

    /**
     * @brief Runtime CLI present and daemon reachable.
     * @return RUNTIME_UNAVAILABLE with a user facing message otherwise.
     */
    virtual core::Status checkAvailable() = 0;

    /**
     * @param running Set to false when no instance with @p name exists
     */
    virtual core::Status isInstanceRunning(const std::string& name, bool& running) = 0;

    /**
     * @brief Compare a running instance's image, host port and bind address.
     */
    virtual core::Status instanceMatches(const std::string& name,
                                         const SandboxSettings& settings,
                                         bool& matches) = 0;

    virtual core::Status launch(const std::string& name,
                                const SandboxSettings& settings,
                                std::unique_ptr<RunningProcess>& out) = 0;

    /**
     * @brief Stop the instance and remove it.
     */
    virtual core::Status stopInstance(const std::string& name) = 0;

    /**
     * @brief Remove a (stale) instance; succeeds when none exists.
     */
    virtual core::Status removeInstance(const std::string& name) = 0;

    virtual bool isPortFree(const std::string& host, int port) = 0;

    virtual bool probe(const std::string& host, int port,
                       std::chrono::milliseconds timeout) = 0;
};

}  // namespace sandbox
}  // namespace psgui
