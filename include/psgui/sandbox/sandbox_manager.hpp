/**
 * @file sandbox_manager.hpp
 * @brief Lifecycle of locally run Pub/Sub emulator instances, one per profile.
 *
 * The SandboxProcessManager:
 * - Checks the container runtime before recording any state
 * - Adopts a matching instance left running by a previous session
 * - Launches new instances and probes them for readiness in the background
 * - Watches launched processes and records unexpected exits as errors
 * - Stops instances gracefully, forcing removal when they linger
 *
 * State machine per profile:
 *   Stopped -> Starting -> Running -> Stopping -> Stopped
 *   Starting -> Error (readiness timeout), any -> Error (unexpected exit)
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/event_sink.hpp"
#include "psgui/core/sandbox_controller.hpp"
#include "psgui/core/status.hpp"
#include "psgui/sandbox/export.hpp"
#include "psgui/sandbox/sandbox_runtime.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace psgui {
namespace sandbox {

enum class SandboxStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error
};

PSGUI_SANDBOX_API const char* sandboxStatusName(SandboxStatus status);

/**
 * @brief Snapshot of one sandbox instance.
 */
struct SandboxInstance {
    std::string profile_id;
    std::string name;        ///< Deterministic container name
    std::string host;        ///< Bind address
    int port = 0;
    SandboxStatus status = SandboxStatus::Stopped;
    std::string error;       ///< Set when status is Error
};

/**
 * @brief Readiness and shutdown timing.
 */
struct SandboxTiming {
    int probe_attempts = 30;
    std::chrono::milliseconds probe_interval{1000};
    std::chrono::milliseconds probe_timeout{1000};
    std::chrono::milliseconds grace_period{500};       ///< Wait after a graceful stop request
    std::chrono::milliseconds force_timeout{10000};    ///< Wait after a forced stop
};

/**
 * @class SandboxProcessManager
 * @brief Thread-safe manager of sandbox instances.
 *
 * Usage:
 * @code
 * auto manager = std::make_shared<SandboxProcessManager>(std::make_shared<DockerRuntime>());
 * manager->start("dev", profile.sandboxConfig());
 * manager->waitUntilReady("dev", std::chrono::seconds(35));
 * // ...
 * manager->stopAll();
 * @endcode
 */
class PSGUI_SANDBOX_API SandboxProcessManager : public core::SandboxController {
public:
    explicit SandboxProcessManager(std::shared_ptr<SandboxRuntime> runtime,
                                   std::shared_ptr<core::EventSink> sink = nullptr,
                                   SandboxTiming timing = SandboxTiming());

    /**
     * @brief Equivalent to shutdown().
     */
    ~SandboxProcessManager() override;

    // Non-copyable
    SandboxProcessManager(const SandboxProcessManager&) = delete;
    SandboxProcessManager& operator=(const SandboxProcessManager&) = delete;

    /**
     * @brief Ensure an instance is running or starting for @p profile_id.
     *
     * Returns once the instance is adopted or launched; readiness is
     * probed in the background (see waitUntilReady()). A no-op when the
     * instance is already Running or Starting.
     */
    core::Status start(const std::string& profile_id,
                       const core::ManagedSandboxConfig& config) override;

    /**
     * @brief Stop the instance and forget it. A no-op when untracked.
     */
    core::Status stop(const std::string& profile_id) override;

    /**
     * @brief Stop every tracked instance.
     */
    void stopAll();

    /**
     * @brief Stop instances started with auto_stop; stop supervising the rest
     *        and leave them running for a later session to adopt.
     */
    void shutdown();

    /**
     * @brief Block until the instance is no longer Starting.
     * @return OK when Running, the recorded error when Error,
     *         READINESS_TIMEOUT if still Starting after @p timeout.
     */
    core::Status waitUntilReady(const std::string& profile_id,
                                std::chrono::milliseconds timeout) override;

    /**
     * @brief Copy of the instance record; Stopped for untracked profiles.
     */
    SandboxInstance getStatus(const std::string& profile_id) const;

    bool isRunning(const std::string& profile_id) const;

    std::vector<SandboxInstance> list() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace sandbox
}  // namespace psgui
