/**
 * @file app_core.hpp
 * @brief Facade exposed to the UI layer.
 *
 * AppCore ties the ConnectionManager, one StreamSession per monitored
 * subscription and the SandboxProcessManager together. It owns session
 * bookkeeping: monitors are keyed by subscription id, at most one per id,
 * and every monitor is dropped (buffer included) whenever the active
 * connection changes.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/app/export.hpp"
#include "psgui/core/connection_manager.hpp"
#include "psgui/core/event_sink.hpp"
#include "psgui/core/message_buffer.hpp"
#include "psgui/core/profile.hpp"
#include "psgui/core/pubsub_api.hpp"
#include "psgui/core/status.hpp"
#include "psgui/core/stream_session.hpp"
#include "psgui/sandbox/sandbox_manager.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace psgui {
namespace app {

/**
 * @brief Defaults applied to monitors and connections.
 */
struct AppOptions {
    size_t buffer_size = core::DEFAULT_BUFFER_SIZE;
    bool auto_ack = true;
    std::chrono::milliseconds stop_timeout = core::DEFAULT_STOP_TIMEOUT;
    std::chrono::milliseconds close_timeout = core::DEFAULT_CLOSE_TIMEOUT;
    std::chrono::milliseconds sandbox_ready_timeout = core::DEFAULT_SANDBOX_READY_TIMEOUT;
};

/**
 * @class AppCore
 * @brief Thread-safe application facade.
 *
 * Usage:
 * @code
 * auto sandbox = std::make_shared<sandbox::SandboxProcessManager>(
 *     std::make_shared<sandbox::DockerRuntime>(), sink);
 * AppCore app(std::make_shared<services::GrpcConnector>(), sandbox, sink);
 *
 * app.connect(profile);
 * app.startStream("orders-sub");
 * auto messages = app.getBuffer("orders-sub");
 * app.shutdown();
 * @endcode
 */
class PSGUI_APP_API AppCore {
public:
    /**
     * @param connector Builds connections (required)
     * @param sandbox Managed emulator lifecycle (may be null)
     * @param sink Receives message and lifecycle events (may be null).
     *        Its handlers must not call back into AppCore lifecycle operations.
     */
    AppCore(std::shared_ptr<core::Connector> connector,
            std::shared_ptr<sandbox::SandboxProcessManager> sandbox,
            std::shared_ptr<core::EventSink> sink,
            AppOptions options = AppOptions());

    /**
     * @brief Equivalent to shutdown().
     */
    ~AppCore();

    AppCore(const AppCore&) = delete;
    AppCore& operator=(const AppCore&) = delete;

    // =========================================================================
    // Connection
    // =========================================================================

    /**
     * @brief Switch to @p profile. Every active monitor is stopped first.
     *
     * Monitors requested while the switch is in progress wait for it and
     * attach to whichever connection is installed afterwards.
     */
    core::Status connect(const core::ConnectionProfile& profile);

    /**
     * @brief Stop every monitor and close the active connection.
     * @return CLOSE_TIMEOUT if the close did not finish in time; the
     *         connection is dropped regardless.
     */
    core::Status disconnect();

    bool isConnected() const;
    std::string getProjectId() const;

    // =========================================================================
    // Monitors
    // =========================================================================

    /**
     * @brief Start monitoring @p subscription_id.
     *
     * A no-op while the subscription's receive loop is live. A monitor
     * whose loop has already ended is replaced by a fresh one.
     */
    core::Status startStream(const std::string& subscription_id, bool auto_ack);

    /// Same as above, with the current auto-ack default
    core::Status startStream(const std::string& subscription_id);

    /**
     * @brief Stop monitoring @p subscription_id and drop its buffer.
     *
     * Succeeds when the subscription is not monitored. Returns STOP_TIMEOUT
     * if the receive loop did not wind down in time; the monitor is
     * forgotten either way.
     */
    core::Status stopStream(const std::string& subscription_id);

    void stopAllStreams();

    /**
     * @brief Change auto-ack for one monitor; affects later deliveries only.
     * @return NOT_FOUND when the subscription is not monitored.
     */
    core::Status setAutoAck(const std::string& subscription_id, bool enabled);

    /**
     * @brief Change the auto-ack default and apply it to every monitor.
     */
    void setAutoAckAll(bool enabled);
    bool autoAckDefault() const;

    /**
     * @brief Snapshot of the buffered messages; empty when not monitored.
     */
    std::vector<core::BufferedMessage> getBuffer(const std::string& subscription_id) const;

    /// A no-op when not monitored
    void clearBuffer(const std::string& subscription_id);

    /**
     * @brief Change the buffer bound for new monitors and resize live buffers.
     */
    void setBufferSize(size_t max_size);

    std::vector<std::string> activeStreams() const;

    // =========================================================================
    // Publishing
    // =========================================================================

    core::Status publish(const std::string& topic_id,
                         const std::string& data,
                         const std::map<std::string, std::string>& attributes,
                         std::string& message_id);

    // =========================================================================
    // Sandbox
    // =========================================================================

    core::Status sandboxStart(const std::string& profile_id,
                              const core::ManagedSandboxConfig& config);
    core::Status sandboxStop(const std::string& profile_id);
    sandbox::SandboxInstance sandboxStatus(const std::string& profile_id) const;
    void sandboxStopAll();

    /**
     * @brief Stop monitors, disconnect and stop auto-stop sandboxes. Idempotent.
     */
    void shutdown();

private:
    using SessionMap = std::map<std::string, std::shared_ptr<core::StreamSession>>;

    /// Remove every session from the map and stop them outside the lock,
    /// all within one stop timeout
    void drainSessions();

    std::shared_ptr<core::EventSink> sink_;
    std::shared_ptr<sandbox::SandboxProcessManager> sandbox_;
    core::ConnectionManager connections_;

    // Held exclusively across connect/disconnect, shared while a monitor registers
    std::shared_mutex switchMutex_;

    mutable std::mutex sessionsMutex_;
    SessionMap sessions_;
    size_t bufferSize_;
    bool autoAck_;
    std::chrono::milliseconds stopTimeout_;

    std::atomic<bool> shutdown_{false};
};

}  // namespace app
}  // namespace psgui
