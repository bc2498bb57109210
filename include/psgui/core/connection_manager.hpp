/**
 * @file connection_manager.hpp
 * @brief Owner of the single active connection handle.
 *
 * The ConnectionManager:
 * - Builds connections through an injected Connector
 * - Ensures a managed sandbox is running before connecting to it
 * - Swaps handles atomically; readers never observe a half-installed handle
 * - Closes replaced handles in the background with a bounded wait
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"
#include "psgui/core/profile.hpp"
#include "psgui/core/pubsub_api.hpp"
#include "psgui/core/sandbox_controller.hpp"
#include "psgui/core/status.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>

namespace psgui {
namespace core {

/// Bound on how long a handle close may block the caller
constexpr std::chrono::milliseconds DEFAULT_CLOSE_TIMEOUT{2000};

/// Bound on how long connect() waits for a managed sandbox to accept connections
constexpr std::chrono::milliseconds DEFAULT_SANDBOX_READY_TIMEOUT{35000};

/**
 * @brief Immutable snapshot of the active connection.
 */
struct ConnectionHandle {
    std::shared_ptr<Connection> connection;
    std::string project_id;
    std::string endpoint;
};

/**
 * @class ConnectionManager
 * @brief Thread-safe holder of the active ConnectionHandle.
 */
class PSGUI_CORE_API ConnectionManager {
public:
    /**
     * @param connector Builds connections (required)
     * @param sandbox Sandbox lifecycle for managed profiles (may be null)
     */
    ConnectionManager(std::shared_ptr<Connector> connector,
                      std::shared_ptr<SandboxController> sandbox);

    ~ConnectionManager();

    // Non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Connect using @p profile and install the result as the active handle.
     *
     * For a managed sandbox profile the sandbox is started and awaited
     * first; a sandbox failure is returned as-is and nothing is installed.
     */
    Status connect(const ConnectionProfile& profile);

    /**
     * @brief Install @p handle, closing the previous one in the background.
     *
     * A close that exceeds the close timeout is logged and abandoned.
     */
    void setHandle(std::shared_ptr<const ConnectionHandle> handle);

    /**
     * @brief Clear the active handle and close it.
     * @return CLOSE_TIMEOUT if the close did not finish in time (the handle
     *         is cleared regardless), the close error, or OK.
     */
    Status disconnect();

    std::shared_ptr<const ConnectionHandle> getHandle() const;
    bool isConnected() const;
    std::string getProjectId() const;

    void setCloseTimeout(std::chrono::milliseconds timeout);
    void setReadyTimeout(std::chrono::milliseconds timeout);

private:
    std::shared_ptr<const ConnectionHandle> swapHandle(
        std::shared_ptr<const ConnectionHandle> next);

    /// Close outside any lock, waiting at most @p timeout
    static Status closeWithTimeout(std::shared_ptr<const ConnectionHandle> handle,
                                   std::chrono::milliseconds timeout);

    std::shared_ptr<Connector> connector_;
    std::shared_ptr<SandboxController> sandbox_;

    mutable std::shared_mutex mutex_;
    std::shared_ptr<const ConnectionHandle> handle_;
    std::chrono::milliseconds closeTimeout_;
    std::chrono::milliseconds readyTimeout_;
};

}  // namespace core
}  // namespace psgui
