/**
 * @file connection_manager.cpp
 * @brief ConnectionManager implementation.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/connection_manager.hpp"
#include "psgui/utils/logger.hpp"

#include <exception>
#include <future>
#include <mutex>
#include <thread>

namespace psgui {
namespace core {

ConnectionManager::ConnectionManager(std::shared_ptr<Connector> connector,
                                     std::shared_ptr<SandboxController> sandbox)
    : connector_(std::move(connector))
    , sandbox_(std::move(sandbox))
    , closeTimeout_(DEFAULT_CLOSE_TIMEOUT)
    , readyTimeout_(DEFAULT_SANDBOX_READY_TIMEOUT) {}

ConnectionManager::~ConnectionManager() {
    Status status = disconnect();
    if (!status.ok()) {
        LOG_WARN("Connection", "Disconnect during teardown: {}", status.toString());
    }
}

Status ConnectionManager::connect(const ConnectionProfile& profile) {
    Status valid = profile.validate();
    if (!valid.ok()) {
        return valid;
    }
    if (!connector_) {
        return Status(ErrorCode::CONNECT_FAILED, "no connector configured");
    }

    std::chrono::milliseconds readyTimeout;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        readyTimeout = readyTimeout_;
    }

    EmulatorMode mode = profile.effectiveEmulatorMode();
    if (mode == EmulatorMode::Managed) {
        if (!sandbox_) {
            return Status(ErrorCode::CONNECT_FAILED, "managed emulator support is not available");
        }
        ManagedSandboxConfig sandboxConfig = profile.sandboxConfig();
        if (sandboxConfig.auto_start) {
            Status started = sandbox_->start(profile.id, sandboxConfig);
            if (!started.ok()) {
                LOG_ERROR("Connection", "Managed emulator for profile {} failed to start: {}",
                          profile.id, started.toString());
                return started;
            }
        }
        Status ready = sandbox_->waitUntilReady(profile.id, readyTimeout);
        if (!ready.ok()) {
            LOG_ERROR("Connection", "Managed emulator for profile {} not ready: {}",
                      profile.id, ready.toString());
            return ready;
        }
    }

    ConnectOptions options;
    options.project_id = profile.project_id;
    options.use_emulator = mode != EmulatorMode::Off;
    options.endpoint = options.use_emulator ? profile.effectiveEmulatorHost()
                                            : std::string(DEFAULT_SERVICE_ENDPOINT);
    options.auth_method = profile.auth_method;
    if (profile.auth_method == AuthMethod::ServiceAccount) {
        options.credentials_path = profile.service_account_path;
    } else if (profile.auth_method == AuthMethod::OAuth) {
        options.credentials_path = profile.oauth_credentials_path;
    }

    std::shared_ptr<Connection> connection;
    Status connected = connector_->connect(options, connection);
    if (!connected.ok()) {
        LOG_ERROR("Connection", "Failed to connect to project {} at {}: {}",
                  options.project_id, options.endpoint, connected.toString());
        return connected;
    }
    if (!connection) {
        return Status(ErrorCode::CONNECT_FAILED, "connector returned no connection");
    }

    auto handle = std::make_shared<ConnectionHandle>();
    handle->connection = std::move(connection);
    handle->project_id = options.project_id;
    handle->endpoint = options.endpoint;
    setHandle(std::move(handle));

    LOG_INFO("Connection", "Connected to project {} via {} ({})",
             options.project_id, options.endpoint, authMethodName(options.auth_method));
    return Status::OK();
}

void ConnectionManager::setHandle(std::shared_ptr<const ConnectionHandle> handle) {
    std::chrono::milliseconds timeout;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        timeout = closeTimeout_;
    }

    auto previous = swapHandle(std::move(handle));
    if (!previous) {
        return;
    }

    Status closed = closeWithTimeout(std::move(previous), timeout);
    if (closed.code() == ErrorCode::CLOSE_TIMEOUT) {
        LOG_WARN("Connection", "Timeout closing old client in setHandle (transport may be stuck)");
    } else if (!closed.ok()) {
        LOG_WARN("Connection", "Error closing old client in setHandle: {}", closed.toString());
    }
}

Status ConnectionManager::disconnect() {
    std::chrono::milliseconds timeout;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        timeout = closeTimeout_;
    }

    auto previous = swapHandle(nullptr);
    if (!previous) {
        return Status::OK();
    }

    LOG_INFO("Connection", "Disconnecting from project {}", previous->project_id);
    return closeWithTimeout(std::move(previous), timeout);
}

std::shared_ptr<const ConnectionHandle> ConnectionManager::getHandle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handle_;
}

bool ConnectionManager::isConnected() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handle_ != nullptr;
}

std::string ConnectionManager::getProjectId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handle_ ? handle_->project_id : std::string();
}

void ConnectionManager::setCloseTimeout(std::chrono::milliseconds timeout) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    closeTimeout_ = timeout;
}

void ConnectionManager::setReadyTimeout(std::chrono::milliseconds timeout) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    readyTimeout_ = timeout;
}

std::shared_ptr<const ConnectionHandle> ConnectionManager::swapHandle(
    std::shared_ptr<const ConnectionHandle> next) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::swap(handle_, next);
    if (next && handle_ && next->connection == handle_->connection) {
        // Same underlying connection re-installed; nothing to close
        return nullptr;
    }
    return next;
}

Status ConnectionManager::closeWithTimeout(std::shared_ptr<const ConnectionHandle> handle,
                                           std::chrono::milliseconds timeout) {
    if (!handle->connection) {
        return Status::OK();
    }

    auto result = std::make_shared<std::promise<Status>>();
    std::future<Status> future = result->get_future();

    // The closer owns the handle; if it wedges, it is abandoned with it
    std::thread closer([handle, result]() {
        Status status;
        try {
            status = handle->connection->close();
        } catch (const std::exception& e) {
            status = Status(ErrorCode::INTERNAL, e.what());
        }
        result->set_value(status);
    });
    closer.detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        return Status(ErrorCode::CLOSE_TIMEOUT,
                      "timeout closing client (transport connections may be stuck)");
    }
    return future.get();
}

}  // namespace core
}  // namespace psgui
