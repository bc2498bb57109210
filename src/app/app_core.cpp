/**
 * @file app_core.cpp
 * @brief AppCore implementation.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/app/app_core.hpp"
#include "psgui/utils/logger.hpp"

#include <algorithm>

namespace psgui {
namespace app {

using core::ErrorCode;
using core::Status;

AppCore::AppCore(std::shared_ptr<core::Connector> connector,
                 std::shared_ptr<sandbox::SandboxProcessManager> sandbox,
                 std::shared_ptr<core::EventSink> sink,
                 AppOptions options)
    : sink_(std::make_shared<core::GuardedEventSink>(std::move(sink)))
    , sandbox_(sandbox)
    , connections_(std::move(connector), sandbox)
    , bufferSize_(options.buffer_size == 0 ? core::DEFAULT_BUFFER_SIZE : options.buffer_size)
    , autoAck_(options.auto_ack)
    , stopTimeout_(options.stop_timeout) {
    connections_.setCloseTimeout(options.close_timeout);
    connections_.setReadyTimeout(options.sandbox_ready_timeout);
}

AppCore::~AppCore() {
    shutdown();
}

// =============================================================================
// Connection
// =============================================================================

Status AppCore::connect(const core::ConnectionProfile& profile) {
    std::unique_lock<std::shared_mutex> switching(switchMutex_);

    // Monitors belong to the connection they were started on
    drainSessions();

    Status status = connections_.connect(profile);
    if (status.ok()) {
        LOG_INFO("App", "Connected with profile {} (project {})", profile.id, profile.project_id);
    }
    return status;
}

Status AppCore::disconnect() {
    std::unique_lock<std::shared_mutex> switching(switchMutex_);
    drainSessions();
    Status status = connections_.disconnect();
    if (!status.ok()) {
        LOG_WARN("App", "Disconnect: {}", status.toString());
    }
    return status;
}

bool AppCore::isConnected() const {
    return connections_.isConnected();
}

std::string AppCore::getProjectId() const {
    return connections_.getProjectId();
}

// =============================================================================
// Monitors
// =============================================================================

Status AppCore::startStream(const std::string& subscription_id) {
    bool autoAck;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        autoAck = autoAck_;
    }
    return startStream(subscription_id, autoAck);
}

Status AppCore::startStream(const std::string& subscription_id, bool auto_ack) {
    if (subscription_id.empty()) {
        return Status(ErrorCode::INVALID_ARGUMENT, "subscription ID cannot be empty");
    }

    // Blocks while a profile switch is in progress
    std::shared_lock<std::shared_mutex> switching(switchMutex_);
    auto handle = connections_.getHandle();
    if (!handle || !handle->connection) {
        return Status(ErrorCode::NOT_CONNECTED, "not connected");
    }

    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto existing = sessions_.find(subscription_id);
    if (existing != sessions_.end()) {
        if (existing->second->isRunning()) {
            LOG_DEBUG("App", "Already monitoring {}", subscription_id);
            return Status::OK();
        }
        // The loop already ended, so this only joins it
        std::shared_ptr<core::StreamSession> ended = existing->second;
        sessions_.erase(existing);
        Status joined = ended->stop(stopTimeout_);
        LOG_INFO("App", "Restarting monitor for {} (previous loop ended: {})",
                 subscription_id, ended->lastStatus().toString());
        if (joined.ok()) {
            sink_->onMonitorStopped(subscription_id);
        }
    }

    auto buffer = std::make_shared<core::MessageBuffer>(bufferSize_);
    auto session = std::make_shared<core::StreamSession>(
        subscription_id, handle->connection->subscriber(), buffer, auto_ack, sink_);

    // start() only spawns the loop; holding the lock keeps start/start races to one session
    Status started = session->start();
    if (!started.ok()) {
        LOG_ERROR("App", "Failed to start monitor for {}: {}", subscription_id, started.toString());
        return started;
    }
    sessions_[subscription_id] = session;

    LOG_INFO("App", "Monitoring {} (auto-ack {})", subscription_id, auto_ack ? "on" : "off");
    sink_->onMonitorStarted(subscription_id);
    return Status::OK();
}

Status AppCore::stopStream(const std::string& subscription_id) {
    std::shared_ptr<core::StreamSession> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(subscription_id);
        if (it == sessions_.end()) {
            return Status::OK();
        }
        session = it->second;
        sessions_.erase(it);
    }

    Status status = session->stop(stopTimeout_);
    if (!status.ok()) {
        LOG_WARN("App", "Monitor for {} did not stop cleanly: {}", subscription_id, status.toString());
        return status;
    }

    LOG_INFO("App", "Stopped monitoring {}", subscription_id);
    sink_->onMonitorStopped(subscription_id);
    return Status::OK();
}

void AppCore::stopAllStreams() {
    drainSessions();
}

void AppCore::drainSessions() {
    SessionMap drained;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        drained.swap(sessions_);
    }

    for (auto& [id, session] : drained) {
        session->cancel();
    }

    // Every loop shares one deadline
    auto deadline = std::chrono::steady_clock::now() + stopTimeout_;
    for (auto& [id, session] : drained) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        Status status = session->stop(std::max(remaining, std::chrono::milliseconds(0)));
        if (!status.ok()) {
            LOG_WARN("App", "Monitor for {} did not stop cleanly: {}", id, status.toString());
            continue;
        }
        sink_->onMonitorStopped(id);
    }
}

Status AppCore::setAutoAck(const std::string& subscription_id, bool enabled) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(subscription_id);
    if (it == sessions_.end()) {
        return Status(ErrorCode::NOT_FOUND, "not monitoring subscription: " + subscription_id);
    }
    it->second->setAutoAck(enabled);
    return Status::OK();
}

void AppCore::setAutoAckAll(bool enabled) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    autoAck_ = enabled;
    for (auto& [id, session] : sessions_) {
        session->setAutoAck(enabled);
    }
}

bool AppCore::autoAckDefault() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return autoAck_;
}

std::vector<core::BufferedMessage> AppCore::getBuffer(const std::string& subscription_id) const {
    std::shared_ptr<core::MessageBuffer> buffer;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(subscription_id);
        if (it == sessions_.end()) {
            return {};
        }
        buffer = it->second->buffer();
    }
    return buffer->getAll();
}

void AppCore::clearBuffer(const std::string& subscription_id) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(subscription_id);
    if (it != sessions_.end()) {
        it->second->buffer()->clear();
    }
}

void AppCore::setBufferSize(size_t max_size) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    bufferSize_ = max_size == 0 ? core::DEFAULT_BUFFER_SIZE : max_size;
    for (auto& [id, session] : sessions_) {
        session->buffer()->setMaxSize(bufferSize_);
    }
}

std::vector<std::string> AppCore::activeStreams() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

// =============================================================================
// Publishing
// =============================================================================

Status AppCore::publish(const std::string& topic_id,
                        const std::string& data,
                        const std::map<std::string, std::string>& attributes,
                        std::string& message_id) {
    if (topic_id.empty()) {
        return Status(ErrorCode::INVALID_ARGUMENT, "topic ID cannot be empty");
    }
    auto handle = connections_.getHandle();
    if (!handle || !handle->connection) {
        return Status(ErrorCode::NOT_CONNECTED, "not connected");
    }
    return handle->connection->publish(topic_id, data, attributes, message_id);
}

// =============================================================================
// Sandbox
// =============================================================================

Status AppCore::sandboxStart(const std::string& profile_id,
                             const core::ManagedSandboxConfig& config) {
    if (!sandbox_) {
        return Status(ErrorCode::RUNTIME_UNAVAILABLE, "managed emulator support is not available");
    }
    return sandbox_->start(profile_id, config);
}

Status AppCore::sandboxStop(const std::string& profile_id) {
    if (!sandbox_) {
        return Status::OK();
    }
    return sandbox_->stop(profile_id);
}

sandbox::SandboxInstance AppCore::sandboxStatus(const std::string& profile_id) const {
    if (!sandbox_) {
        sandbox::SandboxInstance stopped;
        stopped.profile_id = profile_id;
        return stopped;
    }
    return sandbox_->getStatus(profile_id);
}

void AppCore::sandboxStopAll() {
    if (sandbox_) {
        sandbox_->stopAll();
    }
}

void AppCore::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    LOG_INFO("App", "Shutting down");

    std::unique_lock<std::shared_mutex> switching(switchMutex_);
    drainSessions();

    Status status = connections_.disconnect();
    if (!status.ok()) {
        LOG_WARN("App", "Disconnect during shutdown: {}", status.toString());
    }

    if (sandbox_) {
        sandbox_->shutdown();
    }
}

}  // namespace app
}  // namespace psgui
