/**
 * @file event_sink.cpp
 * @brief CallbackEventSink and GuardedEventSink.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/event_sink.hpp"
#include "psgui/utils/logger.hpp"

#include <exception>

namespace psgui {
namespace core {

// =============================================================================
// CallbackEventSink
// =============================================================================

void CallbackEventSink::onMessageReceived(const std::string& subscription_id,
                                          const BufferedMessage& message) {
    if (on_message) on_message(subscription_id, message);
}

void CallbackEventSink::onStreamError(const std::string& subscription_id,
                                      const std::string& error) {
    if (on_stream_error) on_stream_error(subscription_id, error);
}

void CallbackEventSink::onMonitorStarted(const std::string& subscription_id) {
    if (on_monitor_started) on_monitor_started(subscription_id);
}

void CallbackEventSink::onMonitorStopped(const std::string& subscription_id) {
    if (on_monitor_stopped) on_monitor_stopped(subscription_id);
}

void CallbackEventSink::onSandboxError(const std::string& profile_id,
                                       const std::string& error) {
    if (on_sandbox_error) on_sandbox_error(profile_id, error);
}

// =============================================================================
// GuardedEventSink
// =============================================================================

GuardedEventSink::GuardedEventSink(std::shared_ptr<EventSink> target)
    : target_(target ? std::move(target) : std::make_shared<NullEventSink>()) {}

template<typename Fn>
void GuardedEventSink::deliver(const char* event, Fn&& fn) {
    try {
        fn(*target_);
    } catch (const std::exception& e) {
        LOG_WARN("EventSink", "{} handler threw: {}", event, e.what());
    }
}

void GuardedEventSink::onMessageReceived(const std::string& subscription_id,
                                         const BufferedMessage& message) {
    deliver("message-received", [&](EventSink& sink) {
        sink.onMessageReceived(subscription_id, message);
    });
}

void GuardedEventSink::onStreamError(const std::string& subscription_id,
                                     const std::string& error) {
    deliver("stream-error", [&](EventSink& sink) {
        sink.onStreamError(subscription_id, error);
    });
}

void GuardedEventSink::onMonitorStarted(const std::string& subscription_id) {
    deliver("monitor-started", [&](EventSink& sink) {
        sink.onMonitorStarted(subscription_id);
    });
}

void GuardedEventSink::onMonitorStopped(const std::string& subscription_id) {
    deliver("monitor-stopped", [&](EventSink& sink) {
        sink.onMonitorStopped(subscription_id);
    });
}

void GuardedEventSink::onSandboxError(const std::string& profile_id,
                                      const std::string& error) {
    deliver("sandbox-error", [&](EventSink& sink) {
        sink.onSandboxError(profile_id, error);
    });
}

}  // namespace core
}  // namespace psgui
