/**
 * @file event_sink.hpp
 * @brief Notifications from the core to the UI layer.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"
#include "psgui/core/message_buffer.hpp"

#include <functional>
#include <memory>
#include <string>

namespace psgui {
namespace core {

/**
 * @class EventSink
 * @brief Receives "message received" and error notifications.
 *
 * Delivery is best-effort. Implementations are called from background
 * threads and must return quickly.
 */
class PSGUI_CORE_API EventSink {
public:
    virtual ~EventSink() = default;

    virtual void onMessageReceived(const std::string& subscription_id,
                                   const BufferedMessage& message) = 0;
    virtual void onStreamError(const std::string& subscription_id,
                               const std::string& error) = 0;
    virtual void onMonitorStarted(const std::string& subscription_id) = 0;
    virtual void onMonitorStopped(const std::string& subscription_id) = 0;
    virtual void onSandboxError(const std::string& profile_id,
                                const std::string& error) = 0;
};

/**
 * @brief Sink that drops everything.
 */
class PSGUI_CORE_API NullEventSink : public EventSink {
public:
    void onMessageReceived(const std::string&, const BufferedMessage&) override {}
    void onStreamError(const std::string&, const std::string&) override {}
    void onMonitorStarted(const std::string&) override {}
    void onMonitorStopped(const std::string&) override {}
    void onSandboxError(const std::string&, const std::string&) override {}
};

/**
 * @brief Sink built from optional callbacks; unset callbacks are ignored.
 */
class PSGUI_CORE_API CallbackEventSink : public EventSink {
public:
    std::function<void(const std::string&, const BufferedMessage&)> on_message;
    std::function<void(const std::string&, const std::string&)> on_stream_error;
    std::function<void(const std::string&)> on_monitor_started;
    std::function<void(const std::string&)> on_monitor_stopped;
    std::function<void(const std::string&, const std::string&)> on_sandbox_error;

    void onMessageReceived(const std::string& subscription_id,
                           const BufferedMessage& message) override;
    void onStreamError(const std::string& subscription_id,
                       const std::string& error) override;
    void onMonitorStarted(const std::string& subscription_id) override;
    void onMonitorStopped(const std::string& subscription_id) override;
    void onSandboxError(const std::string& profile_id,
                        const std::string& error) override;
};

/**
 * @class GuardedEventSink
 * @brief Forwards to another sink, logging and discarding anything it throws.
 *
 * Every core component talks to the UI through one of these so that a
 * faulty sink never unwinds into a receive loop or probe thread.
 */
class PSGUI_CORE_API GuardedEventSink : public EventSink {
public:
    explicit GuardedEventSink(std::shared_ptr<EventSink> target);

    void onMessageReceived(const std::string& subscription_id,
                           const BufferedMessage& message) override;
    void onStreamError(const std::string& subscription_id,
                       const std::string& error) override;
    void onMonitorStarted(const std::string& subscription_id) override;
    void onMonitorStopped(const std::string& subscription_id) override;
    void onSandboxError(const std::string& profile_id,
                        const std::string& error) override;

private:
    template<typename Fn>
    void deliver(const char* event, Fn&& fn);

    std::shared_ptr<EventSink> target_;
};

}  // namespace core
}  // namespace psgui
