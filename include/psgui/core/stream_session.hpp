/**
 * @file stream_session.hpp
 * @brief One cancellable streaming receive loop bound to a subscription.
 *
 * A StreamSession owns a background thread that pulls messages from a
 * Subscriber, decodes them into BufferedMessage values, appends them to
 * a MessageBuffer and notifies the EventSink. The loop ends when the
 * session's CancellationToken fires or the stream fails; its
 * CompletionSignal fires exactly once on every exit path.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/cancellation.hpp"
#include "psgui/core/event_sink.hpp"
#include "psgui/core/export.hpp"
#include "psgui/core/message_buffer.hpp"
#include "psgui/core/pubsub_api.hpp"
#include "psgui/core/status.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace psgui {
namespace core {

/// Bound on how long stop() waits for the loop to finish
constexpr std::chrono::milliseconds DEFAULT_STOP_TIMEOUT{5000};

/**
 * @brief Convert a transport message into its buffered form.
 *
 * The payload is copied verbatim; delivery_attempt is only set when the
 * transport reported a positive count.
 */
PSGUI_CORE_API BufferedMessage decodeMessage(const ReceivedMessage& message);

/**
 * @class StreamSession
 * @brief Background receive loop for a single subscription.
 *
 * Usage:
 * @code
 * auto buffer = std::make_shared<MessageBuffer>(500);
 * StreamSession session("orders-sub", connection->subscriber(), buffer, true, sink);
 * session.start();
 * // ...
 * Status s = session.stop();   // STOP_TIMEOUT if the loop is wedged
 * @endcode
 */
class PSGUI_CORE_API StreamSession {
public:
    StreamSession(std::string subscription_id,
                  std::shared_ptr<Subscriber> subscriber,
                  std::shared_ptr<MessageBuffer> buffer,
                  bool auto_ack,
                  std::shared_ptr<EventSink> sink);

    /**
     * @brief Cancels the loop. A loop that has not finished yet is detached
     *        and cleans up after itself.
     */
    ~StreamSession();

    // Non-copyable
    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /**
     * @brief Spawn the receive loop and return without waiting for messages.
     * @return NOT_CONNECTED if there is no receive capability. Starting an
     *         already started session is a no-op.
     */
    Status start();

    /**
     * @brief Cancel the loop and wait up to @p timeout for it to finish.
     * @return STOP_TIMEOUT if the loop is still running; cancellation is
     *         not retried and the loop may finish later.
     */
    Status stop(std::chrono::milliseconds timeout = DEFAULT_STOP_TIMEOUT);

    /// Request cancellation without waiting; stop() still reports the outcome
    void cancel();

    /**
     * @brief Change auto-ack for messages received from now on.
     */
    void setAutoAck(bool enabled);
    bool autoAck() const;

    const std::string& subscriptionId() const;
    std::shared_ptr<MessageBuffer> buffer() const;

    /**
     * @brief True between start() and the loop finishing.
     */
    bool isRunning() const;

    /**
     * @brief Status the receive call ended with (OK while still running).
     */
    Status lastStatus() const;

private:
    /// State shared with the loop thread; outlives the session if the
    /// thread has to be detached.
    struct LoopState {
        std::string subscription_id;
        std::shared_ptr<Subscriber> subscriber;
        std::shared_ptr<MessageBuffer> buffer;
        GuardedEventSink sink;
        CancellationToken token;
        std::shared_ptr<CompletionSignal> done;
        std::atomic<bool> auto_ack;

        mutable std::mutex status_mutex;
        Status final_status;

        LoopState(std::string sub, std::shared_ptr<Subscriber> s,
                  std::shared_ptr<MessageBuffer> b, bool ack,
                  std::shared_ptr<EventSink> events);
    };

    static void runLoop(std::shared_ptr<LoopState> state);

    std::shared_ptr<LoopState> state_;
    std::atomic<bool> started_{false};
    mutable std::mutex threadMutex_;
    std::thread thread_;
};

}  // namespace core
}  // namespace psgui
