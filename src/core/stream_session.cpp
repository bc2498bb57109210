/**
 * @file stream_session.cpp
 * @brief StreamSession receive loop.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/stream_session.hpp"
#include "psgui/utils/logger.hpp"

#include <exception>

namespace psgui {
namespace core {

BufferedMessage decodeMessage(const ReceivedMessage& message) {
    BufferedMessage out;
    out.id = message.message_id;
    out.publish_time = message.publish_time;
    out.receive_time = std::chrono::system_clock::now();
    out.data = message.data;
    out.attributes = message.attributes;
    if (message.delivery_attempt > 0) {
        out.delivery_attempt = message.delivery_attempt;
    }
    out.ordering_key = message.ordering_key;
    return out;
}

// =============================================================================
// LoopState
// =============================================================================

StreamSession::LoopState::LoopState(std::string sub,
                                    std::shared_ptr<Subscriber> s,
                                    std::shared_ptr<MessageBuffer> b,
                                    bool ack,
                                    std::shared_ptr<EventSink> events)
    : subscription_id(std::move(sub))
    , subscriber(std::move(s))
    , buffer(std::move(b))
    , sink(std::move(events))
    , done(std::make_shared<CompletionSignal>())
    , auto_ack(ack) {}

// =============================================================================
// StreamSession
// =============================================================================

StreamSession::StreamSession(std::string subscription_id,
                             std::shared_ptr<Subscriber> subscriber,
                             std::shared_ptr<MessageBuffer> buffer,
                             bool auto_ack,
                             std::shared_ptr<EventSink> sink)
    : state_(std::make_shared<LoopState>(std::move(subscription_id),
                                         std::move(subscriber),
                                         buffer ? std::move(buffer)
                                                : std::make_shared<MessageBuffer>(),
                                         auto_ack,
                                         std::move(sink))) {}

StreamSession::~StreamSession() {
    state_->token.cancel();

    std::lock_guard<std::mutex> lock(threadMutex_);
    if (!thread_.joinable()) {
        return;
    }
    if (state_->done->isFired()) {
        thread_.join();
    } else {
        LOG_WARN("Stream", "Receive loop for {} still running at teardown, detaching",
                 state_->subscription_id);
        thread_.detach();
    }
}

Status StreamSession::start() {
    if (!state_->subscriber) {
        return Status(ErrorCode::NOT_CONNECTED,
                      "no receive capability for subscription " + state_->subscription_id);
    }

    std::lock_guard<std::mutex> lock(threadMutex_);
    if (started_.exchange(true)) {
        return Status::OK();
    }

    thread_ = std::thread(&StreamSession::runLoop, state_);
    LOG_INFO("Stream", "Started receive loop for {}", state_->subscription_id);
    return Status::OK();
}

Status StreamSession::stop(std::chrono::milliseconds timeout) {
    state_->token.cancel();

    if (!started_.load()) {
        return Status::OK();
    }

    if (!state_->done->waitFor(timeout)) {
        LOG_WARN("Stream", "Receive loop for {} did not stop within {}ms",
                 state_->subscription_id, timeout.count());
        return Status(ErrorCode::STOP_TIMEOUT,
                      "timeout waiting for streamer to stop: " + state_->subscription_id);
    }

    std::lock_guard<std::mutex> lock(threadMutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_DEBUG("Stream", "Receive loop for {} stopped", state_->subscription_id);
    return Status::OK();
}

void StreamSession::cancel() {
    state_->token.cancel();
}

void StreamSession::setAutoAck(bool enabled) {
    state_->auto_ack.store(enabled);
}

bool StreamSession::autoAck() const {
    return state_->auto_ack.load();
}

const std::string& StreamSession::subscriptionId() const {
    return state_->subscription_id;
}

std::shared_ptr<MessageBuffer> StreamSession::buffer() const {
    return state_->buffer;
}

bool StreamSession::isRunning() const {
    return started_.load() && !state_->done->isFired();
}

Status StreamSession::lastStatus() const {
    std::lock_guard<std::mutex> lock(state_->status_mutex);
    return state_->final_status;
}

void StreamSession::runLoop(std::shared_ptr<LoopState> state) {
    CompletionGuard guard(state->done);

    LOG_DEBUG("Stream", "Receive loop thread started for {}", state->subscription_id);

    MessageHandler handler = [&state](const ReceivedMessage& received, const AckFunction& ack) {
        BufferedMessage message = decodeMessage(received);
        state->buffer->add(message);
        state->sink.onMessageReceived(state->subscription_id, message);

        // Otherwise the service redelivers after the ack deadline
        if (state->auto_ack.load() && ack) {
            ack();
        }
    };

    Status status;
    try {
        status = state->subscriber->receive(state->subscription_id, state->token, handler);
    } catch (const std::exception& e) {
        status = Status(ErrorCode::STREAM_FAILED, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state->status_mutex);
        state->final_status = status;
    }

    if (status.ok() || status.code() == ErrorCode::CANCELLED) {
        LOG_DEBUG("Stream", "Receive loop for {} ended", state->subscription_id);
        return;
    }
    if (status.code() == ErrorCode::NOT_FOUND) {
        // Subscription deleted underneath us; expected during cleanup
        LOG_INFO("Stream", "Subscription {} no longer exists, receive loop ended",
                 state->subscription_id);
        return;
    }

    LOG_ERROR("Stream", "Error receiving messages for subscription {}: {}",
              state->subscription_id, status.toString());
    if (!state->token.isCancelled()) {
        state->sink.onStreamError(state->subscription_id, status.message());
    }
}

}  // namespace core
}  // namespace psgui
