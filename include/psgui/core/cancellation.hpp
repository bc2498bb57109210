/**
 * @file cancellation.hpp
 * @brief Cancellation token and single-fire completion signal for background tasks.
 *
 * Every long-running task in the core (receive loops, readiness probes,
 * handle closes) is driven by a CancellationToken and reports its end
 * through a CompletionSignal that fires exactly once, whatever the exit path.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace psgui {
namespace core {

/**
 * @class CancellationToken
 * @brief Thread-safe, one-way cancellation flag with wake-up and callbacks.
 *
 * Shared between the owner (who cancels) and the task (who observes)
 * through std::shared_ptr.
 */
class PSGUI_CORE_API CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;

    // Non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Fire the token. Idempotent; callbacks run once on the calling thread.
     */
    void cancel();

    bool isCancelled() const;

    /**
     * @brief Sleep for up to @p timeout, waking early on cancellation.
     * @return true if the token was cancelled.
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    /**
     * @brief Register a callback run on cancel().
     *
     * If the token is already cancelled the callback runs immediately
     * and 0 is returned.
     */
    uint64_t addCallback(Callback callback);

    /**
     * @brief Unregister a callback; waits for a concurrently running cancel()
     * to finish invoking callbacks. Must not be called from inside a callback.
     */
    void removeCallback(uint64_t id);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    bool runningCallbacks_ = false;
    uint64_t nextId_ = 1;
    std::unordered_map<uint64_t, Callback> callbacks_;
};

/**
 * @class ScopedCancelCallback
 * @brief RAII registration of a cancellation callback.
 */
class PSGUI_CORE_API ScopedCancelCallback {
public:
    ScopedCancelCallback(CancellationToken& token, CancellationToken::Callback callback)
        : token_(token), id_(token.addCallback(std::move(callback))) {}

    ~ScopedCancelCallback() {
        if (id_ != 0) {
            token_.removeCallback(id_);
        }
    }

    ScopedCancelCallback(const ScopedCancelCallback&) = delete;
    ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
    CancellationToken& token_;
    uint64_t id_;
};

/**
 * @class CompletionSignal
 * @brief "Work finished" latch: fires once, can be awaited with a bound.
 */
class PSGUI_CORE_API CompletionSignal {
public:
    CompletionSignal() = default;

    CompletionSignal(const CompletionSignal&) = delete;
    CompletionSignal& operator=(const CompletionSignal&) = delete;

    /**
     * @brief Fire the signal.
     * @return false if it had already fired.
     */
    bool fire();

    bool isFired() const;

    /**
     * @brief Wait until fired or @p timeout elapses.
     * @return true if fired.
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    void wait() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool fired_ = false;
};

/**
 * @class CompletionGuard
 * @brief Fires a CompletionSignal when it goes out of scope.
 */
class CompletionGuard {
public:
    explicit CompletionGuard(std::shared_ptr<CompletionSignal> signal)
        : signal_(std::move(signal)) {}

    ~CompletionGuard() {
        if (signal_) {
            signal_->fire();
        }
    }

    CompletionGuard(const CompletionGuard&) = delete;
    CompletionGuard& operator=(const CompletionGuard&) = delete;

private:
    std::shared_ptr<CompletionSignal> signal_;
};

}  // namespace core
}  // namespace psgui
