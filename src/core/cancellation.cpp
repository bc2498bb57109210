/**
 * @file cancellation.cpp
 * @brief CancellationToken and CompletionSignal implementation.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/cancellation.hpp"

#include <vector>

namespace psgui {
namespace core {

// =============================================================================
// CancellationToken
// =============================================================================

void CancellationToken::cancel() {
    std::vector<Callback> toRun;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        runningCallbacks_ = true;
        toRun.reserve(callbacks_.size());
        for (auto& [id, callback] : callbacks_) {
            toRun.push_back(std::move(callback));
        }
        callbacks_.clear();
    }
    cv_.notify_all();

    for (auto& callback : toRun) {
        callback();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        runningCallbacks_ = false;
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

uint64_t CancellationToken::addCallback(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            uint64_t id = nextId_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::removeCallback(uint64_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    callbacks_.erase(id);
    cv_.wait(lock, [this]() { return !runningCallbacks_; });
}

// =============================================================================
// CompletionSignal
// =============================================================================

bool CompletionSignal::fire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fired_) {
            return false;
        }
        fired_ = true;
    }
    cv_.notify_all();
    return true;
}

bool CompletionSignal::isFired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

bool CompletionSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return fired_; });
}

void CompletionSignal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return fired_; });
}

}  // namespace core
}  // namespace psgui
