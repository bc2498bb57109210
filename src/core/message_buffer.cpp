/**
 * @file message_buffer.cpp
 * @brief Implementation of MessageBuffer.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/message_buffer.hpp"
#include "psgui/utils/logger.hpp"

#include <mutex>

namespace psgui {
namespace core {

MessageBuffer::MessageBuffer(size_t max_size)
    : max_size_(max_size == 0 ? DEFAULT_BUFFER_SIZE : max_size) {}

void MessageBuffer::add(BufferedMessage message) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    messages_.push_back(std::move(message));
    evictLocked();
}

std::vector<BufferedMessage> MessageBuffer::getAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<BufferedMessage>(messages_.begin(), messages_.end());
}

void MessageBuffer::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    messages_.clear();
}

void MessageBuffer::setMaxSize(size_t max_size) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    max_size_ = max_size == 0 ? DEFAULT_BUFFER_SIZE : max_size;
    size_t before = messages_.size();
    evictLocked();
    if (before != messages_.size()) {
        LOG_DEBUG("MessageBuffer", "Resized to {}, evicted {} messages",
                  max_size_, before - messages_.size());
    }
}

size_t MessageBuffer::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return messages_.size();
}

size_t MessageBuffer::maxSize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return max_size_;
}

void MessageBuffer::evictLocked() {
    while (messages_.size() > max_size_) {
        messages_.pop_front();
    }
}

}  // namespace core
}  // namespace psgui
