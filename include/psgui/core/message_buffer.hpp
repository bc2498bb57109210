/**
 * @file message_buffer.hpp
 * @brief Bounded FIFO of received messages for one monitored subscription.
 *
 * The buffer keeps the most recent messages for display:
 * - Oldest messages are evicted first once the bound is reached
 * - The bound can be changed at runtime; shrinking evicts immediately
 * - Readers get a snapshot copy, never a live view
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace psgui {
namespace core {

/// Default number of messages retained per subscription
constexpr size_t DEFAULT_BUFFER_SIZE = 500;

/**
 * @brief A received message as shown to the user.
 */
struct BufferedMessage {
    std::string id;                                    ///< Service-assigned message id
    std::chrono::system_clock::time_point publish_time;
    std::chrono::system_clock::time_point receive_time;
    std::string data;                                  ///< Payload bytes, verbatim
    std::map<std::string, std::string> attributes;
    std::optional<int32_t> delivery_attempt;           ///< Set only when the service reports one
    std::string ordering_key;                          ///< Empty when the message has none
};

/**
 * @class MessageBuffer
 * @brief Thread-safe bounded deque with FIFO eviction.
 */
class PSGUI_CORE_API MessageBuffer {
public:
    /**
     * @param max_size Maximum retained messages (0 = DEFAULT_BUFFER_SIZE)
     */
    explicit MessageBuffer(size_t max_size = DEFAULT_BUFFER_SIZE);

    ~MessageBuffer() = default;

    // Non-copyable
    MessageBuffer(const MessageBuffer&) = delete;
    MessageBuffer& operator=(const MessageBuffer&) = delete;

    /**
     * @brief Append a message, evicting the oldest ones beyond the bound.
     */
    void add(BufferedMessage message);

    /**
     * @brief Snapshot of all retained messages, oldest first.
     */
    std::vector<BufferedMessage> getAll() const;

    void clear();

    /**
     * @brief Change the bound. Shrinking evicts the oldest excess messages now.
     *        A size of 0 resets the bound to DEFAULT_BUFFER_SIZE.
     */
    void setMaxSize(size_t max_size);

    size_t size() const;
    size_t maxSize() const;

private:
    void evictLocked();

    mutable std::shared_mutex mutex_;
    std::deque<BufferedMessage> messages_;
    size_t max_size_;
};

}  // namespace core
}  // namespace psgui
