/**
 * @file pubsub_api.hpp
 * @brief Abstract Pub/Sub client capabilities used by the core.
 *
 * The core never talks to the transport directly. A Connector produces a
 * Connection; a Connection exposes the receive capability (Subscriber),
 * a publish call, and close(). The gRPC implementation lives in
 * psgui/services/grpc_connection.hpp; tests substitute GoogleMock fakes.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/cancellation.hpp"
#include "psgui/core/export.hpp"
#include "psgui/core/profile.hpp"
#include "psgui/core/status.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace psgui {
namespace core {

/**
 * @brief A message as delivered by the transport, before decoding.
 */
struct ReceivedMessage {
    std::string ack_id;
    std::string message_id;
    std::chrono::system_clock::time_point publish_time;
    std::string data;
    std::map<std::string, std::string> attributes;
    int32_t delivery_attempt = 0;  ///< 0 when no dead-letter policy applies
    std::string ordering_key;
};

/// Acknowledges the message it was handed out with
using AckFunction = std::function<void()>;

/// Called once per delivered message on the receive thread
using MessageHandler = std::function<void(const ReceivedMessage& message,
                                          const AckFunction& ack)>;

/**
 * @class Subscriber
 * @brief Streaming receive capability.
 */
class PSGUI_CORE_API Subscriber {
public:
    virtual ~Subscriber() = default;

    /**
     * @brief Receive messages until @p token is cancelled or the stream fails.
     *
     * Blocks the calling thread. Must return promptly once the token fires.
     *
     * @return CANCELLED after cancellation, NOT_FOUND when the subscription
     *         does not exist, any other code for unexpected failures.
     */
    virtual Status receive(const std::string& subscription_id,
                           CancellationToken& token,
                           const MessageHandler& handler) = 0;
};

/**
 * @class Connection
 * @brief An open client for one project.
 */
class PSGUI_CORE_API Connection {
public:
    virtual ~Connection() = default;

    /**
     * @brief Receive capability; nullptr when the connection cannot receive.
     */
    virtual std::shared_ptr<Subscriber> subscriber() = 0;

    /**
     * @brief Publish one message to @p topic_id.
     * @param message_id Set to the server-assigned id on success
     */
    virtual Status publish(const std::string& topic_id,
                           const std::string& data,
                           const std::map<std::string, std::string>& attributes,
                           std::string& message_id) = 0;

    /**
     * @brief Release transport resources. May block on a wedged transport.
     */
    virtual Status close() = 0;
};

/**
 * @brief What a Connector needs to open a Connection.
 */
struct ConnectOptions {
    std::string project_id;
    std::string endpoint;              ///< host:port to dial
    bool use_emulator = false;         ///< Plaintext, no credentials
    AuthMethod auth_method = AuthMethod::ADC;
    std::string credentials_path;      ///< Key or authorized-user file, per auth_method
};

/**
 * @class Connector
 * @brief Factory for connections.
 */
class PSGUI_CORE_API Connector {
public:
    virtual ~Connector() = default;

    virtual Status connect(const ConnectOptions& options,
                           std::shared_ptr<Connection>& out) = 0;
};

}  // namespace core
}  // namespace psgui
