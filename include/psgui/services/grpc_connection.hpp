/**
 * @file grpc_connection.hpp
 * @brief gRPC implementation of the core Pub/Sub capabilities.
 *
 * GrpcConnector opens a channel per connection: plaintext to an emulator,
 * TLS with Google credentials otherwise. Receiving uses the bidirectional
 * StreamingPull call; acknowledgements travel on the same stream.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/pubsub_api.hpp"
#include "psgui/core/status.hpp"
#include "psgui/services/export.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>

namespace psgui {
namespace services {

/// "projects/<project>/subscriptions/<subscription>"
PSGUI_SERVICES_API std::string subscriptionPath(const std::string& project_id,
                                                const std::string& subscription_id);

/// "projects/<project>/topics/<topic>"
PSGUI_SERVICES_API std::string topicPath(const std::string& project_id,
                                         const std::string& topic_id);

/**
 * @brief Translate a gRPC status into a core Status.
 *
 * CANCELLED, NOT_FOUND, PERMISSION_DENIED and INVALID_ARGUMENT keep their
 * meaning; everything else becomes @p fallback.
 */
PSGUI_SERVICES_API core::Status fromGrpcStatus(const grpc::Status& status,
                                               core::ErrorCode fallback);

/**
 * @brief Status for a failed publish, with a message fit for display.
 */
PSGUI_SERVICES_API core::Status publishError(const std::string& topic_id,
                                             const grpc::Status& status);

/**
 * @brief Tuning for the channels GrpcConnector opens.
 */
struct GrpcOptions {
    int keepalive_time_ms = 30000;
    int keepalive_timeout_ms = 10000;
    std::chrono::milliseconds publish_timeout{30000};
    int stream_ack_deadline_seconds = 60;
    int64_t max_outstanding_messages = 1000;
};

/**
 * @class GrpcConnector
 * @brief Opens GrpcConnection instances.
 *
 * Channel creation does not dial; the first call on the connection does.
 */
class PSGUI_SERVICES_API GrpcConnector : public core::Connector {
public:
    explicit GrpcConnector(GrpcOptions options = GrpcOptions());

    core::Status connect(const core::ConnectOptions& options,
                         std::shared_ptr<core::Connection>& out) override;

    /**
     * @brief Channel credentials for @p options.
     * @return nullptr with @p error set when credentials cannot be loaded.
     */
    static std::shared_ptr<grpc::ChannelCredentials> makeCredentials(
        const core::ConnectOptions& options, std::string& error);

private:
    GrpcOptions options_;
};

}  // namespace services
}  // namespace psgui
