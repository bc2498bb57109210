/**
 * @file grpc_connection.cpp
 * @brief GrpcConnector, GrpcConnection and GrpcSubscriber.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/services/grpc_connection.hpp"
#include "psgui/utils/logger.hpp"
#include "psgui/utils/uuid.hpp"

#include "psgui/proto/pubsub_wire.grpc.pb.h"

#include <fstream>
#include <mutex>
#include <set>
#include <sstream>

namespace psgui {
namespace services {

namespace v1 = google::pubsub::v1;
using core::ErrorCode;
using core::Status;

std::string subscriptionPath(const std::string& project_id, const std::string& subscription_id) {
    return "projects/" + project_id + "/subscriptions/" + subscription_id;
}

std::string topicPath(const std::string& project_id, const std::string& topic_id) {
    return "projects/" + project_id + "/topics/" + topic_id;
}

Status fromGrpcStatus(const grpc::Status& status, ErrorCode fallback) {
    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            return Status::OK();
        case grpc::StatusCode::CANCELLED:
            return Status(ErrorCode::CANCELLED, status.error_message());
        case grpc::StatusCode::NOT_FOUND:
            return Status(ErrorCode::NOT_FOUND, status.error_message());
        case grpc::StatusCode::PERMISSION_DENIED:
            return Status(ErrorCode::PERMISSION_DENIED, status.error_message());
        case grpc::StatusCode::INVALID_ARGUMENT:
            return Status(ErrorCode::INVALID_ARGUMENT, status.error_message());
        default:
            return Status(fallback, status.error_message());
    }
}

Status publishError(const std::string& topic_id, const grpc::Status& status) {
    switch (status.error_code()) {
        case grpc::StatusCode::PERMISSION_DENIED:
            return Status(ErrorCode::PERMISSION_DENIED,
                          "permission denied: you don't have permission to publish to this topic");
        case grpc::StatusCode::NOT_FOUND:
            return Status(ErrorCode::NOT_FOUND,
                          "topic not found: the topic '" + topic_id + "' does not exist");
        case grpc::StatusCode::INVALID_ARGUMENT:
            return Status(ErrorCode::INVALID_ARGUMENT,
                          "invalid message: check your payload and attributes");
        default:
            return Status(ErrorCode::INTERNAL,
                          "failed to publish message: " + status.error_message());
    }
}

namespace {

std::chrono::system_clock::time_point toTimePoint(const google::protobuf::Timestamp& ts) {
    auto since_epoch = std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos());
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

bool readFile(const std::string& path, std::string& contents) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    contents = ss.str();
    return true;
}

/**
 * @brief Ack path for one StreamingPull call.
 *
 * Acks may be invoked after the stream ends (the handler can keep the
 * callback); they are dropped once the stream is closed.
 */
class AckChannel {
public:
    using Stream = grpc::ClientReaderWriter<v1::StreamingPullRequest, v1::StreamingPullResponse>;

    explicit AckChannel(Stream* stream) : stream_(stream) {}

    void ack(const std::string& ack_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) {
            LOG_DEBUG("Subscriber", "Dropping ack for closed stream");
            return;
        }
        v1::StreamingPullRequest request;
        request.add_ack_ids(ack_id);
        if (!stream_->Write(request)) {
            LOG_DEBUG("Subscriber", "Ack write failed, stream closing");
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = nullptr;
    }

private:
    std::mutex mutex_;
    Stream* stream_;
};

// =============================================================================
// GrpcSubscriber
// =============================================================================

class GrpcSubscriber : public core::Subscriber {
public:
    GrpcSubscriber(std::shared_ptr<grpc::Channel> channel,
                   std::string project_id,
                   GrpcOptions options)
        : stub_(v1::Subscriber::NewStub(channel))
        , project_id_(std::move(project_id))
        , options_(options)
        , client_id_(utils::generateUuid()) {}

    Status receive(const std::string& subscription_id,
                   core::CancellationToken& token,
                   const core::MessageHandler& handler) override;

    /// Cancel every stream in flight; later receive() calls fail fast
    void shutdown();

private:
    bool track(grpc::ClientContext* context);
    void untrack(grpc::ClientContext* context);

    std::unique_ptr<v1::Subscriber::Stub> stub_;
    std::string project_id_;
    GrpcOptions options_;
    std::string client_id_;

    std::mutex mutex_;
    bool closed_ = false;
    std::set<grpc::ClientContext*> active_;
};

bool GrpcSubscriber::track(grpc::ClientContext* context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    active_.insert(context);
    return true;
}

void GrpcSubscriber::untrack(grpc::ClientContext* context) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(context);
}

void GrpcSubscriber::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (auto* context : active_) {
        context->TryCancel();
    }
}

Status GrpcSubscriber::receive(const std::string& subscription_id,
                               core::CancellationToken& token,
                               const core::MessageHandler& handler) {
    grpc::ClientContext context;
    if (!track(&context)) {
        return Status(ErrorCode::NOT_CONNECTED, "connection closed");
    }
    core::ScopedCancelCallback onCancel(token, [&context]() { context.TryCancel(); });

    const std::string path = subscriptionPath(project_id_, subscription_id);
    LOG_DEBUG("Subscriber", "Opening streaming pull on {}", path);

    auto stream = stub_->StreamingPull(&context);

    v1::StreamingPullRequest initial;
    initial.set_subscription(path);
    initial.set_stream_ack_deadline_seconds(options_.stream_ack_deadline_seconds);
    initial.set_client_id(client_id_);
    initial.set_max_outstanding_messages(options_.max_outstanding_messages);

    auto acks = std::make_shared<AckChannel>(stream.get());

    if (stream->Write(initial)) {
        v1::StreamingPullResponse response;
        while (stream->Read(&response)) {
            for (const auto& received : response.received_messages()) {
                const auto& msg = received.message();

                core::ReceivedMessage out;
                out.ack_id = received.ack_id();
                out.message_id = msg.message_id();
                out.publish_time = toTimePoint(msg.publish_time());
                out.data = msg.data();
                out.attributes.insert(msg.attributes().begin(), msg.attributes().end());
                out.delivery_attempt = received.delivery_attempt();
                out.ordering_key = msg.ordering_key();

                std::string ack_id = received.ack_id();
                handler(out, [acks, ack_id]() { acks->ack(ack_id); });
            }
        }
    }

    acks->close();
    grpc::Status finished = stream->Finish();
    untrack(&context);

    if (token.isCancelled()) {
        return Status(ErrorCode::CANCELLED, "receive cancelled");
    }
    if (finished.ok()) {
        // The server closed the stream without an error
        return Status(ErrorCode::STREAM_FAILED, "stream closed by server");
    }
    return fromGrpcStatus(finished, ErrorCode::STREAM_FAILED);
}

// =============================================================================
// GrpcConnection
// =============================================================================

class GrpcConnection : public core::Connection {
public:
    GrpcConnection(std::shared_ptr<grpc::Channel> channel,
                   std::string project_id,
                   GrpcOptions options)
        : channel_(channel)
        , publisher_(v1::Publisher::NewStub(channel))
        , subscriber_(std::make_shared<GrpcSubscriber>(channel, project_id, options))
        , project_id_(std::move(project_id))
        , options_(options) {}

    std::shared_ptr<core::Subscriber> subscriber() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriber_;
    }

    Status publish(const std::string& topic_id,
                   const std::string& data,
                   const std::map<std::string, std::string>& attributes,
                   std::string& message_id) override;

    Status close() override;

private:
    std::mutex mutex_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<v1::Publisher::Stub> publisher_;
    std::shared_ptr<GrpcSubscriber> subscriber_;
    std::string project_id_;
    GrpcOptions options_;
};

Status GrpcConnection::publish(const std::string& topic_id,
                               const std::string& data,
                               const std::map<std::string, std::string>& attributes,
                               std::string& message_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel_) {
            return Status(ErrorCode::NOT_CONNECTED, "connection closed");
        }
    }

    v1::PublishRequest request;
    request.set_topic(topicPath(project_id_, topic_id));
    auto* msg = request.add_messages();
    msg->set_data(data);
    for (const auto& [key, value] : attributes) {
        (*msg->mutable_attributes())[key] = value;
    }

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + options_.publish_timeout);

    v1::PublishResponse response;
    grpc::Status status = publisher_->Publish(&context, request, &response);
    if (!status.ok()) {
        LOG_WARN("Publisher", "Publish to {} failed: {}", topic_id, status.error_message());
        return publishError(topic_id, status);
    }
    if (response.message_ids_size() == 0) {
        return Status(ErrorCode::INTERNAL, "failed to publish message: no message id returned");
    }

    message_id = response.message_ids(0);
    LOG_DEBUG("Publisher", "Published {} to {}", message_id, topic_id);
    return Status::OK();
}

Status GrpcConnection::close() {
    std::shared_ptr<GrpcSubscriber> subscriber;
    std::shared_ptr<grpc::Channel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriber = subscriber_;
        channel = std::move(channel_);
    }
    if (!channel) {
        return Status::OK();
    }
    subscriber->shutdown();
    LOG_DEBUG("Connection", "Closed channel for project {}", project_id_);
    return Status::OK();
}

}  // namespace

// =============================================================================
// GrpcConnector
// =============================================================================

GrpcConnector::GrpcConnector(GrpcOptions options)
    : options_(options) {}

std::shared_ptr<grpc::ChannelCredentials> GrpcConnector::makeCredentials(
    const core::ConnectOptions& options, std::string& error) {
    if (options.use_emulator) {
        return grpc::InsecureChannelCredentials();
    }

    switch (options.auth_method) {
        case core::AuthMethod::ADC: {
            auto creds = grpc::GoogleDefaultCredentials();
            if (!creds) {
                error = "application default credentials not found";
            }
            return creds;
        }
        case core::AuthMethod::ServiceAccount: {
            std::string key;
            if (!readFile(options.credentials_path, key)) {
                error = "cannot read service account key file: " + options.credentials_path;
                return nullptr;
            }
            auto call = grpc::ServiceAccountJWTAccessCredentials(key);
            if (!call) {
                error = "invalid service account key file: " + options.credentials_path;
                return nullptr;
            }
            return grpc::CompositeChannelCredentials(
                grpc::SslCredentials(grpc::SslCredentialsOptions()), call);
        }
        case core::AuthMethod::OAuth: {
            std::string token;
            if (!readFile(options.credentials_path, token)) {
                error = "cannot read OAuth credentials file: " + options.credentials_path;
                return nullptr;
            }
            auto call = grpc::GoogleRefreshTokenCredentials(token);
            if (!call) {
                error = "invalid OAuth credentials file: " + options.credentials_path;
                return nullptr;
            }
            return grpc::CompositeChannelCredentials(
                grpc::SslCredentials(grpc::SslCredentialsOptions()), call);
        }
    }
    error = "unsupported auth method";
    return nullptr;
}

Status GrpcConnector::connect(const core::ConnectOptions& options,
                              std::shared_ptr<core::Connection>& out) {
    if (options.project_id.empty() || options.endpoint.empty()) {
        return Status(ErrorCode::INVALID_ARGUMENT, "project ID and endpoint are required");
    }

    std::string error;
    auto creds = makeCredentials(options, error);
    if (!creds) {
        LOG_ERROR("Connector", "Failed to load credentials: {}", error);
        return Status(ErrorCode::CONNECT_FAILED, "failed to create client: " + error);
    }

    LOG_INFO("Connector", "Creating channel to {} for project {}{}", options.endpoint,
             options.project_id, options.use_emulator ? " (emulator)" : "");

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, options_.keepalive_time_ms);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, options_.keepalive_timeout_ms);
    args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);

    auto channel = grpc::CreateCustomChannel(options.endpoint, creds, args);
    if (!channel) {
        return Status(ErrorCode::CONNECT_FAILED, "failed to create client for " + options.endpoint);
    }

    out = std::make_shared<GrpcConnection>(channel, options.project_id, options_);
    return Status::OK();
}

}  // namespace services
}  // namespace psgui
