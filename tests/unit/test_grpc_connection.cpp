/**
 * @file test_grpc_connection.cpp
 * @brief Unit tests for the gRPC connection layer
 *
 * None of these tests need a server: channels are created lazily and
 * calls against a closed port fail fast.
 */

#include <gtest/gtest.h>
#include <psgui/services/grpc_connection.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace psgui;
using namespace psgui::services;
using namespace std::chrono_literals;
using core::ErrorCode;

class GrpcConnectionTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!tempFile_.empty()) {
            std::remove(tempFile_.c_str());
        }
    }

    std::string writeTempFile(const std::string& contents) {
        tempFile_ = ::testing::TempDir() + "psgui_grpc_test_credentials.json";
        std::ofstream out(tempFile_, std::ios::binary | std::ios::trunc);
        out << contents;
        return tempFile_;
    }

    static core::ConnectOptions emulatorOptions(const std::string& endpoint) {
        core::ConnectOptions options;
        options.project_id = "test-project";
        options.endpoint = endpoint;
        options.use_emulator = true;
        return options;
    }

    std::string tempFile_;
};

// =============================================================================
// Resource Paths
// =============================================================================

TEST_F(GrpcConnectionTest, ResourcePaths) {
    EXPECT_EQ(subscriptionPath("proj", "sub-1"), "projects/proj/subscriptions/sub-1");
    EXPECT_EQ(topicPath("proj", "orders"), "projects/proj/topics/orders");
}

// =============================================================================
// Status Translation
// =============================================================================

TEST_F(GrpcConnectionTest, KnownCodesKeepTheirMeaning) {
    EXPECT_TRUE(fromGrpcStatus(grpc::Status::OK, ErrorCode::INTERNAL).ok());
    EXPECT_EQ(fromGrpcStatus(grpc::Status(grpc::StatusCode::CANCELLED, "c"), ErrorCode::INTERNAL).code(),
              ErrorCode::CANCELLED);
    EXPECT_EQ(fromGrpcStatus(grpc::Status(grpc::StatusCode::NOT_FOUND, "n"), ErrorCode::INTERNAL).code(),
              ErrorCode::NOT_FOUND);
    EXPECT_EQ(fromGrpcStatus(grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "p"), ErrorCode::INTERNAL).code(),
              ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(fromGrpcStatus(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "i"), ErrorCode::INTERNAL).code(),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(GrpcConnectionTest, OtherCodesUseFallback) {
    core::Status s = fromGrpcStatus(grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection refused"),
                                    ErrorCode::STREAM_FAILED);
    EXPECT_EQ(s.code(), ErrorCode::STREAM_FAILED);
    EXPECT_EQ(s.message(), "connection refused");
}

TEST_F(GrpcConnectionTest, PublishErrorMessages) {
    core::Status denied = publishError("orders", grpc::Status(grpc::StatusCode::PERMISSION_DENIED, ""));
    EXPECT_EQ(denied.code(), ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(denied.message(), "permission denied: you don't have permission to publish to this topic");

    core::Status missing = publishError("orders", grpc::Status(grpc::StatusCode::NOT_FOUND, ""));
    EXPECT_EQ(missing.code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(missing.message(), "topic not found: the topic 'orders' does not exist");

    core::Status invalid = publishError("orders", grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, ""));
    EXPECT_EQ(invalid.message(), "invalid message: check your payload and attributes");

    core::Status other = publishError("orders", grpc::Status(grpc::StatusCode::UNAVAILABLE, "down"));
    EXPECT_EQ(other.code(), ErrorCode::INTERNAL);
    EXPECT_EQ(other.message(), "failed to publish message: down");
}

// =============================================================================
// Credentials
// =============================================================================

TEST_F(GrpcConnectionTest, EmulatorUsesInsecureCredentials) {
    std::string error;
    auto creds = GrpcConnector::makeCredentials(emulatorOptions("localhost:8085"), error);
    EXPECT_NE(creds, nullptr);
    EXPECT_TRUE(error.empty());
}

TEST_F(GrpcConnectionTest, MissingServiceAccountFile) {
    core::ConnectOptions options;
    options.project_id = "p";
    options.endpoint = "pubsub.googleapis.com:443";
    options.auth_method = core::AuthMethod::ServiceAccount;
    options.credentials_path = "/nonexistent/psgui/key.json";

    std::string error;
    EXPECT_EQ(GrpcConnector::makeCredentials(options, error), nullptr);
    EXPECT_EQ(error, "cannot read service account key file: /nonexistent/psgui/key.json");
}

TEST_F(GrpcConnectionTest, MalformedServiceAccountFile) {
    core::ConnectOptions options;
    options.project_id = "p";
    options.endpoint = "pubsub.googleapis.com:443";
    options.auth_method = core::AuthMethod::ServiceAccount;
    options.credentials_path = writeTempFile("not a key");

    std::string error;
    EXPECT_EQ(GrpcConnector::makeCredentials(options, error), nullptr);
    EXPECT_NE(error.find("invalid service account key file"), std::string::npos);
}

TEST_F(GrpcConnectionTest, MissingOAuthFile) {
    core::ConnectOptions options;
    options.project_id = "p";
    options.endpoint = "pubsub.googleapis.com:443";
    options.auth_method = core::AuthMethod::OAuth;
    options.credentials_path = "/nonexistent/psgui/token.json";

    std::string error;
    EXPECT_EQ(GrpcConnector::makeCredentials(options, error), nullptr);
    EXPECT_NE(error.find("cannot read OAuth credentials file"), std::string::npos);
}

TEST_F(GrpcConnectionTest, CredentialFailureIsConnectFailure) {
    core::ConnectOptions options;
    options.project_id = "p";
    options.endpoint = "pubsub.googleapis.com:443";
    options.auth_method = core::AuthMethod::ServiceAccount;
    options.credentials_path = "/nonexistent/psgui/key.json";

    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;
    core::Status s = connector.connect(options, connection);
    EXPECT_EQ(s.code(), ErrorCode::CONNECT_FAILED);
    EXPECT_EQ(s.message().rfind("failed to create client: ", 0), 0u);
    EXPECT_EQ(connection, nullptr);
}

// =============================================================================
// Connection
// =============================================================================

TEST_F(GrpcConnectionTest, ConnectRequiresProjectAndEndpoint) {
    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;

    auto options = emulatorOptions("localhost:8085");
    options.project_id.clear();
    EXPECT_EQ(connector.connect(options, connection).code(), ErrorCode::INVALID_ARGUMENT);

    options = emulatorOptions("");
    EXPECT_EQ(connector.connect(options, connection).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(connection, nullptr);
}

TEST_F(GrpcConnectionTest, ConnectDoesNotDial) {
    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;

    // Nothing listens on port 1; channel creation still succeeds
    ASSERT_TRUE(connector.connect(emulatorOptions("127.0.0.1:1"), connection).ok());
    ASSERT_NE(connection, nullptr);
    EXPECT_NE(connection->subscriber(), nullptr);
    EXPECT_TRUE(connection->close().ok());
    EXPECT_TRUE(connection->close().ok());
}

TEST_F(GrpcConnectionTest, PublishAfterCloseIsNotConnected) {
    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;
    ASSERT_TRUE(connector.connect(emulatorOptions("127.0.0.1:1"), connection).ok());
    ASSERT_TRUE(connection->close().ok());

    std::string id;
    EXPECT_EQ(connection->publish("t", "data", {}, id).code(), ErrorCode::NOT_CONNECTED);
    EXPECT_TRUE(id.empty());
}

TEST_F(GrpcConnectionTest, PublishToUnreachableEndpointFails) {
    GrpcOptions grpcOptions;
    grpcOptions.publish_timeout = 2000ms;
    GrpcConnector connector(grpcOptions);

    std::shared_ptr<core::Connection> connection;
    ASSERT_TRUE(connector.connect(emulatorOptions("127.0.0.1:1"), connection).ok());

    std::string id;
    core::Status s = connection->publish("t", "data", {{"k", "v"}}, id);
    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.message().rfind("failed to publish message: ", 0), 0u);
    EXPECT_TRUE(id.empty());
}

TEST_F(GrpcConnectionTest, ReceiveWithCancelledTokenReturnsCancelled) {
    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;
    ASSERT_TRUE(connector.connect(emulatorOptions("127.0.0.1:1"), connection).ok());

    core::CancellationToken token;
    token.cancel();

    int delivered = 0;
    core::Status s = connection->subscriber()->receive(
        "sub", token, [&](const core::ReceivedMessage&, const core::AckFunction&) { ++delivered; });
    EXPECT_EQ(s.code(), ErrorCode::CANCELLED);
    EXPECT_EQ(delivered, 0);
}

TEST_F(GrpcConnectionTest, ReceiveFromUnreachableEndpointIsStreamFailure) {
    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;
    ASSERT_TRUE(connector.connect(emulatorOptions("127.0.0.1:1"), connection).ok());

    core::CancellationToken token;
    core::Status s = connection->subscriber()->receive(
        "sub", token, [](const core::ReceivedMessage&, const core::AckFunction&) {});
    EXPECT_EQ(s.code(), ErrorCode::STREAM_FAILED);
}

TEST_F(GrpcConnectionTest, ReceiveAfterCloseFailsFast) {
    GrpcConnector connector;
    std::shared_ptr<core::Connection> connection;
    ASSERT_TRUE(connector.connect(emulatorOptions("127.0.0.1:1"), connection).ok());
    auto subscriber = connection->subscriber();
    ASSERT_TRUE(connection->close().ok());

    core::CancellationToken token;
    core::Status s = subscriber->receive(
        "sub", token, [](const core::ReceivedMessage&, const core::AckFunction&) {});
    EXPECT_EQ(s.code(), ErrorCode::NOT_CONNECTED);
}
