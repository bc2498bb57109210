/**
 * @file test_connection_manager.cpp
 * @brief Unit tests for ConnectionManager
 *
 * Tests cover:
 * - Connect option building for each emulator mode
 * - Managed sandbox precondition
 * - Handle swaps with bounded close
 * - Concurrent readers during swaps
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <psgui/core/connection_manager.hpp>

#include "mocks.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace psgui;
using namespace psgui::core;
using namespace psgui::testing;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        connector_ = std::make_shared<NiceMock<MockConnector>>();
        sandbox_ = std::make_shared<NiceMock<MockSandboxController>>();
    }

    ConnectionProfile profile(const std::string& id, const std::string& project) {
        ConnectionProfile p;
        p.id = id;
        p.name = id;
        p.project_id = project;
        return p;
    }

    std::shared_ptr<NiceMock<MockConnection>> makeConnection() {
        auto conn = std::make_shared<NiceMock<MockConnection>>();
        ON_CALL(*conn, close()).WillByDefault(Return(Status::OK()));
        return conn;
    }

    std::shared_ptr<const ConnectionHandle> handleFor(std::shared_ptr<Connection> conn,
                                                      const std::string& project) {
        auto h = std::make_shared<ConnectionHandle>();
        h->connection = std::move(conn);
        h->project_id = project;
        return h;
    }

    // The abandoned closer thread owns the last reference to a wedged connection
    static void waitForRelease(const std::weak_ptr<MockConnection>& conn) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!conn.expired() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        EXPECT_TRUE(conn.expired());
    }

    std::shared_ptr<NiceMock<MockConnector>> connector_;
    std::shared_ptr<NiceMock<MockSandboxController>> sandbox_;
};

// =============================================================================
// Connect
// =============================================================================

TEST_F(ConnectionManagerTest, InitiallyDisconnected) {
    ConnectionManager manager(connector_, sandbox_);
    EXPECT_FALSE(manager.isConnected());
    EXPECT_EQ(manager.getHandle(), nullptr);
    EXPECT_EQ(manager.getProjectId(), "");
    EXPECT_TRUE(manager.disconnect().ok());
}

TEST_F(ConnectionManagerTest, InvalidProfileRejectedBeforeConnecting) {
    EXPECT_CALL(*connector_, connect(_, _)).Times(0);
    ConnectionManager manager(connector_, sandbox_);

    Status s = manager.connect(profile("p", ""));
    EXPECT_EQ(s.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(manager.isConnected());
}

TEST_F(ConnectionManagerTest, ConnectsToProductionEndpoint) {
    auto conn = makeConnection();
    EXPECT_CALL(*connector_, connect(
            ::testing::AllOf(Field(&ConnectOptions::project_id, "proj-a"),
                             Field(&ConnectOptions::endpoint, "pubsub.googleapis.com:443"),
                             Field(&ConnectOptions::use_emulator, false)), _))
        .WillOnce(DoAll(SetArgReferee<1>(conn), Return(Status::OK())));
    EXPECT_CALL(*sandbox_, start(_, _)).Times(0);

    ConnectionManager manager(connector_, sandbox_);
    ASSERT_TRUE(manager.connect(profile("a", "proj-a")).ok());
    EXPECT_TRUE(manager.isConnected());
    EXPECT_EQ(manager.getProjectId(), "proj-a");
    EXPECT_EQ(manager.getHandle()->connection, conn);
}

TEST_F(ConnectionManagerTest, ExternalEmulatorUsesPlaintextHost) {
    auto conn = makeConnection();
    EXPECT_CALL(*connector_, connect(
            ::testing::AllOf(Field(&ConnectOptions::endpoint, "localhost:8681"),
                             Field(&ConnectOptions::use_emulator, true)), _))
        .WillOnce(DoAll(SetArgReferee<1>(conn), Return(Status::OK())));

    auto p = profile("e", "proj-e");
    p.emulator_host = "localhost:8681";

    ConnectionManager manager(connector_, sandbox_);
    EXPECT_TRUE(manager.connect(p).ok());
}

TEST_F(ConnectionManagerTest, ServiceAccountPathPassedThrough) {
    auto conn = makeConnection();
    EXPECT_CALL(*connector_, connect(
            ::testing::AllOf(Field(&ConnectOptions::auth_method, AuthMethod::ServiceAccount),
                             Field(&ConnectOptions::credentials_path, "/k.json")), _))
        .WillOnce(DoAll(SetArgReferee<1>(conn), Return(Status::OK())));

    auto p = profile("s", "proj-s");
    p.auth_method = AuthMethod::ServiceAccount;
    p.service_account_path = "/k.json";

    ConnectionManager manager(connector_, sandbox_);
    EXPECT_TRUE(manager.connect(p).ok());
}

TEST_F(ConnectionManagerTest, ConnectorFailureKeepsPreviousHandle) {
    auto first = makeConnection();
    EXPECT_CALL(*connector_, connect(_, _))
        .WillOnce(DoAll(SetArgReferee<1>(first), Return(Status::OK())))
        .WillOnce(Return(Status(ErrorCode::CONNECT_FAILED, "failed to create client")));

    ConnectionManager manager(connector_, sandbox_);
    ASSERT_TRUE(manager.connect(profile("a", "proj-a")).ok());

    Status s = manager.connect(profile("b", "proj-b"));
    EXPECT_EQ(s.code(), ErrorCode::CONNECT_FAILED);
    EXPECT_EQ(manager.getProjectId(), "proj-a");
}

TEST_F(ConnectionManagerTest, ReconnectClosesPreviousConnection) {
    auto first = makeConnection();
    auto second = makeConnection();
    EXPECT_CALL(*first, close()).WillOnce(Return(Status::OK()));
    EXPECT_CALL(*connector_, connect(_, _))
        .WillOnce(DoAll(SetArgReferee<1>(first), Return(Status::OK())))
        .WillOnce(DoAll(SetArgReferee<1>(second), Return(Status::OK())));

    ConnectionManager manager(connector_, sandbox_);
    ASSERT_TRUE(manager.connect(profile("a", "proj-a")).ok());
    EXPECT_CALL(*second, close()).Times(0);
    ASSERT_TRUE(manager.connect(profile("b", "proj-b")).ok());
    EXPECT_EQ(manager.getProjectId(), "proj-b");
    ::testing::Mock::VerifyAndClearExpectations(second.get());
}

// =============================================================================
// Managed Sandbox
// =============================================================================

TEST_F(ConnectionManagerTest, ManagedProfileStartsAndAwaitsSandbox) {
    auto conn = makeConnection();
    auto p = profile("m", "proj-m");
    p.emulator_mode = EmulatorMode::Managed;
    ManagedSandboxConfig cfg;
    cfg.port = 9005;
    p.managed_sandbox = cfg;

    {
        InSequence seq;
        EXPECT_CALL(*sandbox_, start("m", Field(&ManagedSandboxConfig::port, 9005)))
            .WillOnce(Return(Status::OK()));
        EXPECT_CALL(*sandbox_, waitUntilReady("m", std::chrono::milliseconds(1234)))
            .WillOnce(Return(Status::OK()));
        EXPECT_CALL(*connector_, connect(
                ::testing::AllOf(Field(&ConnectOptions::endpoint, "127.0.0.1:9005"),
                                 Field(&ConnectOptions::use_emulator, true)), _))
            .WillOnce(DoAll(SetArgReferee<1>(conn), Return(Status::OK())));
    }

    ConnectionManager manager(connector_, sandbox_);
    manager.setReadyTimeout(1234ms);
    EXPECT_TRUE(manager.connect(p).ok());
}

TEST_F(ConnectionManagerTest, SandboxErrorPropagatedVerbatim) {
    auto p = profile("m", "proj-m");
    p.emulator_mode = EmulatorMode::Managed;

    Status failure(ErrorCode::PORT_CONFLICT, "port 8085 is already in use on 127.0.0.1");
    EXPECT_CALL(*sandbox_, start("m", _)).WillOnce(Return(failure));
    EXPECT_CALL(*sandbox_, waitUntilReady(_, _)).Times(0);
    EXPECT_CALL(*connector_, connect(_, _)).Times(0);

    ConnectionManager manager(connector_, sandbox_);
    EXPECT_EQ(manager.connect(p), failure);
    EXPECT_FALSE(manager.isConnected());
}

TEST_F(ConnectionManagerTest, ReadinessFailureIsFatal) {
    auto p = profile("m", "proj-m");
    p.emulator_mode = EmulatorMode::Managed;

    EXPECT_CALL(*sandbox_, start(_, _)).WillOnce(Return(Status::OK()));
    EXPECT_CALL(*sandbox_, waitUntilReady(_, _))
        .WillOnce(Return(Status(ErrorCode::READINESS_TIMEOUT, "timeout waiting for emulator to start")));
    EXPECT_CALL(*connector_, connect(_, _)).Times(0);

    ConnectionManager manager(connector_, sandbox_);
    EXPECT_EQ(manager.connect(p).code(), ErrorCode::READINESS_TIMEOUT);
}

TEST_F(ConnectionManagerTest, AutoStartDisabledOnlyWaits) {
    auto conn = makeConnection();
    auto p = profile("m", "proj-m");
    p.emulator_mode = EmulatorMode::Managed;
    ManagedSandboxConfig cfg = ManagedSandboxConfig::defaults();
    cfg.auto_start = false;
    p.managed_sandbox = cfg;

    EXPECT_CALL(*sandbox_, start(_, _)).Times(0);
    EXPECT_CALL(*sandbox_, waitUntilReady("m", _)).WillOnce(Return(Status::OK()));
    EXPECT_CALL(*connector_, connect(_, _))
        .WillOnce(DoAll(SetArgReferee<1>(conn), Return(Status::OK())));

    ConnectionManager manager(connector_, sandbox_);
    EXPECT_TRUE(manager.connect(p).ok());
}

TEST_F(ConnectionManagerTest, ManagedProfileWithoutSandboxSupportFails) {
    auto p = profile("m", "proj-m");
    p.emulator_mode = EmulatorMode::Managed;

    ConnectionManager manager(connector_, nullptr);
    EXPECT_EQ(manager.connect(p).code(), ErrorCode::CONNECT_FAILED);
}

// =============================================================================
// Handle Swaps
// =============================================================================

TEST_F(ConnectionManagerTest, SetHandleWithBlockedCloseInstallsNewHandleWithinBound) {
    auto gate = std::make_shared<Latch>();
    auto closed = std::make_shared<Latch>();
    std::weak_ptr<MockConnection> watch;
    auto stuck = std::make_shared<NiceMock<MockConnection>>();
    EXPECT_CALL(*stuck, close()).WillOnce(Invoke([gate, closed]() {
        gate->wait();
        closed->release();
        return Status::OK();
    }));
    auto fresh = makeConnection();

    {
        ConnectionManager manager(connector_, sandbox_);
        manager.setCloseTimeout(200ms);
        manager.setHandle(handleFor(stuck, "old"));
        watch = stuck;
        stuck.reset();

        std::atomic<bool> sawDisconnected{false};
        std::atomic<bool> running{true};
        std::thread reader([&]() {
            bool installed = false;
            while (running.load()) {
                auto h = manager.getHandle();
                if (h && h->project_id == "new") installed = true;
                if (installed && !manager.isConnected()) sawDisconnected = true;
                if (!h) sawDisconnected = true;
            }
        });

        auto start = std::chrono::steady_clock::now();
        manager.setHandle(handleFor(fresh, "new"));
        auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_LT(elapsed, 1s);
        EXPECT_TRUE(manager.isConnected());
        EXPECT_EQ(manager.getProjectId(), "new");

        running = false;
        reader.join();
        EXPECT_FALSE(sawDisconnected.load());
    }

    gate->release();
    EXPECT_TRUE(closed->waitFor(2s));
    waitForRelease(watch);
}

TEST_F(ConnectionManagerTest, DisconnectTimeoutReportedButHandleCleared) {
    auto gate = std::make_shared<Latch>();
    auto closed = std::make_shared<Latch>();
    std::weak_ptr<MockConnection> watch;
    auto stuck = std::make_shared<NiceMock<MockConnection>>();
    EXPECT_CALL(*stuck, close()).WillOnce(Invoke([gate, closed]() {
        gate->wait();
        closed->release();
        return Status::OK();
    }));

    {
        ConnectionManager manager(connector_, sandbox_);
        manager.setCloseTimeout(100ms);
        manager.setHandle(handleFor(stuck, "p"));
        watch = stuck;
        stuck.reset();

        Status s = manager.disconnect();
        EXPECT_EQ(s.code(), ErrorCode::CLOSE_TIMEOUT);
        EXPECT_FALSE(manager.isConnected());
        EXPECT_EQ(manager.getProjectId(), "");
    }

    gate->release();
    EXPECT_TRUE(closed->waitFor(2s));
    waitForRelease(watch);
}

TEST_F(ConnectionManagerTest, CloseErrorReturnedFromDisconnect) {
    auto conn = std::make_shared<NiceMock<MockConnection>>();
    EXPECT_CALL(*conn, close()).WillOnce(Return(Status(ErrorCode::INTERNAL, "close failed")));

    ConnectionManager manager(connector_, sandbox_);
    manager.setHandle(handleFor(conn, "p"));
    EXPECT_EQ(manager.disconnect().code(), ErrorCode::INTERNAL);
    EXPECT_FALSE(manager.isConnected());
}

TEST_F(ConnectionManagerTest, ReinstallingSameConnectionDoesNotClose) {
    auto conn = std::make_shared<NiceMock<MockConnection>>();
    EXPECT_CALL(*conn, close()).Times(1).WillOnce(Return(Status::OK()));

    ConnectionManager manager(connector_, sandbox_);
    manager.setHandle(handleFor(conn, "p"));
    manager.setHandle(handleFor(conn, "p"));
    EXPECT_TRUE(manager.disconnect().ok());
}

TEST_F(ConnectionManagerTest, ReadersNeverSeeTornHandle) {
    std::vector<std::shared_ptr<NiceMock<MockConnection>>> conns;
    for (int i = 0; i < 20; ++i) {
        conns.push_back(makeConnection());
    }

    ConnectionManager manager(connector_, sandbox_);
    std::atomic<bool> running{true};
    std::atomic<bool> torn{false};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (running.load()) {
                auto h = manager.getHandle();
                if (!h) continue;
                // Project id and connection always come from the same install
                int idx = std::stoi(h->project_id);
                if (h->connection != conns[idx]) torn = true;
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        manager.setHandle(handleFor(conns[i], std::to_string(i)));
    }
    running = false;
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_FALSE(torn.load());
    EXPECT_EQ(manager.getProjectId(), "19");
}
