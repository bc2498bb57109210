/**
 * @file test_tcp_socket.cpp
 * @brief Unit tests for TCP listen/probe helpers
 */

#include <gtest/gtest.h>
#include <psgui/net/tcp_socket.hpp>

#include <chrono>
#include <utility>

using namespace psgui::net;
using namespace std::chrono_literals;

class TcpSocketTest : public ::testing::Test {
protected:
    // Listen on an ephemeral loopback port
    uint16_t listenEphemeral(TcpSocket& socket) {
        EXPECT_TRUE(socket.listen("127.0.0.1", 0, 4));
        return socket.getLocalPort();
    }
};

TEST_F(TcpSocketTest, DefaultIsInvalid) {
    TcpSocket socket;
    EXPECT_FALSE(socket.isValid());
    EXPECT_EQ(socket.getLocalPort(), 0);
}

TEST_F(TcpSocketTest, ListenOnEphemeralPort) {
    TcpSocket socket;
    uint16_t port = listenEphemeral(socket);
    EXPECT_TRUE(socket.isValid());
    EXPECT_NE(port, 0);

    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(TcpSocketTest, MoveTransfersOwnership) {
    TcpSocket a;
    uint16_t port = listenEphemeral(a);

    TcpSocket b(std::move(a));
    EXPECT_FALSE(a.isValid());
    EXPECT_TRUE(b.isValid());
    EXPECT_EQ(b.getLocalPort(), port);
}

TEST_F(TcpSocketTest, PortUnavailableWhileListening) {
    TcpSocket socket;
    uint16_t port = listenEphemeral(socket);

    EXPECT_FALSE(isPortAvailable("127.0.0.1", port));

    socket.close();
    EXPECT_TRUE(isPortAvailable("127.0.0.1", port));
}

TEST_F(TcpSocketTest, ProbeSucceedsAgainstListener) {
    TcpSocket socket;
    uint16_t port = listenEphemeral(socket);

    EXPECT_TRUE(probeTcp("127.0.0.1", port, 500ms));
}

TEST_F(TcpSocketTest, ProbeFailsWhenNothingListens) {
    uint16_t port;
    {
        TcpSocket socket;
        port = listenEphemeral(socket);
    }
    EXPECT_FALSE(probeTcp("127.0.0.1", port, 200ms));
}

TEST_F(TcpSocketTest, UnresolvableHostFails) {
    TcpSocket socket;
    EXPECT_FALSE(socket.connect("no-such-host.invalid", 80, 200ms));
    EXPECT_FALSE(socket.isValid());
}
