/**
 * @file tcp_socket.hpp
 * @brief Minimal RAII TCP socket used for port checks and readiness probes.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/net/export.hpp"
#include "psgui/net/platform.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace psgui {
namespace net {

/**
 * @class TcpSocket
 * @brief Owns one TCP socket handle.
 *
 * Usage:
 * @code
 * TcpSocket probe;
 * if (probe.connect("127.0.0.1", 8085, std::chrono::seconds(1))) {
 *     // something is listening
 * }
 * @endcode
 */
class PSGUI_NET_API TcpSocket {
public:
    TcpSocket() = default;
    ~TcpSocket();

    // Move-only
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    /**
     * @brief Bind to host:port and start listening.
     *
     * An empty host binds all interfaces. A port held by an active
     * listener in another process is reported as a failure.
     */
    bool listen(const std::string& host, uint16_t port, int backlog = 1);

    /**
     * @brief Connect to host:port, giving up after @p timeout.
     */
    bool connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    /**
     * @brief Port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    int getLastError() const { return lastError_; }

    void close();

private:
    bool open(int family);
    void setLastError();

    SocketHandle socket_ = INVALID_SOCKET_HANDLE;
    int lastError_ = 0;
};

/**
 * @brief True if a listener could be bound on host:port right now.
 */
PSGUI_NET_API bool isPortAvailable(const std::string& host, uint16_t port);

/**
 * @brief True if something accepts TCP connections on host:port.
 */
PSGUI_NET_API bool probeTcp(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout);

}  // namespace net
}  // namespace psgui
