/**
 * @file tcp_socket.cpp
 * @brief Cross-platform TCP socket implementation.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/net/tcp_socket.hpp"
#include "psgui/utils/logger.hpp"

#include <cstring>

namespace psgui {
namespace net {

namespace {

/**
 * @brief RAII wrapper around getaddrinfo results.
 */
class AddressList {
public:
    AddressList(const std::string& host, uint16_t port, bool passive) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;
        if (passive) {
            hints.ai_flags = AI_PASSIVE;
        }
        std::string service = std::to_string(port);
        const char* node = host.empty() ? nullptr : host.c_str();
        error_ = ::getaddrinfo(node, service.c_str(), &hints, &head_);
        if (error_ != 0) {
            head_ = nullptr;
        }
    }

    ~AddressList() {
        if (head_) {
            ::freeaddrinfo(head_);
        }
    }

    AddressList(const AddressList&) = delete;
    AddressList& operator=(const AddressList&) = delete;

    const struct addrinfo* head() const { return head_; }
    int error() const { return error_; }

private:
    struct addrinfo* head_ = nullptr;
    int error_ = 0;
};

}  // namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool TcpSocket::open(int family) {
    close();
    if (!ensureSocketsReady()) {
        setLastError();
        LOG_ERROR("TcpSocket", "Socket library unavailable: error {}", lastError_);
        return false;
    }
    socket_ = ::socket(family, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("TcpSocket", "Failed to create socket: error {}", lastError_);
        return false;
    }
    return true;
}

bool TcpSocket::listen(const std::string& host, uint16_t port, int backlog) {
    AddressList addresses(host, port, true);
    if (!addresses.head()) {
        LOG_DEBUG("TcpSocket", "Cannot resolve {}: {}", host, ::gai_strerror(addresses.error()));
        return false;
    }

    for (const struct addrinfo* ai = addresses.head(); ai; ai = ai->ai_next) {
        if (!open(ai->ai_family)) {
            continue;
        }
#ifndef _WIN32
        // Lets a port in TIME_WAIT be reused; an active listener still conflicts
        int optval = 1;
        ::setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
#endif
        if (::bind(socket_, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen)) == 0 &&
            ::listen(socket_, backlog) == 0) {
            LOG_TRACE("TcpSocket", "Listening on {}:{}", host, port);
            return true;
        }
        setLastError();
        close();
    }

    LOG_DEBUG("TcpSocket", "Failed to listen on {}:{} - error {}", host, port, lastError_);
    return false;
}

bool TcpSocket::connect(const std::string& host, uint16_t port,
                        std::chrono::milliseconds timeout) {
    AddressList addresses(host, port, false);
    if (!addresses.head()) {
        LOG_DEBUG("TcpSocket", "Cannot resolve {}: {}", host, ::gai_strerror(addresses.error()));
        return false;
    }

    for (const struct addrinfo* ai = addresses.head(); ai; ai = ai->ai_next) {
        if (!open(ai->ai_family)) {
            continue;
        }
        if (!setBlocking(socket_, false)) {
            setLastError();
            close();
            continue;
        }

        int rc = ::connect(socket_, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        if (rc == 0) {
            setBlocking(socket_, true);
            return true;
        }

        setLastError();
        if (!connectPending(lastError_)) {
            close();
            continue;
        }

        fd_set writeSet;
        FD_ZERO(&writeSet);
        FD_SET(socket_, &writeSet);

        struct timeval tv;
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

        rc = ::select(static_cast<int>(socket_ + 1), nullptr, &writeSet, nullptr, &tv);
        if (rc > 0) {
            int soError = 0;
            socklen_t len = sizeof(soError);
            ::getsockopt(socket_, SOL_SOCKET, SO_ERROR,
                         reinterpret_cast<char*>(&soError), &len);
            if (soError == 0) {
                setBlocking(socket_, true);
                return true;
            }
            lastError_ = soError;
        } else if (rc < 0) {
            setLastError();
        }
        close();
    }
    return false;
}

uint16_t TcpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
}

void TcpSocket::close() {
    if (isValid()) {
        closeSocketHandle(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void TcpSocket::setLastError() {
    lastError_ = lastSocketError();
}

bool isPortAvailable(const std::string& host, uint16_t port) {
    TcpSocket listener;
    return listener.listen(host, port);
}

bool probeTcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    TcpSocket probe;
    return probe.connect(host, port, timeout);
}

}  // namespace net
}  // namespace psgui
