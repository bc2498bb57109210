/**
 * @file platform.hpp
 * @brief Socket handle type and the few calls that differ between
 *        Winsock2 and POSIX.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>
#else
    #include <cerrno>
    #include <fcntl.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <unistd.h>
#endif

#include <mutex>

namespace psgui {
namespace net {

#ifdef _WIN32
using SocketHandle = SOCKET;
constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;
#else
using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;
#endif

/**
 * @brief Initialize the socket library once per process (Winsock only).
 * @return false if initialization failed.
 */
inline bool ensureSocketsReady() {
#ifdef _WIN32
    static std::once_flag once;
    static bool ready = false;
    std::call_once(once, []() {
        WSADATA data;
        ready = ::WSAStartup(MAKEWORD(2, 2), &data) == 0;
    });
    return ready;
#else
    return true;
#endif
}

inline int lastSocketError() {
#ifdef _WIN32
    return ::WSAGetLastError();
#else
    return errno;
#endif
}

inline void closeSocketHandle(SocketHandle s) {
#ifdef _WIN32
    ::closesocket(s);
#else
    ::close(s);
#endif
}

/// True when a non-blocking connect() is still under way
inline bool connectPending(int error) {
#ifdef _WIN32
    return error == WSAEWOULDBLOCK;
#else
    return error == EINPROGRESS;
#endif
}

inline bool setBlocking(SocketHandle s, bool blocking) {
#ifdef _WIN32
    u_long nonBlocking = blocking ? 0 : 1;
    return ::ioctlsocket(s, FIONBIO, &nonBlocking) == 0;
#else
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return ::fcntl(s, F_SETFL, flags) == 0;
#endif
}

}  // namespace net
}  // namespace psgui
