#pragma once

#ifdef _WIN32
    #define XFER_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define XFER_PLATFORM_LINUX
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <cerrno>
    #include <cstring>
#endif

#include <string>

namespace xfer {

#ifdef XFER_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;
    constexpr int SHUTDOWN_BOTH = SD_BOTH;
#else
    using socket_t = int;
    constexpr socket_t INVALID_SOCKET_VALUE = -1;
    constexpr int SHUTDOWN_BOTH = SHUT_RDWR;
#endif

inline void close_native_socket(socket_t socket) {
#ifdef XFER_PLATFORM_WINDOWS
    ::closesocket(socket);
#else
    ::close(socket);
#endif
}

/// Text of the last socket-level error on this thread, for log messages.
inline std::string last_socket_error() {
#ifdef XFER_PLATFORM_WINDOWS
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

} // namespace xfer
