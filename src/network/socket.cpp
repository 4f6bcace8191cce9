#include "xfer/network/socket.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

#ifdef XFER_PLATFORM_WINDOWS
    using socklen_t = int;
#endif

namespace xfer::network {

namespace {

template<typename T>
Result<T> not_open() {
    return Err<T>(std::string("socket is not open"));
}

// Empty or "0.0.0.0" means any interface when binding; "localhost" maps to loopback.
Result<sockaddr_in> make_endpoint(const std::string& host, uint16_t port, bool passive) {
    sockaddr_in endpoint{};
    endpoint.sin_family = AF_INET;
    endpoint.sin_port = htons(port);
    if (passive && (host.empty() || host == "0.0.0.0")) {
        endpoint.sin_addr.s_addr = htonl(INADDR_ANY);
        return Ok(endpoint);
    }
    const std::string numeric = host == "localhost" ? std::string("127.0.0.1") : host;
    if (inet_pton(AF_INET, numeric.c_str(), &endpoint.sin_addr) != 1) {
        return Err<sockaddr_in>("not an IPv4 address: '" + host + "'");
    }
    return Ok(endpoint);
}

std::string describe_endpoint(const sockaddr_in& endpoint) {
    char text[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &endpoint.sin_addr, text, sizeof(text));
    return std::string(text) + ":" + std::to_string(ntohs(endpoint.sin_port));
}

} // namespace

Result<void> Socket::initialize_platform() {
#ifdef XFER_PLATFORM_WINDOWS
    static std::once_flag once;
    static bool initialized = false;
    std::call_once(once, [] {
        WSADATA wsa_data;
        initialized = WSAStartup(MAKEWORD(2, 2), &wsa_data) == 0;
    });
    if (!initialized) {
        return Err<void>(std::string("WSAStartup failed"));
    }
#endif
    return Ok();
}

Socket::Socket() : socket_(INVALID_SOCKET_VALUE) {}

Socket::Socket(socket_t socket, std::string peer) : socket_(socket), peer_(std::move(peer)) {}

Socket::~Socket() { close(); }

Socket::Socket(Socket&& other) noexcept
    : socket_(std::exchange(other.socket_, INVALID_SOCKET_VALUE)), peer_(std::move(other.peer_)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    close();
    socket_ = std::exchange(other.socket_, INVALID_SOCKET_VALUE);
    peer_ = std::move(other.peer_);
    return *this;
}

Result<void> Socket::create() {
    if (is_valid()) {
        return Err<void>(std::string("socket is already open"));
    }
    if (auto init = initialize_platform(); init.is_error()) {
        return init;
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (!is_valid()) {
        return Err<void>("socket() failed: " + last_socket_error());
    }

    spdlog::debug("Socket created: fd={}", socket_);
    return Ok();
}

Result<void> Socket::bind(const std::string& address, uint16_t port) {
    if (!is_valid()) {
        return not_open<void>();
    }
    auto endpoint = make_endpoint(address, port, true);
    if (endpoint.is_error()) {
        return Err<void>(endpoint.error());
    }
    const sockaddr_in& local = endpoint.value();
    if (::bind(socket_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
        return Err<void>("bind " + describe_endpoint(local) + " failed: " + last_socket_error());
    }

    spdlog::debug("Socket bound to {}:{}", address, port);
    return Ok();
}

Result<void> Socket::listen(int backlog) {
    if (!is_valid()) {
        return not_open<void>();
    }
    if (::listen(socket_, backlog) != 0) {
        return Err<void>("listen() failed: " + last_socket_error());
    }

    spdlog::debug("Socket listening with backlog={}", backlog);
    return Ok();
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    using Accepted = std::unique_ptr<Socket>;
    if (!is_valid()) {
        return not_open<Accepted>();
    }

    sockaddr_in remote{};
    socklen_t remote_len = sizeof(remote);
    const socket_t fd = ::accept(socket_, reinterpret_cast<sockaddr*>(&remote), &remote_len);
    if (fd == INVALID_SOCKET_VALUE) {
        return Err<Accepted>("accept() failed: " + last_socket_error());
    }

    std::string peer = describe_endpoint(remote);
    spdlog::info("Accepted connection from {}", peer);
    return Ok(Accepted(new Socket(fd, std::move(peer))));
}

Result<void> Socket::connect(const std::string& address, uint16_t port) {
    if (!is_valid()) {
        return not_open<void>();
    }
    auto endpoint = make_endpoint(address, port, false);
    if (endpoint.is_error()) {
        return Err<void>(endpoint.error());
    }
    const sockaddr_in& remote = endpoint.value();
    if (::connect(socket_, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote)) != 0) {
        return Err<void>("connect " + describe_endpoint(remote) + " failed: " + last_socket_error());
    }

    peer_ = describe_endpoint(remote);
    spdlog::info("Connected to {}", peer_);
    return Ok();
}

Result<void> Socket::set_reuse_address(bool enable) {
    if (!is_valid()) {
        return not_open<void>();
    }
    const int flag = enable ? 1 : 0;
    if (::setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&flag),
                     sizeof(flag)) != 0) {
        return Err<void>("SO_REUSEADDR: " + last_socket_error());
    }
    return Ok();
}

Result<uint16_t> Socket::local_port() const {
    if (!is_valid()) {
        return not_open<uint16_t>();
    }
    sockaddr_in local{};
    socklen_t local_len = sizeof(local);
    if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&local), &local_len) != 0) {
        return Err<uint16_t>("getsockname() failed: " + last_socket_error());
    }
    return Ok(static_cast<uint16_t>(ntohs(local.sin_port)));
}

Result<void> Socket::write_all(const std::uint8_t* data, std::size_t size) {
    if (!is_valid()) {
        return not_open<void>();
    }

#ifdef MSG_NOSIGNAL
    constexpr int kSendFlags = MSG_NOSIGNAL;
#else
    constexpr int kSendFlags = 0;
#endif

    std::size_t total_sent = 0;
    while (total_sent < size) {
        auto sent = ::send(socket_,
                           reinterpret_cast<const char*>(data + total_sent),
                           static_cast<int>(size - total_sent), kSendFlags);
        if (sent < 0) {
#ifdef XFER_PLATFORM_LINUX
            if (errno == EINTR) {
                continue;
            }
#endif
            return Err<void>("send() failed: " + last_socket_error());
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return Ok();
}

Result<std::size_t> Socket::read_some(std::uint8_t* buffer, std::size_t max_size) {
    if (!is_valid()) {
        return not_open<std::size_t>();
    }

    while (true) {
        auto received = ::recv(socket_, reinterpret_cast<char*>(buffer), static_cast<int>(max_size), 0);
        if (received >= 0) {
            return Ok(static_cast<std::size_t>(received));
        }
#ifdef XFER_PLATFORM_LINUX
        if (errno == EINTR) {
            continue;
        }
#endif
        return Err<std::size_t>("recv() failed: " + last_socket_error());
    }
}

void Socket::shutdown() {
    if (is_valid()) {
        ::shutdown(socket_, SHUTDOWN_BOTH);
    }
}

void Socket::close() {
    if (!is_valid()) {
        return;
    }
    close_native_socket(std::exchange(socket_, INVALID_SOCKET_VALUE));
    spdlog::debug("Closed socket {}", peer_.empty() ? std::string("(unconnected)") : peer_);
}

} // namespace xfer::network
