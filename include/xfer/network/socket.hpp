#pragma once

#include "xfer/core/platform.hpp"
#include "xfer/core/result.hpp"
#include "xfer/network/stream.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace xfer::network {

/**
 * @brief RAII wrapper around a blocking TCP socket
 *
 * Listening sockets use bind/listen/accept; connected sockets are used
 * through the ByteStream interface. shutdown() is safe to call from another
 * thread while a read or accept is blocked: the blocked call returns.
 */
class Socket : public ByteStream {
public:
    Socket();
    ~Socket() override;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Result<void> create();
    Result<void> bind(const std::string& address, uint16_t port);
    Result<void> listen(int backlog = 5);
    Result<std::unique_ptr<Socket>> accept();
    Result<void> connect(const std::string& address, uint16_t port);

    Result<void> set_reuse_address(bool enable);

    /// Port actually bound, useful after binding port 0.
    Result<uint16_t> local_port() const;

    using ByteStream::write_all;
    Result<void> write_all(const std::uint8_t* data, std::size_t size) override;
    Result<std::size_t> read_some(std::uint8_t* buffer, std::size_t max_size) override;

    void shutdown();
    void close() override;
    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }

    socket_t native_handle() const { return socket_; }
    const std::string& peer() const { return peer_; }

private:
    Socket(socket_t socket, std::string peer);

    socket_t socket_;
    std::string peer_;

    static Result<void> initialize_platform();
};

} // namespace xfer::network
