#pragma once

#include "xfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace xfer::network {

/**
 * @brief Blocking, connection-oriented byte stream
 *
 * read_some() blocks until at least one byte is available and returns 0
 * once the peer has closed its side. close() may be called from another
 * thread and must wake any reader parked in read_some().
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual Result<void> write_all(const std::uint8_t* data, std::size_t size) = 0;
    virtual Result<std::size_t> read_some(std::uint8_t* buffer, std::size_t max_size) = 0;
    virtual void close() = 0;

    Result<void> write_all(const std::vector<std::uint8_t>& data) {
        return write_all(data.data(), data.size());
    }

    /// Reads until size bytes arrived or the stream ended. A short count means closed.
    Result<std::size_t> read_exact(std::uint8_t* buffer, std::size_t size);
};

} // namespace xfer::network
