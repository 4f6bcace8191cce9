#include "xfer/network/stream.hpp"

namespace xfer::network {

Result<std::size_t> ByteStream::read_exact(std::uint8_t* buffer, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        auto result = read_some(buffer + total, size - total);
        if (result.is_error()) {
            return result;
        }
        if (result.value() == 0) {
            break;
        }
        total += result.value();
    }
    return Ok(total);
}

} // namespace xfer::network
