#pragma once

#include "xfer/core/error.hpp"
#include "xfer/network/stream.hpp"
#include "xfer/protocol/message.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace xfer::protocol {

/**
 * @brief Length-prefixed JSON envelope codec
 *
 * Frame layout:
 *   [4 bytes big-endian length N][N bytes UTF-8 JSON envelope]
 *
 * Binary payloads travel hex-encoded inside the envelope, so the envelope
 * is always valid text.
 */
class MessageCodec {
public:
    static constexpr std::size_t kPrefixSize = 4;
    static constexpr std::uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

    /// Full frame: prefix followed by the envelope. FrameError when the envelope exceeds kMaxFrameSize.
    static TransferResult<std::vector<std::uint8_t>> encode(const Message& message);

    /// Envelope bytes only (no prefix). Schema violations are FrameError.
    static TransferResult<Message> decode_envelope(const std::vector<std::uint8_t>& envelope);

    /// Decodes one complete frame held in memory.
    static TransferResult<Message> decode(const std::vector<std::uint8_t>& frame);

    /**
     * @brief Reads one frame's envelope bytes from the stream
     *
     * Blocks until the prefix and the declared payload are complete.
     * ConnectionClosed when the stream ends cleanly between frames,
     * FrameError when it ends inside a frame or the prefix is unusable.
     */
    static TransferResult<std::vector<std::uint8_t>> read_frame(network::ByteStream& stream);

    static TransferResult<Message> read_message(network::ByteStream& stream);

    static TransferResult<void> write_message(network::ByteStream& stream, const Message& message);
};

} // namespace xfer::protocol
