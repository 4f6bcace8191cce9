#pragma once

#include "xfer/core/error.hpp"
#include "xfer/network/stream.hpp"
#include "xfer/protocol/message.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/fault_injector.hpp"
#include "xfer/transfer/session.hpp"

#include <cstddef>
#include <vector>

namespace xfer::transfer {

struct SendReport {
    std::size_t chunks_planned = 0;
    std::size_t chunks_sent = 0;
    std::size_t bytes_sent = 0;
    FaultReport faults;
};

/**
 * @brief Sending half of one attempt: metadata, chunk stream, end marker
 */
class ChunkSender {
public:
    explicit ChunkSender(network::ByteStream& stream) : stream_(stream) {}

    /**
     * @brief Streams one attempt and leaves the session in Verifying
     *
     * When an injector is given, the chunk stream passes through it after
     * metadata has been sent, so the declared metadata always describes the
     * unfaulted buffer.
     */
    TransferResult<SendReport> send(TransferSession& session,
                                    const FileMetadata& metadata,
                                    std::vector<ChunkRecord> chunks,
                                    FaultInjector* injector = nullptr);

    /// Reads the receiver's ResultMessage and settles the session to Success or Failed.
    TransferResult<protocol::ResultMessage> await_verdict(TransferSession& session);

private:
    network::ByteStream& stream_;
};

struct ReceivedTransfer {
    FileMetadata metadata;
    std::vector<std::uint8_t> data;
    std::size_t chunks_received = 0;
    std::size_t messages_skipped = 0;
};

/**
 * @brief Receiving half of one attempt
 *
 * The first message must be metadata; anything else is fatal. After that,
 * structurally invalid messages are logged and skipped so one bad frame
 * does not hide the remaining chunks. Reading stops at end-of-transmission,
 * then the receive buffer goes to the Reassembler.
 */
class ChunkReceiver {
public:
    explicit ChunkReceiver(network::ByteStream& stream) : stream_(stream) {}

    TransferResult<ReceivedTransfer> receive(TransferSession& session);

    /// Sends the verdict for a finished receive back to the sender.
    TransferResult<void> report(const TransferResult<ReceivedTransfer>& outcome);

private:
    TransferResult<FileMetadata> read_metadata();

    network::ByteStream& stream_;
};

/// Longest missing list a verdict carries; the detail text still gives the full count.
inline constexpr std::size_t kMaxReportedMissing = 1024;

/// Builds the verdict message sent back for a finished receive.
protocol::ResultMessage make_verdict(const TransferResult<ReceivedTransfer>& outcome);

/// Error equivalent of a failed verdict, used by the sending side.
TransferError verdict_error(const protocol::ResultMessage& verdict);

protocol::MetadataMessage to_message(const FileMetadata& metadata);
FileMetadata from_message(const protocol::MetadataMessage& message);

} // namespace xfer::transfer
