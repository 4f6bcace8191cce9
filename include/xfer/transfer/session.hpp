#pragma once

#include "xfer/core/error.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/reassembler.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace xfer::transfer {

enum class SessionState {
    Init,
    MetadataSent,
    Streaming,
    AwaitingEot,
    Verifying,
    Success,
    Failed
};

const char* to_string(SessionState state) noexcept;

enum class SessionRole {
    Sender,
    Receiver
};

enum class ChunkVerdict {
    Accepted,
    Duplicate,
    OutOfRange,
    Oversize
};

/**
 * @brief State of one transfer attempt on one side of the connection
 *
 * Created when an attempt starts and dropped when it ends, whatever the
 * outcome. Failed and Success are terminal: a failed session is never
 * resumed, the next attempt gets a fresh session.
 */
class TransferSession {
public:
    TransferSession(std::string session_id, SessionRole role);

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] SessionRole role() const noexcept { return role_; }
    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] bool finished() const noexcept {
        return state_ == SessionState::Success || state_ == SessionState::Failed;
    }

    TransferResult<void> transition_to(SessionState next_state);
    TransferResult<void> mark_failed(TransferError error);

    /// Records the expected metadata and moves Init -> MetadataSent.
    TransferResult<void> begin(FileMetadata metadata);

    [[nodiscard]] const std::optional<FileMetadata>& metadata() const noexcept { return metadata_; }

    /// Files a chunk into the receive buffer; the first copy of a sequence number wins.
    ChunkVerdict accept_chunk(std::uint32_t seq, std::vector<std::uint8_t> data);

    [[nodiscard]] const ReceiveBuffer& buffer() const noexcept { return buffer_; }
    [[nodiscard]] const std::optional<TransferError>& last_error() const noexcept { return last_error_; }

    [[nodiscard]] std::chrono::steady_clock::duration elapsed() const noexcept {
        return std::chrono::steady_clock::now() - started_at_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    std::string session_id_;
    SessionRole role_;
    SessionState state_ = SessionState::Init;
    std::optional<FileMetadata> metadata_;
    ReceiveBuffer buffer_;
    std::optional<TransferError> last_error_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace xfer::transfer
