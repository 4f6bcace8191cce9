#include "xfer/transfer/session.hpp"

#include <spdlog/spdlog.h>

namespace xfer::transfer {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    if (target == SessionState::Failed) {
        return true;
    }
    switch (current) {
        case SessionState::Init: return target == SessionState::MetadataSent;
        case SessionState::MetadataSent: return target == SessionState::Streaming;
        case SessionState::Streaming: return target == SessionState::AwaitingEot;
        case SessionState::AwaitingEot: return target == SessionState::Verifying;
        case SessionState::Verifying: return target == SessionState::Success;
        default: return false;
    }
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Init: return "INIT";
        case SessionState::MetadataSent: return "METADATA_SENT";
        case SessionState::Streaming: return "STREAMING";
        case SessionState::AwaitingEot: return "AWAITING_EOT";
        case SessionState::Verifying: return "VERIFYING";
        case SessionState::Success: return "SUCCESS";
        case SessionState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

TransferSession::TransferSession(std::string session_id, SessionRole role)
    : session_id_(std::move(session_id))
    , role_(role)
    , started_at_(std::chrono::steady_clock::now()) {
}

TransferResult<void> TransferSession::transition_to(SessionState next_state) {
    if (state_ == next_state) {
        return {};
    }

    if (!can_transition(next_state)) {
        return Fail<void>(ErrorKind::InvalidState,
                          std::string("Illegal session state transition ") + to_string(state_) + " -> " +
                          to_string(next_state));
    }

    spdlog::trace("[{}] {} -> {}", session_id_, to_string(state_), to_string(next_state));
    state_ = next_state;
    return {};
}

TransferResult<void> TransferSession::mark_failed(TransferError error) {
    if (state_ == SessionState::Success) {
        return Fail<void>(ErrorKind::InvalidState, "Session already succeeded");
    }
    last_error_ = std::move(error);
    return transition_to(SessionState::Failed);
}

TransferResult<void> TransferSession::begin(FileMetadata metadata) {
    if (state_ != SessionState::Init) {
        return Fail<void>(ErrorKind::InvalidState, "Session already started");
    }
    metadata_ = std::move(metadata);
    return transition_to(SessionState::MetadataSent);
}

ChunkVerdict TransferSession::accept_chunk(std::uint32_t seq, std::vector<std::uint8_t> data) {
    if (!metadata_ || seq >= metadata_->total_chunks) {
        return ChunkVerdict::OutOfRange;
    }
    if (data.size() > metadata_->chunk_size) {
        return ChunkVerdict::Oversize;
    }
    const bool inserted = buffer_.emplace(seq, std::move(data)).second;
    return inserted ? ChunkVerdict::Accepted : ChunkVerdict::Duplicate;
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (finished()) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace xfer::transfer
