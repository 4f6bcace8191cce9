#include "xfer/transfer/transmission.hpp"
#include "xfer/protocol/codec.hpp"
#include "xfer/transfer/reassembler.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

namespace xfer::transfer {

using protocol::ChunkMessage;
using protocol::EndOfTransmission;
using protocol::Message;
using protocol::MessageCodec;
using protocol::MetadataMessage;
using protocol::ResultMessage;

protocol::MetadataMessage to_message(const FileMetadata& metadata) {
    MetadataMessage m;
    m.filename = metadata.filename;
    m.total_size = metadata.total_size;
    m.chunk_size = metadata.chunk_size;
    m.total_chunks = metadata.total_chunks;
    m.checksum = metadata.checksum;
    return m;
}

FileMetadata from_message(const protocol::MetadataMessage& message) {
    FileMetadata metadata;
    metadata.filename = message.filename;
    metadata.total_size = message.total_size;
    metadata.chunk_size = message.chunk_size;
    metadata.total_chunks = message.total_chunks;
    metadata.checksum = message.checksum;
    return metadata;
}

// ════════════════════════════════════════════════════════
// Sender
// ════════════════════════════════════════════════════════

TransferResult<SendReport> ChunkSender::send(TransferSession& session,
                                             const FileMetadata& metadata,
                                             std::vector<ChunkRecord> chunks,
                                             FaultInjector* injector) {
    auto fail = [&session](TransferError error) {
        session.mark_failed(error);
        return Err<SendReport>(std::move(error));
    };

    if (auto started = session.begin(metadata); started.is_error()) {
        return Err<SendReport>(started.error());
    }

    SendReport report;
    report.chunks_planned = chunks.size();

    if (auto sent = MessageCodec::write_message(stream_, to_message(metadata)); sent.is_error()) {
        return fail(sent.error());
    }
    spdlog::debug("[{}] metadata sent: {} bytes in {} chunks, checksum {}", session.session_id(),
                  metadata.total_size, metadata.total_chunks, metadata.checksum);

    if (auto moved = session.transition_to(SessionState::Streaming); moved.is_error()) {
        return fail(moved.error());
    }

    if (injector != nullptr) {
        chunks = injector->apply(std::move(chunks));
        report.faults = injector->report();
    }

    for (auto& chunk : chunks) {
        const std::size_t size = chunk.data.size();
        ChunkMessage message{chunk.seq, std::move(chunk.data)};
        if (auto sent = MessageCodec::write_message(stream_, message); sent.is_error()) {
            return fail(sent.error());
        }
        ++report.chunks_sent;
        report.bytes_sent += size;
    }

    if (auto moved = session.transition_to(SessionState::AwaitingEot); moved.is_error()) {
        return fail(moved.error());
    }
    if (auto sent = MessageCodec::write_message(stream_, EndOfTransmission{}); sent.is_error()) {
        return fail(sent.error());
    }
    if (auto moved = session.transition_to(SessionState::Verifying); moved.is_error()) {
        return fail(moved.error());
    }

    spdlog::info("[{}] sent {}/{} chunks ({} dropped, {} corrupted{})", session.session_id(),
                 report.chunks_sent, report.chunks_planned, report.faults.dropped.size(),
                 report.faults.corrupted.size(), report.faults.reordered ? ", reordered" : "");
    return OkAs<SendReport, TransferError>(std::move(report));
}

TransferResult<ResultMessage> ChunkSender::await_verdict(TransferSession& session) {
    auto message = MessageCodec::read_message(stream_);
    if (message.is_error()) {
        session.mark_failed(message.error());
        return Err<ResultMessage>(message.error());
    }

    auto* verdict = std::get_if<ResultMessage>(&message.value());
    if (verdict == nullptr) {
        TransferError error(ErrorKind::FrameError,
                            std::string("expected result, got ") + protocol::type_name(message.value()));
        session.mark_failed(error);
        return Err<ResultMessage>(std::move(error));
    }

    if (!verdict->success) {
        auto error = verdict_error(*verdict);
        if (session.metadata()) {
            error.expected_checksum = session.metadata()->checksum;
        }
        session.mark_failed(error);
        return Err<ResultMessage>(std::move(error));
    }

    if (auto done = session.transition_to(SessionState::Success); done.is_error()) {
        return Err<ResultMessage>(done.error());
    }
    return OkAs<ResultMessage, TransferError>(std::move(*verdict));
}

// ════════════════════════════════════════════════════════
// Receiver
// ════════════════════════════════════════════════════════

TransferResult<FileMetadata> ChunkReceiver::read_metadata() {
    auto first = MessageCodec::read_message(stream_);
    if (first.is_error()) {
        return Err<FileMetadata>(first.error());
    }

    if (const auto* metadata = std::get_if<MetadataMessage>(&first.value())) {
        auto limits = Chunker::check_limits(metadata->total_size, metadata->chunk_size, metadata->total_chunks);
        if (limits.is_error()) {
            auto error = limits.error();
            error.message = "refusing metadata for '" + metadata->filename + "': " + error.message;
            return Err<FileMetadata>(std::move(error));
        }
        return OkAs<FileMetadata, TransferError>(from_message(*metadata));
    }
    if (const auto* refusal = std::get_if<ResultMessage>(&first.value())) {
        auto error = verdict_error(*refusal);
        error.message = "peer declined transfer: " + error.message;
        return Err<FileMetadata>(std::move(error));
    }
    return Fail<FileMetadata>(ErrorKind::FrameError,
                              std::string("expected metadata, got ") + protocol::type_name(first.value()));
}

TransferResult<ReceivedTransfer> ChunkReceiver::receive(TransferSession& session) {
    auto fail = [&session](TransferError error) {
        session.mark_failed(error);
        return Err<ReceivedTransfer>(std::move(error));
    };

    auto metadata = read_metadata();
    if (metadata.is_error()) {
        return fail(metadata.error());
    }
    if (auto started = session.begin(metadata.value()); started.is_error()) {
        return Err<ReceivedTransfer>(started.error());
    }
    spdlog::info("[{}] expecting {} bytes in {} chunks, checksum {}", session.session_id(),
                 metadata.value().total_size, metadata.value().total_chunks, metadata.value().checksum);

    if (auto moved = session.transition_to(SessionState::Streaming); moved.is_error()) {
        return fail(moved.error());
    }

    ReceivedTransfer received;
    bool end_seen = false;
    while (!end_seen) {
        // Frame-level failures end the attempt; envelope-level ones only skip the message.
        auto frame = MessageCodec::read_frame(stream_);
        if (frame.is_error()) {
            return fail(frame.error());
        }

        auto message = MessageCodec::decode_envelope(frame.value());
        if (message.is_error()) {
            spdlog::warn("[{}] ignoring malformed message: {}", session.session_id(), message.error().message);
            ++received.messages_skipped;
            continue;
        }

        std::visit([&](auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, ChunkMessage>) {
                const auto seq = m.seq;
                switch (session.accept_chunk(seq, std::move(m.data))) {
                    case ChunkVerdict::Accepted:
                        ++received.chunks_received;
                        spdlog::trace("[{}] chunk {} accepted", session.session_id(), seq);
                        break;
                    case ChunkVerdict::Duplicate:
                        spdlog::debug("[{}] duplicate chunk {} ignored", session.session_id(), seq);
                        break;
                    case ChunkVerdict::OutOfRange:
                        spdlog::warn("[{}] chunk {} outside [0, {})", session.session_id(), seq,
                                     session.metadata()->total_chunks);
                        ++received.messages_skipped;
                        break;
                    case ChunkVerdict::Oversize:
                        spdlog::warn("[{}] chunk {} larger than chunk_size", session.session_id(), seq);
                        ++received.messages_skipped;
                        break;
                }
            } else if constexpr (std::is_same_v<T, EndOfTransmission>) {
                end_seen = true;
            } else {
                spdlog::warn("[{}] unexpected {} message mid-stream", session.session_id(),
                             protocol::type_name(Message(m)));
                ++received.messages_skipped;
            }
        }, message.value());
    }

    if (auto moved = session.transition_to(SessionState::AwaitingEot); moved.is_error()) {
        return fail(moved.error());
    }
    if (auto moved = session.transition_to(SessionState::Verifying); moved.is_error()) {
        return fail(moved.error());
    }

    auto rebuilt = Reassembler::verify(metadata.value(), session.buffer());
    if (rebuilt.is_error()) {
        spdlog::warn("[{}] verification failed: {}", session.session_id(), rebuilt.error().describe());
        return fail(rebuilt.error());
    }

    if (auto done = session.transition_to(SessionState::Success); done.is_error()) {
        return Err<ReceivedTransfer>(done.error());
    }

    received.metadata = metadata.take_value();
    received.data = rebuilt.take_value();
    spdlog::info("[{}] verified {} bytes, checksum {}", session.session_id(), received.data.size(),
                 received.metadata.checksum);
    return OkAs<ReceivedTransfer, TransferError>(std::move(received));
}

TransferResult<void> ChunkReceiver::report(const TransferResult<ReceivedTransfer>& outcome) {
    return MessageCodec::write_message(stream_, make_verdict(outcome));
}

protocol::ResultMessage make_verdict(const TransferResult<ReceivedTransfer>& outcome) {
    ResultMessage verdict;
    if (outcome.is_ok()) {
        verdict.success = true;
        verdict.checksum = outcome.value().metadata.checksum;
        return verdict;
    }

    const auto& error = outcome.error();
    verdict.success = false;
    verdict.checksum = error.actual_checksum;
    verdict.error = to_string(error.kind);
    verdict.detail = error.message;
    if (error.missing.size() > kMaxReportedMissing) {
        verdict.missing.assign(error.missing.begin(),
                               error.missing.begin() + static_cast<std::ptrdiff_t>(kMaxReportedMissing));
        verdict.detail += " (" + std::to_string(error.missing.size()) + " missing, first " +
                          std::to_string(kMaxReportedMissing) + " listed)";
    } else {
        verdict.missing = error.missing;
    }
    return verdict;
}

TransferError verdict_error(const protocol::ResultMessage& verdict) {
    const auto kind = error_kind_from_string(verdict.error).value_or(ErrorKind::Io);
    TransferError error(kind, verdict.detail.empty() ? std::string("peer reported failure") : verdict.detail);
    error.missing = verdict.missing;
    error.actual_checksum = verdict.checksum;
    return error;
}

} // namespace xfer::transfer
