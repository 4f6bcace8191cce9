#include "xfer/service/client.hpp"
#include "xfer/events/events.hpp"
#include "xfer/protocol/codec.hpp"
#include "xfer/transfer/fault_injector.hpp"
#include "xfer/transfer/session.hpp"
#include "xfer/transfer/transmission.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace xfer::service {

using protocol::Command;
using protocol::MessageCodec;
using protocol::RequestMessage;
using transfer::AttemptSuccess;
using transfer::Outcome;

namespace {

bool connection_lost(const TransferError& error) {
    return error.kind == ErrorKind::ConnectionClosed || error.kind == ErrorKind::FrameError;
}

Outcome failed_before_start(TransferError error) {
    Outcome outcome;
    outcome.error = std::move(error);
    return outcome;
}

} // namespace

TransferClient::TransferClient(TransferConfig config, events::EventBus* bus)
    : config_(std::move(config))
    , bus_(bus) {
}

TransferClient::~TransferClient() {
    if (socket_) {
        socket_->close();
    }
}

Result<void> TransferClient::connect() {
    if (socket_) {
        return Ok();
    }

    auto socket = std::make_unique<network::Socket>();
    auto created = socket->create();
    if (created.is_error()) {
        return Err<void, std::string>("Failed to create socket: " + created.error());
    }
    auto connected = socket->connect(config_.host, config_.port);
    if (connected.is_error()) {
        return Err<void, std::string>(connected.error());
    }

    spdlog::info("Connected to {}:{}", config_.host, config_.port);
    socket_ = std::move(socket);
    return Ok();
}

TransferResult<void> TransferClient::ensure_connected() {
    auto connected = connect();
    if (connected.is_error()) {
        return Err<void>(TransferError(ErrorKind::ConnectionClosed, connected.error()));
    }
    return {};
}

void TransferClient::drop_connection() {
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

void TransferClient::disconnect() {
    if (!socket_) {
        return;
    }
    RequestMessage bye;
    bye.command = Command::Disconnect;
    auto sent = MessageCodec::write_message(*socket_, bye);
    if (sent.is_error()) {
        spdlog::debug("disconnect request not delivered: {}", sent.error().describe());
    }
    drop_connection();
    spdlog::info("Disconnected from {}:{}", config_.host, config_.port);
}

// ════════════════════════════════════════════════════════
// Upload
// ════════════════════════════════════════════════════════

Outcome TransferClient::upload_file(const std::filesystem::path& file) {
    auto contents = transfer::read_file(file);
    if (contents.is_error()) {
        auto outcome = failed_before_start(contents.error());
        log_outcome("upload " + file.string(), outcome);
        return outcome;
    }
    return upload_buffer(file.filename().string(), contents.value());
}

Outcome TransferClient::upload_buffer(const std::string& filename, const std::vector<std::uint8_t>& data) {
    const std::string name = std::filesystem::path(filename).filename().string();
    const std::string operation = "upload " + name;

    auto chunked = transfer::Chunker::split(data, config_.chunk_size);
    if (chunked.is_error()) {
        auto outcome = failed_before_start(chunked.error());
        log_outcome(operation, outcome);
        return outcome;
    }
    auto metadata = transfer::Chunker::make_metadata(name, data, chunked.value(), config_.chunk_size);
    if (metadata.is_error()) {
        auto outcome = failed_before_start(metadata.error());
        log_outcome(operation, outcome);
        return outcome;
    }

    spdlog::info("Uploading {} ({} bytes, {} chunks, sha256 {})", name, metadata.value().total_size,
                 metadata.value().total_chunks, metadata.value().checksum);

    transfer::RetryController controller(operation, bus_);
    auto outcome = controller.run(
        [&](std::uint32_t attempt) {
            return upload_attempt(metadata.value(), chunked.value().chunks, attempt);
        },
        config_.max_retries);
    log_outcome(operation, outcome);
    return outcome;
}

TransferResult<AttemptSuccess> TransferClient::upload_attempt(const transfer::FileMetadata& metadata,
                                                              const std::vector<transfer::ChunkRecord>& chunks,
                                                              std::uint32_t attempt) {
    if (auto ready = ensure_connected(); ready.is_error()) {
        return Err<AttemptSuccess>(ready.error());
    }

    RequestMessage request;
    request.command = Command::Upload;
    request.filename = metadata.filename;
    request.attempt = attempt;
    if (auto sent = MessageCodec::write_message(*socket_, request); sent.is_error()) {
        drop_connection();
        return Err<AttemptSuccess>(sent.error());
    }

    transfer::TransferSession session("upload-" + metadata.filename + "#" + std::to_string(attempt),
                                      transfer::SessionRole::Sender);
    transfer::ChunkSender sender(*socket_);

    auto policy = transfer::FaultPolicy::from_config(config_, attempt);
    transfer::FaultInjector injector(policy);
    auto sent = sender.send(session, metadata, chunks, policy.enabled() ? &injector : nullptr);
    if (sent.is_error()) {
        drop_connection();
        return Err<AttemptSuccess>(sent.error());
    }

    const auto& faults = sent.value().faults;
    if (bus_ != nullptr && (!faults.dropped.empty() || !faults.corrupted.empty() || faults.reordered)) {
        bus_->emit(events::ChunksFaultedEvent{session.session_id(), faults.dropped, faults.corrupted,
                                              faults.reordered});
    }

    auto verdict = sender.await_verdict(session);
    if (verdict.is_error()) {
        if (connection_lost(verdict.error())) {
            drop_connection();
        }
        return Err<AttemptSuccess>(verdict.error());
    }

    AttemptSuccess success;
    success.checksum = verdict.value().checksum;
    return OkAs<AttemptSuccess, TransferError>(std::move(success));
}

// ════════════════════════════════════════════════════════
// Download
// ════════════════════════════════════════════════════════

Outcome TransferClient::download_buffer(const std::string& filename) {
    const std::string operation = "download " + filename;
    spdlog::info("Downloading {}", filename);

    transfer::RetryController controller(operation, bus_);
    auto outcome = controller.run(
        [&](std::uint32_t attempt) { return download_attempt(filename, attempt); },
        config_.max_retries);
    log_outcome(operation, outcome);
    return outcome;
}

Outcome TransferClient::download_file(const std::string& filename, const std::filesystem::path& output) {
    auto outcome = download_buffer(filename);
    if (!outcome.success) {
        return outcome;
    }

    auto written = transfer::write_file(output, outcome.data);
    if (written.is_error()) {
        spdlog::error("Cannot save {}: {}", output.string(), written.error().describe());
        outcome.success = false;
        outcome.error = written.error();
        return outcome;
    }
    spdlog::info("Saved {} ({} bytes)", output.string(), outcome.data.size());
    return outcome;
}

TransferResult<AttemptSuccess> TransferClient::download_attempt(const std::string& filename,
                                                                std::uint32_t attempt) {
    if (auto ready = ensure_connected(); ready.is_error()) {
        return Err<AttemptSuccess>(ready.error());
    }

    RequestMessage request;
    request.command = Command::Download;
    request.filename = filename;
    request.attempt = attempt;
    if (auto sent = MessageCodec::write_message(*socket_, request); sent.is_error()) {
        drop_connection();
        return Err<AttemptSuccess>(sent.error());
    }

    transfer::TransferSession session("download-" + filename + "#" + std::to_string(attempt),
                                      transfer::SessionRole::Receiver);
    transfer::ChunkReceiver receiver(*socket_);
    auto received = receiver.receive(session);

    if (received.is_error()) {
        if (connection_lost(received.error())) {
            drop_connection();
            return Err<AttemptSuccess>(received.error());
        }
        // A refusal arrives in place of metadata and needs no verdict.
        if (session.metadata()) {
            if (auto replied = receiver.report(received); replied.is_error()) {
                drop_connection();
            }
        }
        return Err<AttemptSuccess>(received.error());
    }

    if (auto replied = receiver.report(received); replied.is_error()) {
        spdlog::warn("verdict not delivered: {}", replied.error().describe());
        drop_connection();
    }

    AttemptSuccess success;
    success.checksum = received.value().metadata.checksum;
    success.data = std::move(received.value().data);
    return OkAs<AttemptSuccess, TransferError>(std::move(success));
}

void TransferClient::log_outcome(const std::string& operation, const Outcome& outcome) const {
    const double seconds = std::chrono::duration<double>(outcome.elapsed).count();
    if (outcome.success) {
        spdlog::info("Transfer successful, time taken: {:.3f} s ({} attempt{}, sha256 {})",
                     seconds, outcome.attempts, outcome.attempts == 1 ? "" : "s", outcome.checksum);
        return;
    }

    const TransferError fallback(ErrorKind::Io, "unknown failure");
    const TransferError& error = outcome.error ? *outcome.error : fallback;
    spdlog::error("{} failed after {} attempt(s): {}", operation, outcome.attempts, error.describe());
    if (outcome.last_failure && outcome.last_failure->kind != error.kind) {
        spdlog::error("  last attempt: {}", outcome.last_failure->describe());
    }
}

} // namespace xfer::service
