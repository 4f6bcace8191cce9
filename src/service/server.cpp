#include "xfer/service/server.hpp"
#include "xfer/events/events.hpp"
#include "xfer/protocol/codec.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/fault_injector.hpp"
#include "xfer/transfer/session.hpp"
#include "xfer/transfer/transmission.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

namespace xfer::service {

using protocol::Command;
using protocol::MessageCodec;
using protocol::RequestMessage;
using protocol::ResultMessage;

Result<std::string> storage_name(const std::string& filename) {
    const auto name = std::filesystem::path(filename).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return Err<std::string, std::string>("invalid file name '" + filename + "'");
    }
    return Ok(name);
}

std::chrono::milliseconds accept_backoff(std::size_t consecutive_failures) {
    constexpr std::chrono::milliseconds kFirst{10};
    constexpr std::chrono::milliseconds kLongest{500};
    if (consecutive_failures == 0) {
        return std::chrono::milliseconds{0};
    }
    const auto doublings = std::min<std::size_t>(consecutive_failures - 1, 6);
    return std::min(kFirst * (1 << doublings), kLongest);
}

TransferServer::TransferServer(TransferConfig config, events::EventBus* bus)
    : config_(std::move(config))
    , bus_(bus) {
}

TransferServer::~TransferServer() {
    stop();
    join_all();
}

Result<void> TransferServer::listen() {
    if (auto valid = config_.validate(); valid.is_error()) {
        return Err<void, std::string>("invalid configuration: " + valid.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.storage_dir, ec);
    if (ec) {
        return Err<void, std::string>("cannot create storage directory " + config_.storage_dir.string() +
                                      ": " + ec.message());
    }

    auto create_result = listener_.create();
    if (create_result.is_error()) {
        return Err<void, std::string>("Failed to create listener socket: " + create_result.error());
    }

    auto reuse_result = listener_.set_reuse_address(true);
    if (reuse_result.is_error()) {
        spdlog::warn("Failed to set SO_REUSEADDR: {}", reuse_result.error());
    }

    auto bind_result = listener_.bind(config_.host, config_.port);
    if (bind_result.is_error()) {
        return Err<void, std::string>("Failed to bind to " + config_.host + ":" +
                                      std::to_string(config_.port) + " - " + bind_result.error());
    }

    auto listen_result = listener_.listen(128);
    if (listen_result.is_error()) {
        return Err<void, std::string>("Failed to listen: " + listen_result.error());
    }

    auto bound = listener_.local_port();
    port_.store(bound.is_ok() ? bound.value() : config_.port, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    publish(events::ServerStartedEvent{config_.host, port()});
    spdlog::debug("storage directory: {}", config_.storage_dir.string());
    return Ok();
}

Result<void> TransferServer::serve_forever() {
    if (!listener_.is_valid()) {
        return Err<void, std::string>("Server not initialized. Call listen() first.");
    }

    std::size_t accept_failures = 0;
    while (running_.load(std::memory_order_acquire)) {
        auto accept_result = listener_.accept();
        if (accept_result.is_error()) {
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
            // Persistent failures such as EMFILE would otherwise spin this loop.
            const auto pause = accept_backoff(++accept_failures);
            spdlog::error("Failed to accept connection: {} (retrying in {} ms)", accept_result.error(),
                          pause.count());
            std::this_thread::sleep_for(pause);
            continue;
        }
        accept_failures = 0;

        reap_finished();

        auto context = std::make_shared<ConnectionContext>();
        context->socket = std::move(accept_result.value());
        context->peer = context->socket->peer();

        std::lock_guard lock(workers_mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            // stop() ran between accept and here and will not see this socket.
            context->socket->close();
            break;
        }
        context->id = next_connection_id_++;
        ++connections_served_;

        Worker& worker = workers_[context->id];
        worker.context = context;
        worker.thread = std::thread([this, context]() {
            handle_connection(*context);
            context->socket->shutdown();
            context->finished.store(true, std::memory_order_release);
        });
    }

    join_all();
    listener_.close();

    std::size_t served = 0;
    {
        std::lock_guard lock(workers_mutex_);
        served = connections_served_;
    }
    publish(events::ServerStoppedEvent{served});
    return Ok();
}

void TransferServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    spdlog::info("Stopping transfer server...");
    listener_.shutdown();

    std::lock_guard lock(workers_mutex_);
    for (auto& [id, worker] : workers_) {
        if (!worker.context->finished.load(std::memory_order_acquire)) {
            worker.context->socket->shutdown();
        }
    }
}

void TransferServer::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second.context->finished.load(std::memory_order_acquire)) {
                done.push_back(std::move(it->second.thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : done) {
        thread.join();
    }
}

void TransferServer::join_all() {
    std::map<std::uint64_t, Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& [id, worker] : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

// ════════════════════════════════════════════════════════
// Per-connection request loop
// ════════════════════════════════════════════════════════

void TransferServer::handle_connection(ConnectionContext& ctx) {
    publish(events::ConnectionOpenedEvent{ctx.id, ctx.peer});

    while (running_.load(std::memory_order_acquire)) {
        auto frame = MessageCodec::read_frame(*ctx.socket);
        if (frame.is_error()) {
            if (frame.error().kind == ErrorKind::ConnectionClosed) {
                spdlog::debug("[conn {}] peer closed", ctx.id);
            } else {
                spdlog::warn("[conn {}] dropping connection: {}", ctx.id, frame.error().describe());
            }
            break;
        }
        ctx.bytes_received += frame.value().size() + MessageCodec::kPrefixSize;

        auto message = MessageCodec::decode_envelope(frame.value());
        if (message.is_error()) {
            spdlog::warn("[conn {}] malformed request: {}", ctx.id, message.error().message);
            if (!reply_failure(ctx, ErrorKind::FrameError, message.error().message)) {
                break;
            }
            continue;
        }

        const auto* request = std::get_if<RequestMessage>(&message.value());
        if (request == nullptr) {
            const std::string detail = std::string("expected request, got ") + protocol::type_name(message.value());
            spdlog::warn("[conn {}] {}", ctx.id, detail);
            if (!reply_failure(ctx, ErrorKind::InvalidState, detail)) {
                break;
            }
            continue;
        }

        ++ctx.requests_handled;
        spdlog::debug("[conn {}] {} '{}' attempt {}", ctx.id, protocol::to_string(request->command),
                      request->filename, request->attempt);

        bool keep_going = true;
        switch (request->command) {
            case Command::Upload:
                keep_going = handle_upload(ctx, *request);
                break;
            case Command::Download:
                keep_going = handle_download(ctx, *request);
                break;
            case Command::Disconnect:
                spdlog::info("[conn {}] client disconnected", ctx.id);
                keep_going = false;
                break;
        }
        if (!keep_going) {
            break;
        }
    }

    publish(events::ConnectionClosedEvent{ctx.id, ctx.peer, ctx.requests_handled});
}

bool TransferServer::reply_failure(ConnectionContext& ctx, ErrorKind kind, const std::string& detail) {
    ResultMessage verdict;
    verdict.success = false;
    verdict.error = to_string(kind);
    verdict.detail = detail;
    auto sent = MessageCodec::write_message(*ctx.socket, verdict);
    if (sent.is_error()) {
        spdlog::warn("[conn {}] cannot send reply: {}", ctx.id, sent.error().describe());
        return false;
    }
    return true;
}

bool TransferServer::handle_upload(ConnectionContext& ctx, const RequestMessage& request) {
    using namespace transfer;

    events::ServerTransferEvent report;
    report.connection_id = ctx.id;
    report.command = "upload";
    report.filename = request.filename;
    report.attempt = request.attempt;

    TransferSession session("conn" + std::to_string(ctx.id) + "-up" + std::to_string(request.attempt),
                            SessionRole::Receiver);
    ChunkReceiver receiver(*ctx.socket);
    auto outcome = receiver.receive(session);

    if (outcome.is_error() && !session.metadata()) {
        // Never got as far as metadata; the stream is not in a known state.
        report.detail = outcome.error().describe();
        publish(report);
        return false;
    }
    if (outcome.is_error() && (outcome.error().kind == ErrorKind::ConnectionClosed ||
                               outcome.error().kind == ErrorKind::FrameError)) {
        report.detail = outcome.error().describe();
        publish(report);
        return false;
    }

    if (outcome.is_ok()) {
        auto name = storage_name(outcome.value().metadata.filename);
        if (name.is_error()) {
            outcome = Fail<ReceivedTransfer>(ErrorKind::InvalidArgument, name.error());
        } else {
            auto target = config_.storage_dir / name.value();
            auto stored = write_file(target, outcome.value().data);
            if (stored.is_error()) {
                outcome = Err<ReceivedTransfer>(stored.error());
            } else {
                spdlog::info("[conn {}] stored {} ({} bytes)", ctx.id, target.string(),
                             outcome.value().data.size());
                report.success = true;
                report.bytes = outcome.value().data.size();
                ctx.bytes_received += report.bytes;
            }
        }
    }
    if (outcome.is_error()) {
        report.detail = outcome.error().describe();
    }

    auto replied = receiver.report(outcome);
    publish(report);
    if (replied.is_error()) {
        spdlog::warn("[conn {}] cannot send verdict: {}", ctx.id, replied.error().describe());
        return false;
    }
    return true;
}

bool TransferServer::handle_download(ConnectionContext& ctx, const RequestMessage& request) {
    using namespace transfer;

    events::ServerTransferEvent report;
    report.connection_id = ctx.id;
    report.command = "download";
    report.filename = request.filename;
    report.attempt = request.attempt;

    auto name = storage_name(request.filename);
    if (name.is_error()) {
        report.detail = name.error();
        publish(report);
        return reply_failure(ctx, ErrorKind::InvalidArgument, name.error());
    }

    auto contents = read_file(config_.storage_dir / name.value());
    if (contents.is_error()) {
        report.detail = contents.error().message;
        publish(report);
        return reply_failure(ctx, ErrorKind::Io, "file not found: " + name.value());
    }

    auto chunked = Chunker::split(contents.value(), config_.chunk_size);
    if (chunked.is_error()) {
        report.detail = chunked.error().describe();
        publish(report);
        return reply_failure(ctx, chunked.error().kind, chunked.error().message);
    }
    auto metadata = Chunker::make_metadata(name.value(), contents.value(), chunked.value(), config_.chunk_size);
    if (metadata.is_error()) {
        report.detail = metadata.error().describe();
        publish(report);
        return reply_failure(ctx, metadata.error().kind, metadata.error().message);
    }

    TransferSession session("conn" + std::to_string(ctx.id) + "-down" + std::to_string(request.attempt),
                            SessionRole::Sender);
    ChunkSender sender(*ctx.socket);

    auto policy = FaultPolicy::from_config(config_, request.attempt);
    FaultInjector injector(policy);
    auto sent = sender.send(session, metadata.value(), std::move(chunked.value().chunks),
                            policy.enabled() ? &injector : nullptr);
    if (sent.is_error()) {
        report.detail = sent.error().describe();
        publish(report);
        return false;
    }
    ctx.bytes_sent += sent.value().bytes_sent;

    const auto& faults = sent.value().faults;
    if (!faults.dropped.empty() || !faults.corrupted.empty() || faults.reordered) {
        publish(events::ChunksFaultedEvent{session.session_id(), faults.dropped, faults.corrupted, faults.reordered});
    }

    auto verdict = sender.await_verdict(session);
    if (verdict.is_error()) {
        report.detail = verdict.error().describe();
        publish(report);
        return verdict.error().kind != ErrorKind::ConnectionClosed &&
               verdict.error().kind != ErrorKind::FrameError;
    }

    report.success = true;
    report.bytes = metadata.value().total_size;
    publish(report);
    return true;
}

} // namespace xfer::service
