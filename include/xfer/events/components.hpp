/**
 * @file components.hpp
 * @brief Subscribers that turn transfer events into logs and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "xfer/events/event_bus.hpp"
#include "xfer/events/events.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cstdint>

namespace xfer::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Attempt-level events go to debug or warn; final outcomes and server
 * lifecycle go to info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<AttemptStartedEvent>([](const AttemptStartedEvent& e) {
            spdlog::debug("[AttemptStarted] op={} attempt={}/{}", e.operation, e.attempt, e.max_attempts);
        });

        bus.subscribe<AttemptFailedEvent>([](const AttemptFailedEvent& e) {
            spdlog::warn("[AttemptFailed] op={} attempt={} {}{}", e.operation, e.attempt,
                         e.error.describe(), e.will_retry ? " (retrying)" : "");
        });

        bus.subscribe<TransferSucceededEvent>([](const TransferSucceededEvent& e) {
            spdlog::info("[TransferSucceeded] op={} attempts={} bytes={} sha256={} duration={}ms",
                         e.operation, e.attempts, e.bytes, e.checksum, e.duration.count());
        });

        bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
            spdlog::error("[TransferFailed] op={} attempts={} {} duration={}ms",
                          e.operation, e.attempts, e.error.describe(), e.duration.count());
        });

        bus.subscribe<ChunksFaultedEvent>([](const ChunksFaultedEvent& e) {
            spdlog::info("[ChunksFaulted] session={} dropped={} corrupted={} reordered={}",
                         e.session_id, e.dropped.size(), e.corrupted.size(), e.reordered);
        });

        bus.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Transfer server listening on {}:{}", e.host, e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus.subscribe<ServerStoppedEvent>([](const ServerStoppedEvent& e) {
            spdlog::info("Transfer server stopped after {} connections", e.connections_served);
        });

        bus.subscribe<ConnectionOpenedEvent>([](const ConnectionOpenedEvent& e) {
            spdlog::info("[ConnectionOpened] id={} peer={}", e.connection_id, e.peer);
        });

        bus.subscribe<ConnectionClosedEvent>([](const ConnectionClosedEvent& e) {
            spdlog::info("[ConnectionClosed] id={} peer={} requests={}",
                         e.connection_id, e.peer, e.requests_handled);
        });

        bus.subscribe<ServerTransferEvent>([](const ServerTransferEvent& e) {
            if (e.success) {
                spdlog::info("[{}] conn={} file={} attempt={} bytes={}",
                             e.command, e.connection_id, e.filename, e.attempt, e.bytes);
            } else {
                spdlog::warn("[{}] conn={} file={} attempt={} failed: {}",
                             e.command, e.connection_id, e.filename, e.attempt, e.detail);
            }
        });
    }
};

/**
 * @brief Atomic counters over transfer events
 */
class MetricsComponent {
public:
    static constexpr std::size_t kKindCount = static_cast<std::size_t>(ErrorKind::Io) + 1;

    struct Stats {
        std::atomic<std::uint64_t> attempts_started{0};
        std::atomic<std::uint64_t> attempts_failed{0};
        std::atomic<std::uint64_t> transfers_succeeded{0};
        std::atomic<std::uint64_t> transfers_failed{0};
        std::atomic<std::uint64_t> bytes_transferred{0};
        std::atomic<std::uint64_t> chunks_dropped{0};
        std::atomic<std::uint64_t> chunks_corrupted{0};
        std::atomic<std::uint64_t> connections{0};
        std::array<std::atomic<std::uint64_t>, kKindCount> failures_by_kind{};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<AttemptStartedEvent>([this](const AttemptStartedEvent&) {
            stats_.attempts_started++;
        });

        bus.subscribe<AttemptFailedEvent>([this](const AttemptFailedEvent& e) {
            stats_.attempts_failed++;
            stats_.failures_by_kind[static_cast<std::size_t>(e.error.kind)]++;
        });

        bus.subscribe<TransferSucceededEvent>([this](const TransferSucceededEvent& e) {
            stats_.transfers_succeeded++;
            stats_.bytes_transferred += e.bytes;
        });

        bus.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });

        bus.subscribe<ChunksFaultedEvent>([this](const ChunksFaultedEvent& e) {
            stats_.chunks_dropped += e.dropped.size();
            stats_.chunks_corrupted += e.corrupted.size();
        });

        bus.subscribe<ConnectionOpenedEvent>([this](const ConnectionOpenedEvent&) {
            stats_.connections++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    std::uint64_t failures(ErrorKind kind) const {
        return stats_.failures_by_kind[static_cast<std::size_t>(kind)].load();
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer statistics:");
        spdlog::info("  Attempts started:    {}", stats_.attempts_started.load());
        spdlog::info("  Attempts failed:     {}", stats_.attempts_failed.load());
        spdlog::info("  Transfers succeeded: {}", stats_.transfers_succeeded.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Bytes transferred:   {}", stats_.bytes_transferred.load());
        spdlog::info("  Chunks dropped:      {}", stats_.chunks_dropped.load());
        spdlog::info("  Chunks corrupted:    {}", stats_.chunks_corrupted.load());
        for (std::size_t i = 0; i < kKindCount; ++i) {
            if (auto n = stats_.failures_by_kind[i].load(); n > 0) {
                spdlog::info("  {:<20} {}", to_string(static_cast<ErrorKind>(i)), n);
            }
        }
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace xfer::events
