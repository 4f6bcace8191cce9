/**
 * @file events.hpp
 * @brief Events raised by the transfer engine and the service layer
 *
 * Events are past-tense facts. They carry enough context to be logged on
 * their own; subscribers never call back into the emitter.
 */

#pragma once

#include "xfer/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace xfer::events {

// ════════════════════════════════════════════════════════
// Retry controller
// ════════════════════════════════════════════════════════

struct AttemptStartedEvent {
    std::string operation;   // e.g. "upload report.pdf"
    std::uint32_t attempt = 0;
    std::uint32_t max_attempts = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct AttemptFailedEvent {
    std::string operation;
    std::uint32_t attempt = 0;
    TransferError error;
    bool will_retry = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferSucceededEvent {
    std::string operation;
    std::uint32_t attempts = 0;
    std::uint64_t bytes = 0;
    std::string checksum;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    std::string operation;
    std::uint32_t attempts = 0;
    TransferError error;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Fault injection
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted by a sender after its injector touched the chunk stream
 *
 * Only raised when at least one fault was applied.
 */
struct ChunksFaultedEvent {
    std::string session_id;
    std::vector<std::uint32_t> dropped;
    std::vector<std::uint32_t> corrupted;
    bool reordered = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server lifecycle
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::string host;
    std::uint16_t port = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ServerStoppedEvent {
    std::size_t connections_served = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConnectionOpenedEvent {
    std::uint64_t connection_id = 0;
    std::string peer;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConnectionClosedEvent {
    std::uint64_t connection_id = 0;
    std::string peer;
    std::size_t requests_handled = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief One upload or download handled by the server, either outcome
 */
struct ServerTransferEvent {
    std::uint64_t connection_id = 0;
    std::string command;     // "upload" or "download"
    std::string filename;
    std::uint32_t attempt = 0;
    bool success = false;
    std::uint64_t bytes = 0;
    std::string detail;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace xfer::events
