#pragma once

#include "xfer/core/config.hpp"
#include "xfer/core/error.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/network/socket.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/retry.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace xfer::service {

/**
 * @brief Client side of the transfer service
 *
 * Every upload or download runs under a RetryController: each attempt
 * sends a fresh request and restarts the whole transfer. An attempt that
 * loses the connection drops the socket, and the next attempt reconnects.
 * Uploads go through the client's fault injector, downloads through the
 * server's.
 */
class TransferClient {
public:
    explicit TransferClient(TransferConfig config, events::EventBus* bus = nullptr);
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    Result<void> connect();
    bool connected() const { return socket_ != nullptr; }

    transfer::Outcome upload_file(const std::filesystem::path& file);
    transfer::Outcome upload_buffer(const std::string& filename, const std::vector<std::uint8_t>& data);

    /// Downloads into memory, then writes output. The outcome's data stays filled either way.
    transfer::Outcome download_file(const std::string& filename, const std::filesystem::path& output);
    transfer::Outcome download_buffer(const std::string& filename);

    /// Tells the server we are done and closes the socket.
    void disconnect();

    const TransferConfig& config() const { return config_; }

private:
    TransferResult<void> ensure_connected();
    void drop_connection();

    TransferResult<transfer::AttemptSuccess> upload_attempt(const transfer::FileMetadata& metadata,
                                                            const std::vector<transfer::ChunkRecord>& chunks,
                                                            std::uint32_t attempt);
    TransferResult<transfer::AttemptSuccess> download_attempt(const std::string& filename,
                                                              std::uint32_t attempt);

    void log_outcome(const std::string& operation, const transfer::Outcome& outcome) const;

    TransferConfig config_;
    events::EventBus* bus_;
    std::unique_ptr<network::Socket> socket_;
};

} // namespace xfer::service
