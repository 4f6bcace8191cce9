#pragma once

#include "xfer/core/config.hpp"
#include "xfer/core/error.hpp"
#include "xfer/core/result.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/network/socket.hpp"
#include "xfer/protocol/message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace xfer::service {

/**
 * @brief Everything one accepted connection owns
 *
 * Created by the accept loop and handed to a dedicated thread. Nothing in
 * here is shared with other connections; the server only touches the
 * socket to shut it down from stop().
 */
struct ConnectionContext {
    std::uint64_t id = 0;
    std::unique_ptr<network::Socket> socket;
    std::string peer;
    std::size_t requests_handled = 0;
    std::uint64_t bytes_received = 0;
    std::uint64_t bytes_sent = 0;
    std::atomic<bool> finished{false};
};

/**
 * @brief Thread-per-connection transfer server
 *
 * Each connection runs a request loop: upload stores a verified file under
 * the storage directory, download streams a stored file back through the
 * server's fault injector, disconnect ends the loop.
 *
 * Usage:
 * ```cpp
 * TransferServer server(config, &bus);
 * if (server.listen().is_ok()) {
 *     server.serve_forever();   // until stop() from another thread
 * }
 * ```
 */
class TransferServer {
public:
    explicit TransferServer(TransferConfig config, events::EventBus* bus = nullptr);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    /// Binds config.host:config.port. Port 0 picks a free port, see port().
    Result<void> listen();

    /// Accept loop. Returns after stop(), once every connection thread is joined.
    Result<void> serve_forever();

    /// Stops accepting and unblocks every live connection. Safe from any thread.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    std::uint16_t port() const { return port_.load(std::memory_order_acquire); }
    const TransferConfig& config() const { return config_; }

private:
    struct Worker {
        std::shared_ptr<ConnectionContext> context;
        std::thread thread;
    };

    void handle_connection(ConnectionContext& ctx);

    /// Both return false when the connection is no longer usable.
    bool handle_upload(ConnectionContext& ctx, const protocol::RequestMessage& request);
    bool handle_download(ConnectionContext& ctx, const protocol::RequestMessage& request);

    bool reply_failure(ConnectionContext& ctx, ErrorKind kind, const std::string& detail);

    void reap_finished();
    void join_all();

    template<typename Event>
    void publish(const Event& event) const {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    TransferConfig config_;
    events::EventBus* bus_;
    network::Socket listener_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};

    std::mutex workers_mutex_;
    std::map<std::uint64_t, Worker> workers_;
    std::uint64_t next_connection_id_ = 1;
    std::size_t connections_served_ = 0;
};

/// Storage-safe form of a client-supplied name: its last path component.
Result<std::string> storage_name(const std::string& filename);

/// Pause before retrying accept() after consecutive failures: 10 ms, doubling, at most 500 ms.
std::chrono::milliseconds accept_backoff(std::size_t consecutive_failures);

} // namespace xfer::service
