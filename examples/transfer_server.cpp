#include "xfer/core/config.hpp"
#include "xfer/events/components.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/service/server.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

xfer::service::TransferServer* g_server = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_server) {
            g_server->stop();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <file>        JSON configuration file\n"
              << "  --host <address>       bind address (default 127.0.0.1)\n"
              << "  --port <port>          listen port (default 9999)\n"
              << "  --storage-dir <dir>    where uploads are stored (default xfer_data)\n"
              << "  --chunk-size <bytes>   chunk size for downloads (default 1024)\n"
              << "  --simulate-errors      inject faults into downloads\n"
              << "  --error-rate <p>       fault probability per chunk (default 0.1)\n"
              << "  --seed <n>             fault injection seed\n"
              << "  --no-reorder           keep chunk order when simulating errors\n"
              << "  --log-level <level>    trace, debug, info, warn, error\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    std::map<std::string, std::string> unused;
    auto config = xfer::config_from_args(args, {}, unused);
    if (config.is_error()) {
        spdlog::error("{}", config.error());
        print_usage(argv[0]);
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(config.value().log_level));

    xfer::events::EventBus event_bus;
    xfer::events::LoggerComponent logger(event_bus);
    xfer::events::MetricsComponent metrics(event_bus);

    xfer::service::TransferServer server(config.value(), &event_bus);
    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto listen_result = server.listen();
    if (listen_result.is_error()) {
        spdlog::error("Failed to start server: {}", listen_result.error());
        return 1;
    }
    if (config.value().simulate_errors) {
        spdlog::info("Simulating errors on downloads: error_rate={} seed={} reorder={}",
                     config.value().error_rate, config.value().seed, config.value().reorder);
    }
    spdlog::info("Press Ctrl+C to stop");

    auto serve_result = server.serve_forever();
    g_server = nullptr;
    if (serve_result.is_error()) {
        spdlog::error("Server error: {}", serve_result.error());
        return 1;
    }

    metrics.print_stats();
    return 0;
}
