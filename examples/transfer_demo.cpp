#include "xfer/core/config.hpp"
#include "xfer/events/components.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/service/client.hpp"
#include "xfer/service/server.hpp"
#include "xfer/transfer/chunker.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Uploads a generated file to an in-process server and downloads it back.\n"
              << "  --test-file-size <KiB> size of the generated file (default 10)\n"
              << "  --simulate-errors      inject faults in both directions\n"
              << "  --error-rate <p>       fault probability per chunk (default 0.1)\n"
              << "  --max-retries <n>      total attempts per transfer (default 3)\n"
              << "  --chunk-size <bytes>   chunk size (default 1024)\n"
              << "  --seed <n>             fault injection seed\n"
              << "  --port <port>          server port, 0 for any free port (default 9999)\n"
              << "  --config <file>        JSON configuration file\n";
}

std::vector<std::uint8_t> random_bytes(std::size_t size, std::uint64_t seed) {
    std::mt19937_64 engine(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<std::uint8_t> data(size);
    for (auto& b : data) {
        b = static_cast<std::uint8_t>(byte(engine));
    }
    return data;
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

    std::map<std::string, std::string> options;
    auto parsed = xfer::config_from_args(args, {"--test-file-size"}, options);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error());
        print_usage(argv[0]);
        return 2;
    }
    xfer::TransferConfig config = parsed.take_value();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::size_t size_kib = 10;
    if (options.count("--test-file-size") > 0) {
        try {
            size_kib = std::stoul(options["--test-file-size"]);
        } catch (const std::exception&) {
            spdlog::error("Invalid --test-file-size: {}", options["--test-file-size"]);
            return 2;
        }
    }

    std::error_code ec;
    const fs::path work_dir = fs::temp_directory_path(ec) / ("xfer_demo_" + std::to_string(std::random_device{}()));
    if (ec) {
        spdlog::error("No temporary directory: {}", ec.message());
        return 1;
    }
    const fs::path source = work_dir / "test_file.bin";
    const fs::path received = work_dir / "received_test_file.bin";
    config.storage_dir = work_dir / "server";

    fs::create_directories(work_dir, ec);
    auto written = xfer::transfer::write_file(source, random_bytes(size_kib * 1024, config.seed));
    if (ec || written.is_error()) {
        spdlog::error("Cannot create test file in {}", work_dir.string());
        return 1;
    }
    spdlog::info("Created test file: {} ({} KB)", source.string(), size_kib);

    xfer::events::EventBus event_bus;
    xfer::events::LoggerComponent logger(event_bus);
    xfer::events::MetricsComponent metrics(event_bus);

    xfer::service::TransferServer server(config, &event_bus);
    if (auto listening = server.listen(); listening.is_error()) {
        spdlog::error("Failed to start server: {}", listening.error());
        fs::remove_all(work_dir, ec);
        return 1;
    }
    std::thread server_thread([&server]() {
        auto served = server.serve_forever();
        if (served.is_error()) {
            spdlog::error("Server error: {}", served.error());
        }
    });

    xfer::TransferConfig client_config = config;
    client_config.port = server.port();
    xfer::service::TransferClient client(client_config, &event_bus);

    bool ok = false;
    if (auto connected = client.connect(); connected.is_error()) {
        spdlog::error("Connection to server failed: {}", connected.error());
    } else {
        auto upload = client.upload_file(source);
        if (upload.success) {
            auto download = client.download_file(source.filename().string(), received);
            ok = download.success && download.checksum == upload.checksum;
        }
        client.disconnect();
    }

    server.stop();
    server_thread.join();

    const auto source_size = fs::file_size(source, ec);
    const auto received_size = ok ? fs::file_size(received, ec) : 0;

    std::cout << "\n==================================================\n";
    std::cout << (ok ? "DEMO COMPLETED SUCCESSFULLY!" : "DEMO FAILED!") << "\n";
    std::cout << "Original file size:  " << source_size << " bytes\n";
    std::cout << "Received file size:  " << received_size << " bytes\n";
    std::cout << "==================================================\n\n";

    metrics.print_stats();

    fs::remove_all(work_dir, ec);
    return ok ? 0 : 1;
}
