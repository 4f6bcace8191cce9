#include "xfer/core/config.hpp"
#include "xfer/events/components.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/service/client.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " (--upload <file> | --download <name> [--output <path>]) [options]\n"
              << "  --config <file>        JSON configuration file\n"
              << "  --host <address>       server address (default 127.0.0.1)\n"
              << "  --port <port>          server port (default 9999)\n"
              << "  --chunk-size <bytes>   chunk size for uploads (default 1024)\n"
              << "  --max-retries <n>      total attempts per transfer (default 3)\n"
              << "  --simulate-errors      inject faults into uploads\n"
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

    std::map<std::string, std::string> options;
    auto config = xfer::config_from_args(args, {"--upload", "--download", "--output"}, options);
    if (config.is_error()) {
        spdlog::error("{}", config.error());
        print_usage(argv[0]);
        return 2;
    }
    if (options.count("--upload") == options.count("--download")) {
        spdlog::error("Exactly one of --upload or --download is required");
        print_usage(argv[0]);
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(config.value().log_level));

    xfer::events::EventBus event_bus;
    xfer::events::LoggerComponent logger(event_bus);

    xfer::service::TransferClient client(config.value(), &event_bus);
    if (auto connected = client.connect(); connected.is_error()) {
        spdlog::error("Cannot reach {}:{}: {}", config.value().host, config.value().port, connected.error());
        return 1;
    }

    xfer::transfer::Outcome outcome;
    if (options.count("--upload") > 0) {
        outcome = client.upload_file(options["--upload"]);
    } else {
        const std::string& name = options["--download"];
        const std::string output = options.count("--output") > 0 ? options["--output"] : name;
        outcome = client.download_file(name, output);
    }
    client.disconnect();

    return outcome.success ? 0 : 1;
}
