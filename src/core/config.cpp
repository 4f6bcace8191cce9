#include "xfer/core/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <limits>

namespace xfer {

using json = nlohmann::json;

Result<void> TransferConfig::validate() const {
    if (host.empty()) {
        return Err<void>(std::string("host must not be empty"));
    }
    if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
        return Err<void>("chunk_size must be within 1.." + std::to_string(kMaxChunkSize));
    }
    if (!(error_rate >= 0.0 && error_rate <= 1.0)) {
        return Err<void>(std::string("error_rate must be within [0, 1]"));
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return Err<void>(std::string("Unknown log_level: ") + log_level);
    }
    return Ok();
}

Result<TransferConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<TransferConfig>(std::string("Configuration must be a JSON object"));
    }

    TransferConfig config;
    try {
        config.host = j.value("host", config.host);

        const auto port = j.value("port", static_cast<std::int64_t>(config.port));
        if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            return Err<TransferConfig>(std::string("port out of range: ") + std::to_string(port));
        }
        config.port = static_cast<std::uint16_t>(port);

        const auto chunk_size = j.value("chunk_size", static_cast<std::int64_t>(config.chunk_size));
        if (chunk_size <= 0) {
            return Err<TransferConfig>(std::string("chunk_size must be > 0"));
        }
        config.chunk_size = static_cast<std::size_t>(chunk_size);

        const auto max_retries = j.value("max_retries", static_cast<std::int64_t>(config.max_retries));
        if (max_retries < 0 || max_retries > std::numeric_limits<std::uint32_t>::max()) {
            return Err<TransferConfig>(std::string("max_retries must be >= 0"));
        }
        config.max_retries = static_cast<std::uint32_t>(max_retries);

        config.simulate_errors = j.value("simulate_errors", config.simulate_errors);
        config.error_rate = j.value("error_rate", config.error_rate);
        config.seed = j.value("seed", config.seed);
        config.reorder = j.value("reorder", config.reorder);
        config.storage_dir = j.value("storage_dir", config.storage_dir.string());
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<TransferConfig>(std::string("Invalid configuration value: ") + e.what());
    }

    if (auto valid = config.validate(); valid.is_error()) {
        return Err<TransferConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<TransferConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(std::string("Failed to open config file: ") + path.string());
    }

    auto parsed = json::parse(input, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<TransferConfig>(std::string("Invalid JSON in config file: ") + path.string());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return config_from_json(parsed);
}

json config_to_json(const TransferConfig& config) {
    json j;
    j["host"] = config.host;
    j["port"] = config.port;
    j["chunk_size"] = config.chunk_size;
    j["max_retries"] = config.max_retries;
    j["simulate_errors"] = config.simulate_errors;
    j["error_rate"] = config.error_rate;
    j["seed"] = config.seed;
    j["reorder"] = config.reorder;
    j["storage_dir"] = config.storage_dir.string();
    j["log_level"] = config.log_level;
    return j;
}

Result<void> apply_cli_flag(TransferConfig& config, const std::string& flag, const std::string& value) {
    if (flag.rfind("--", 0) != 0) {
        return Err<void>(std::string("Expected --option, got ") + flag);
    }
    std::string key = flag.substr(2);
    std::replace(key.begin(), key.end(), '-', '_');

    json j = config_to_json(config);
    if (!j.contains(key)) {
        return Err<void>(std::string("Unknown option: ") + flag);
    }

    if (j[key].is_string()) {
        j[key] = value;
    } else {
        auto parsed = json::parse(value, nullptr, false);
        if (parsed.is_discarded() || parsed.is_structured()) {
            return Err<void>("Invalid value for " + flag + ": " + value);
        }
        j[key] = parsed;
    }

    auto updated = config_from_json(j);
    if (updated.is_error()) {
        return Err<void>(updated.error());
    }
    config = updated.take_value();
    return Ok();
}

Result<TransferConfig> config_from_args(const std::vector<std::string>& args,
                                        const std::set<std::string>& own_flags,
                                        std::map<std::string, std::string>& own_values) {
    TransferConfig config;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--simulate-errors") {
            overrides.emplace_back(arg, "true");
            continue;
        }
        if (arg == "--no-reorder") {
            overrides.emplace_back("--reorder", "false");
            continue;
        }
        if (i + 1 >= args.size()) {
            return Err<TransferConfig>("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            auto loaded = load_config(value);
            if (loaded.is_error()) {
                return loaded;
            }
            config = loaded.take_value();
        } else if (own_flags.count(arg) > 0) {
            own_values[arg] = value;
        } else {
            overrides.emplace_back(arg, value);
        }
    }

    for (const auto& [flag, value] : overrides) {
        if (auto applied = apply_cli_flag(config, flag, value); applied.is_error()) {
            return Err<TransferConfig>(applied.error());
        }
    }
    return Ok(std::move(config));
}

} // namespace xfer
