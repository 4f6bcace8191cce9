#pragma once

#include "xfer/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace xfer {

/**
 * @brief Runtime settings shared by the client, the server and the demo
 *
 * max_retries is the total number of attempts a transfer may use.
 * simulate_errors enables the fault injector on the sending side: each
 * chunk is faulted with probability error_rate, as a drop or a corruption
 * with equal odds.
 */
struct TransferConfig {
    static constexpr std::size_t kDefaultChunkSize = 1024;
    static constexpr std::size_t kMaxChunkSize = 16u * 1024u * 1024u;

    std::string host = "127.0.0.1";
    std::uint16_t port = 9999;
    std::size_t chunk_size = kDefaultChunkSize;
    std::uint32_t max_retries = 3;
    bool simulate_errors = false;
    double error_rate = 0.1;
    std::uint64_t seed = 0;
    bool reorder = true;
    std::filesystem::path storage_dir = "xfer_data";
    std::string log_level = "info";

    Result<void> validate() const;
};

/// Reads known keys from a JSON object, leaving defaults for absent ones.
Result<TransferConfig> config_from_json(const nlohmann::json& j);

Result<TransferConfig> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const TransferConfig& config);

/**
 * @brief Applies one command-line override such as ("--chunk-size", "512")
 *
 * The flag names a config key with dashes for underscores. The result is
 * validated like a config file; config is left untouched on error.
 */
Result<void> apply_cli_flag(TransferConfig& config, const std::string& flag, const std::string& value);

/**
 * @brief Builds a config from command-line arguments (argv without argv[0])
 *
 * "--config <file>" is loaded first wherever it appears, then the remaining
 * "--key value" pairs are applied in order. --simulate-errors and
 * --no-reorder take no value. Flags listed in own_flags are not config keys:
 * their values are returned through own_values for the caller.
 */
Result<TransferConfig> config_from_args(const std::vector<std::string>& args,
                                        const std::set<std::string>& own_flags,
                                        std::map<std::string, std::string>& own_values);

} // namespace xfer
