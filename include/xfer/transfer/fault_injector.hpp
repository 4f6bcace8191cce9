#pragma once

#include "xfer/core/config.hpp"
#include "xfer/transfer/chunker.hpp"

#include <cstdint>
#include <random>
#include <set>
#include <vector>

namespace xfer::transfer {

/**
 * @brief Which faults to simulate on an outbound chunk stream
 *
 * Drop and corruption are exclusive outcomes of one draw per chunk, so a
 * chunk is faulted with probability drop + corrupt (capped at 1). forced_drops and
 * forced_corruptions name sequence numbers that are always dropped or
 * corrupted, on top of the random draws; tests use them to script exact
 * failures.
 */
struct FaultPolicy {
    double drop_probability = 0.0;
    double corrupt_probability = 0.0;
    bool reorder = false;
    std::uint64_t seed = 0;
    std::set<std::uint32_t> forced_drops;
    std::set<std::uint32_t> forced_corruptions;

    [[nodiscard]] bool enabled() const noexcept;

    /**
     * @brief Policy for one attempt under the given configuration
     *
     * Disabled unless simulate_errors is set. Each chunk is faulted with
     * probability error_rate, half of the faults drops and half corruptions. The seed mixes config.seed with the
     * attempt number, so retries see different but reproducible faults.
     */
    static FaultPolicy from_config(const TransferConfig& config, std::uint32_t attempt);

    static std::uint64_t mix_seed(std::uint64_t seed, std::uint32_t attempt) noexcept;
};

struct FaultReport {
    std::vector<std::uint32_t> dropped;
    std::vector<std::uint32_t> corrupted;
    bool reordered = false;
};

class FaultInjector {
public:
    explicit FaultInjector(FaultPolicy policy);

    /**
     * @brief Applies the policy to an ordered chunk stream
     *
     * Dropped chunks are omitted, corrupted chunks keep their sequence
     * number but have at least one payload bit flipped, and with reorder
     * set the survivors come out permuted, each exactly once.
     */
    std::vector<ChunkRecord> apply(std::vector<ChunkRecord> chunks);

    [[nodiscard]] const FaultReport& report() const noexcept { return report_; }
    [[nodiscard]] const FaultPolicy& policy() const noexcept { return policy_; }

private:
    void corrupt(ChunkRecord& chunk);

    FaultPolicy policy_;
    std::mt19937_64 engine_;
    FaultReport report_;
};

} // namespace xfer::transfer
