#include "xfer/transfer/fault_injector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace xfer::transfer {

bool FaultPolicy::enabled() const noexcept {
    return drop_probability > 0.0 || corrupt_probability > 0.0 || reorder ||
           !forced_drops.empty() || !forced_corruptions.empty();
}

std::uint64_t FaultPolicy::mix_seed(std::uint64_t seed, std::uint32_t attempt) noexcept {
    // splitmix64 finaliser
    std::uint64_t z = seed + 0x9e3779b97f4a7c15ULL * (static_cast<std::uint64_t>(attempt) + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

FaultPolicy FaultPolicy::from_config(const TransferConfig& config, std::uint32_t attempt) {
    FaultPolicy policy;
    if (!config.simulate_errors) {
        return policy;
    }
    policy.drop_probability = config.error_rate / 2.0;
    policy.corrupt_probability = config.error_rate / 2.0;
    policy.reorder = config.reorder;
    policy.seed = mix_seed(config.seed, attempt);
    return policy;
}

FaultInjector::FaultInjector(FaultPolicy policy)
    : policy_(std::move(policy))
    , engine_(policy_.seed) {
}

std::vector<ChunkRecord> FaultInjector::apply(std::vector<ChunkRecord> chunks) {
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    std::vector<ChunkRecord> out;
    out.reserve(chunks.size());

    for (auto& chunk : chunks) {
        // One draw per chunk, forced or not, so forced faults do not shift the random sequence.
        // [0, drop) drops, [drop, drop + corrupt) corrupts.
        const double fault_roll = roll(engine_);
        const bool random_drop = fault_roll < policy_.drop_probability;
        const bool random_corrupt =
            !random_drop && fault_roll < policy_.drop_probability + policy_.corrupt_probability;

        if (policy_.forced_drops.count(chunk.seq) > 0 || random_drop) {
            spdlog::info("Simulating packet loss for chunk {}", chunk.seq);
            report_.dropped.push_back(chunk.seq);
            continue;
        }

        if ((policy_.forced_corruptions.count(chunk.seq) > 0 || random_corrupt) &&
            !chunk.data.empty()) {
            spdlog::info("Simulating data corruption for chunk {}", chunk.seq);
            corrupt(chunk);
            report_.corrupted.push_back(chunk.seq);
        }

        out.push_back(std::move(chunk));
    }

    if (policy_.reorder && out.size() > 1) {
        std::shuffle(out.begin(), out.end(), engine_);
        report_.reordered = true;
        spdlog::debug("Reordered {} chunks", out.size());
    }

    return out;
}

void FaultInjector::corrupt(ChunkRecord& chunk) {
    // Distinct positions, each XORed with a non-zero mask, so the payload always changes.
    const std::size_t flips = std::min<std::size_t>(10, chunk.data.size());
    std::uniform_int_distribution<std::size_t> position(0, chunk.data.size() - 1);
    std::uniform_int_distribution<int> mask(1, 255);

    std::unordered_set<std::size_t> touched;
    while (touched.size() < flips) {
        const auto pos = position(engine_);
        if (touched.insert(pos).second) {
            chunk.data[pos] ^= static_cast<std::uint8_t>(mask(engine_));
        }
    }
}

} // namespace xfer::transfer
