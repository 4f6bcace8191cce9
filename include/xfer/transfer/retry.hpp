#pragma once

#include "xfer/core/error.hpp"
#include "xfer/events/event_bus.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace xfer::transfer {

/// What a successful attempt hands back to the controller.
struct AttemptSuccess {
    std::vector<std::uint8_t> data;
    std::string checksum;
};

struct RetryState {
    std::uint32_t attempt = 0;
    std::uint32_t max_attempts = 0;
    std::chrono::steady_clock::time_point started_at;

    [[nodiscard]] bool exhausted() const noexcept { return attempt >= max_attempts; }
    [[nodiscard]] std::chrono::steady_clock::duration elapsed() const noexcept {
        return std::chrono::steady_clock::now() - started_at;
    }
};

/**
 * @brief Result of a whole retried transfer
 *
 * On failure, error is RetriesExhausted when the budget ran out, or the
 * non-retryable error that stopped the loop early. last_failure is the
 * error of the final attempt that ran, if any.
 */
struct Outcome {
    bool success = false;
    std::uint32_t attempts = 0;
    std::chrono::steady_clock::duration elapsed{};
    std::vector<std::uint8_t> data;
    std::string checksum;
    std::optional<TransferError> error;
    std::optional<TransferError> last_failure;
};

/**
 * @brief Runs whole-transfer attempts until one verifies
 *
 * Each attempt is independent: the factory gets the 1-based attempt number
 * and must start from scratch. max_retries is the total attempt budget, so
 * run(f, 3) calls f at most three times and run(f, 0) not at all.
 */
class RetryController {
public:
    using AttemptFn = std::function<TransferResult<AttemptSuccess>(std::uint32_t attempt)>;

    explicit RetryController(std::string operation = "transfer", events::EventBus* bus = nullptr)
        : operation_(std::move(operation)), bus_(bus) {}

    Outcome run(const AttemptFn& attempt_factory, std::uint32_t max_retries);

private:
    template<typename Event>
    void publish(const Event& event) const {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    std::string operation_;
    events::EventBus* bus_;
};

} // namespace xfer::transfer
