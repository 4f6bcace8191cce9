#include "xfer/transfer/retry.hpp"
#include "xfer/events/events.hpp"

#include <spdlog/spdlog.h>

namespace xfer::transfer {

namespace {

std::chrono::milliseconds as_millis(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

} // namespace

Outcome RetryController::run(const AttemptFn& attempt_factory, std::uint32_t max_retries) {
    RetryState state;
    state.max_attempts = max_retries;
    state.started_at = std::chrono::steady_clock::now();

    Outcome outcome;

    while (!state.exhausted()) {
        ++state.attempt;
        outcome.attempts = state.attempt;
        publish(events::AttemptStartedEvent{operation_, state.attempt, state.max_attempts});
        spdlog::debug("{}: attempt {}/{}", operation_, state.attempt, state.max_attempts);

        auto result = attempt_factory(state.attempt);
        if (result.is_ok()) {
            auto success = result.take_value();
            outcome.success = true;
            outcome.elapsed = state.elapsed();
            outcome.checksum = std::move(success.checksum);
            outcome.data = std::move(success.data);

            events::TransferSucceededEvent done;
            done.operation = operation_;
            done.attempts = state.attempt;
            done.bytes = outcome.data.size();
            done.checksum = outcome.checksum;
            done.duration = as_millis(outcome.elapsed);
            publish(done);
            return outcome;
        }

        const TransferError& failure = result.error();
        outcome.last_failure = failure;
        const bool retry = failure.retryable() && !state.exhausted();

        events::AttemptFailedEvent failed;
        failed.operation = operation_;
        failed.attempt = state.attempt;
        failed.error = failure;
        failed.will_retry = retry;
        publish(failed);

        if (!failure.retryable()) {
            spdlog::error("{}: attempt {} failed with non-retryable {}", operation_, state.attempt,
                          failure.describe());
            outcome.error = failure;
            break;
        }
        spdlog::warn("{}: attempt {}/{} failed: {}", operation_, state.attempt, state.max_attempts,
                     failure.describe());
    }

    if (!outcome.error) {
        TransferError exhausted(ErrorKind::RetriesExhausted,
                                "no verified transfer after " + std::to_string(outcome.attempts) + " attempt(s)");
        if (outcome.last_failure) {
            exhausted.message += "; last: " + outcome.last_failure->describe();
            exhausted.missing = outcome.last_failure->missing;
            exhausted.expected_checksum = outcome.last_failure->expected_checksum;
            exhausted.actual_checksum = outcome.last_failure->actual_checksum;
        }
        outcome.error = std::move(exhausted);
    }

    outcome.elapsed = state.elapsed();

    events::TransferFailedEvent failed;
    failed.operation = operation_;
    failed.attempts = outcome.attempts;
    failed.error = *outcome.error;
    failed.duration = as_millis(outcome.elapsed);
    publish(failed);
    return outcome;
}

} // namespace xfer::transfer
