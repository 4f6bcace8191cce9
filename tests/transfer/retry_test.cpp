#include "xfer/events/components.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/events/events.hpp"
#include "xfer/network/pipe_stream.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/fault_injector.hpp"
#include "xfer/transfer/retry.hpp"
#include "xfer/transfer/transmission.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace xfer::transfer;
using xfer::ErrorKind;
using xfer::TransferError;
using xfer::TransferResult;

namespace {

// Fails with a retryable error until attempt `succeed_on`.
RetryController::AttemptFn succeed_on(std::uint32_t succeed_on, std::uint32_t& calls) {
    return [succeed_on, &calls](std::uint32_t attempt) -> TransferResult<AttemptSuccess> {
        ++calls;
        if (attempt < succeed_on) {
            TransferError error(ErrorKind::IncompleteTransfer, "attempt " + std::to_string(attempt));
            error.missing = {attempt};
            return xfer::Err<AttemptSuccess>(std::move(error));
        }
        AttemptSuccess success;
        success.data = {1, 2, 3};
        success.checksum = "digest";
        return xfer::OkAs<AttemptSuccess, TransferError>(std::move(success));
    };
}

} // namespace

TEST(RetryController, SucceedsWithinBudget) {
    for (std::uint32_t n = 1; n <= 3; ++n) {
        std::uint32_t calls = 0;
        auto outcome = RetryController().run(succeed_on(n, calls), 3);

        EXPECT_TRUE(outcome.success) << "n=" << n;
        EXPECT_EQ(outcome.attempts, n);
        EXPECT_EQ(calls, n);
        EXPECT_EQ(outcome.checksum, "digest");
        EXPECT_EQ(outcome.data, (std::vector<std::uint8_t>{1, 2, 3}));
        EXPECT_FALSE(outcome.error.has_value());
    }
}

TEST(RetryController, ExhaustsAfterExactlyMaxAttempts) {
    std::uint32_t calls = 0;
    auto outcome = RetryController().run(succeed_on(5, calls), 3);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attempts, 3u);
    EXPECT_EQ(calls, 3u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::RetriesExhausted);
    EXPECT_EQ(outcome.error->missing, std::vector<std::uint32_t>{3});

    ASSERT_TRUE(outcome.last_failure.has_value());
    EXPECT_EQ(outcome.last_failure->kind, ErrorKind::IncompleteTransfer);
    EXPECT_EQ(outcome.last_failure->message, "attempt 3");
}

TEST(RetryController, ZeroBudgetRunsNothing) {
    std::uint32_t calls = 0;
    auto outcome = RetryController().run(succeed_on(1, calls), 0);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attempts, 0u);
    EXPECT_EQ(calls, 0u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::RetriesExhausted);
    EXPECT_FALSE(outcome.last_failure.has_value());
}

TEST(RetryController, NonRetryableErrorStopsImmediately) {
    std::uint32_t calls = 0;
    auto outcome = RetryController().run(
        [&calls](std::uint32_t) -> TransferResult<AttemptSuccess> {
            ++calls;
            return xfer::Fail<AttemptSuccess>(ErrorKind::FrameError, "garbage on the wire");
        },
        5);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(outcome.attempts, 1u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::FrameError);
}

TEST(RetryController, PublishesAttemptEvents) {
    xfer::events::EventBus bus;
    xfer::events::MetricsComponent metrics(bus);

    std::vector<bool> retry_flags;
    bus.subscribe<xfer::events::AttemptFailedEvent>(
        [&retry_flags](const xfer::events::AttemptFailedEvent& e) { retry_flags.push_back(e.will_retry); });

    std::uint32_t calls = 0;
    RetryController("upload test.bin", &bus).run(succeed_on(3, calls), 3);
    RetryController("upload other.bin", &bus).run(succeed_on(9, calls), 2);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.attempts_started.load(), 5u);
    EXPECT_EQ(stats.attempts_failed.load(), 4u);
    EXPECT_EQ(stats.transfers_succeeded.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
    EXPECT_EQ(stats.bytes_transferred.load(), 3u);
    EXPECT_EQ(metrics.failures(ErrorKind::IncompleteTransfer), 4u);
    EXPECT_EQ(retry_flags, (std::vector<bool>{true, true, true, false}));
}

// 10 KiB in 1 KiB chunks, chunk 3 lost on the first attempt only.
TEST(RetryController, RecoversFromDroppedChunkOnSecondAttempt) {
    std::vector<std::uint8_t> original(10 * 1024);
    for (std::size_t i = 0; i < original.size(); ++i) {
        original[i] = static_cast<std::uint8_t>(i * 7 + 3);
    }
    auto chunked = Chunker::split(original, 1024);
    ASSERT_TRUE(chunked.is_ok());
    auto metadata = Chunker::make_metadata("ten_kib.bin", original, chunked.value(), 1024);
    ASSERT_TRUE(metadata.is_ok());

    std::vector<std::vector<std::uint32_t>> missing_per_attempt;

    auto attempt = [&](std::uint32_t n) -> TransferResult<AttemptSuccess> {
        auto [sender_end, receiver_end] = xfer::network::PipeStream::create_pair();

        FaultPolicy policy;
        if (n == 1) {
            policy.forced_drops = {3};
        }
        FaultInjector injector(policy);

        TransferSession tx("tx" + std::to_string(n), SessionRole::Sender);
        ChunkSender sender(*sender_end);
        auto sent = sender.send(tx, metadata.value(), chunked.value().chunks, &injector);
        if (sent.is_error()) {
            return xfer::Err<AttemptSuccess>(sent.error());
        }

        TransferSession rx("rx" + std::to_string(n), SessionRole::Receiver);
        ChunkReceiver receiver(*receiver_end);
        auto received = receiver.receive(rx);
        if (auto replied = receiver.report(received); replied.is_error()) {
            return xfer::Err<AttemptSuccess>(replied.error());
        }

        auto verdict = sender.await_verdict(tx);
        if (verdict.is_error()) {
            missing_per_attempt.push_back(verdict.error().missing);
            return xfer::Err<AttemptSuccess>(verdict.error());
        }

        AttemptSuccess success;
        success.data = std::move(received.value().data);
        success.checksum = verdict.value().checksum;
        return xfer::OkAs<AttemptSuccess, TransferError>(std::move(success));
    };

    auto outcome = RetryController("ten_kib").run(attempt, 3);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.attempts, 2u);
    EXPECT_EQ(outcome.data, original);
    EXPECT_EQ(outcome.checksum, metadata.value().checksum);
    ASSERT_EQ(missing_per_attempt.size(), 1u);
    EXPECT_EQ(missing_per_attempt[0], std::vector<std::uint32_t>{3});
}
