#include "xfer/events/components.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/events/events.hpp"

#include <gtest/gtest.h>

using namespace xfer::events;
using xfer::ErrorKind;
using xfer::TransferError;

TEST(MetricsComponentTest, CountsAttemptsAndOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(AttemptStartedEvent{"upload a", 1, 3});
    bus.emit(AttemptStartedEvent{"upload a", 2, 3});

    AttemptFailedEvent failed;
    failed.error = TransferError(ErrorKind::ChecksumMismatch, "bad digest");
    bus.emit(failed);

    TransferSucceededEvent done;
    done.bytes = 10240;
    bus.emit(done);

    TransferFailedEvent gave_up;
    gave_up.error = TransferError(ErrorKind::RetriesExhausted, "3 attempts");
    bus.emit(gave_up);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.attempts_started.load(), 2u);
    EXPECT_EQ(stats.attempts_failed.load(), 1u);
    EXPECT_EQ(stats.transfers_succeeded.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
    EXPECT_EQ(stats.bytes_transferred.load(), 10240u);
    EXPECT_EQ(metrics.failures(ErrorKind::ChecksumMismatch), 1u);
    EXPECT_EQ(metrics.failures(ErrorKind::IncompleteTransfer), 0u);
}

TEST(MetricsComponentTest, CountsInjectedFaultsAndConnections) {
    EventBus bus;
    MetricsComponent metrics(bus);
    LoggerComponent logger(bus);

    bus.emit(ChunksFaultedEvent{"s1", {1, 4}, {7}, true});
    bus.emit(ChunksFaultedEvent{"s2", {}, {2, 3}, false});
    bus.emit(ConnectionOpenedEvent{1, "127.0.0.1:40000"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.chunks_dropped.load(), 2u);
    EXPECT_EQ(stats.chunks_corrupted.load(), 3u);
    EXPECT_EQ(stats.connections.load(), 1u);
}
