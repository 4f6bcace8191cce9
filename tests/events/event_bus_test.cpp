#include "xfer/events/event_bus.hpp"
#include "xfer/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace xfer::events;

TEST(EventBus, DeliversToSubscribersOfThatTypeOnly) {
    EventBus bus;

    std::uint32_t last_attempt = 0;
    int failures = 0;
    bus.subscribe<AttemptStartedEvent>([&](const AttemptStartedEvent& e) { last_attempt = e.attempt; });
    bus.subscribe<AttemptFailedEvent>([&](const AttemptFailedEvent&) { failures++; });

    bus.emit(AttemptStartedEvent{"upload a.bin", 2, 3});

    EXPECT_EQ(last_attempt, 2u);
    EXPECT_EQ(failures, 0);
}

TEST(EventBus, EverySubscriberRuns) {
    EventBus bus;
    int count = 0;
    for (int i = 0; i < 3; ++i) {
        bus.subscribe<ServerStartedEvent>([&](const ServerStartedEvent&) { count++; });
    }

    bus.emit(ServerStartedEvent{"127.0.0.1", 9999});
    EXPECT_EQ(count, 3);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int count = 0;
    auto id = bus.subscribe<ConnectionOpenedEvent>([&](const ConnectionOpenedEvent&) { count++; });

    bus.emit(ConnectionOpenedEvent{1, "127.0.0.1:5000"});
    bus.unsubscribe<ConnectionOpenedEvent>(id);
    bus.emit(ConnectionOpenedEvent{2, "127.0.0.1:5001"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ConnectionOpenedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    bool second_ran = false;
    bus.subscribe<ServerStoppedEvent>([](const ServerStoppedEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe<ServerStoppedEvent>([&](const ServerStoppedEvent&) { second_ran = true; });

    EXPECT_NO_THROW(bus.emit(ServerStoppedEvent{4}));
    EXPECT_TRUE(second_ran);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;
    int inner = 0;
    bus.subscribe<ConnectionClosedEvent>([&](const ConnectionClosedEvent&) {
        bus.subscribe<ConnectionClosedEvent>([&](const ConnectionClosedEvent&) { inner++; });
    });

    bus.emit(ConnectionClosedEvent{1, "peer", 0});
    EXPECT_EQ(inner, 0);
    EXPECT_EQ(bus.subscriber_count<ConnectionClosedEvent>(), 2u);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> total{0};
    bus.subscribe<ServerTransferEvent>([&](const ServerTransferEvent& e) { total += static_cast<int>(e.bytes); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&bus]() {
            for (int j = 0; j < 50; ++j) {
                ServerTransferEvent e;
                e.bytes = 1;
                bus.emit(e);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total.load(), 16 * 50);
}

TEST(EventBus, Clear) {
    EventBus bus;
    bus.subscribe<AttemptStartedEvent>([](const AttemptStartedEvent&) {});
    bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<AttemptStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 0u);
}
