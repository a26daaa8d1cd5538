#include <gtest/gtest.h>
#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rup::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string received;
    std::uint64_t offset = 0;

    bus.subscribe<ChunkAppliedEvent>([&](const ChunkAppliedEvent& e) {
        received = e.session_id;
        offset = e.new_offset;
    });

    bus.emit(ChunkAppliedEvent{"s-1", 1, 1024, 1024, 4096});

    EXPECT_EQ(received, "s-1");
    EXPECT_EQ(offset, 1024u);
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { count++; });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { count++; });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { count++; });

    bus.emit(UploadCompletedEvent{"s-1", "alice", "post-1", "mem://s-1", 10});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int created = 0;
    int terminated = 0;

    bus.subscribe<UploadCreatedEvent>([&](const UploadCreatedEvent&) { created++; });
    bus.subscribe<UploadTerminatedEvent>([&](const UploadTerminatedEvent&) { terminated++; });

    bus.emit(UploadCreatedEvent{"s-1", "alice", "", 10});
    bus.emit(UploadTerminatedEvent{"s-1", "alice", "client"});
    bus.emit(UploadCreatedEvent{"s-2", "alice", "", 20});

    EXPECT_EQ(created, 2);
    EXPECT_EQ(terminated, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadExpiredEvent>([&](const UploadExpiredEvent&) { count++; });

    bus.emit(UploadExpiredEvent{"s-1", 0, 10});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<UploadExpiredEvent>(id);

    bus.emit(UploadExpiredEvent{"s-2", 0, 10});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ScopedSubscriptionEndsWithHandle) {
    EventBus bus;
    int count = 0;

    {
        auto subscription = bus.scoped_subscribe<SweepFinishedEvent>([&](const SweepFinishedEvent&) { count++; });
        EXPECT_TRUE(subscription.active());
        bus.emit(SweepFinishedEvent{3, 1, 0});

        Subscription moved = std::move(subscription);
        EXPECT_FALSE(subscription.active());
        bus.emit(SweepFinishedEvent{3, 1, 0});
    }

    bus.emit(SweepFinishedEvent{3, 1, 0});
    EXPECT_EQ(count, 2);
    EXPECT_EQ(bus.subscriber_count<SweepFinishedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int count = 0;

    bus.subscribe<ChunkRejectedEvent>([](const ChunkRejectedEvent&) {
        throw std::runtime_error("observer failed");
    });
    bus.subscribe<ChunkRejectedEvent>([&](const ChunkRejectedEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(ChunkRejectedEvent{"s-1", "OffsetConflict", 0}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(UploadCreatedEvent{"s-1", "alice", "", 1}));
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<ChunkAppliedEvent>([&count](const ChunkAppliedEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(ChunkAppliedEvent{"s-1", 1, 1, 1, 1});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<ChunkAppliedEvent>([&bytes](const ChunkAppliedEvent& e) {
        bytes += e.bytes;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(ChunkAppliedEvent{"s-1", 1, 512, 512, 1024});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 51200u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 0u);

    auto id1 = bus.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 1u);

    bus.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 2u);

    bus.unsubscribe<UploadCreatedEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent&) {});
    bus.subscribe<UploadExpiredEvent>([](const UploadExpiredEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadExpiredEvent>(), 0u);
}
