#include <gtest/gtest.h>
#include "medialib/events/event_bus.hpp"
#include "medialib/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace medialib::events;

TEST(EventBus, DeliversToSubscriber) {
    EventBus bus;

    std::string seen_path;
    bus.subscribe<AssetOfflineEvent>([&](const AssetOfflineEvent& e) {
        seen_path = e.path;
    });

    bus.emit(AssetOfflineEvent{"1", "lib", "/media/c.jpg"});

    EXPECT_EQ(seen_path, "/media/c.jpg");
}

TEST(EventBus, EverySubscriberIsCalled) {
    EventBus bus;
    int count = 0;

    for (int i = 0; i < 3; ++i) {
        bus.subscribe<AssetRemovedEvent>([&](const AssetRemovedEvent&) { count++; });
    }

    bus.emit(AssetRemovedEvent{"1", "lib", "/media/c.jpg"});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, EventTypesAreRoutedSeparately) {
    EventBus bus;
    int offline = 0;
    int online = 0;

    bus.subscribe<AssetOfflineEvent>([&](const AssetOfflineEvent&) { offline++; });
    bus.subscribe<AssetOnlineEvent>([&](const AssetOnlineEvent&) { online++; });

    bus.emit(AssetOfflineEvent{"1", "lib", "/a.jpg"});
    bus.emit(AssetOnlineEvent{"1", "lib", "/a.jpg"});
    bus.emit(AssetOfflineEvent{"2", "lib", "/b.jpg"});

    EXPECT_EQ(offline, 2);
    EXPECT_EQ(online, 1);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int count = 0;

    auto id = bus.subscribe<AssetOfflineEvent>([&](const AssetOfflineEvent&) { count++; });
    bus.emit(AssetOfflineEvent{"1", "lib", "/a.jpg"});

    bus.unsubscribe<AssetOfflineEvent>(id);
    bus.emit(AssetOfflineEvent{"1", "lib", "/a.jpg"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<AssetOfflineEvent>(), 0u);
}

TEST(EventBus, EmitWithoutSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(LibraryRefreshedEvent{"lib", 0, 0, 0}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int after = 0;

    bus.subscribe<JobFailedEvent>([](const JobFailedEvent&) {
        throw std::runtime_error("observer failed");
    });
    bus.subscribe<JobFailedEvent>([&](const JobFailedEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(JobFailedEvent{"REFRESH_LIBRARY_FILE", "Internal", "boom", 1}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, NonStandardThrowIsContained) {
    EventBus bus;
    int after = 0;

    bus.subscribe<AssetRemovedEvent>([](const AssetRemovedEvent&) { throw 7; });
    bus.subscribe<AssetRemovedEvent>([&](const AssetRemovedEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(AssetRemovedEvent{"1", "lib", "/a.jpg"}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;
    int count = 0;
    size_t id = 0;

    id = bus.subscribe<AssetOnlineEvent>([&](const AssetOnlineEvent&) {
        count++;
        bus.unsubscribe<AssetOnlineEvent>(id);
    });

    bus.emit(AssetOnlineEvent{"1", "lib", "/a.jpg"});
    bus.emit(AssetOnlineEvent{"1", "lib", "/a.jpg"});

    EXPECT_EQ(count, 1);
}

TEST(EventBus, ConcurrentEmitFromWorkers) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<AssetOfflineEvent>([&count](const AssetOfflineEvent&) { count++; });

    std::vector<std::thread> workers;
    for (int i = 0; i < 16; ++i) {
        workers.emplace_back([&bus, i]() {
            for (int j = 0; j < 25; ++j) {
                bus.emit(AssetOfflineEvent{std::to_string(i), "lib", "/media/" + std::to_string(j)});
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(count.load(), 400);
}

TEST(EventBus, ClearRemovesAllSubscriptions) {
    EventBus bus;

    bus.subscribe<AssetOfflineEvent>([](const AssetOfflineEvent&) {});
    bus.subscribe<AssetRemovedEvent>([](const AssetRemovedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<AssetOfflineEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<AssetRemovedEvent>(), 0u);
}
