#include <gtest/gtest.h>
#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ingest::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string received;
    bus.subscribe<StatusChangedEvent>([&](const StatusChangedEvent& e) {
        received = e.text;
    });

    bus.emit(StatusChangedEvent{"starting upload: jobA"});

    EXPECT_EQ(received, "starting upload: jobA");
}

TEST(EventBus, EventTypesAreRoutedSeparately) {
    EventBus bus;

    int status_count = 0;
    int progress_count = 0;

    bus.subscribe<StatusChangedEvent>([&](const StatusChangedEvent&) { status_count++; });
    bus.subscribe<DirectoryProgressEvent>([&](const DirectoryProgressEvent&) { progress_count++; });

    bus.emit(StatusChangedEvent{"waiting for next job"});
    bus.emit(DirectoryProgressEvent{ProgressSnapshot{50, 5, 10}, "jobA"});
    bus.emit(StatusChangedEvent{"starting upload: jobB"});

    EXPECT_EQ(status_count, 2);
    EXPECT_EQ(progress_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<JobRunningChangedEvent>([&](const JobRunningChangedEvent&) { count++; });

    bus.emit(JobRunningChangedEvent{true, "jobA"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<JobRunningChangedEvent>(id);

    bus.emit(JobRunningChangedEvent{false, "jobA"});
    EXPECT_EQ(count, 1);  // Handler was removed
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int later_calls = 0;
    bus.subscribe<WatcherStateChangedEvent>([](const WatcherStateChangedEvent&) {
        throw std::runtime_error("presentation layer broke");
    });
    bus.subscribe<WatcherStateChangedEvent>([&](const WatcherStateChangedEvent&) { later_calls++; });

    EXPECT_NO_THROW(bus.emit(WatcherStateChangedEvent{true}));
    EXPECT_EQ(later_calls, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int inner_calls = 0;
    bus.subscribe<StatusChangedEvent>([&](const StatusChangedEvent&) {
        bus.subscribe<StatusChangedEvent>([&](const StatusChangedEvent&) { inner_calls++; });
    });

    bus.emit(StatusChangedEvent{"first"});
    EXPECT_EQ(inner_calls, 0);  // Subscribed after the snapshot was taken

    bus.emit(StatusChangedEvent{"second"});
    EXPECT_EQ(inner_calls, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<FileProgressEvent>([&bytes](const FileProgressEvent& e) {
        bytes += e.progress.bytes_done;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(FileProgressEvent{ProgressSnapshot{100, 2, 2}, "a.jpg"});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes, 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<StatusChangedEvent>(), 0u);

    auto id = bus.subscribe<StatusChangedEvent>([](const StatusChangedEvent&) {});
    bus.subscribe<StatusChangedEvent>([](const StatusChangedEvent&) {});
    bus.subscribe<SettingsChangedEvent>([](const SettingsChangedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<StatusChangedEvent>(), 2u);

    bus.unsubscribe<StatusChangedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<StatusChangedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<StatusChangedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SettingsChangedEvent>(), 0u);
}
