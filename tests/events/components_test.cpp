#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using ingest::events::DirectoryProgressEvent;
using ingest::events::EventBus;
using ingest::events::JobFinishedEvent;
using ingest::events::LoggerComponent;
using ingest::events::MetricsComponent;
using ingest::events::ProgressSnapshot;

TEST(MetricsComponentTest, CountsJobsAndUploadedBytes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(DirectoryProgressEvent{ProgressSnapshot{0, 0, 3072}, "jobA"});
    bus.emit(DirectoryProgressEvent{ProgressSnapshot{100, 3072, 3072}, "jobA"});
    bus.emit(JobFinishedEvent{"jobA", true, "https://short/x", std::chrono::milliseconds{200}});
    bus.emit(DirectoryProgressEvent{ProgressSnapshot{}, "jobA"});

    bus.emit(DirectoryProgressEvent{ProgressSnapshot{0, 0, 500}, "jobB"});
    bus.emit(JobFinishedEvent{"jobB", false, "HTTP 500: boom", std::chrono::milliseconds{20}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.jobs_succeeded.load(), 1u);
    EXPECT_EQ(stats.jobs_failed.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 3072u);
}

TEST(MetricsComponentTest, ResetTupleDoesNotClearPendingTotal) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(DirectoryProgressEvent{ProgressSnapshot{100, 10, 10}, "jobA"});
    bus.emit(DirectoryProgressEvent{ProgressSnapshot{}, "jobA"});
    bus.emit(JobFinishedEvent{"jobA", true, "", std::chrono::milliseconds{1}});

    EXPECT_EQ(metrics.get_stats().bytes_uploaded.load(), 10u);
}

TEST(ComponentsTest, UnsubscribeOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<JobFinishedEvent>(), 2u);
        EXPECT_EQ(bus.subscriber_count<DirectoryProgressEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<JobFinishedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<DirectoryProgressEvent>(), 0u);
}
