#include "ingest/pipeline/folder_watcher.hpp"
#include "ingest/pipeline/marker.hpp"

#include "temp_directory.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace fs = std::filesystem;
using ingest::config::Settings;
using ingest::config::SettingsStore;
using ingest::events::EventBus;
using ingest::events::WatcherStateChangedEvent;
using ingest::pipeline::FolderWatcher;
using ingest::pipeline::JobQueue;
using ingest::pipeline::kClaimedMarker;
using ingest::pipeline::kReadyMarker;
using ingest::testing::TempDirectory;
using ingest::testing::make_ready_directory;
using namespace std::chrono_literals;

class FolderWatcherTest : public ::testing::Test {
protected:
    FolderWatcherTest() : store_(make_settings(), bus_) {}

    Settings make_settings() {
        Settings settings;
        settings.monitor_path = inbox();
        return settings;
    }

    fs::path inbox() const { return root_.path() / "inbox"; }

    TempDirectory root_{"watcher_test"};
    EventBus bus_;
    SettingsStore store_;
    JobQueue queue_;
};

TEST_F(FolderWatcherTest, ScanClaimsReadyDirectoriesInNameOrder) {
    make_ready_directory(inbox(), "jobB", {{"b.jpg", 10}}, R"({"email": "b@example.com"})");
    make_ready_directory(inbox(), "jobA", {{"a.jpg", 10}});
    fs::create_directories(inbox() / "still_copying");
    ingest::testing::write_file(inbox() / "loose_file.txt", "x");

    FolderWatcher watcher(store_, queue_, bus_);
    auto report = watcher.scan_once(inbox());

    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().claimed, 2u);
    EXPECT_EQ(report.value().skipped, 1u);
    EXPECT_EQ(report.value().failed, 0u);

    auto first = queue_.try_take();
    auto second = queue_.try_take();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->directory_name(), "jobA");
    EXPECT_FALSE(first->customer.has_value());
    EXPECT_EQ(second->directory_name(), "jobB");
    ASSERT_TRUE(second->customer.has_value());
    EXPECT_EQ(second->customer->email, "b@example.com");
    EXPECT_TRUE(second->directory_path.is_absolute());

    EXPECT_TRUE(fs::exists(inbox() / "jobA" / kClaimedMarker));
    EXPECT_FALSE(fs::exists(inbox() / "jobA" / kReadyMarker));
}

TEST_F(FolderWatcherTest, RescanDoesNotClaimTwice) {
    make_ready_directory(inbox(), "jobA", {{"a.jpg", 10}});

    FolderWatcher watcher(store_, queue_, bus_);
    ASSERT_EQ(watcher.scan_once(inbox()).value().claimed, 1u);

    auto again = watcher.scan_once(inbox());
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().claimed, 0u);
    EXPECT_EQ(again.value().skipped, 1u);
    EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(FolderWatcherTest, BrokenCustomerDataStillEnqueues) {
    make_ready_directory(inbox(), "jobA", {{"a.jpg", 10}}, "{not json");

    FolderWatcher watcher(store_, queue_, bus_);
    ASSERT_EQ(watcher.scan_once(inbox()).value().claimed, 1u);

    auto job = queue_.try_take();
    ASSERT_TRUE(job.has_value());
    EXPECT_FALSE(job->customer.has_value());
}

TEST_F(FolderWatcherTest, ConcurrentScansClaimEachDirectoryOnce) {
    constexpr int kDirectories = 40;
    for (int i = 0; i < kDirectories; ++i) {
        make_ready_directory(inbox(), "job" + std::to_string(i), {{"f.bin", 4}});
    }

    FolderWatcher first(store_, queue_, bus_);
    FolderWatcher second(store_, queue_, bus_);
    std::atomic<std::size_t> claimed{0};

    std::thread a([&]() { claimed += first.scan_once(inbox()).value().claimed; });
    std::thread b([&]() { claimed += second.scan_once(inbox()).value().claimed; });
    a.join();
    b.join();

    EXPECT_EQ(claimed.load(), static_cast<std::size_t>(kDirectories));
    EXPECT_EQ(queue_.size(), static_cast<std::size_t>(kDirectories));
}

TEST_F(FolderWatcherTest, ListingErrorAbortsScan) {
    FolderWatcher watcher(store_, queue_, bus_);
    auto report = watcher.scan_once(root_.path() / "does_not_exist");

    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ingest::ErrorCode::IoError);
}

TEST_F(FolderWatcherTest, MissingWatchPathWaitsAndResumesAfterWake) {
    std::atomic<int> active_events{0};
    bus_.subscribe<WatcherStateChangedEvent>([&](const WatcherStateChangedEvent& e) {
        if (e.active) {
            active_events++;
        }
    });

    FolderWatcher watcher(store_, queue_, bus_);
    std::thread runner([&watcher]() { watcher.run(); });

    // Loop is parked on the missing folder
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(watcher.is_running());
    EXPECT_EQ(active_events.load(), 1);
    EXPECT_TRUE(queue_.empty());

    make_ready_directory(inbox(), "jobA", {{"a.jpg", 10}});
    watcher.wake_up();

    auto job = queue_.take_for(5s);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->directory_name(), "jobA");

    watcher.stop();
    runner.join();
    EXPECT_FALSE(watcher.is_running());
}

TEST_F(FolderWatcherTest, StopEndsIdleLoopPromptly) {
    fs::create_directories(inbox());
    FolderWatcher watcher(store_, queue_, bus_);

    std::thread runner([&watcher]() { watcher.run(); });
    std::this_thread::sleep_for(50ms);

    const auto start = std::chrono::steady_clock::now();
    watcher.stop();
    runner.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}
