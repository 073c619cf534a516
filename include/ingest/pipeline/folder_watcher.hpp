#pragma once

#include "ingest/config/settings.hpp"
#include "ingest/core/blocking_queue.hpp"
#include "ingest/core/result.hpp"
#include "ingest/core/wake_signal.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/pipeline/job.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace ingest::pipeline {

using JobQueue = BlockingQueue<Job>;

/**
 * @brief Outcome of one pass over the watch folder
 */
struct ScanReport {
    std::size_t claimed = 0;    ///< Directories claimed and enqueued
    std::size_t skipped = 0;    ///< Child directories without a ready marker
    std::size_t failed = 0;     ///< Ready directories whose claim failed
};

/**
 * @brief Producer: finds ready directories, claims them, enqueues Jobs
 *
 * Settings are re-read at the start of every cycle, so a reload takes
 * effect on the next scan (or immediately after wake_up()).
 */
class FolderWatcher {
public:
    static constexpr std::chrono::seconds kMissingPathPause{60};

    FolderWatcher(const config::SettingsStore& settings, JobQueue& queue, events::EventBus& bus);

    FolderWatcher(const FolderWatcher&) = delete;
    FolderWatcher& operator=(const FolderWatcher&) = delete;

    /**
     * @brief Scan loop; returns after stop()
     *
     * BLOCKS: Yes, run it on a dedicated thread
     */
    void run();

    /// Finish the current child directory, then leave run()
    void stop();

    /// Cut the current wait short without stopping
    void wake_up();

    bool is_running() const { return running_; }

    /**
     * @brief One synchronous pass over `root`
     *
     * Child directories are visited in name order. A listing error aborts
     * the pass (IoError); per-directory problems are logged and counted.
     */
    Result<ScanReport> scan_once(const std::filesystem::path& root);

private:
    bool claim_and_enqueue(const std::filesystem::path& directory);

    const config::SettingsStore& settings_;
    JobQueue& queue_;
    events::EventBus& bus_;
    WakeSignal wake_;
    std::atomic<bool> running_{false};
};

} // namespace ingest::pipeline
