/**
 * @file components.hpp
 * @brief Ready-made subscribers for the pipeline events
 *
 * WHY THIS FILE EXISTS:
 * The daemon has no GUI; these components are its presentation layer.
 * They subscribe on construction and unsubscribe on destruction.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace ingest::events {

/**
 * @brief Logs status, connection and job events; progress at debug level
 *
 * Directory progress is logged only when the percentage moves by at least
 * ten points so large chunked uploads do not flood the log.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        status_id_ = bus_.subscribe<StatusChangedEvent>([](const StatusChangedEvent& e) {
            spdlog::info("[Status] {}", e.text);
        });

        connection_id_ = bus_.subscribe<ConnectionStatusChangedEvent>(
            [](const ConnectionStatusChangedEvent& e) {
                spdlog::info("[Connection] {} -> {} ({})", e.transport,
                             e.connected ? "connected" : "disconnected", e.text);
            });

        watcher_id_ = bus_.subscribe<WatcherStateChangedEvent>([](const WatcherStateChangedEvent& e) {
            spdlog::info("[Watcher] {}", e.active ? "active" : "stopped");
        });

        finished_id_ = bus_.subscribe<JobFinishedEvent>([](const JobFinishedEvent& e) {
            if (e.succeeded) {
                spdlog::info("[JobFinished] {} succeeded in {}ms link={}",
                             e.directory_name, e.duration.count(), e.detail);
            } else {
                spdlog::warn("[JobFinished] {} failed in {}ms: {}",
                             e.directory_name, e.duration.count(), e.detail);
            }
        });

        progress_id_ = bus_.subscribe<DirectoryProgressEvent>([this](const DirectoryProgressEvent& e) {
            on_directory_progress(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<StatusChangedEvent>(status_id_);
        bus_.unsubscribe<ConnectionStatusChangedEvent>(connection_id_);
        bus_.unsubscribe<WatcherStateChangedEvent>(watcher_id_);
        bus_.unsubscribe<JobFinishedEvent>(finished_id_);
        bus_.unsubscribe<DirectoryProgressEvent>(progress_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_directory_progress(const DirectoryProgressEvent& e) {
        if (e.progress.is_reset()) {
            last_logged_percent_ = -10;
            return;
        }
        if (e.progress.percent < last_logged_percent_ + 10 && e.progress.percent != 100) {
            return;
        }
        last_logged_percent_ = e.progress.percent;
        spdlog::debug("[Progress] {} {}% ({} / {} bytes)", e.directory_name,
                      e.progress.percent, e.progress.bytes_done, e.progress.bytes_total);
    }

    EventBus& bus_;
    size_t status_id_ = 0;
    size_t connection_id_ = 0;
    size_t watcher_id_ = 0;
    size_t finished_id_ = 0;
    size_t progress_id_ = 0;
    std::atomic<int> last_logged_percent_{-10};
};

/**
 * @brief Metrics component - counts processed jobs
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> jobs_succeeded{0};
        std::atomic<uint64_t> jobs_failed{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        finished_id_ = bus_.subscribe<JobFinishedEvent>([this](const JobFinishedEvent& e) {
            if (e.succeeded) {
                stats_.jobs_succeeded++;
                stats_.bytes_uploaded += last_total_.exchange(0);
            } else {
                stats_.jobs_failed++;
                last_total_ = 0;
            }
        });

        progress_id_ = bus_.subscribe<DirectoryProgressEvent>([this](const DirectoryProgressEvent& e) {
            if (!e.progress.is_reset()) {
                last_total_ = e.progress.bytes_total;
            }
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<JobFinishedEvent>(finished_id_);
        bus_.unsubscribe<DirectoryProgressEvent>(progress_id_);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Jobs succeeded:  {}", stats_.jobs_succeeded.load());
        spdlog::info("  Jobs failed:     {}", stats_.jobs_failed.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    std::atomic<uint64_t> last_total_{0};
    size_t finished_id_ = 0;
    size_t progress_id_ = 0;
};

} // namespace ingest::events
