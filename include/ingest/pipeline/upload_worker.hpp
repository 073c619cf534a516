#pragma once

#include "ingest/core/error.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/pipeline/archiver.hpp"
#include "ingest/pipeline/folder_watcher.hpp"
#include "ingest/pipeline/notifier.hpp"
#include "ingest/transport/transport_handle.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace ingest::pipeline {

/**
 * @brief What happened to one Job
 */
struct JobOutcome {
    bool succeeded = false;
    std::optional<std::filesystem::path> archived_to;   ///< nullopt: left in place
    std::optional<Error> error;                         ///< Set when !succeeded
    std::string share_link;                             ///< Empty when unresolved
};

/**
 * @brief Consumer: uploads claimed directories one at a time
 *
 * Job lifecycle:
 *   Received -> Uploading -> LinkResolution -> Notifying -> Archiving -> Done
 *
 * Upload errors skip straight to Archiving with the failure bucket. Link
 * and notification errors are logged and absorbed. Nothing a Job does ends
 * the loop; only stop() or a sentinel does.
 *
 * THREAD SAFETY:
 * - run() on one thread; stop() and is_busy() from any thread
 */
class UploadWorker {
public:
    UploadWorker(JobQueue& queue,
                 transport::TransportHandle& transport,
                 const Archiver& archiver,
                 Notifier& email,
                 Notifier* sms,
                 events::EventBus& bus);

    UploadWorker(const UploadWorker&) = delete;
    UploadWorker& operator=(const UploadWorker&) = delete;

    /**
     * @brief Take and process Jobs until stopped
     *
     * BLOCKS: Yes, run it on a dedicated thread
     */
    void run();

    /// The current Job finishes first; queued Jobs stay queued
    void stop();

    /**
     * @brief Process one Job synchronously
     *
     * Publishes the same events as run() but does not touch the queue.
     */
    JobOutcome process(const Job& job);

    [[nodiscard]] bool is_busy() const noexcept { return busy_; }
    [[nodiscard]] bool is_running() const noexcept { return running_; }

private:
    Result<std::string> upload(const Job& job, const std::string& target, ProgressReporter& progress);
    std::string resolve_link(transport::RemoteTransport& remote, const std::string& target);
    void notify_success(const Job& job, const std::string& share_link);
    void notify_failure(const Job& job, const Error& error);
    std::optional<std::filesystem::path> archive(const Job& job, Bucket bucket);

    JobQueue& queue_;
    transport::TransportHandle& transport_;
    const Archiver& archiver_;
    Notifier& email_;
    Notifier* sms_;
    events::EventBus& bus_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> busy_{false};
};

} // namespace ingest::pipeline
