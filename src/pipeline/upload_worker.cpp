#include "ingest/pipeline/upload_worker.hpp"

#include "ingest/events/events.hpp"
#include "ingest/logging/log_setup.hpp"
#include "ingest/pipeline/progress.hpp"
#include "ingest/transport/upload_manifest.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

namespace ingest::pipeline {
namespace fs = std::filesystem;

UploadWorker::UploadWorker(JobQueue& queue,
                           transport::TransportHandle& transport,
                           const Archiver& archiver,
                           Notifier& email,
                           Notifier* sms,
                           events::EventBus& bus)
    : queue_(queue)
    , transport_(transport)
    , archiver_(archiver)
    , email_(email)
    , sms_(sms)
    , bus_(bus) {
}

void UploadWorker::run() {
    running_ = true;
    spdlog::info("Upload worker started");

    while (!stop_requested_) {
        auto job = queue_.take();
        if (!job) {
            spdlog::debug("Upload worker received stop sentinel");
            break;
        }
        process(*job);
        queue_.task_done();
    }

    running_ = false;
    spdlog::info("Upload worker stopped");
}

void UploadWorker::stop() {
    spdlog::info("Stopping upload worker");
    stop_requested_ = true;
    queue_.put_stop();
}

JobOutcome UploadWorker::process(const Job& job) {
    const std::string name = job.directory_name();
    const auto started = std::chrono::steady_clock::now();
    ProgressReporter progress(bus_, name);

    // Received
    busy_ = true;
    progress.reset();
    bus_.emit(events::StatusChangedEvent{"starting upload: " + name});
    bus_.emit(events::JobRunningChangedEvent{true, name});
    logging::activity()->info("Upload started: {}", name);

    JobOutcome outcome;
    const std::string target = transport::slugify(name);

    // Uploading
    Result<std::string> uploaded = Err<std::string>(ErrorCode::TransferFailed, "not started");
    try {
        uploaded = upload(job, target, progress);
    } catch (const std::exception& e) {
        // Anything escaping the transport fails this Job, not the worker
        spdlog::critical("Unexpected exception while uploading '{}': {}", name, e.what());
        uploaded = Err<std::string>(ErrorCode::TransferFailed, name + ": unexpected error: " + e.what());
    }
    if (uploaded.is_ok()) {
        outcome.succeeded = true;
        outcome.share_link = uploaded.value();

        // Notifying
        notify_success(job, outcome.share_link);

        // Archiving
        outcome.archived_to = archive(job, Bucket::Success);
        logging::activity()->info("Upload succeeded: {}{}", name,
                                  outcome.share_link.empty() ? "" : " -> " + outcome.share_link);
    } else {
        outcome.error = uploaded.error();
        spdlog::error("Upload of '{}' failed: {}", name, uploaded.error().describe());
        logging::activity()->error("Upload failed: {}: {}", name, uploaded.error().message);

        outcome.archived_to = archive(job, Bucket::Failure);
        notify_failure(job, uploaded.error());
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    bus_.emit(events::JobFinishedEvent{
        name, outcome.succeeded,
        outcome.succeeded ? outcome.share_link : outcome.error->message,
        duration});
    bus_.emit(events::StatusChangedEvent{(outcome.succeeded ? "succeeded: " : "failed: ") + name});

    // Done
    progress.reset();
    bus_.emit(events::StatusChangedEvent{"waiting for next job"});
    bus_.emit(events::JobRunningChangedEvent{false, name});
    busy_ = false;
    return outcome;
}

Result<std::string> UploadWorker::upload(const Job& job, const std::string& target, ProgressReporter& progress) {
    auto remote = transport_.snapshot();
    if (!remote) {
        return Err<std::string>(ErrorCode::ConfigurationMissing, "No transport configured");
    }

    spdlog::info("Uploading '{}' via {} as '{}'", job.directory_name(), remote->name(), target);
    auto result = remote->upload_directory(job.directory_path, target, job.customer, progress);
    if (result.is_error()) {
        return Err<std::string>(result.error().code == ErrorCode::RegistrationOrphan
                                    ? result.error()
                                    : result.error().rewrap(ErrorCode::TransferFailed, job.directory_name()));
    }

    // LinkResolution
    return Ok(resolve_link(*remote, target));
}

std::string UploadWorker::resolve_link(transport::RemoteTransport& remote, const std::string& target) {
    auto link = remote.shareable_link(target);
    if (link.is_error()) {
        spdlog::warn("No share link for '{}': {}", target, link.error().describe());
        return {};
    }
    spdlog::info("Share link for '{}': {}", target, link.value());
    return link.value();
}

void UploadWorker::notify_success(const Job& job, const std::string& share_link) {
    const std::string name = job.directory_name();
    if (share_link.empty()) {
        spdlog::warn("'{}' uploaded without a share link; no notification sent", name);
        return;
    }
    if (!job.customer) {
        spdlog::warn("'{}' has no customer data; no notification sent", name);
        return;
    }
    const Customer& customer = *job.customer;
    if (!customer.has_email() && !customer.has_phone()) {
        spdlog::warn("Customer of '{}' has neither email nor phone; no notification sent", name);
        return;
    }

    auto mailed = email_.send_success(name, share_link, customer);
    if (mailed.is_error()) {
        spdlog::error("{} notification for '{}' failed: {}", email_.channel(), name, mailed.error().describe());
    }

    if (customer.has_phone() && sms_ != nullptr) {
        auto texted = sms_->send_success(name, share_link, customer);
        if (texted.is_error()) {
            spdlog::warn("{} notification for '{}' failed: {}", sms_->channel(), name, texted.error().describe());
        }
    }
}

void UploadWorker::notify_failure(const Job& job, const Error& error) {
    auto sent = email_.send_failure(job.directory_name(), error.message);
    if (sent.is_error()) {
        spdlog::error("Failure notification for '{}' failed: {}", job.directory_name(), sent.error().describe());
    }
}

std::optional<fs::path> UploadWorker::archive(const Job& job, Bucket bucket) {
    auto archived = archiver_.archive(job.directory_path, bucket);
    if (archived.is_error()) {
        spdlog::error("{}; '{}' stays in place", archived.error().describe(), job.directory_path.string());
        return std::nullopt;
    }
    if (archived.value()) {
        logging::activity()->info("Archived {} to {}", job.directory_name(), archived.value()->string());
    }
    return archived.value();
}

} // namespace ingest::pipeline
