#include "ingest/pipeline/folder_watcher.hpp"

#include "ingest/events/events.hpp"
#include "ingest/pipeline/marker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <vector>

namespace ingest::pipeline {
namespace fs = std::filesystem;

FolderWatcher::FolderWatcher(const config::SettingsStore& settings, JobQueue& queue, events::EventBus& bus)
    : settings_(settings)
    , queue_(queue)
    , bus_(bus) {
}

void FolderWatcher::run() {
    running_ = true;
    bus_.emit(events::WatcherStateChangedEvent{true});
    spdlog::info("Folder watcher started");

    while (!wake_.stopped()) {
        const config::Settings settings = settings_.snapshot();
        const fs::path& root = settings.monitor_path;

        std::error_code ec;
        if (root.empty() || !fs::is_directory(root, ec)) {
            if (root.empty()) {
                spdlog::info("No watch folder configured; pausing");
            } else {
                spdlog::warn("Watch folder '{}' does not exist; pausing", root.string());
            }
            wake_.wait_for(kMissingPathPause);
            continue;
        }

        spdlog::debug("Scanning {}", root.string());
        auto report = scan_once(root);
        if (report.is_error()) {
            spdlog::error("Scan of '{}' aborted: {}", root.string(), report.error().message);
        } else if (report.value().claimed > 0 || report.value().failed > 0) {
            spdlog::info("Scan finished: {} claimed, {} failed, {} not ready",
                         report.value().claimed, report.value().failed, report.value().skipped);
        }

        if (wake_.stopped()) {
            break;
        }
        spdlog::debug("Next scan in {}s", settings.scan_interval.count());
        wake_.wait_for(settings.scan_interval);
    }

    running_ = false;
    bus_.emit(events::WatcherStateChangedEvent{false});
    spdlog::info("Folder watcher stopped");
}

void FolderWatcher::stop() {
    spdlog::info("Stopping folder watcher");
    wake_.stop();
}

void FolderWatcher::wake_up() {
    wake_.wake();
}

Result<ScanReport> FolderWatcher::scan_once(const fs::path& root) {
    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            children.push_back(it->path());
        }
    }
    if (ec) {
        return Err<ScanReport>(ErrorCode::IoError, "Cannot list " + root.string() + ": " + ec.message());
    }
    std::sort(children.begin(), children.end());

    ScanReport report;
    for (const auto& child : children) {
        if (wake_.stopped()) {
            break;
        }
        if (!is_ready(child)) {
            ++report.skipped;
            continue;
        }
        if (claim_and_enqueue(child)) {
            ++report.claimed;
        } else {
            ++report.failed;
        }
    }
    return Ok(report);
}

bool FolderWatcher::claim_and_enqueue(const fs::path& directory) {
    const std::string name = directory.filename().string();
    spdlog::info("Found ready directory: {}", name);

    Job job;
    std::error_code ec;
    job.directory_path = fs::absolute(directory, ec);
    if (ec) {
        job.directory_path = directory;
    }

    auto customer = read_customer(directory);
    if (customer.is_error()) {
        spdlog::error("Customer data of '{}' unusable, continuing without: {}", name, customer.error().message);
    } else if (!customer.value()) {
        spdlog::warn("No customer data in marker of '{}'", name);
    } else {
        job.customer = std::move(customer.value());
        spdlog::info("Customer for '{}': {} <{}>", name, job.customer->display_name(), job.customer->email);
    }

    auto claimed = claim(directory);
    if (claimed.is_error()) {
        spdlog::error("{}", claimed.error().message);
        return false;
    }

    job.claimed_at = std::chrono::system_clock::now();
    queue_.put(std::move(job));
    spdlog::info("'{}' added to the upload queue", name);
    return true;
}

} // namespace ingest::pipeline
