#include "ingest/pipeline/progress.hpp"

#include <algorithm>

namespace ingest::pipeline {

ProgressReporter::ProgressReporter(events::EventBus& bus, std::string directory_name)
    : bus_(bus)
    , directory_name_(std::move(directory_name)) {
}

int ProgressReporter::percent_of(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    done = std::min(done, total);
    return static_cast<int>((done * 100) / total);
}

void ProgressReporter::reset() {
    std::lock_guard lock(mutex_);
    total_ = 0;
    last_file_ = events::ProgressSnapshot{};
    last_directory_ = events::ProgressSnapshot{};
    bus_.emit(events::FileProgressEvent{last_file_, ""});
    bus_.emit(events::DirectoryProgressEvent{last_directory_, directory_name_});
}

void ProgressReporter::begin(std::uint64_t total_bytes) {
    std::lock_guard lock(mutex_);
    total_ = total_bytes;
    // An empty directory has nothing to report until complete()
    if (total_ == 0) {
        return;
    }
    last_directory_ = events::ProgressSnapshot{0, 0, total_};
    bus_.emit(events::DirectoryProgressEvent{last_directory_, directory_name_});
}

void ProgressReporter::file_progress(const std::string& file_name, std::uint64_t done, std::uint64_t size) {
    std::lock_guard lock(mutex_);
    done = std::min(done, size);
    last_file_ = events::ProgressSnapshot{percent_of(done, size), done, size};
    bus_.emit(events::FileProgressEvent{last_file_, file_name});
}

void ProgressReporter::directory_progress(std::uint64_t done) {
    std::lock_guard lock(mutex_);
    done = std::min(done, total_);
    if (done < last_directory_.bytes_done) {
        done = last_directory_.bytes_done;
    }
    last_directory_ = events::ProgressSnapshot{percent_of(done, total_), done, total_};
    bus_.emit(events::DirectoryProgressEvent{last_directory_, directory_name_});
}

void ProgressReporter::complete() {
    directory_progress(total_bytes());
}

events::ProgressSnapshot ProgressReporter::last_file() const {
    std::lock_guard lock(mutex_);
    return last_file_;
}

events::ProgressSnapshot ProgressReporter::last_directory() const {
    std::lock_guard lock(mutex_);
    return last_directory_;
}

std::uint64_t ProgressReporter::total_bytes() const {
    std::lock_guard lock(mutex_);
    return total_;
}

} // namespace ingest::pipeline
