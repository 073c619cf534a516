#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace ingest::pipeline {

/**
 * @brief Publishes file and directory progress for one Job
 *
 * Transports report raw byte counts; the reporter turns them into
 * ProgressSnapshot events and keeps the directory channel monotone: a
 * report below the previous one republishes the previous value.
 *
 * THREAD SAFETY:
 * - All methods may be called from several upload threads
 */
class ProgressReporter {
public:
    ProgressReporter(events::EventBus& bus, std::string directory_name);

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    /// Publish (0, 0, 0) on both channels and forget the current Job
    void reset();

    /// Announce the byte total of the directory; publishes 0%
    void begin(std::uint64_t total_bytes);

    void file_progress(const std::string& file_name, std::uint64_t done, std::uint64_t size);

    void directory_progress(std::uint64_t done);

    /// Shortcut for transports without intermediate progress
    void complete();

    events::ProgressSnapshot last_file() const;
    events::ProgressSnapshot last_directory() const;
    std::uint64_t total_bytes() const;

    /// Integer percentage, 100 for an empty total
    static int percent_of(std::uint64_t done, std::uint64_t total);

private:
    events::EventBus& bus_;
    const std::string directory_name_;

    mutable std::mutex mutex_;
    std::uint64_t total_ = 0;
    events::ProgressSnapshot last_file_;
    events::ProgressSnapshot last_directory_;
};

} // namespace ingest::pipeline
