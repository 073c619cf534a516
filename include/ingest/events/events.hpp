/**
 * @file events.hpp
 * @brief Event types published by the ingestion pipeline
 *
 * WHY THIS FILE EXISTS:
 * Defines the observable surface of the pipeline. A presentation layer
 * (console log, GUI, tests) subscribes to these on the EventBus it handed
 * to the watcher and the worker.
 *
 * NAMING CONVENTION:
 * - Events are past-tense or state snapshots: StatusChangedEvent, FileProgressEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ingest::events {

// ════════════════════════════════════════════════════════
// Progress Events
// ════════════════════════════════════════════════════════

/**
 * @brief Progress tuple shared by both progress channels
 *
 * (0, 0, 0) is the reset tuple published before and after every job.
 */
struct ProgressSnapshot {
    int percent = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;

    bool is_reset() const { return percent == 0 && bytes_done == 0 && bytes_total == 0; }
};

/**
 * @brief Progress of the file currently being transferred
 *
 * WHO EMITS: transports, through ProgressReporter
 * WHO SUBSCRIBES: presentation layer (per-file bar)
 */
struct FileProgressEvent {
    ProgressSnapshot progress;
    std::string file_name;
};

/**
 * @brief Progress of the whole directory
 *
 * WHO EMITS: transports, through ProgressReporter
 * WHO SUBSCRIBES: presentation layer (per-directory bar)
 */
struct DirectoryProgressEvent {
    ProgressSnapshot progress;
    std::string directory_name;
};

// ════════════════════════════════════════════════════════
// Status Events
// ════════════════════════════════════════════════════════

/**
 * @brief Short human-readable status line
 *
 * WHO EMITS: UploadWorker ("starting upload: jobA", "waiting for next job")
 */
struct StatusChangedEvent {
    std::string text;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief "Is a job currently running" indicator
 */
struct JobRunningChangedEvent {
    bool running = false;
    std::string directory_name;
};

/**
 * @brief Job finished (either bucket)
 */
struct JobFinishedEvent {
    std::string directory_name;
    bool succeeded = false;
    std::string detail;     ///< Share link on success, error text on failure
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted by a transport when its connection state changes
 */
struct ConnectionStatusChangedEvent {
    std::string transport;
    bool connected = false;
    std::string text;
};

/**
 * @brief Emitted when the folder watcher loop starts or stops
 */
struct WatcherStateChangedEvent {
    bool active = false;
};

/**
 * @brief Emitted by SettingsStore after a successful update
 */
struct SettingsChangedEvent {
    bool watch_changed = false;
    bool transport_changed = false;
};

} // namespace ingest::events
