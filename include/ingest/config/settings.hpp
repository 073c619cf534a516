#pragma once

#include "ingest/core/result.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>

namespace ingest::config {

/**
 * @brief Which wire protocol the upload worker speaks
 */
enum class TransportKind {
    SimpleMultipart,
    ChunkedSession,
    DirectBlob
};

const char* to_string(TransportKind kind);
Result<TransportKind> transport_kind_from_string(const std::string& text);

/**
 * @brief Daemon configuration, loaded from a JSON file
 *
 * Empty paths are legal: the watcher pauses on an empty monitor path and
 * the archiver leaves directories in place without an archive root.
 */
struct Settings {
    std::filesystem::path monitor_path;
    std::filesystem::path archive_path;
    std::filesystem::path log_file_path;
    std::chrono::seconds scan_interval{10};

    TransportKind selected_transport = TransportKind::SimpleMultipart;
    std::string api_url;
    std::string api_bearer_token;

    std::string shortener_url;
    std::string shortener_api_key;

    std::string fallback_recipient;

    std::size_t direct_blob_max_parallel = 3;
    std::chrono::seconds status_poll_interval{2};
    std::chrono::seconds status_timeout{120};
    std::size_t chunk_size_override = 0;  ///< 0: use the size the server announces

    /// True when fields read by the folder watcher differ
    bool watch_differs(const Settings& other) const;

    /// True when fields baked into a transport instance differ
    bool transport_differs(const Settings& other) const;
};

/**
 * @brief Parse and validate a settings document
 *
 * Unknown keys are ignored. Type mismatches and out-of-range values are
 * InvalidArgument.
 */
Result<Settings> parse_settings(const std::string& json_text);

Result<Settings> load_settings(const std::filesystem::path& file);

/**
 * @brief Thread-safe holder of the current Settings
 *
 * Readers take a copy (snapshot) so a concurrent update never tears a
 * value they are using. Updates publish SettingsChangedEvent on the bus.
 */
class SettingsStore {
public:
    SettingsStore(Settings initial, events::EventBus& bus);

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    Settings snapshot() const;

    /**
     * @brief Replace the settings and announce what changed
     *
     * RETURNS: The event that was published
     */
    events::SettingsChangedEvent update(Settings next);

    /**
     * @brief Re-read the file and update; the old value stays on error
     */
    Result<events::SettingsChangedEvent> reload(const std::filesystem::path& file);

private:
    mutable std::mutex mutex_;
    Settings current_;
    events::EventBus& bus_;
};

} // namespace ingest::config
