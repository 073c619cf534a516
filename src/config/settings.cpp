#include "ingest/config/settings.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace ingest::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxParallelUploads = 16;

// Accepts a number or a numeric string, like the settings dialog wrote them
Result<std::int64_t> read_integer(const json& doc, const char* key, std::int64_t fallback) {
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return Ok(fallback);
    }
    const json& value = doc.at(key);
    if (value.is_number_integer()) {
        return Ok(value.get<std::int64_t>());
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        try {
            size_t consumed = 0;
            const long long parsed = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return Ok(static_cast<std::int64_t>(parsed));
            }
        } catch (const std::exception&) {
            // Falls through to the error below
        }
    }
    return Err<std::int64_t>(ErrorCode::InvalidArgument,
                             std::string("Setting '") + key + "' must be an integer");
}

Result<std::string> read_string(const json& doc, const char* key) {
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return Ok(std::string());
    }
    if (!doc.at(key).is_string()) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                std::string("Setting '") + key + "' must be a string");
    }
    return Ok(doc.at(key).get<std::string>());
}

} // namespace

const char* to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::SimpleMultipart: return "simple_multipart";
        case TransportKind::ChunkedSession: return "chunked_session";
        case TransportKind::DirectBlob: return "direct_blob";
    }
    return "unknown";
}

Result<TransportKind> transport_kind_from_string(const std::string& text) {
    if (text == "simple_multipart") return Ok(TransportKind::SimpleMultipart);
    if (text == "chunked_session") return Ok(TransportKind::ChunkedSession);
    if (text == "direct_blob") return Ok(TransportKind::DirectBlob);
    return Err<TransportKind>(ErrorCode::InvalidArgument, "Unknown cloud service: '" + text + "'");
}

bool Settings::watch_differs(const Settings& other) const {
    return monitor_path != other.monitor_path || scan_interval != other.scan_interval;
}

bool Settings::transport_differs(const Settings& other) const {
    return selected_transport != other.selected_transport ||
           api_url != other.api_url ||
           api_bearer_token != other.api_bearer_token ||
           shortener_url != other.shortener_url ||
           shortener_api_key != other.shortener_api_key ||
           direct_blob_max_parallel != other.direct_blob_max_parallel ||
           status_poll_interval != other.status_poll_interval ||
           status_timeout != other.status_timeout ||
           chunk_size_override != other.chunk_size_override;
}

Result<Settings> parse_settings(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Err<Settings>(ErrorCode::InvalidArgument, std::string("Settings are not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return Err<Settings>(ErrorCode::InvalidArgument, "Settings document must be a JSON object");
    }

    Settings settings;

    struct StringField {
        const char* key;
        std::string* target;
    };
    std::string monitor, archive, logs;
    const StringField strings[] = {
        {"monitor_path", &monitor},
        {"archive_path", &archive},
        {"log_file_path", &logs},
        {"custom_api_url", &settings.api_url},
        {"custom_api_bearer_token", &settings.api_bearer_token},
        {"skylink_api_url", &settings.shortener_url},
        {"skylink_api_key", &settings.shortener_api_key},
        {"smtp_fallback_recipient", &settings.fallback_recipient},
    };
    for (const auto& field : strings) {
        auto value = read_string(doc, field.key);
        if (value.is_error()) {
            return Err<Settings>(value.error());
        }
        *field.target = value.value();
    }
    settings.monitor_path = monitor;
    settings.archive_path = archive;
    settings.log_file_path = logs;

    auto service = read_string(doc, "selected_cloud_service");
    if (service.is_error()) {
        return Err<Settings>(service.error());
    }
    if (!service.value().empty()) {
        auto kind = transport_kind_from_string(service.value());
        if (kind.is_error()) {
            return Err<Settings>(kind.error());
        }
        settings.selected_transport = kind.value();
    }

    auto scan = read_integer(doc, "scan_interval", 10);
    auto parallel = read_integer(doc, "direct_blob_max_parallel", 3);
    auto poll = read_integer(doc, "status_poll_interval", 2);
    auto timeout = read_integer(doc, "status_timeout", 120);
    auto chunk = read_integer(doc, "chunk_size", 0);
    for (const auto* number : {&scan, &parallel, &poll, &timeout, &chunk}) {
        if (number->is_error()) {
            return Err<Settings>(number->error());
        }
    }

    if (scan.value() < 1) {
        return Err<Settings>(ErrorCode::InvalidArgument, "scan_interval must be at least 1 second");
    }
    if (parallel.value() < 1 || parallel.value() > static_cast<std::int64_t>(kMaxParallelUploads)) {
        return Err<Settings>(ErrorCode::InvalidArgument,
                             "direct_blob_max_parallel must be between 1 and " + std::to_string(kMaxParallelUploads));
    }
    if (poll.value() < 1 || timeout.value() < poll.value()) {
        return Err<Settings>(ErrorCode::InvalidArgument,
                             "status_poll_interval must be >= 1 and not exceed status_timeout");
    }
    if (chunk.value() < 0) {
        return Err<Settings>(ErrorCode::InvalidArgument, "chunk_size must not be negative");
    }

    settings.scan_interval = std::chrono::seconds(scan.value());
    settings.direct_blob_max_parallel = static_cast<std::size_t>(parallel.value());
    settings.status_poll_interval = std::chrono::seconds(poll.value());
    settings.status_timeout = std::chrono::seconds(timeout.value());
    settings.chunk_size_override = static_cast<std::size_t>(chunk.value());
    return Ok(std::move(settings));
}

Result<Settings> load_settings(const fs::path& file) {
    std::ifstream input(file);
    if (!input) {
        return Err<Settings>(ErrorCode::ConfigurationMissing, "Cannot open settings file: " + file.string());
    }
    std::ostringstream content;
    content << input.rdbuf();

    auto parsed = parse_settings(content.str());
    if (parsed.is_error()) {
        return Err<Settings>(parsed.error().rewrap(parsed.error().code, file.string()));
    }
    return parsed;
}

SettingsStore::SettingsStore(Settings initial, events::EventBus& bus)
    : current_(std::move(initial))
    , bus_(bus) {
}

Settings SettingsStore::snapshot() const {
    std::lock_guard lock(mutex_);
    return current_;
}

events::SettingsChangedEvent SettingsStore::update(Settings next) {
    events::SettingsChangedEvent event;
    {
        std::lock_guard lock(mutex_);
        event.watch_changed = current_.watch_differs(next);
        event.transport_changed = current_.transport_differs(next);
        current_ = std::move(next);
    }
    // Emit outside the lock so handlers may call snapshot()
    bus_.emit(event);
    return event;
}

Result<events::SettingsChangedEvent> SettingsStore::reload(const fs::path& file) {
    auto loaded = load_settings(file);
    if (loaded.is_error()) {
        spdlog::error("Reloading settings failed, keeping previous values: {}", loaded.error().message);
        return Err<events::SettingsChangedEvent>(loaded.error());
    }
    auto event = update(std::move(loaded.value()));
    spdlog::info("Settings reloaded from {} (watch changed: {}, transport changed: {})",
                 file.string(), event.watch_changed, event.transport_changed);
    return Ok(event);
}

} // namespace ingest::config
