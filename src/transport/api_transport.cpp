#include "ingest/transport/api_transport.hpp"

#include "ingest/events/events.hpp"
#include "ingest/network/url.hpp"

#include <spdlog/spdlog.h>

namespace ingest::transport {
using json = nlohmann::json;

ApiTransport::ApiTransport(ApiCredentials credentials,
                           events::EventBus& bus,
                           std::unique_ptr<LinkShortener> shortener)
    : credentials_(std::move(credentials))
    , bus_(bus)
    , shortener_(std::move(shortener)) {
}

bool ApiTransport::is_valid_token(const std::string& token) {
    if (token.rfind("key_", 0) != 0) {
        return false;
    }
    const auto dot = token.find('.', 4);
    return dot != std::string::npos && dot > 4 && dot + 1 < token.size();
}

Result<void> ApiTransport::connect() {
    if (credentials_.base_url.empty() || credentials_.bearer_token.empty()) {
        spdlog::warn("[{}] API URL or bearer token missing", name());
        set_status(false, "error: API URL/token missing");
        return Err<void>(ErrorCode::ConfigurationMissing, "API URL or bearer token missing");
    }
    if (!is_valid_token(credentials_.bearer_token)) {
        spdlog::warn("[{}] Malformed API key, expected key_<id>.<secret>", name());
        set_status(false, "error: invalid API key");
        return Err<void>(ErrorCode::ConfigurationMissing, "Malformed API key, expected key_<id>.<secret>");
    }

    spdlog::info("[{}] Checking API at {}", name(), credentials_.base_url);
    auto response = http_.get(endpoint("health"), auth_headers(), network::timeouts::kHealth);
    if (response.is_error()) {
        const bool timed_out = response.error().code == ErrorCode::Timeout;
        set_status(false, timed_out ? "timeout" : "connection error");
        return Err<void>(response.error().rewrap(ErrorCode::NotConnected, "Health check failed"));
    }
    if (response.value().status_code != 200) {
        const std::string text = "error: HTTP " + std::to_string(response.value().status_code);
        set_status(false, text);
        return Err<void>(ErrorCode::NotConnected, "Health check answered " + text.substr(7));
    }

    auto body = decode_json(response.value());
    if (body.is_error()) {
        set_status(false, "error: malformed health response");
        return Err<void>(body.error().rewrap(ErrorCode::NotConnected, "Health check"));
    }
    const std::string health = text_field(body.value(), "status");
    if (health != "healthy") {
        const std::string text = health == "unauthorized" ? "error: invalid API key" : "error: " + health;
        set_status(false, text);
        return Err<void>(ErrorCode::NotConnected, "API reports status '" + health + "'");
    }

    spdlog::info("[{}] Connected, tenant {}", name(), text_field(body.value(), "tenant_id"));
    set_status(true, "connected");
    return Ok();
}

void ApiTransport::disconnect() {
    set_status(false, "not connected");
    spdlog::info("[{}] Disconnected", name());
}

ConnectionStatus ApiTransport::status() const {
    std::lock_guard lock(status_mutex_);
    return status_;
}

Result<void> ApiTransport::ensure_connected() {
    if (status().connected) {
        return Ok();
    }
    return connect();
}

void ApiTransport::set_status(bool connected, std::string text) {
    {
        std::lock_guard lock(status_mutex_);
        if (status_.connected == connected && status_.text == text) {
            return;
        }
        status_.connected = connected;
        status_.text = text;
    }
    bus_.emit(events::ConnectionStatusChangedEvent{name(), connected, std::move(text)});
}

std::string ApiTransport::endpoint(const std::string& path) const {
    return network::join_url(credentials_.base_url, path);
}

network::HttpHeaders ApiTransport::auth_headers() const {
    return {
        {"Authorization", "Bearer " + credentials_.bearer_token},
        {"Accept", "application/json"},
    };
}

Result<json> ApiTransport::post_json(const std::string& path,
                                     const json& body,
                                     std::chrono::milliseconds timeout) const {
    // File names come straight from the filesystem and need not be UTF-8;
    // invalid sequences go out as U+FFFD instead of throwing
    const std::string text = body.dump(-1, ' ', false, json::error_handler_t::replace);
    auto response = http_.post(endpoint(path), text, "application/json", auth_headers(), timeout);
    if (response.is_error()) {
        return Err<json>(response.error().rewrap(ErrorCode::TransferFailed, "POST " + path));
    }
    if (response.value().status_code != 200) {
        return Err<json>(http_error(response.value()));
    }
    return decode_json(response.value());
}

Result<json> ApiTransport::get_json(const std::string& path, std::chrono::milliseconds timeout) const {
    auto response = http_.get(endpoint(path), auth_headers(), timeout);
    if (response.is_error()) {
        return Err<json>(response.error().rewrap(ErrorCode::TransferFailed, "GET " + path));
    }
    if (response.value().status_code != 200) {
        return Err<json>(http_error(response.value()));
    }
    return decode_json(response.value());
}

Result<json> ApiTransport::decode_json(const network::HttpResponse& response) {
    try {
        json body = json::parse(response.body_as_string());
        if (!body.is_object()) {
            return Err<json>(ErrorCode::ProtocolError, "Expected a JSON object, got: " + response.body_as_string());
        }
        return Ok(std::move(body));
    } catch (const json::parse_error& e) {
        return Err<json>(ErrorCode::ProtocolError, std::string("Response is not JSON: ") + e.what());
    }
}

std::string ApiTransport::text_field(const json& doc, const char* key) {
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string ApiTransport::id_field(const json& doc, const char* key) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<std::int64_t>());
    }
    return "";
}

json ApiTransport::customer_json(const pipeline::Customer& customer) {
    json doc{
        {"first_name", customer.first_name},
        {"last_name", customer.last_name},
        {"email", customer.email},
        {"phone", customer.phone},
        {"photo", customer.photo},
        {"video", customer.video},
        {"handcam_photo", customer.handcam_photo},
        {"handcam_video", customer.handcam_video},
        {"outside_photo", customer.outside_photo},
        {"outside_video", customer.outside_video},
        {"paid_handcam_photo", customer.paid_handcam_photo},
        {"paid_handcam_video", customer.paid_handcam_video},
        {"paid_outside_photo", customer.paid_outside_photo},
        {"paid_outside_video", customer.paid_outside_video},
    };
    if (customer.customer_number) {
        doc["customer_number"] = *customer.customer_number;
    }
    return doc;
}

json ApiTransport::files_json(const UploadManifest& manifest) {
    json files = json::array();
    for (const auto& entry : manifest.files) {
        files.push_back({{"name", entry.name}, {"size", entry.size}, {"type", entry.mime_type}});
    }
    return files;
}

Error ApiTransport::http_error(const network::HttpResponse& response) {
    return Error(ErrorCode::TransferFailed,
                 "HTTP " + std::to_string(response.status_code) + ": " + response.body_as_string());
}

std::string ApiTransport::shorten(const std::string& long_url) {
    return shorten_or_keep(shortener_.get(), long_url);
}

} // namespace ingest::transport
