#include "ingest/transport/link_shortener.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ingest::transport {
using json = nlohmann::json;

HttpLinkShortener::HttpLinkShortener(std::string api_url, std::string api_key)
    : api_url_(std::move(api_url))
    , api_key_(std::move(api_key)) {
}

Result<std::string> HttpLinkShortener::shorten(const std::string& long_url) {
    if (api_url_.empty()) {
        return Err<std::string>(ErrorCode::ConfigurationMissing, "No shortener URL configured");
    }

    network::HttpHeaders headers{{"Accept", "application/json"}};
    if (!api_key_.empty()) {
        headers["Authorization"] = "Bearer " + api_key_;
    }

    const std::string request_body =
        json{{"long_url", long_url}}.dump(-1, ' ', false, json::error_handler_t::replace);
    auto response = http_.post(api_url_, request_body, "application/json", headers, network::timeouts::kShortener);
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }

    const auto& res = response.value();
    if (res.status_code != 200 && res.status_code != 201) {
        if (res.status_code == 401) {
            spdlog::error("Link shortener rejected the API key");
        }
        return Err<std::string>(ErrorCode::ProtocolError,
                                "Shortener answered HTTP " + std::to_string(res.status_code) +
                                " (Content-Type: " + res.get_header("Content-Type") + ")");
    }

    try {
        const json body = json::parse(res.body_as_string());
        const std::string short_url = body.value("short_url", "");
        if (short_url.empty()) {
            return Err<std::string>(ErrorCode::ProtocolError, "Shortener response has no short_url");
        }
        return Ok(short_url);
    } catch (const json::exception& e) {
        return Err<std::string>(ErrorCode::ProtocolError, std::string("Shortener response is not JSON: ") + e.what());
    }
}

std::string shorten_or_keep(LinkShortener* shortener, const std::string& long_url) {
    if (shortener == nullptr) {
        return long_url;
    }
    spdlog::info("Shortening link {}", long_url);
    auto shortened = shortener->shorten(long_url);
    if (shortened.is_error()) {
        spdlog::warn("Link shortening failed, using the original link: {}", shortened.error().message);
        return long_url;
    }
    spdlog::info("Shortened link: {}", shortened.value());
    return shortened.value();
}

} // namespace ingest::transport
