#pragma once

#include "ingest/core/result.hpp"
#include "ingest/network/http_client.hpp"

#include <memory>
#include <string>

namespace ingest::transport {

/**
 * @brief Optional collaborator that turns a long share link into a short one
 *
 * Best effort: callers log the error and keep the long URL.
 */
class LinkShortener {
public:
    virtual ~LinkShortener() = default;
    virtual Result<std::string> shorten(const std::string& long_url) = 0;
};

/**
 * @brief Shortener speaking the SkyLink-style JSON API
 *
 * POST {api_url} {"long_url": "..."} with an optional bearer key;
 * 200/201 answers carry {"short_url": "..."}.
 */
class HttpLinkShortener : public LinkShortener {
public:
    HttpLinkShortener(std::string api_url, std::string api_key);

    Result<std::string> shorten(const std::string& long_url) override;

private:
    std::string api_url_;
    std::string api_key_;
    network::HttpClient http_;
};

/**
 * @brief Shortened link, or `long_url` when shortening is unavailable
 */
std::string shorten_or_keep(LinkShortener* shortener, const std::string& long_url);

} // namespace ingest::transport
