#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/network/http_client.hpp"
#include "ingest/transport/link_shortener.hpp"
#include "ingest/transport/remote_transport.hpp"
#include "ingest/transport/upload_manifest.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace ingest::transport {

/**
 * @brief Base URL and API key of the upload service
 */
struct ApiCredentials {
    std::string base_url;       ///< e.g. "https://cloud.example.com/api"
    std::string bearer_token;   ///< "key_<id>.<secret>"
};

/**
 * @brief Shared plumbing of the three upload protocols
 *
 * All variants talk to the same service: same base URL, same bearer
 * token, same health check. Each variant gets its own instance of this
 * base; nothing here is shared between variants.
 */
class ApiTransport : public RemoteTransport {
public:
    ApiTransport(ApiCredentials credentials,
                 events::EventBus& bus,
                 std::unique_ptr<LinkShortener> shortener);

    /**
     * @brief GET {base}/health with the bearer token
     *
     * Connected only for 200 + {"status": "healthy"}.
     */
    Result<void> connect() override;

    void disconnect() override;

    ConnectionStatus status() const override;

    /// True when the token looks like "key_<id>.<secret>"
    static bool is_valid_token(const std::string& token);

protected:
    /// connect() unless already connected
    Result<void> ensure_connected();

    std::string endpoint(const std::string& path) const;

    network::HttpHeaders auth_headers() const;

    /**
     * @brief POST a JSON document and decode the JSON answer
     *
     * Any status other than 200 is TransferFailed "HTTP <code>: <body>".
     */
    Result<nlohmann::json> post_json(const std::string& path,
                                     const nlohmann::json& body,
                                     std::chrono::milliseconds timeout) const;

    Result<nlohmann::json> get_json(const std::string& path, std::chrono::milliseconds timeout) const;

    static Result<nlohmann::json> decode_json(const network::HttpResponse& response);

    /// String member of `doc`, or "" when missing, null or not a string
    static std::string text_field(const nlohmann::json& doc, const char* key);

    /// Identifier member that may arrive as a string or an integer
    static std::string id_field(const nlohmann::json& doc, const char* key);

    /// Customer record as upload metadata
    static nlohmann::json customer_json(const pipeline::Customer& customer);

    /// Manifest as [{name, size, type}]
    static nlohmann::json files_json(const UploadManifest& manifest);

    /// "HTTP <code>: <body>"
    static Error http_error(const network::HttpResponse& response);

    std::string shorten(const std::string& long_url);

    const network::HttpClient& http() const { return http_; }
    const ApiCredentials& credentials() const { return credentials_; }
    events::EventBus& bus() { return bus_; }

private:
    void set_status(bool connected, std::string text);

    ApiCredentials credentials_;
    events::EventBus& bus_;
    std::unique_ptr<LinkShortener> shortener_;
    network::HttpClient http_;

    mutable std::mutex status_mutex_;
    ConnectionStatus status_;
};

} // namespace ingest::transport
