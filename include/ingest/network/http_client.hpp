#pragma once

#include <boost/asio/ssl/context.hpp>
#include "ingest/core/result.hpp"
#include "ingest/network/http_types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ingest {
namespace network {

using HttpHeaders = std::unordered_map<std::string, std::string>;

/**
 * @brief Per-call deadlines used by the transports
 *
 * Each deadline covers the whole exchange: resolve, connect, TLS handshake,
 * request write and response read.
 */
namespace timeouts {
constexpr std::chrono::seconds kHealth{10};
constexpr std::chrono::seconds kLink{30};
constexpr std::chrono::seconds kControl{60};
constexpr std::chrono::seconds kBulk{600};
constexpr std::chrono::seconds kShortener{5};
} // namespace timeouts

/**
 * @brief Blocking HTTP/1.1 client on top of Boost.Asio
 *
 * Every call runs its own io_context on the calling thread, bounded by
 * io_context::run_for(timeout). One request per connection
 * ("Connection: close"); no pooling or redirects.
 *
 * https URLs go through boost::asio::ssl with peer and host name
 * verification against the system trust store.
 *
 * Thread safety:
 * - send() and the helpers are const and may run concurrently; the shared
 *   SSL context is read-only after construction
 *
 * Usage:
 * ```cpp
 * HttpClient client;
 * auto res = client.get("https://api.example.com/health",
 *                       {{"Authorization", "Bearer ..."}}, timeouts::kHealth);
 * if (res.is_ok() && res.value().status_code == 200) { ... }
 * ```
 */
class HttpClient {
public:
    /// Read size for bodies streamed from disk by put_file()
    static constexpr std::size_t kStreamBlockSize = 256 * 1024;

    HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Send a request to an absolute URL
     *
     * The request target and Host header are taken from the URL.
     *
     * @return The response for any status code; an error only when no
     *         complete response was received (ProtocolError, IoError,
     *         Timeout, InvalidArgument for a bad URL)
     */
    Result<HttpResponse> send(const std::string& url,
                              HttpRequest request,
                              std::chrono::milliseconds timeout) const;

    Result<HttpResponse> get(const std::string& url,
                             const HttpHeaders& headers,
                             std::chrono::milliseconds timeout) const;

    Result<HttpResponse> post(const std::string& url,
                              const std::string& body,
                              const std::string& content_type,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout) const;

    Result<HttpResponse> post(const std::string& url,
                              std::vector<uint8_t> body,
                              const std::string& content_type,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout) const;

    Result<HttpResponse> put(const std::string& url,
                             std::vector<uint8_t> body,
                             const std::string& content_type,
                             const HttpHeaders& headers,
                             std::chrono::milliseconds timeout) const;

    /**
     * @brief PUT a file without loading it into memory
     *
     * Content-Length is the file size when the request starts; the body is
     * read and written kStreamBlockSize bytes at a time. A file that shrinks
     * mid-transfer fails the call with IoError.
     */
    Result<HttpResponse> put_file(const std::string& url,
                                  const std::filesystem::path& file,
                                  const std::string& content_type,
                                  const HttpHeaders& headers,
                                  std::chrono::milliseconds timeout) const;

private:
    Result<HttpResponse> perform(const std::string& url,
                                 HttpRequest request,
                                 const std::optional<std::filesystem::path>& body_file,
                                 std::chrono::milliseconds timeout) const;

    mutable boost::asio::ssl::context ssl_context_;
};

} // namespace network
} // namespace ingest
