#include "ingest/network/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include "ingest/network/http_parser.hpp"
#include "ingest/network/url.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <type_traits>

namespace ingest {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using TlsStream = asio::ssl::stream<tcp::socket>;

namespace {

/**
 * @brief What goes on the wire: the serialized head plus a body held in
 * memory or streamed from `body_file` (exactly `body_size` bytes)
 */
struct Payload {
    std::vector<uint8_t> head;
    std::vector<uint8_t> body;
    std::optional<std::filesystem::path> body_file;
    std::uintmax_t body_size = 0;
};

/**
 * @brief One request/response exchange driven by an io_context
 *
 * Async chain: resolve -> connect -> [handshake] -> write head -> write
 * body (one block at a time for file bodies) -> read...
 * Each step either schedules the next one or records the outcome. The
 * first recorded outcome wins; handlers that run after a timeout has
 * closed the socket only see operation_aborted and are ignored.
 */
template<typename Stream>
class Exchange {
public:
    Exchange(asio::io_context& io, Stream& stream, const Url& url, Payload payload, bool head)
        : resolver_(io)
        , stream_(stream)
        , url_(url)
        , payload_(std::move(payload))
        , parser_(HttpMessageParser::Kind::Response) {
        parser_.set_expect_no_body(head);
    }

    void start() {
        resolver_.async_resolve(url_.host, std::to_string(url_.port),
            [this](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    fail(ErrorCode::IoError, "Resolve " + url_.host + " failed: " + ec.message());
                    return;
                }
                on_resolved(endpoints);
            });
    }

    /// Timeout expired: close the socket so pending handlers complete
    void abort(std::chrono::milliseconds timeout) {
        fail(ErrorCode::Timeout, "No response from " + url_.host_header() + " within " +
                                 std::to_string(timeout.count()) + "ms");
        resolver_.cancel();
        boost::system::error_code ignored;
        stream_.lowest_layer().close(ignored);
    }

    Result<HttpResponse> outcome() const {
        if (failure_) {
            return Err<HttpResponse>(*failure_);
        }
        if (!done_) {
            return Err<HttpResponse>(ErrorCode::IoError, "Exchange ended without a response");
        }
        return Ok(parser_.get_response());
    }

private:
    void on_resolved(const tcp::resolver::results_type& endpoints) {
        asio::async_connect(stream_.lowest_layer(), endpoints,
            [this](boost::system::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    fail(ErrorCode::IoError, "Connect to " + url_.host_header() + " failed: " + ec.message());
                    return;
                }
                on_connected();
            });
    }

    void on_connected() {
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            stream_.async_handshake(asio::ssl::stream_base::client,
                [this](boost::system::error_code ec) {
                    if (ec) {
                        fail(ErrorCode::IoError, "TLS handshake with " + url_.host + " failed: " + ec.message());
                        return;
                    }
                    do_write();
                });
        } else {
            do_write();
        }
    }

    void do_write() {
        if (payload_.body_file) {
            file_.open(*payload_.body_file, std::ios::binary);
            if (!file_) {
                fail(ErrorCode::IoError, "Cannot open " + payload_.body_file->string());
                return;
            }
            remaining_ = payload_.body_size;
            block_.resize(HttpClient::kStreamBlockSize);
            asio::async_write(stream_, asio::buffer(payload_.head),
                [this](boost::system::error_code ec, size_t) {
                    if (ec) {
                        fail(ErrorCode::IoError, "Sending request failed: " + ec.message());
                        return;
                    }
                    write_file_block();
                });
            return;
        }

        // Head and body go out as one buffer sequence, without joining them
        const std::array<asio::const_buffer, 2> buffers{asio::buffer(payload_.head), asio::buffer(payload_.body)};
        asio::async_write(stream_, buffers,
            [this](boost::system::error_code ec, size_t) {
                if (ec) {
                    fail(ErrorCode::IoError, "Sending request failed: " + ec.message());
                    return;
                }
                do_read();
            });
    }

    void write_file_block() {
        if (remaining_ == 0) {
            do_read();
            return;
        }
        const auto wanted = static_cast<std::streamsize>(
            std::min<std::uintmax_t>(remaining_, block_.size()));
        file_.read(block_.data(), wanted);
        const auto got = file_.gcount();
        if (got <= 0) {
            fail(ErrorCode::IoError, payload_.body_file->string() + " ended " +
                                     std::to_string(remaining_) + " bytes early");
            return;
        }
        remaining_ -= static_cast<std::uintmax_t>(got);
        asio::async_write(stream_, asio::buffer(block_.data(), static_cast<size_t>(got)),
            [this](boost::system::error_code ec, size_t) {
                if (ec) {
                    fail(ErrorCode::IoError, "Sending request body failed: " + ec.message());
                    return;
                }
                write_file_block();
            });
    }

    void do_read() {
        stream_.async_read_some(asio::buffer(buffer_),
            [this](boost::system::error_code ec, size_t bytes_transferred) {
                if (bytes_transferred > 0 && !finished()) {
                    auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
                    if (parsed.is_error()) {
                        fail(ErrorCode::ProtocolError, "Malformed response: " + parsed.error().message);
                        return;
                    }
                    if (parsed.value()) {
                        done_ = true;
                        return;
                    }
                }

                if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
                    // Peer closed: completes a close-delimited body
                    auto finished_result = parser_.finish();
                    if (finished_result.is_error()) {
                        fail(ErrorCode::ProtocolError, finished_result.error().message);
                        return;
                    }
                    done_ = true;
                    return;
                }
                if (ec) {
                    fail(ErrorCode::IoError, "Reading response failed: " + ec.message());
                    return;
                }
                if (!finished()) {
                    do_read();
                }
            });
    }

    void fail(ErrorCode code, std::string message) {
        if (finished()) {
            return;
        }
        failure_ = Error(code, std::move(message));
    }

    bool finished() const { return done_ || failure_.has_value(); }

    tcp::resolver resolver_;
    Stream& stream_;
    const Url& url_;
    Payload payload_;
    std::ifstream file_;
    std::uintmax_t remaining_ = 0;
    std::vector<char> block_;
    HttpMessageParser parser_;
    std::array<char, 16384> buffer_{};
    bool done_ = false;
    std::optional<Error> failure_;
};

template<typename Stream>
Result<HttpResponse> run_exchange(asio::io_context& io,
                                  Stream& stream,
                                  const Url& url,
                                  Payload payload,
                                  bool head,
                                  std::chrono::milliseconds timeout) {
    Exchange<Stream> exchange(io, stream, url, std::move(payload), head);
    exchange.start();

    io.run_for(timeout);
    if (!io.stopped()) {
        exchange.abort(timeout);
        io.run();  // Drain aborted handlers before the exchange goes away
    }
    return exchange.outcome();
}

HttpRequest make_request(HttpMethod method, const HttpHeaders& headers) {
    HttpRequest request;
    request.method = method;
    for (const auto& [name, value] : headers) {
        request.set_header(name, value);
    }
    return request;
}

} // namespace

HttpClient::HttpClient()
    : ssl_context_(asio::ssl::context::tls_client) {
    boost::system::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Could not load system CA certificates: {}", ec.message());
    }
    ssl_context_.set_verify_mode(asio::ssl::verify_peer);
}

Result<HttpResponse> HttpClient::send(const std::string& url,
                                      HttpRequest request,
                                      std::chrono::milliseconds timeout) const {
    return perform(url, std::move(request), std::nullopt, timeout);
}

Result<HttpResponse> HttpClient::perform(const std::string& url_text,
                                         HttpRequest request,
                                         const std::optional<std::filesystem::path>& body_file,
                                         std::chrono::milliseconds timeout) const {
    auto parsed = Url::parse(url_text);
    if (parsed.is_error()) {
        return Err<HttpResponse>(parsed.error());
    }
    const Url& url = parsed.value();

    request.target = url.target;
    if (!request.has_header("Connection")) {
        request.set_header("Connection", "close");
    }
    if (!request.has_header("User-Agent")) {
        request.set_header("User-Agent", "media-ingest/1.0");
    }
    const bool head = request.method == HttpMethod::HEAD;

    Payload payload;
    if (body_file) {
        std::error_code ec;
        payload.body_size = std::filesystem::file_size(*body_file, ec);
        if (ec) {
            return Err<HttpResponse>(ErrorCode::IoError,
                                     "Cannot stat " + body_file->string() + ": " + ec.message());
        }
        payload.body_file = body_file;
    } else {
        payload.body_size = request.body.size();
        payload.body = std::move(request.body);
    }
    payload.head = request.serialize_head(url.host_header(), payload.body_size);

    const auto started = std::chrono::steady_clock::now();
    asio::io_context io;
    Result<HttpResponse> result = Err<HttpResponse>(ErrorCode::IoError, "not sent");

    if (url.is_tls()) {
        TlsStream stream(io, ssl_context_);
        // SNI: most TLS front ends refuse the handshake without it
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            return Err<HttpResponse>(ErrorCode::IoError, "Failed to set TLS server name for " + url.host);
        }
        stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        result = run_exchange(io, stream, url, std::move(payload), head, timeout);
    } else {
        tcp::socket socket(io);
        result = run_exchange(io, socket, url, std::move(payload), head, timeout);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (result.is_ok()) {
        spdlog::debug("{} {} -> {} ({} bytes, {}ms)", HttpMethodUtils::to_string(request.method),
                      url.to_string(), result.value().status_code, result.value().body.size(),
                      elapsed.count());
    } else {
        spdlog::debug("{} {} failed after {}ms: {}", HttpMethodUtils::to_string(request.method),
                      url.to_string(), elapsed.count(), result.error().message);
    }
    return result;
}

Result<HttpResponse> HttpClient::get(const std::string& url,
                                     const HttpHeaders& headers,
                                     std::chrono::milliseconds timeout) const {
    return send(url, make_request(HttpMethod::GET, headers), timeout);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::string& content_type,
                                      const HttpHeaders& headers,
                                      std::chrono::milliseconds timeout) const {
    HttpRequest request = make_request(HttpMethod::POST, headers);
    request.set_body(body, content_type);
    return send(url, std::move(request), timeout);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      std::vector<uint8_t> body,
                                      const std::string& content_type,
                                      const HttpHeaders& headers,
                                      std::chrono::milliseconds timeout) const {
    HttpRequest request = make_request(HttpMethod::POST, headers);
    request.set_body(std::move(body), content_type);
    return send(url, std::move(request), timeout);
}

Result<HttpResponse> HttpClient::put(const std::string& url,
                                     std::vector<uint8_t> body,
                                     const std::string& content_type,
                                     const HttpHeaders& headers,
                                     std::chrono::milliseconds timeout) const {
    HttpRequest request = make_request(HttpMethod::PUT, headers);
    request.set_body(std::move(body), content_type);
    return send(url, std::move(request), timeout);
}

Result<HttpResponse> HttpClient::put_file(const std::string& url,
                                          const std::filesystem::path& file,
                                          const std::string& content_type,
                                          const HttpHeaders& headers,
                                          std::chrono::milliseconds timeout) const {
    HttpRequest request = make_request(HttpMethod::PUT, headers);
    request.set_header("Content-Type", content_type);
    return perform(url, std::move(request), file, timeout);
}

} // namespace network
} // namespace ingest
