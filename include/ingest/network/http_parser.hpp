#pragma once

#include "ingest/core/result.hpp"
#include "ingest/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace ingest {
namespace network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * HTTP message format (request or response):
 * START-LINE CRLF                  <- "POST /x HTTP/1.1" or "HTTP/1.1 200 OK"
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes, chunked, or until EOF
 */
enum class ParseState {
    START_LINE,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,              // Fixed-length body (Content-Length)
    BODY_UNTIL_EOF,    // Response without length: everything until close
    CHUNK_SIZE,        // Transfer-Encoding: chunked, size line
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after chunk data
    CHUNK_TRAILER,     // Trailer headers after the last chunk
    COMPLETE,
    PARSE_ERROR        // Renamed to avoid Windows macro conflict
};

/**
 * @brief Incremental HTTP/1.x message parser
 *
 * Feed it bytes as they arrive from the socket. The same state machine parses
 * requests (the test API server) and responses (the upload client); only the
 * start line differs.
 *
 * Usage example:
 * ```cpp
 * HttpMessageParser parser(HttpMessageParser::Kind::Response);
 * while (!parser.is_complete()) {
 *     auto n = socket.read_some(buffer);
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpMessageParser {
public:
    enum class Kind {
        Request,
        Response
    };

    explicit HttpMessageParser(Kind kind = Kind::Response) : kind_(kind) { reset(); }

    /**
     * @brief Parse incoming data
     *
     * @return true once the message is complete, false if more data is needed;
     *         error on malformed input
     */
    Result<bool> parse(const char* data, size_t len);

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a response whose body is delimited by connection close.
     * Returns an error when the message was cut short.
     */
    Result<bool> finish();

    /**
     * @brief Responses to HEAD (and 1xx/204/304) carry no body
     */
    void set_expect_no_body(bool value) { expect_no_body_ = value; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

    HttpRequest get_request() const;
    HttpResponse get_response() const;

    void reset();

private:
    Result<bool> fail(const std::string& what);

    bool parse_start_line(const std::string& line);
    bool on_headers_complete();
    bool parse_chunk_size(const std::string& line);

    Kind kind_;
    ParseState state_ = ParseState::START_LINE;

    HttpMethod method_ = HttpMethod::UNKNOWN;
    std::string target_;
    HttpVersion version_ = HttpVersion::HTTP_1_1;
    int status_code_ = 0;
    std::string reason_phrase_;
    std::unordered_map<std::string, std::string> headers_;
    std::vector<uint8_t> body_;

    std::string buffer_;                // Current token or line
    std::string current_header_name_;
    size_t body_remaining_ = 0;         // Bytes left in fixed body or current chunk
    size_t line_ = 1;                   // Current line (for error reporting)
    bool last_char_was_cr_ = false;
    bool expect_no_body_ = false;
};

} // namespace network
} // namespace ingest
