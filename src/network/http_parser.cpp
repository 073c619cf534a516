#include "ingest/network/http_parser.hpp"

#include <algorithm>
#include <cctype>

namespace ingest {
namespace network {
namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

bool iequals(const std::string& lhs, const std::string& rhs) {
    return detail::strcasecmp_cross_platform(lhs.c_str(), rhs.c_str()) == 0;
}

bool parse_version_token(const std::string& token, HttpVersion& out) {
    if (token == "HTTP/1.1") {
        out = HttpVersion::HTTP_1_1;
        return true;
    }
    if (token == "HTTP/1.0") {
        out = HttpVersion::HTTP_1_0;
        return true;
    }
    return false;
}

} // namespace

void HttpMessageParser::reset() {
    state_ = ParseState::START_LINE;
    method_ = HttpMethod::UNKNOWN;
    target_.clear();
    version_ = HttpVersion::HTTP_1_1;
    status_code_ = 0;
    reason_phrase_.clear();
    headers_.clear();
    body_.clear();
    buffer_.clear();
    current_header_name_.clear();
    body_remaining_ = 0;
    line_ = 1;
    last_char_was_cr_ = false;
}

Result<bool> HttpMessageParser::fail(const std::string& what) {
    state_ = ParseState::PARSE_ERROR;
    return Err<bool>(ErrorCode::ProtocolError, what + " at line " + std::to_string(line_));
}

Result<bool> HttpMessageParser::parse(const char* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::PARSE_ERROR) {
            return Err<bool>(ErrorCode::ProtocolError, "Parser in error state");
        }

        // Bulk copy for body states
        if (state_ == ParseState::BODY || state_ == ParseState::CHUNK_DATA) {
            const size_t take = std::min(body_remaining_, len - i);
            body_.insert(body_.end(), data + i, data + i + take);
            body_remaining_ -= take;
            i += take;
            if (body_remaining_ == 0) {
                state_ = state_ == ParseState::BODY ? ParseState::COMPLETE : ParseState::CHUNK_DATA_END;
            }
            continue;
        }
        if (state_ == ParseState::BODY_UNTIL_EOF) {
            body_.insert(body_.end(), data + i, data + len);
            i = len;
            continue;
        }

        const char c = data[i++];
        if (c == '\n') {
            line_++;
        }

        switch (state_) {
            case ParseState::START_LINE:
            case ParseState::CHUNK_SIZE:
            case ParseState::CHUNK_DATA_END:
            case ParseState::CHUNK_TRAILER: {
                // Line-oriented states: collect until LF, tolerate bare LF
                if (c == '\r') {
                    last_char_was_cr_ = true;
                    break;
                }
                if (c != '\n') {
                    if (last_char_was_cr_) {
                        return fail("Stray CR");
                    }
                    buffer_ += c;
                    break;
                }
                last_char_was_cr_ = false;
                std::string line = std::move(buffer_);
                buffer_.clear();

                if (state_ == ParseState::START_LINE) {
                    if (line.empty()) {
                        break;  // Leading empty lines are ignored (RFC 7230 3.5)
                    }
                    if (!parse_start_line(line)) {
                        return fail("Malformed start line");
                    }
                    state_ = ParseState::HEADER_NAME;
                } else if (state_ == ParseState::CHUNK_SIZE) {
                    if (!parse_chunk_size(line)) {
                        return fail("Malformed chunk size");
                    }
                } else if (state_ == ParseState::CHUNK_DATA_END) {
                    if (!line.empty()) {
                        return fail("Missing CRLF after chunk data");
                    }
                    state_ = ParseState::CHUNK_SIZE;
                } else if (line.empty()) {
                    state_ = ParseState::COMPLETE;
                }
                break;
            }

            case ParseState::HEADER_NAME:
                if (c == '\r') {
                    last_char_was_cr_ = true;
                    break;
                }
                if (c == '\n') {
                    last_char_was_cr_ = false;
                    if (!buffer_.empty()) {
                        return fail("Header without colon");
                    }
                    if (!on_headers_complete()) {
                        return fail("Invalid Content-Length");
                    }
                    break;
                }
                last_char_was_cr_ = false;
                if (c == ':') {
                    if (buffer_.empty()) {
                        return fail("Empty header name");
                    }
                    current_header_name_ = std::move(buffer_);
                    buffer_.clear();
                    state_ = ParseState::HEADER_VALUE;
                    break;
                }
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
                    return fail("Invalid header name character");
                }
                buffer_ += c;
                break;

            case ParseState::HEADER_VALUE:
                if (buffer_.empty() && (c == ' ' || c == '\t')) {
                    break;  // Skip leading whitespace after colon
                }
                if (c == '\r') {
                    last_char_was_cr_ = true;
                    break;
                }
                if (c == '\n') {
                    headers_[current_header_name_] = trim(buffer_);
                    buffer_.clear();
                    current_header_name_.clear();
                    last_char_was_cr_ = false;
                    state_ = ParseState::HEADER_NAME;
                    break;
                }
                last_char_was_cr_ = false;
                buffer_ += c;
                break;

            default:
                break;
        }
    }

    return Ok(state_ == ParseState::COMPLETE);
}

Result<bool> HttpMessageParser::finish() {
    if (state_ == ParseState::COMPLETE) {
        return Ok(true);
    }
    if (state_ == ParseState::BODY_UNTIL_EOF) {
        state_ = ParseState::COMPLETE;
        return Ok(true);
    }
    return Err<bool>(ErrorCode::ProtocolError, "Connection closed before message was complete");
}

bool HttpMessageParser::parse_start_line(const std::string& line) {
    const auto first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return false;
    }

    if (kind_ == Kind::Response) {
        // HTTP/1.1 200 OK
        if (!parse_version_token(line.substr(0, first_space), version_)) {
            return false;
        }
        const auto second_space = line.find(' ', first_space + 1);
        const auto code = line.substr(first_space + 1,
            second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);
        if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
            return false;
        }
        status_code_ = std::stoi(code);
        reason_phrase_ = second_space == std::string::npos ? std::string() : line.substr(second_space + 1);
        return true;
    }

    // POST /upload/chunk HTTP/1.1
    const auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string::npos) {
        return false;
    }
    method_ = HttpMethodUtils::from_string(line.substr(0, first_space));
    if (method_ == HttpMethod::UNKNOWN) {
        return false;
    }
    target_ = line.substr(first_space + 1, second_space - first_space - 1);
    if (target_.empty()) {
        return false;
    }
    return parse_version_token(line.substr(second_space + 1), version_);
}

bool HttpMessageParser::on_headers_complete() {
    const bool informational_or_empty =
        kind_ == Kind::Response &&
        (expect_no_body_ || (status_code_ >= 100 && status_code_ < 200) ||
         status_code_ == 204 || status_code_ == 304);
    if (informational_or_empty) {
        state_ = ParseState::COMPLETE;
        return true;
    }

    const std::string transfer_encoding = detail::find_header(headers_, "Transfer-Encoding");
    if (!transfer_encoding.empty() && iequals(trim(transfer_encoding), "chunked")) {
        state_ = ParseState::CHUNK_SIZE;
        return true;
    }

    const std::string content_length = detail::find_header(headers_, "Content-Length");
    if (!content_length.empty()) {
        if (!std::all_of(content_length.begin(), content_length.end(),
                [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
            return false;
        }
        body_remaining_ = static_cast<size_t>(std::stoull(content_length));
        if (body_remaining_ == 0) {
            state_ = ParseState::COMPLETE;
        } else {
            body_.reserve(body_remaining_);
            state_ = ParseState::BODY;
        }
        return true;
    }

    // Requests without a length have no body; responses run until close
    state_ = kind_ == Kind::Request ? ParseState::COMPLETE : ParseState::BODY_UNTIL_EOF;
    return true;
}

bool HttpMessageParser::parse_chunk_size(const std::string& line) {
    const std::string size_token = trim(line.substr(0, line.find(';')));
    if (size_token.empty() || !std::all_of(size_token.begin(), size_token.end(),
            [](char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; })) {
        return false;
    }
    body_remaining_ = static_cast<size_t>(std::stoull(size_token, nullptr, 16));
    state_ = body_remaining_ == 0 ? ParseState::CHUNK_TRAILER : ParseState::CHUNK_DATA;
    return true;
}

HttpRequest HttpMessageParser::get_request() const {
    HttpRequest request;
    request.method = method_;
    request.target = target_;
    request.version = version_;
    request.headers = headers_;
    request.body = body_;
    return request;
}

HttpResponse HttpMessageParser::get_response() const {
    HttpResponse response;
    response.version = version_;
    response.status_code = status_code_;
    response.reason_phrase = reason_phrase_;
    response.headers = headers_;
    response.body = body_;
    return response;
}

} // namespace network
} // namespace ingest
