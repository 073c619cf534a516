#pragma once

#include <cstdint>
#include <cstring>  // For _stricmp on Windows, strcasecmp on Unix
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

// For strcasecmp on Unix/Linux
#ifndef _WIN32
#include <strings.h>
#endif

namespace ingest {
namespace network {

/**
 * @brief HTTP request methods used by the upload protocols
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Renamed to avoid Windows macro conflict
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the pipeline reacts to explicitly
 *
 * Responses keep the raw integer; this enum only names the ones that code
 * compares against.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

namespace detail {

// Cross-platform case-insensitive string comparison
inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

} // namespace detail

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief An HTTP request, either built by the client or parsed by a server
 *
 * `target` is the origin-form request target ("/upload/chunk?x=1"). Headers
 * are stored as given and looked up case-insensitively. The body is a byte
 * vector because chunk and blob uploads carry binary data.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target = "/";
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content, const std::string& content_type) {
        body.assign(content.begin(), content.end());
        headers["Content-Type"] = content_type;
    }

    void set_body(std::vector<uint8_t> data, const std::string& content_type) {
        body = std::move(data);
        headers["Content-Type"] = content_type;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /// Path component of the target (query string stripped)
    std::string path() const {
        const auto pos = target.find('?');
        return pos == std::string::npos ? target : target.substr(0, pos);
    }

    /**
     * @brief Serialize to the HTTP/1.1 wire format
     *
     * Content-Length is always written (0 for empty bodies) so servers that
     * require it for POST/PUT are satisfied.
     */
    std::vector<uint8_t> serialize(const std::string& host_header) const {
        std::vector<uint8_t> result = serialize_head(host_header, body.size());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    /// Request line and headers up to the blank line, announcing `content_length`
    std::vector<uint8_t> serialize_head(const std::string& host_header, std::uintmax_t content_length) const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << target << " "
            << (version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1") << "\r\n";
        oss << "Host: " << host_header << "\r\n";
        for (const auto& [name, value] : headers) {
            if (detail::strcasecmp_cross_platform(name.c_str(), "Host") == 0 ||
                detail::strcasecmp_cross_platform(name.c_str(), "Content-Length") == 0) {
                continue;
            }
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << content_length << "\r\n";
        oss << "\r\n";

        std::string header_str = oss.str();
        return std::vector<uint8_t>(header_str.begin(), header_str.end());
    }
};

/**
 * @brief An HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(int status)
        : status_code(status)
        , reason_phrase(get_reason_phrase(status)) {
    }

    explicit HttpResponse(HttpStatus status)
        : HttpResponse(static_cast<int>(status)) {
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << (version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1") << " "
            << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 404: return "Not Found";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "Unknown";
        }
    }
};

} // namespace network
} // namespace ingest
