#pragma once

#include "ingest/core/result.hpp"

#include <cstdint>
#include <string>

namespace ingest {
namespace network {

/**
 * @brief Absolute http/https URL split into what a client connection needs
 *
 * `target` is the origin-form request target: path plus query, always
 * starting with '/'. Fragments are dropped.
 */
struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::uint16_t port = 0;
    std::string target = "/";

    bool is_tls() const { return scheme == "https"; }

    /// Host header value; the port is omitted when it is the scheme default
    std::string host_header() const;

    std::string to_string() const;

    static Result<Url> parse(const std::string& text);
};

/**
 * @brief Join a base URL and a path with exactly one '/' between them
 *
 * join_url("http://h/api/", "/upload") == "http://h/api/upload"
 */
std::string join_url(const std::string& base, const std::string& path);

/**
 * @brief Percent-encode one path segment (RFC 3986 unreserved set kept)
 */
std::string encode_path_segment(const std::string& segment);

} // namespace network
} // namespace ingest
