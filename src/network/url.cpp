#include "ingest/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace ingest {
namespace network {

std::string Url::host_header() const {
    const bool default_port = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
    return default_port ? host : host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(ErrorCode::InvalidArgument, "URL has no scheme: " + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(ErrorCode::InvalidArgument, "Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_begin = scheme_end + 3;
    const auto authority_end = text.find_first_of("/?#", authority_begin);
    std::string authority = text.substr(authority_begin,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_begin);

    // Userinfo is not supported, but must not be mistaken for the host
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return Err<Url>(ErrorCode::InvalidArgument, "URL has no host: " + text);
    }

    std::string port_text;
    if (authority.front() == '[') {
        // [::1]:8080
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(ErrorCode::InvalidArgument, "Unterminated IPv6 literal: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>(ErrorCode::InvalidArgument, "Malformed authority: " + text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }
    if (url.host.empty()) {
        return Err<Url>(ErrorCode::InvalidArgument, "URL has no host: " + text);
    }

    if (port_text.empty()) {
        url.port = url.is_tls() ? 443 : 80;
    } else {
        if (port_text.size() > 5 || !std::all_of(port_text.begin(), port_text.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Err<Url>(ErrorCode::InvalidArgument, "Invalid port in URL: " + text);
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(ErrorCode::InvalidArgument, "Port out of range in URL: " + text);
        }
        url.port = static_cast<std::uint16_t>(port);
    }

    if (authority_end != std::string::npos) {
        std::string rest = text.substr(authority_end);
        rest = rest.substr(0, rest.find('#'));
        url.target = rest.empty() || rest.front() != '/' ? "/" + rest : rest;
    }
    return Ok(std::move(url));
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string left = base;
    while (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    std::size_t skip = 0;
    while (skip < path.size() && path[skip] == '/') {
        ++skip;
    }
    return left + "/" + path.substr(skip);
}

std::string encode_path_segment(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace network
} // namespace ingest
