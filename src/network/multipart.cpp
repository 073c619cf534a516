#include "ingest/network/multipart.hpp"

#include <algorithm>
#include <random>

namespace ingest {
namespace network {
namespace {

std::string random_boundary() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);

    std::string boundary = "----ingest-";
    for (int i = 0; i < 24; ++i) {
        boundary += alphabet[pick(rng)];
    }
    return boundary;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

std::string header_param(const std::string& headers, const std::string& key) {
    const std::string needle = "; " + key + "=\"";
    const auto pos = headers.find(needle);
    if (pos == std::string::npos) {
        return "";
    }
    std::string value;
    for (auto i = pos + needle.size(); i < headers.size() && headers[i] != '"'; ++i) {
        if (headers[i] == '\\' && i + 1 < headers.size()) {
            ++i;
        }
        value += headers[i];
    }
    return value;
}

} // namespace

MultipartForm::MultipartForm() : boundary_(random_boundary()) {}

MultipartForm::MultipartForm(std::string boundary) : boundary_(std::move(boundary)) {}

void MultipartForm::append(const std::string& text) {
    buffer_.insert(buffer_.end(), text.begin(), text.end());
}

void MultipartForm::add_field(const std::string& name, const std::string& value) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=" + quote(name) + "\r\n\r\n");
    append(value);
    append("\r\n");
    ++parts_;
}

void MultipartForm::add_file(const std::string& name,
                             const std::string& filename,
                             const std::string& content_type,
                             const std::vector<std::uint8_t>& data) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=" + quote(name) +
           "; filename=" + quote(filename) + "\r\n");
    append("Content-Type: " + content_type + "\r\n\r\n");
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    append("\r\n");
    ++parts_;
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::vector<std::uint8_t> MultipartForm::body() const {
    std::vector<std::uint8_t> out = buffer_;
    const std::string closing = "--" + boundary_ + "--\r\n";
    out.insert(out.end(), closing.begin(), closing.end());
    return out;
}

std::vector<MultipartPart> parse_multipart(const std::vector<std::uint8_t>& body,
                                           const std::string& content_type) {
    std::vector<MultipartPart> parts;

    const auto marker = content_type.find("boundary=");
    if (marker == std::string::npos) {
        return parts;
    }
    std::string boundary = content_type.substr(marker + 9);
    if (!boundary.empty() && boundary.front() == '"') {
        boundary = boundary.substr(1, boundary.find('"', 1) - 1);
    }
    const std::string delimiter = "--" + boundary;
    const std::string next_delimiter = "\r\n" + delimiter;

    auto search = [&body](std::size_t from, const std::string& needle) {
        if (from >= body.size()) {
            return std::string::npos;
        }
        auto it = std::search(body.begin() + static_cast<std::ptrdiff_t>(from), body.end(),
                              needle.begin(), needle.end());
        return it == body.end() ? std::string::npos : static_cast<std::size_t>(it - body.begin());
    };

    std::size_t pos = search(0, delimiter);
    while (pos != std::string::npos) {
        pos += delimiter.size();
        if (pos + 2 <= body.size() && body[pos] == '-' && body[pos + 1] == '-') {
            break;  // Closing delimiter
        }
        pos += 2;  // CRLF after delimiter

        const std::string header_end = "\r\n\r\n";
        const auto headers_stop = search(pos, header_end);
        if (headers_stop == std::string::npos) {
            break;
        }
        const std::string headers(body.begin() + static_cast<std::ptrdiff_t>(pos),
                                  body.begin() + static_cast<std::ptrdiff_t>(headers_stop));
        const auto data_begin = headers_stop + header_end.size();
        const auto data_end = search(data_begin, next_delimiter);
        if (data_end == std::string::npos) {
            break;
        }

        MultipartPart part;
        part.name = header_param(headers, "name");
        part.filename = header_param(headers, "filename");
        if (const auto ct = headers.find("Content-Type: "); ct != std::string::npos) {
            part.content_type = headers.substr(ct + 14, headers.find("\r\n", ct) - ct - 14);
        }
        part.data.assign(body.begin() + static_cast<std::ptrdiff_t>(data_begin),
                         body.begin() + static_cast<std::ptrdiff_t>(data_end));
        parts.push_back(std::move(part));

        pos = data_end + 2;  // Skip CRLF, land on the delimiter
    }
    return parts;
}

} // namespace network
} // namespace ingest
