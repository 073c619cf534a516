#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ingest {
namespace network {

/**
 * @brief multipart/form-data body builder (RFC 7578)
 *
 * Parts are appended in order; body() renders them with the closing
 * delimiter. File parts carry raw bytes, so the body is binary.
 */
class MultipartForm {
public:
    MultipartForm();
    explicit MultipartForm(std::string boundary);

    void add_field(const std::string& name, const std::string& value);

    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  const std::vector<std::uint8_t>& data);

    /// "multipart/form-data; boundary=..."
    std::string content_type() const;

    const std::string& boundary() const { return boundary_; }

    std::vector<std::uint8_t> body() const;

    std::size_t part_count() const { return parts_; }

private:
    void append(const std::string& text);

    std::string boundary_;
    std::vector<std::uint8_t> buffer_;
    std::size_t parts_ = 0;
};

/**
 * @brief One decoded part of a multipart body
 */
struct MultipartPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::vector<std::uint8_t> data;

    std::string data_as_string() const { return std::string(data.begin(), data.end()); }
};

/**
 * @brief Split a multipart/form-data body into its parts
 *
 * Used by the in-process test server to inspect what the client sent.
 * Returns an empty vector when the boundary never appears.
 */
std::vector<MultipartPart> parse_multipart(const std::vector<std::uint8_t>& body,
                                           const std::string& content_type);

} // namespace network
} // namespace ingest
