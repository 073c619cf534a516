#include "ingest/pipeline/marker.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <system_error>

namespace ingest::pipeline {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const json* find_key(const json& doc, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = doc.find(key);
        if (it != doc.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string string_field(const json& doc, std::initializer_list<const char*> keys) {
    const json* value = find_key(doc, keys);
    if (value == nullptr) {
        return "";
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    // Phone numbers occasionally arrive as numbers
    return value->dump();
}

bool flag_field(const json& doc, std::initializer_list<const char*> keys) {
    const json* value = find_key(doc, keys);
    if (value == nullptr) {
        return false;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0.0;
    }
    if (value->is_string()) {
        const auto text = value->get<std::string>();
        return text == "true" || text == "1" || text == "ja";
    }
    return false;
}

std::optional<std::int64_t> number_field(const json& doc, std::initializer_list<const char*> keys) {
    const json* value = find_key(doc, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        const auto number = value->get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(number);
    }
    if (value->is_number_integer()) {
        return value->get<std::int64_t>();
    }
    if (value->is_string()) {
        const auto text = value->get<std::string>();
        try {
            size_t consumed = 0;
            const long long parsed = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return static_cast<std::int64_t>(parsed);
            }
        } catch (const std::exception&) {
            // Not a number: treated as absent
        }
    }
    return std::nullopt;
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

bool is_marker_file(const std::string& file_name) {
    return file_name == kReadyMarker || file_name == kClaimedMarker;
}

bool is_ready(const fs::path& directory) {
    std::error_code ec;
    return fs::is_directory(directory, ec) && fs::is_regular_file(directory / kReadyMarker, ec);
}

Result<void> claim(const fs::path& directory) {
    std::error_code ec;
    fs::rename(directory / kReadyMarker, directory / kClaimedMarker, ec);
    if (ec) {
        return Err<void>(ErrorCode::ClaimRaceLost,
                         "Cannot claim " + directory.filename().string() + ": " + ec.message());
    }
    return Ok();
}

Result<Customer> parse_customer(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<Customer>(ErrorCode::InvalidArgument, std::string("Marker is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return Err<Customer>(ErrorCode::InvalidArgument, "Marker JSON must be an object");
    }

    Customer customer;
    customer.customer_number = number_field(doc, {"kunde_id", "customer_number"});
    customer.first_name = string_field(doc, {"vorname", "first_name"});
    customer.last_name = string_field(doc, {"nachname", "last_name"});
    customer.email = string_field(doc, {"email"});
    customer.phone = string_field(doc, {"telefon", "phone"});

    customer.photo = flag_field(doc, {"foto", "photo"});
    customer.video = flag_field(doc, {"video"});
    customer.handcam_photo = flag_field(doc, {"handcam_foto"});
    customer.handcam_video = flag_field(doc, {"handcam_video"});
    customer.outside_photo = flag_field(doc, {"outside_foto"});
    customer.outside_video = flag_field(doc, {"outside_video"});
    customer.paid_handcam_photo = flag_field(doc, {"ist_bezahlt_handcam_foto"});
    customer.paid_handcam_video = flag_field(doc, {"ist_bezahlt_handcam_video"});
    customer.paid_outside_photo = flag_field(doc, {"ist_bezahlt_outside_foto"});
    customer.paid_outside_video = flag_field(doc, {"ist_bezahlt_outside_video"});
    return Ok(std::move(customer));
}

Result<std::optional<Customer>> read_customer(const fs::path& directory) {
    const fs::path marker = directory / kReadyMarker;
    std::ifstream input(marker, std::ios::binary);
    if (!input) {
        return Err<std::optional<Customer>>(ErrorCode::IoError, "Cannot read marker " + marker.string());
    }
    std::ostringstream content;
    content << input.rdbuf();
    const std::string text = content.str();

    if (is_blank(text)) {
        return Ok(std::optional<Customer>());
    }
    auto parsed = parse_customer(text);
    if (parsed.is_error()) {
        return Err<std::optional<Customer>>(parsed.error());
    }
    return Ok(std::optional<Customer>(std::move(parsed.value())));
}

} // namespace ingest::pipeline
