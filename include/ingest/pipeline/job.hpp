#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ingest::pipeline {

/**
 * @brief Customer record carried by the ready marker
 *
 * All fields are optional on the wire; strings default to empty and flags
 * to false.
 */
struct Customer {
    std::optional<std::int64_t> customer_number;
    std::string first_name;
    std::string last_name;
    std::string email;
    std::string phone;

    bool photo = false;
    bool video = false;

    bool handcam_photo = false;
    bool handcam_video = false;
    bool outside_photo = false;
    bool outside_video = false;
    bool paid_handcam_photo = false;
    bool paid_handcam_video = false;
    bool paid_outside_photo = false;
    bool paid_outside_video = false;

    bool has_email() const { return !email.empty(); }
    bool has_phone() const { return !phone.empty(); }

    std::string display_name() const {
        if (first_name.empty()) {
            return last_name;
        }
        return last_name.empty() ? first_name : first_name + " " + last_name;
    }
};

/**
 * @brief One claimed directory waiting for upload
 */
struct Job {
    std::filesystem::path directory_path;
    std::optional<Customer> customer;
    std::chrono::system_clock::time_point claimed_at{};

    std::string directory_name() const {
        return directory_path.filename().string();
    }
};

} // namespace ingest::pipeline
