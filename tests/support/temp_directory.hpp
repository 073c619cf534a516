#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ingest::testing {

/**
 * @brief Scratch directory removed on destruction
 *
 * Names carry the process id, so tests discovered by ctest can run in
 * parallel processes without sharing a directory.
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "ingest_test");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& child) const { return path_ / child; }

private:
    std::filesystem::path path_;
};

void write_file(const std::filesystem::path& file, const std::string& content);
void write_file(const std::filesystem::path& file, const std::vector<std::uint8_t>& content);
std::string read_text(const std::filesystem::path& file);

/// Deterministic non-repeating byte pattern of `size` bytes
std::vector<std::uint8_t> pattern_bytes(std::size_t size, std::uint8_t seed = 0);

/**
 * @brief Create `{parent}/{name}` with the given files and a ready marker
 *
 * `files` maps relative names to sizes; `marker` is the marker content.
 */
std::filesystem::path make_ready_directory(const std::filesystem::path& parent,
                                           const std::string& name,
                                           const std::vector<std::pair<std::string, std::size_t>>& files,
                                           const std::string& marker = "");

} // namespace ingest::testing
