#pragma once

#include "ingest/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ingest::transport {

struct ManifestEntry {
    std::filesystem::path absolute_path;
    std::string name;           ///< Path relative to the job directory, '/' separated
    std::uint64_t size = 0;
    std::string mime_type;
};

/**
 * @brief The files of one job directory, in upload order
 */
struct UploadManifest {
    std::filesystem::path directory;
    std::vector<ManifestEntry> files;

    std::uint64_t total_bytes() const;

    /// Name prefixed with the directory name ("jobA/sub/x.jpg")
    std::string qualified_name(const ManifestEntry& entry) const;
};

/**
 * @brief Collect regular files below `directory`, recursively
 *
 * Marker files are excluded at every depth. Entries are sorted by name.
 * An unreadable directory is IoError; an empty result is TransferFailed.
 */
Result<UploadManifest> build_manifest(const std::filesystem::path& directory);

std::string mime_type_for(const std::filesystem::path& file);

/**
 * @brief Remote-safe name for a directory
 *
 * Lower-case ASCII; [a-z0-9._-] kept, every run of other characters
 * becomes one '-', leading and trailing '-' removed. Never empty.
 */
std::string slugify(const std::string& name);

/**
 * @brief One slice of a file, handed to a chunk sink
 */
struct FileChunk {
    std::uint32_t index = 0;
    std::uint32_t total = 0;
    std::uint64_t offset = 0;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Read `file` in `chunk_size` slices and pass each to `sink`
 *
 * total = ceil(size / chunk_size): a zero-byte file yields no chunk. The
 * first sink error stops the loop and is returned.
 */
Result<void> for_each_chunk(const std::filesystem::path& file,
                            std::size_t chunk_size,
                            const std::function<Result<void>(FileChunk&&)>& sink);

Result<std::vector<std::uint8_t>> read_file(const std::filesystem::path& file);

} // namespace ingest::transport
