#pragma once

#include "ingest/config/settings.hpp"
#include "ingest/core/result.hpp"

#include <filesystem>
#include <optional>

namespace ingest::pipeline {

enum class Bucket {
    Success,
    Failure
};

/// On-disk folder name of a bucket ("erfolg" / "fehler")
const char* bucket_directory(Bucket bucket);

/**
 * @brief Moves processed directories into {archive_root}/{bucket}/
 *
 * Never overwrites: a colliding destination gets a "_<unix-seconds>"
 * suffix, and "_<n>" on top when that exists as well. The claimed marker
 * is removed from the archived copy.
 */
class Archiver {
public:
    explicit Archiver(const config::SettingsStore& settings);

    /**
     * @brief Archive using the archive root from the current settings
     *
     * RETURNS: Destination path; nullopt when no archive root is configured
     *          (the directory stays where it is); ArchiveFailed on I/O errors
     */
    Result<std::optional<std::filesystem::path>> archive(const std::filesystem::path& directory,
                                                         Bucket bucket) const;

    static Result<std::filesystem::path> move_into(const std::filesystem::path& archive_root,
                                                   const std::filesystem::path& directory,
                                                   Bucket bucket);

private:
    const config::SettingsStore& settings_;
};

} // namespace ingest::pipeline
