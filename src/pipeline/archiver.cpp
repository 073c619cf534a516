#include "ingest/pipeline/archiver.hpp"

#include "ingest/pipeline/marker.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace ingest::pipeline {
namespace fs = std::filesystem;

namespace {

fs::path free_destination(const fs::path& wanted) {
    std::error_code ec;
    if (!fs::exists(wanted, ec)) {
        return wanted;
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const fs::path stamped = wanted.string() + "_" + std::to_string(seconds);
    if (!fs::exists(stamped, ec)) {
        return stamped;
    }
    for (int n = 1;; ++n) {
        fs::path candidate = stamped.string() + "_" + std::to_string(n);
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

// rename() cannot cross filesystems; copy then delete the source
Result<void> move_directory(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return Ok();
    }
    if (ec != std::errc::cross_device_link) {
        return Err<void>(ErrorCode::ArchiveFailed,
                         "Cannot move " + source.string() + " to " + destination.string() + ": " + ec.message());
    }

    spdlog::debug("{} is on another filesystem, copying", destination.string());
    fs::copy(source, destination, fs::copy_options::recursive, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(destination, cleanup);
        return Err<void>(ErrorCode::ArchiveFailed,
                         "Cannot copy " + source.string() + " to " + destination.string() + ": " + ec.message());
    }
    fs::remove_all(source, ec);
    if (ec) {
        return Err<void>(ErrorCode::ArchiveFailed,
                         "Copied to " + destination.string() + " but cannot remove source: " + ec.message());
    }
    return Ok();
}

} // namespace

const char* bucket_directory(Bucket bucket) {
    return bucket == Bucket::Success ? "erfolg" : "fehler";
}

Archiver::Archiver(const config::SettingsStore& settings) : settings_(settings) {}

Result<std::optional<fs::path>> Archiver::archive(const fs::path& directory, Bucket bucket) const {
    const fs::path root = settings_.snapshot().archive_path;
    if (root.empty()) {
        spdlog::warn("No archive path configured; {} is not moved", directory.string());
        return Ok(std::optional<fs::path>());
    }

    auto moved = move_into(root, directory, bucket);
    if (moved.is_error()) {
        return Err<std::optional<fs::path>>(moved.error());
    }
    return Ok(std::optional<fs::path>(moved.value()));
}

Result<fs::path> Archiver::move_into(const fs::path& archive_root, const fs::path& directory, Bucket bucket) {
    const fs::path target_dir = archive_root / bucket_directory(bucket);
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec && !fs::is_directory(target_dir)) {
        return Err<fs::path>(ErrorCode::ArchiveFailed,
                             "Cannot create " + target_dir.string() + ": " + ec.message());
    }

    const fs::path wanted = target_dir / directory.filename();
    const fs::path destination = free_destination(wanted);
    if (destination != wanted) {
        spdlog::warn("{} already exists, archiving as {}", wanted.string(), destination.filename().string());
    }

    auto moved = move_directory(directory, destination);
    if (moved.is_error()) {
        return Err<fs::path>(moved.error());
    }

    fs::remove(destination / kClaimedMarker, ec);
    if (ec) {
        spdlog::warn("Could not remove {} from {}: {}", kClaimedMarker, destination.string(), ec.message());
    }
    spdlog::info("Moved {} to {}", directory.filename().string(), destination.string());
    return Ok(destination);
}

} // namespace ingest::pipeline
