#pragma once

#include "ingest/core/result.hpp"
#include "ingest/pipeline/job.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ingest::pipeline {

/// Written by the producer of a directory once all files are in place
inline constexpr const char* kReadyMarker = "_fertig.txt";

/// Replaces the ready marker once a directory has been claimed for upload
inline constexpr const char* kClaimedMarker = "_in_verarbeitung.txt";

bool is_marker_file(const std::string& file_name);

/**
 * @brief True when `directory` is a directory holding the ready marker
 */
bool is_ready(const std::filesystem::path& directory);

/**
 * @brief Claim a ready directory by renaming its marker
 *
 * The rename is the only synchronisation between scanners: of several
 * concurrent claims exactly one succeeds, the rest get ClaimRaceLost.
 */
Result<void> claim(const std::filesystem::path& directory);

/**
 * @brief Parse marker content as a customer record
 *
 * Accepts the German and English key spellings. Unknown keys are ignored,
 * JSON null strings become empty. Invalid JSON or a non-object document is
 * InvalidArgument.
 */
Result<Customer> parse_customer(const std::string& text);

/**
 * @brief Read the ready marker of `directory` and parse it if non-empty
 *
 * RETURNS: nullopt for an empty (whitespace-only) marker; IoError when the
 *          marker cannot be read; parse errors from parse_customer
 */
Result<std::optional<Customer>> read_customer(const std::filesystem::path& directory);

} // namespace ingest::pipeline
