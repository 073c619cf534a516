#pragma once

#include "ingest/core/result.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace ingest::logging {

inline constexpr const char* kActivityLoggerName = "activity";

struct LogOptions {
    std::filesystem::path directory;            ///< Empty: current directory
    spdlog::level::level_enum console_level = spdlog::level::info;
};

/**
 * @brief Install the process loggers
 *
 * - default logger: coloured console + rotating debug.log (5 MiB x 3, debug)
 * - "activity" logger: job milestones, INFO and above, written to
 *   activity.log (2 MiB x 2) and to the default logger's sinks
 *
 * Falls back to the current directory when the log directory cannot be
 * created. Returns an error only when no file sink could be opened; the
 * console logger is installed in every case.
 */
Result<void> setup(const LogOptions& options);

/**
 * @brief The activity logger, or the default logger before setup()
 */
std::shared_ptr<spdlog::logger> activity();

} // namespace ingest::logging
