#include "ingest/logging/log_setup.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <optional>
#include <system_error>
#include <vector>

namespace ingest::logging {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kDebugLogBytes = 5 * 1024 * 1024;
constexpr std::size_t kDebugLogFiles = 3;
constexpr std::size_t kActivityLogBytes = 2 * 1024 * 1024;
constexpr std::size_t kActivityLogFiles = 2;

constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v";
constexpr const char* kConsolePattern = "[%H:%M:%S] [%^%l%$] %v";

fs::path usable_directory(const fs::path& requested) {
    if (requested.empty()) {
        return fs::current_path();
    }
    std::error_code ec;
    fs::create_directories(requested, ec);
    if (ec && !fs::is_directory(requested)) {
        spdlog::warn("Could not create log directory {}: {}; using current directory",
                     requested.string(), ec.message());
        return fs::current_path();
    }
    return requested;
}

} // namespace

Result<void> setup(const LogOptions& options) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(options.console_level);
    console->set_pattern(kConsolePattern);

    std::vector<spdlog::sink_ptr> main_sinks{console};
    std::vector<spdlog::sink_ptr> activity_sinks;
    std::optional<Error> failure;

    const fs::path directory = usable_directory(options.directory);
    try {
        auto debug_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (directory / "debug.log").string(), kDebugLogBytes, kDebugLogFiles);
        debug_file->set_level(spdlog::level::debug);
        debug_file->set_pattern(kPattern);
        main_sinks.push_back(debug_file);

        auto activity_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (directory / "activity.log").string(), kActivityLogBytes, kActivityLogFiles);
        activity_file->set_level(spdlog::level::info);
        activity_file->set_pattern(kPattern);
        activity_sinks.push_back(activity_file);
    } catch (const spdlog::spdlog_ex& e) {
        failure = Error(ErrorCode::IoError, std::string("Cannot open log files: ") + e.what());
    }

    auto main_logger = std::make_shared<spdlog::logger>("ingest", main_sinks.begin(), main_sinks.end());
    main_logger->set_level(spdlog::level::debug);
    main_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(main_logger);

    activity_sinks.insert(activity_sinks.end(), main_sinks.begin(), main_sinks.end());
    auto activity_logger = std::make_shared<spdlog::logger>(
        kActivityLoggerName, activity_sinks.begin(), activity_sinks.end());
    activity_logger->set_level(spdlog::level::info);
    activity_logger->flush_on(spdlog::level::info);
    spdlog::drop(kActivityLoggerName);
    spdlog::register_logger(activity_logger);

    if (failure) {
        spdlog::error("{}", failure->message);
        return Err<void>(*failure);
    }
    spdlog::debug("Logging to {}", directory.string());
    return Ok();
}

std::shared_ptr<spdlog::logger> activity() {
    auto logger = spdlog::get(kActivityLoggerName);
    return logger ? logger : spdlog::default_logger();
}

} // namespace ingest::logging
