#include "ingest/config/settings.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/logging/log_setup.hpp"
#include "ingest/pipeline/archiver.hpp"
#include "ingest/pipeline/folder_watcher.hpp"
#include "ingest/pipeline/notifier.hpp"
#include "ingest/pipeline/upload_worker.hpp"
#include "ingest/transport/transport_factory.hpp"
#include "ingest/transport/transport_handle.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

using ingest::config::Settings;
using ingest::config::SettingsStore;
using ingest::pipeline::FolderWatcher;
using ingest::pipeline::UploadWorker;
using ingest::transport::TransportHandle;

namespace {

constexpr std::chrono::seconds kStopGrace{5};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --config <settings.json> [--verbose]\n"
              << "\n"
              << "Watches the configured folder for directories marked ready,\n"
              << "uploads them and archives them into erfolg/ or fehler/.\n"
              << "\n"
              << "Signals: SIGINT/SIGTERM stop, SIGHUP reloads the settings file.\n";
}

void connect_transport(TransportHandle& handle) {
    auto transport = handle.snapshot();
    auto connected = transport->connect();
    if (connected.is_error()) {
        // Not fatal: uploads retry the connection per Job
        spdlog::warn("Transport '{}' not connected: {}", transport->name(), connected.error().describe());
    }
}

/// Warns once the grace period expires, then keeps waiting for the current Job
void join_with_grace(std::thread& thread, std::future<void>& finished, const char* what) {
    if (finished.wait_for(kStopGrace) != std::future_status::ready) {
        spdlog::warn("{}: stop requested but not yet confirmed after {}s", what, kStopGrace.count());
    }
    thread.join();
}

} // namespace

int main(int argc, char* argv[]) {
    fs::path config_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }
    if (config_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = ingest::config::load_settings(config_path);
    if (loaded.is_error()) {
        std::cerr << "Cannot load " << config_path.string() << ": " << loaded.error().describe() << "\n";
        return 1;
    }
    const Settings initial = loaded.value();

    ingest::logging::LogOptions log_options;
    log_options.directory = initial.log_file_path;
    log_options.console_level = verbose ? spdlog::level::debug : spdlog::level::info;
    auto logging_ready = ingest::logging::setup(log_options);
    if (logging_ready.is_error()) {
        spdlog::warn("File logging unavailable: {}", logging_ready.error().message);
    }

    ingest::events::EventBus event_bus;
    ingest::events::LoggerComponent logger(event_bus);
    ingest::events::MetricsComponent metrics(event_bus);

    SettingsStore settings(initial, event_bus);
    TransportHandle transport(ingest::transport::make_transport(initial, event_bus));
    connect_transport(transport);

    ingest::pipeline::JobQueue queue;
    ingest::pipeline::Archiver archiver(settings);
    ingest::pipeline::LoggingNotifier email(ingest::pipeline::LoggingNotifier::Channel::Email, settings);
    ingest::pipeline::LoggingNotifier sms(ingest::pipeline::LoggingNotifier::Channel::Sms, settings);

    FolderWatcher watcher(settings, queue, event_bus);
    UploadWorker worker(queue, transport, archiver, email, &sms, event_bus);

    std::packaged_task<void()> watcher_task([&watcher]() { watcher.run(); });
    std::packaged_task<void()> worker_task([&worker]() { worker.run(); });
    auto watcher_done = watcher_task.get_future();
    auto worker_done = worker_task.get_future();
    std::thread watcher_thread(std::move(watcher_task));
    std::thread worker_thread(std::move(worker_task));

    spdlog::info("ingestd running: watching '{}', archive '{}'",
                 initial.monitor_path.string(), initial.archive_path.string());

    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
#ifdef SIGHUP
    signals.add(SIGHUP);
#endif

    std::function<void(const boost::system::error_code&, int)> on_signal;
    on_signal = [&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
#ifdef SIGHUP
        if (signal_number == SIGHUP) {
            spdlog::info("SIGHUP: reloading {}", config_path.string());
            auto changed = settings.reload(config_path);
            if (changed.is_error()) {
                spdlog::error("Reload failed, keeping previous settings: {}", changed.error().describe());
            } else {
                if (changed.value().watch_changed) {
                    watcher.wake_up();
                }
                if (changed.value().transport_changed) {
                    transport.swap(ingest::transport::make_transport(settings.snapshot(), event_bus));
                    connect_transport(transport);
                }
            }
            signals.async_wait(on_signal);
            return;
        }
#endif
        spdlog::info("Signal {} received, shutting down", signal_number);
        io.stop();
    };
    signals.async_wait(on_signal);
    io.run();

    watcher.stop();
    worker.stop();
    join_with_grace(watcher_thread, watcher_done, "Folder watcher");
    join_with_grace(worker_thread, worker_done, "Upload worker");

    transport.snapshot()->disconnect();
    metrics.print_stats();
    spdlog::shutdown();
    return 0;
}
