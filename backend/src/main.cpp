/**
 * nodeward — Backend Entry Point
 *
 * Loads config, restores the persisted data path, then serves the local
 * command API and polls the node's liveness until interrupted.
 */

#include <csignal>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "api/command_surface.h"
#include "api/event_journal.h"
#include "api/local_api.h"
#include "config/app_config.h"
#include "config/settings_store.h"
#include "crypto/sha256.h"
#include "node/status_poller.h"
#include "node/supervisor.h"
#include "version.h"

using namespace nodeward;

namespace {

constexpr unsigned kApiThreads = 4;

void print_usage(const char* argv0) {
    spdlog::info("usage: {} [config.json] [--verbose]", argv0);
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::string config_path = "config.json";
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            config_path = argv[i];
        }
    }

    auto loaded = AppConfig::load(config_path);
    if (!loaded) return 1;
    const AppConfig& config = *loaded;

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));
    spdlog::info("nodeward {} starting…", NODEWARD_VERSION);
    spdlog::info("Loaded config from {}", config_path);

    if (!Sha256::init()) return 1;

    SettingsStore settings(config.settings_path, config.default_data_path);
    spdlog::info("Data path: {}", settings.current_data_path().string());
    if (!Supervisor::executable_exists(settings.current_data_path())) {
        spdlog::warn("OpenHash executable not found. Run check_and_download_update to fetch it.");
    }

    Downloader downloader(config.release_index_url, config.asset_name,
                          std::string("nodeward/") + NODEWARD_VERSION);
    Supervisor supervisor(std::move(downloader), config.terminate_grace);
    EventJournal journal(supervisor.events());
    CommandSurface commands(supervisor, settings, journal);

    asio::io_context io;
    std::unique_ptr<LocalAPI> api;
    try {
        api = std::make_unique<LocalAPI>(io, config.api_port, commands);
    } catch (const asio::system_error& e) {
        spdlog::error("Cannot listen on 127.0.0.1:{}: {}", config.api_port, e.what());
        return 1;
    }
    api->start();

    // Liveness polling gets its own thread so slow API clients cannot starve it.
    asio::io_context poll_io;
    StatusPoller poller(poll_io, supervisor, config.poll_interval);
    poller.start();
    std::thread poll_thread([&poll_io] { poll_io.run(); });

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Received signal {}, shutting down", signo);
        poller.stop();
        api->stop();
        io.stop();
    });

    spdlog::info("Backend ready. Press Ctrl+C to exit.");

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < kApiThreads; ++i) {
        workers.emplace_back([&io] { io.run(); });
    }
    io.run();
    for (auto& t : workers) t.join();

    poller.stop();
    poll_thread.join();

    // The journal unsubscribes before the supervisor goes away, so no update
    // worker may still be publishing to it.
    supervisor.wait_for_update();

    // Supervisor's destructor stops the node.
    return 0;
}
