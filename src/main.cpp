#include "config_loader.hpp"
#include "modbus_session.hpp"
#include "poll_scheduler.hpp"
#include "snapshot_store.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Flags set by the signal handler and acted upon by the main loop
std::atomic<bool> g_shutdown_requested(false);
std::atomic<bool> g_reload_requested(false);

/**
 * @brief Signal handler: SIGINT/SIGTERM shut down, SIGHUP reloads the configuration.
 * @param signum The signal number received.
 */
void signal_handler(int signum) {
    if (signum == SIGHUP) {
        g_reload_requested = true;
    } else {
        g_shutdown_requested = true;
    }
}

void print_snapshot(const std::shared_ptr<const Snapshot>& snapshot) {
    std::cout << "--- Snapshot " << snapshot->cycle << " ---" << std::endl;
    for (const auto& [key, value] : snapshot->values) {
        std::cout << key << " = " << value.text() << (value.stale ? " (stale)" : "") << std::endl;
    }
}

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string config_file = "config/poller.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }
    std::cout << "Loading configuration from: " << config_file << std::endl;

    PollerConfig config;
    std::shared_ptr<const RegisterMap> register_map;
    try {
        config = ConfigLoader::loadConfig(config_file);
        register_map = std::make_shared<const RegisterMap>(
            ConfigLoader::loadRegisterMap(config.register_map_file).withOverrides(config.enable, config.disable));
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Register map loaded: " << register_map->describeEnabled().size() << " of "
              << register_map->size() << " registers enabled." << std::endl;

    // --- 2. Initialize Snapshot Store ---
    auto store = std::make_shared<SnapshotStore>();
    store->subscribe(print_snapshot);

    // --- 3. Initialize and Start Poll Scheduler ---
    auto session = std::make_unique<ModbusSession>(
        config.polling.response_timeout, BackoffPolicy(config.polling.backoff_base, config.polling.backoff_max));
    PollScheduler scheduler(register_map, std::move(session), store, config.polling);
    scheduler.start(config.connection);
    std::cout << "Polling " << config.connection.host << ":" << config.connection.port << " every "
              << config.connection.poll_interval.count() << " ms." << std::endl;

    // --- 4. Set up Signal Handler and Wait ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (g_reload_requested.exchange(false)) {
            try {
                // Only the connection section is applied live; polling options need a restart.
                PollerConfig reloaded = ConfigLoader::loadConfig(config_file);
                scheduler.configure(reloaded.connection);
            } catch (const std::exception& e) {
                std::cerr << "Reload failed, keeping current settings: " << e.what() << std::endl;
            }
        }
    }

    std::cout << "\nShutting down gracefully..." << std::endl;
    scheduler.stop();
    return 0;
}
