/**
 * stark_sync - Main Entry Point
 *
 * Follows the StarkNet state facts published on Ethereum, resolves the
 * memory pages behind each fact and materializes the L2 state tree into a
 * local database.
 *
 * Usage:
 *   ./stark_sync --replay tests/data/replay --once
 *   ./stark_sync --config sync.json --db /var/lib/stark_sync/state.sqlite --replay DIR
 *
 * Environment Variables:
 *   STARK_SYNC_*        Configuration overrides (see common/config.hpp)
 *   STARK_SYNC_DEBUG    Enable per-event output
 *   STARK_SYNC_PROFILE  Enable timing output
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "feeder/replay_client.hpp"
#include "l1/replay_client.hpp"
#include "storage/database.hpp"
#include "sync/synchronizer.hpp"

using namespace stark_sync;

// Set from the signal handler, polled by the main loop
static std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --config FILE    JSON configuration file" << std::endl;
    std::cerr << "  --db PATH        SQLite database file (default: in-memory)" << std::endl;
    std::cerr << "  --replay DIR     Serve L1 and feeder data from DIR/l1.json and DIR/feeder.json" << std::endl;
    std::cerr << "  --once           Exit once caught up with both L1 and the feeder" << std::endl;
    std::cerr << "  --help           Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Environment Variables:" << std::endl;
    std::cerr << "  STARK_SYNC_DB_PATH, STARK_SYNC_REPLAY_DIR, STARK_SYNC_WINDOW_SIZE, ..." << std::endl;
    std::cerr << "  STARK_SYNC_DEBUG     Enable debug output" << std::endl;
    std::cerr << "  STARK_SYNC_PROFILE   Enable timing output" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string db_path;
    std::string replay_dir;
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires FILE argument" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--db") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --db requires PATH argument" << std::endl;
                return 1;
            }
            db_path = argv[++i];
        } else if (arg == "--replay") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --replay requires DIR argument" << std::endl;
                return 1;
            }
            replay_dir = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    SyncContext context;
    try {
        context.config = config_path.empty() ? Config() : Config::from_json_file(config_path);
        context.config.apply_env();
        if (!db_path.empty()) context.config.storage.db_path = db_path;
        if (!replay_dir.empty()) context.config.storage.replay_dir = replay_dir;
        context.config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    const Config& config = context.config;

    if (config.storage.replay_dir.empty()) {
        std::cerr << "Error: No L1 or feeder transport available; pass --replay DIR" << std::endl;
        return 1;
    }

    try {
        if (config.storage.db_path.empty()) {
            context.db = std::make_shared<storage::MemoryDatabase>();
            std::cout << "[main] Database: in-memory" << std::endl;
        } else {
            context.db = std::make_shared<storage::SqliteDatabase>(config.storage.db_path);
            std::cout << "[main] Database: " << config.storage.db_path << std::endl;
        }
        context.l1 = l1::ReplayL1Client::from_file(config.storage.replay_dir + "/l1.json");
        context.feeder = feeder::ReplayFeederClient::from_file(config.storage.replay_dir + "/feeder.json");
        std::cout << "[main] Replaying from " << config.storage.replay_dir << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to open collaborators: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<Synchronizer> sync;
    try {
        sync = std::make_unique<Synchronizer>(std::move(context));
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to initialize: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    sync->start();
    std::cout << "[main] Running. Press Ctrl+C to stop." << std::endl;

    bool reported_caught_up = false;
    while (!g_stop_requested.load() && !sync->failed()) {
        if (sync->caught_up() && !reported_caught_up) {
            reported_caught_up = true;
            std::cout << "[main] Caught up" << std::endl;
            if (once) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_stop_requested.load()) {
        std::cout << "\n[main] Received signal, stopping..." << std::endl;
    }

    sync->stop();
    const bool failed = sync->failed();
    std::cout << "[main] Stopped." << std::endl;
    return failed ? 2 : 0;
}
