#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace stark_sync {

/**
 * Config - runtime settings
 *
 * Sources, later ones winning: built-in defaults, a JSON file, then
 * STARK_SYNC_* environment variables.
 *
 * JSON layout mirrors the struct:
 *   {
 *     "network":  { "chain_id_override": 0, "state_contract": "", "abi_dir": "" },
 *     "ingest":   { "window_size": 10000, "max_retries": 5, ... },
 *     "resolver": { "poll_interval_ms": 5000, "allow_out_of_order": false },
 *     "state":    { "poll_interval_ms": 120000, "store_blocks": true, "max_write_retries": 3 },
 *     "storage":  { "db_path": "", "replay_dir": "" }
 *   }
 */
struct Config {
    struct Network {
        uint64_t chain_id_override = 0;   // 0 = ask the L1 node
        std::string state_contract;       // empty = ask the feeder gateway
        std::string abi_dir;              // empty = built-in event definitions
    } network;

    struct Ingest {
        uint64_t window_size = 10000;
        uint32_t max_retries = 5;
        uint64_t initial_backoff_ms = 1000;
        uint64_t max_backoff_ms = 30000;
        uint64_t subscription_poll_ms = 1000;
        size_t channel_capacity = 1024;
    } ingest;

    struct Resolver {
        uint64_t poll_interval_ms = 5000;
        bool allow_out_of_order = false;
    } resolver;

    struct State {
        uint64_t poll_interval_ms = 120000;
        bool store_blocks = true;
        uint32_t max_write_retries = 3;
    } state;

    struct Storage {
        std::string db_path;     // empty = in-memory database
        std::string replay_dir;  // l1.json / feeder.json fixtures
    } storage;

    /**
     * @throws std::invalid_argument on values of the wrong type
     */
    static Config from_json(const nlohmann::json& json);
    static Config from_json_file(const std::string& path);

    // Apply STARK_SYNC_* overrides
    void apply_env();

    // @throws std::invalid_argument when a setting is out of range
    void validate() const;

    nlohmann::json to_json() const;
};

} // namespace stark_sync
