#include "common/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace stark_sync {

namespace {

template <typename T>
void read_field(const nlohmann::json& section, const char* name, T& target) {
    if (!section.contains(name)) {
        return;
    }
    try {
        target = section.at(name).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Config field '") + name + "': " + e.what());
    }
}

const nlohmann::json& section_of(const nlohmann::json& json, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!json.contains(name)) {
        return empty;
    }
    const auto& section = json.at(name);
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("Config section '") + name + "' is not an object");
    }
    return section;
}

bool env_u64(const char* name, uint64_t& target) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') {
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(env, &pos);
        if (pos != std::string(env).size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = value;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Environment variable ") + name +
                                    " is not an unsigned integer: " + env);
    }
    return true;
}

bool env_string(const char* name, std::string& target) {
    const char* env = std::getenv(name);
    if (!env) {
        return false;
    }
    target = env;
    return true;
}

bool env_bool(const char* name, bool& target) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') {
        return false;
    }
    std::string value = env;
    if (value == "1" || value == "true") {
        target = true;
    } else if (value == "0" || value == "false") {
        target = false;
    } else {
        throw std::invalid_argument(std::string("Environment variable ") + name +
                                    " must be 1/0/true/false: " + value);
    }
    return true;
}

} // namespace

Config Config::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("Config root is not a JSON object");
    }
    Config config;

    const auto& network = section_of(json, "network");
    read_field(network, "chain_id_override", config.network.chain_id_override);
    read_field(network, "state_contract", config.network.state_contract);
    read_field(network, "abi_dir", config.network.abi_dir);

    const auto& ingest = section_of(json, "ingest");
    read_field(ingest, "window_size", config.ingest.window_size);
    read_field(ingest, "max_retries", config.ingest.max_retries);
    read_field(ingest, "initial_backoff_ms", config.ingest.initial_backoff_ms);
    read_field(ingest, "max_backoff_ms", config.ingest.max_backoff_ms);
    read_field(ingest, "subscription_poll_ms", config.ingest.subscription_poll_ms);
    read_field(ingest, "channel_capacity", config.ingest.channel_capacity);

    const auto& resolver = section_of(json, "resolver");
    read_field(resolver, "poll_interval_ms", config.resolver.poll_interval_ms);
    read_field(resolver, "allow_out_of_order", config.resolver.allow_out_of_order);

    const auto& state = section_of(json, "state");
    read_field(state, "poll_interval_ms", config.state.poll_interval_ms);
    read_field(state, "store_blocks", config.state.store_blocks);
    read_field(state, "max_write_retries", config.state.max_write_retries);

    const auto& storage = section_of(json, "storage");
    read_field(storage, "db_path", config.storage.db_path);
    read_field(storage, "replay_dir", config.storage.replay_dir);

    return config;
}

Config Config::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Config file " + path + " is not valid JSON: " + e.what());
    }
    return from_json(json);
}

void Config::apply_env() {
    env_u64("STARK_SYNC_CHAIN_ID", network.chain_id_override);
    env_string("STARK_SYNC_STATE_CONTRACT", network.state_contract);
    env_string("STARK_SYNC_ABI_DIR", network.abi_dir);

    env_u64("STARK_SYNC_WINDOW_SIZE", ingest.window_size);
    uint64_t retries = ingest.max_retries;
    if (env_u64("STARK_SYNC_MAX_RETRIES", retries)) {
        ingest.max_retries = static_cast<uint32_t>(retries);
    }

    env_u64("STARK_SYNC_RESOLVER_POLL_MS", resolver.poll_interval_ms);
    env_bool("STARK_SYNC_OUT_OF_ORDER", resolver.allow_out_of_order);

    env_u64("STARK_SYNC_STATE_POLL_MS", state.poll_interval_ms);
    env_bool("STARK_SYNC_STORE_BLOCKS", state.store_blocks);

    env_string("STARK_SYNC_DB_PATH", storage.db_path);
    env_string("STARK_SYNC_REPLAY_DIR", storage.replay_dir);
}

void Config::validate() const {
    if (ingest.window_size == 0) {
        throw std::invalid_argument("ingest.window_size must be positive");
    }
    if (ingest.initial_backoff_ms > ingest.max_backoff_ms) {
        throw std::invalid_argument("ingest.initial_backoff_ms exceeds ingest.max_backoff_ms");
    }
    if (ingest.subscription_poll_ms == 0) {
        throw std::invalid_argument("ingest.subscription_poll_ms must be positive");
    }
    if (ingest.channel_capacity == 0) {
        throw std::invalid_argument("ingest.channel_capacity must be positive");
    }
    if (resolver.poll_interval_ms == 0 || state.poll_interval_ms == 0) {
        throw std::invalid_argument("poll intervals must be positive");
    }
}

nlohmann::json Config::to_json() const {
    return {
        {"network", {
            {"chain_id_override", network.chain_id_override},
            {"state_contract", network.state_contract},
            {"abi_dir", network.abi_dir},
        }},
        {"ingest", {
            {"window_size", ingest.window_size},
            {"max_retries", ingest.max_retries},
            {"initial_backoff_ms", ingest.initial_backoff_ms},
            {"max_backoff_ms", ingest.max_backoff_ms},
            {"subscription_poll_ms", ingest.subscription_poll_ms},
            {"channel_capacity", ingest.channel_capacity},
        }},
        {"resolver", {
            {"poll_interval_ms", resolver.poll_interval_ms},
            {"allow_out_of_order", resolver.allow_out_of_order},
        }},
        {"state", {
            {"poll_interval_ms", state.poll_interval_ms},
            {"store_blocks", state.store_blocks},
            {"max_write_retries", state.max_write_retries},
        }},
        {"storage", {
            {"db_path", storage.db_path},
            {"replay_dir", storage.replay_dir},
        }},
    };
}

} // namespace stark_sync
