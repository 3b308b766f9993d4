#include "feeder/replay_client.hpp"
#include "common/errors.hpp"
#include "feeder/json_codec.hpp"
#include <fstream>
#include <iostream>

namespace stark_sync {
namespace feeder {

std::unique_ptr<ReplayFeederClient> ReplayFeederClient::from_json(const nlohmann::json& fixture) {
    auto client = std::make_unique<ReplayFeederClient>();
    if (fixture.contains("contract_addresses")) {
        client->set_contract_addresses(parse_contract_addresses(fixture.at("contract_addresses")));
    }
    if (fixture.contains("state_updates")) {
        for (const auto& entry : fixture.at("state_updates")) {
            if (!entry.contains("block_number") || !entry.at("block_number").is_number_unsigned()) {
                throw DecodeError("Replay state update without block_number");
            }
            client->add_state_update(parse_state_update(entry, entry.at("block_number").get<uint64_t>()));
        }
    }
    if (fixture.contains("code")) {
        for (auto it = fixture.at("code").begin(); it != fixture.at("code").end(); ++it) {
            client->add_code(parse_felt(nlohmann::json(it.key()), "code address"), parse_code(it.value()));
        }
    }
    if (fixture.contains("blocks")) {
        for (const auto& entry : fixture.at("blocks")) {
            client->add_block(parse_block(entry));
        }
    }
    if (fixture.contains("transactions")) {
        for (const auto& entry : fixture.at("transactions")) {
            client->add_transaction(parse_transaction(entry));
        }
    }
    std::cout << "[feeder] Loaded replay gateway state_updates=" << client->updates_.size()
              << " contracts=" << client->code_.size()
              << " blocks=" << client->blocks_.size() << std::endl;
    return client;
}

std::unique_ptr<ReplayFeederClient> ReplayFeederClient::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return from_json(nlohmann::json::parse(file));
}

ContractAddresses ReplayFeederClient::get_contract_addresses() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!addresses_) {
        throw TransportError("get_contract_addresses: not available");
    }
    return *addresses_;
}

std::optional<StateUpdate> ReplayFeederClient::get_state_update(uint64_t block_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_updates_ > 0) {
        --fail_updates_;
        throw TransportError("get_state_update failed block_number=" + std::to_string(block_number));
    }
    auto it = updates_.find(block_number);
    if (it == updates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ContractCode ReplayFeederClient::get_code(const FieldElement& address, const FieldElement& block_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++code_fetches_;
    if (fail_code_ > 0) {
        --fail_code_;
        throw TransportError("get_code failed address=0x" + address.to_hex() +
                             " block_hash=0x" + block_hash.to_hex());
    }
    auto it = code_.find(address);
    if (it == code_.end()) {
        throw TransportError("get_code: unknown contract address=0x" + address.to_hex());
    }
    return it->second;
}

FeederBlock ReplayFeederClient::get_block(const FieldElement& block_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blocks_.find(block_hash);
    if (it == blocks_.end()) {
        throw TransportError("get_block: unknown block_hash=0x" + block_hash.to_hex());
    }
    return it->second;
}

FeederTransaction ReplayFeederClient::get_transaction(const FieldElement& tx_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(tx_hash);
    if (it == transactions_.end()) {
        throw TransportError("get_transaction: unknown tx_hash=0x" + tx_hash.to_hex());
    }
    return it->second;
}

void ReplayFeederClient::set_contract_addresses(const ContractAddresses& addresses) {
    std::lock_guard<std::mutex> lock(mutex_);
    addresses_ = addresses;
}

void ReplayFeederClient::add_state_update(const StateUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    updates_[update.block_number] = update;
}

void ReplayFeederClient::add_code(const FieldElement& address, const ContractCode& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    code_[address] = code;
}

void ReplayFeederClient::add_block(const FeederBlock& block) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocks_[block.block_hash] = block;
}

void ReplayFeederClient::add_transaction(const FeederTransaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);
    transactions_[tx.hash] = tx;
}

void ReplayFeederClient::fail_next_state_updates(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_updates_ = count;
}

void ReplayFeederClient::fail_next_code_fetches(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_code_ = count;
}

size_t ReplayFeederClient::code_fetches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return code_fetches_;
}

std::optional<uint64_t> ReplayFeederClient::latest_block() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (updates_.empty()) {
        return std::nullopt;
    }
    return updates_.rbegin()->first;
}

} // namespace feeder
} // namespace stark_sync
