#pragma once

#include "feeder/client.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace stark_sync {
namespace feeder {

/**
 * ReplayFeederClient - feeder gateway served from memory
 *
 * Fixture format:
 *   {
 *     "contract_addresses": { "Starknet": "0x..", "GpsStatementVerifier": "0x.." },
 *     "state_updates": [ { "block_number": 0, "block_hash": .., "new_root": ..,
 *                          "old_root": .., "state_diff": {..} } ],
 *     "code": { "<address>": { "bytecode": [..], "abi": [..] } },
 *     "blocks": [ <get_block payloads> ],
 *     "transactions": [ <get_transaction payloads> ]
 *   }
 */
class ReplayFeederClient : public FeederClient {
public:
    ReplayFeederClient() = default;

    static std::unique_ptr<ReplayFeederClient> from_json(const nlohmann::json& fixture);
    static std::unique_ptr<ReplayFeederClient> from_file(const std::string& path);

    ContractAddresses get_contract_addresses() override;
    std::optional<StateUpdate> get_state_update(uint64_t block_number) override;
    ContractCode get_code(const FieldElement& address, const FieldElement& block_hash) override;
    FeederBlock get_block(const FieldElement& block_hash) override;
    FeederTransaction get_transaction(const FieldElement& tx_hash) override;

    void set_contract_addresses(const ContractAddresses& addresses);
    void add_state_update(const StateUpdate& update);
    void add_code(const FieldElement& address, const ContractCode& code);
    void add_block(const FeederBlock& block);
    void add_transaction(const FeederTransaction& tx);

    // The next `count` calls of that kind throw TransportError
    void fail_next_state_updates(size_t count);
    void fail_next_code_fetches(size_t count);

    size_t code_fetches() const;
    std::optional<uint64_t> latest_block() const;

private:
    mutable std::mutex mutex_;
    std::optional<ContractAddresses> addresses_;
    std::map<uint64_t, StateUpdate> updates_;
    std::map<FieldElement, ContractCode> code_;
    std::map<FieldElement, FeederBlock> blocks_;
    std::map<FieldElement, FeederTransaction> transactions_;
    size_t fail_updates_ = 0;
    size_t fail_code_ = 0;
    size_t code_fetches_ = 0;
};

} // namespace feeder
} // namespace stark_sync
