#pragma once

#include "types/field_element.hpp"
#include "types/hash32.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stark_sync {
namespace feeder {

struct DeployedContract {
    FieldElement address;
    FieldElement contract_hash;
};

// One storage write
struct KV {
    FieldElement key;
    FieldElement value;
};

/**
 * Per-block state changes. Storage writes keep their order within one
 * contract; contracts are ordered by address.
 */
struct StateDiff {
    std::vector<DeployedContract> deployed_contracts;
    std::map<FieldElement, std::vector<KV>> storage_diffs;
};

struct StateUpdate {
    uint64_t block_number = 0;
    FieldElement block_hash;
    FieldElement new_root;
    FieldElement old_root;
    StateDiff state_diff;
};

struct ContractAddresses {
    EthAddress starknet;
    EthAddress gps_statement_verifier;
};

struct ContractCode {
    std::vector<FieldElement> bytecode;
    nlohmann::json abi = nlohmann::json::array();
};

struct FeederTransaction {
    FieldElement hash;
    std::string type;
    std::string status;
    std::optional<FieldElement> contract_address;
    std::optional<FieldElement> entry_point_selector;
    std::vector<FieldElement> calldata;
    std::vector<FieldElement> signature;
};

struct FeederBlock {
    FieldElement block_hash;
    FieldElement parent_block_hash;
    uint64_t block_number = 0;
    FieldElement state_root;
    std::string status;
    uint64_t timestamp = 0;
    std::vector<FieldElement> transaction_hashes;
};

} // namespace feeder
} // namespace stark_sync
