#pragma once

#include "feeder/types.hpp"
#include <nlohmann/json.hpp>

namespace stark_sync {
namespace feeder {

/**
 * Feeder gateway payload codec. Parsing failures, including felts that are
 * not below the field modulus, raise DecodeError.
 */

FieldElement parse_felt(const nlohmann::json& value, const char* what);

ContractAddresses parse_contract_addresses(const nlohmann::json& obj);

// get_state_update payloads do not carry their block number
StateUpdate parse_state_update(const nlohmann::json& obj, uint64_t block_number);
nlohmann::json state_update_to_json(const StateUpdate& update);

ContractCode parse_code(const nlohmann::json& obj);
nlohmann::json code_to_json(const ContractCode& code);

FeederBlock parse_block(const nlohmann::json& obj);
nlohmann::json block_to_json(const FeederBlock& block);

// Accepts the get_transaction wrapper or a bare transaction object
FeederTransaction parse_transaction(const nlohmann::json& obj);
nlohmann::json transaction_to_json(const FeederTransaction& tx);

// "0x" + canonical hex
std::string felt_to_json_hex(const FieldElement& value);

} // namespace feeder
} // namespace stark_sync
