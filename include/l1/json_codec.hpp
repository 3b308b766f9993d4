#pragma once

#include "l1/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace stark_sync {
namespace l1 {

/**
 * Ethereum JSON-RPC object codec (logs, transactions, quantities).
 *
 * Parsing failures raise DecodeError.
 */

// "0x1a" -> 26. Plain JSON numbers are accepted as well.
uint64_t parse_quantity(const nlohmann::json& value);
std::string format_quantity(uint64_t value);

L1Log parse_log(const nlohmann::json& obj);
nlohmann::json log_to_json(const L1Log& log);

L1Transaction parse_transaction(const nlohmann::json& obj);
nlohmann::json transaction_to_json(const L1Transaction& tx);

} // namespace l1
} // namespace stark_sync
