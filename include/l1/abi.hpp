#pragma once

#include "types/hash32.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace stark_sync {
namespace abi {

/**
 * Minimal Solidity event ABI decoder.
 *
 * Supported parameter types: bytes32, uint256, address, bool and the dynamic
 * array bytes32[]. uint256 values are kept as their 32-byte big-endian word.
 */

enum class ParamType {
    Bytes32,
    Uint256,
    Address,
    Bool,
    Bytes32Array,
};

ParamType parse_param_type(const std::string& type);
const char* param_type_name(ParamType type);

struct EventParam {
    std::string name;
    ParamType type;
    bool indexed = false;
};

struct EventAbi {
    std::string name;
    std::vector<EventParam> inputs;
};

using Value = std::variant<Hash32, EthAddress, bool, std::vector<Hash32>>;
using FieldMap = std::map<std::string, Value>;

// Built-in definitions of the three watched events
const EventAbi& log_state_transition_fact();
const EventAbi& log_memory_pages_hashes();
const EventAbi& log_memory_page_fact_continuous();

/**
 * Find `event_name` in a contract ABI (the JSON array solc emits).
 *
 * @throws DecodeError if the event is missing or uses an unsupported type
 */
EventAbi parse_event_abi(const nlohmann::json& contract_abi, const std::string& event_name);
EventAbi load_event_abi(const std::string& path, const std::string& event_name);

/**
 * Decode the non-indexed parameters of an event from the log data.
 *
 * @throws DecodeError on truncated data, bad offsets or out-of-range values
 */
FieldMap decode_event_data(const EventAbi& event, const Bytes& data);

/**
 * Decode indexed parameters from topics[1..] and the rest from the data.
 */
FieldMap decode_event(const EventAbi& event, const std::vector<Hash32>& topics, const Bytes& data);

// Typed field access; throw DecodeError when missing or of another type
const Hash32& get_word(const FieldMap& fields, const std::string& name);
const std::vector<Hash32>& get_word_array(const FieldMap& fields, const std::string& name);

// ABI encoding, used to build fixtures
Bytes encode_event_data(const EventAbi& event, const FieldMap& fields);

} // namespace abi
} // namespace stark_sync
