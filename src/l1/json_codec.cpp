#include "l1/json_codec.hpp"
#include "common/errors.hpp"
#include <sstream>

namespace stark_sync {
namespace l1 {

namespace {

const nlohmann::json& require(const nlohmann::json& obj, const char* field) {
    if (!obj.is_object() || !obj.contains(field)) {
        throw DecodeError(std::string("Missing field '") + field + "' in RPC object");
    }
    return obj.at(field);
}

std::string require_string(const nlohmann::json& obj, const char* field) {
    const auto& value = require(obj, field);
    if (!value.is_string()) {
        throw DecodeError(std::string("Field '") + field + "' is not a string");
    }
    return value.get<std::string>();
}

template <typename T>
T parse_fixed(const nlohmann::json& obj, const char* field) {
    std::string hex = require_string(obj, field);
    try {
        return T::from_hex(hex);
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("Field '") + field + "': " + e.what());
    }
}

Bytes parse_data(const nlohmann::json& obj, const char* field) {
    std::string hex = require_string(obj, field);
    try {
        return hex_to_bytes(hex);
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("Field '") + field + "': " + e.what());
    }
}

} // namespace

uint64_t parse_quantity(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        int64_t signed_value = value.get<int64_t>();
        if (signed_value < 0) {
            throw DecodeError("Quantity is negative: " + value.dump());
        }
        return static_cast<uint64_t>(signed_value);
    }
    if (!value.is_string()) {
        throw DecodeError("Quantity is neither a string nor a number: " + value.dump());
    }
    std::string text = value.get<std::string>();
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        throw DecodeError("Quantity must be 0x-prefixed: " + text);
    }
    if (text.size() > 18) {
        throw DecodeError("Quantity overflows 64 bits: " + text);
    }
    uint64_t result = 0;
    for (size_t i = 2; i < text.size(); ++i) {
        char c = text[i];
        uint64_t digit;
        if (c >= '0' && c <= '9') digit = static_cast<uint64_t>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<uint64_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<uint64_t>(c - 'A' + 10);
        else throw DecodeError("Invalid quantity: " + text);
        result = (result << 4) | digit;
    }
    return result;
}

std::string format_quantity(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

L1Log parse_log(const nlohmann::json& obj) {
    L1Log log;
    log.address = parse_fixed<EthAddress>(obj, "address");

    const auto& topics = require(obj, "topics");
    if (!topics.is_array()) {
        throw DecodeError("Field 'topics' is not an array");
    }
    for (const auto& topic : topics) {
        if (!topic.is_string()) {
            throw DecodeError("Topic is not a string");
        }
        try {
            log.topics.push_back(Hash32::from_hex(topic.get<std::string>()));
        } catch (const std::invalid_argument& e) {
            throw DecodeError(std::string("Invalid topic: ") + e.what());
        }
    }

    log.data = obj.contains("data") ? parse_data(obj, "data") : Bytes{};
    log.block_number = parse_quantity(require(obj, "blockNumber"));
    log.log_index = parse_quantity(require(obj, "logIndex"));
    if (obj.contains("blockHash")) log.block_hash = parse_fixed<Hash32>(obj, "blockHash");
    if (obj.contains("transactionHash")) log.tx_hash = parse_fixed<Hash32>(obj, "transactionHash");
    log.removed = obj.value("removed", false);
    return log;
}

nlohmann::json log_to_json(const L1Log& log) {
    nlohmann::json topics = nlohmann::json::array();
    for (const auto& topic : log.topics) {
        topics.push_back(topic.to_hex());
    }
    return {
        {"address", log.address.to_hex()},
        {"topics", topics},
        {"data", "0x" + bytes_to_hex(log.data)},
        {"blockNumber", format_quantity(log.block_number)},
        {"blockHash", log.block_hash.to_hex()},
        {"transactionHash", log.tx_hash.to_hex()},
        {"logIndex", format_quantity(log.log_index)},
        {"removed", log.removed},
    };
}

L1Transaction parse_transaction(const nlohmann::json& obj) {
    L1Transaction tx;
    tx.hash = parse_fixed<Hash32>(obj, "hash");
    tx.input = parse_data(obj, "input");
    if (obj.contains("blockNumber") && !obj.at("blockNumber").is_null()) {
        tx.block_number = parse_quantity(obj.at("blockNumber"));
    }
    return tx;
}

nlohmann::json transaction_to_json(const L1Transaction& tx) {
    return {
        {"hash", tx.hash.to_hex()},
        {"input", "0x" + bytes_to_hex(tx.input)},
        {"blockNumber", format_quantity(tx.block_number)},
    };
}

} // namespace l1
} // namespace stark_sync
