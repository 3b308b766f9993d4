#include "feeder/json_codec.hpp"
#include "common/errors.hpp"

namespace stark_sync {
namespace feeder {

namespace {

const nlohmann::json& require(const nlohmann::json& obj, const char* field) {
    if (!obj.is_object() || !obj.contains(field)) {
        throw DecodeError(std::string("Missing field '") + field + "' in feeder payload");
    }
    return obj.at(field);
}

// Calldata and signatures are decimal strings unless 0x-prefixed
FieldElement parse_decimal_felt(const std::string& text, const char* what) {
    if (text.empty()) {
        throw DecodeError(std::string("Empty decimal value for ") + what);
    }
    FieldElement::Limbs limbs{0, 0, 0, 0};
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw DecodeError(std::string("Invalid decimal value for ") + what + ": " + text);
        }
        uint128_t carry = static_cast<uint64_t>(c - '0');
        for (auto& limb : limbs) {
            uint128_t t = static_cast<uint128_t>(limb) * 10 + carry;
            limb = static_cast<uint64_t>(t);
            carry = t >> 64;
        }
        if (carry != 0) {
            throw DecodeError(std::string("Decimal value overflows 256 bits for ") + what);
        }
    }
    try {
        return FieldElement::from_canonical_limbs(limbs);
    } catch (const std::invalid_argument&) {
        throw DecodeError(std::string("Value for ") + what + " is not a field element: " + text);
    }
}

FieldElement parse_decimal_or_hex(const nlohmann::json& value, const char* what) {
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.rfind("0x", 0) != 0 && text.rfind("0X", 0) != 0) {
            return parse_decimal_felt(text, what);
        }
    }
    return parse_felt(value, what);
}

std::vector<FieldElement> parse_felt_list(const nlohmann::json& obj, const char* field, bool decimal) {
    std::vector<FieldElement> out;
    if (!obj.contains(field) || obj.at(field).is_null()) {
        return out;
    }
    const auto& list = obj.at(field);
    if (!list.is_array()) {
        throw DecodeError(std::string("Field '") + field + "' is not an array");
    }
    for (const auto& item : list) {
        out.push_back(decimal ? parse_decimal_or_hex(item, field) : parse_felt(item, field));
    }
    return out;
}

uint64_t parse_u64(const nlohmann::json& value, const char* what) {
    if (!value.is_number_unsigned()) {
        throw DecodeError(std::string("Field '") + what + "' is not an unsigned integer");
    }
    return value.get<uint64_t>();
}

nlohmann::json felt_list_to_json(const std::vector<FieldElement>& values) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& v : values) {
        out.push_back(felt_to_json_hex(v));
    }
    return out;
}

} // namespace

std::string felt_to_json_hex(const FieldElement& value) {
    return "0x" + value.to_hex();
}

FieldElement parse_felt(const nlohmann::json& value, const char* what) {
    if (value.is_number_unsigned()) {
        return FieldElement(value.get<uint64_t>());
    }
    if (!value.is_string()) {
        throw DecodeError(std::string("Felt for ") + what + " is neither a string nor a number");
    }
    try {
        return FieldElement::from_hex(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("Invalid felt for ") + what + ": " + e.what());
    }
}

ContractAddresses parse_contract_addresses(const nlohmann::json& obj) {
    ContractAddresses addresses;
    try {
        addresses.starknet = EthAddress::from_hex(require(obj, "Starknet").get<std::string>());
        addresses.gps_statement_verifier =
            EthAddress::from_hex(require(obj, "GpsStatementVerifier").get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("Invalid contract address: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("Invalid contract address: ") + e.what());
    }
    return addresses;
}

StateUpdate parse_state_update(const nlohmann::json& obj, uint64_t block_number) {
    StateUpdate update;
    update.block_number = block_number;
    update.block_hash = parse_felt(require(obj, "block_hash"), "block_hash");
    update.new_root = parse_felt(require(obj, "new_root"), "new_root");
    if (obj.contains("old_root") && !obj.at("old_root").is_null()) {
        update.old_root = parse_felt(obj.at("old_root"), "old_root");
    }

    const auto& diff = require(obj, "state_diff");
    if (diff.contains("deployed_contracts")) {
        for (const auto& entry : diff.at("deployed_contracts")) {
            DeployedContract deployed;
            deployed.address = parse_felt(require(entry, "address"), "address");
            deployed.contract_hash = parse_felt(require(entry, "contract_hash"), "contract_hash");
            update.state_diff.deployed_contracts.push_back(deployed);
        }
    }
    if (diff.contains("storage_diffs")) {
        const auto& storage = diff.at("storage_diffs");
        if (!storage.is_object()) {
            throw DecodeError("Field 'storage_diffs' is not an object");
        }
        for (auto it = storage.begin(); it != storage.end(); ++it) {
            FieldElement address = parse_felt(nlohmann::json(it.key()), "storage_diffs address");
            std::vector<KV>& writes = update.state_diff.storage_diffs[address];
            for (const auto& kv : it.value()) {
                writes.push_back(KV{parse_felt(require(kv, "key"), "key"),
                                    parse_felt(require(kv, "value"), "value")});
            }
        }
    }
    return update;
}

nlohmann::json state_update_to_json(const StateUpdate& update) {
    nlohmann::json deployed = nlohmann::json::array();
    for (const auto& contract : update.state_diff.deployed_contracts) {
        deployed.push_back({{"address", felt_to_json_hex(contract.address)},
                            {"contract_hash", felt_to_json_hex(contract.contract_hash)}});
    }
    nlohmann::json storage = nlohmann::json::object();
    for (const auto& [address, writes] : update.state_diff.storage_diffs) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& kv : writes) {
            list.push_back({{"key", felt_to_json_hex(kv.key)}, {"value", felt_to_json_hex(kv.value)}});
        }
        storage[felt_to_json_hex(address)] = list;
    }
    return {
        {"block_hash", felt_to_json_hex(update.block_hash)},
        {"new_root", felt_to_json_hex(update.new_root)},
        {"old_root", felt_to_json_hex(update.old_root)},
        {"state_diff", {{"deployed_contracts", deployed}, {"storage_diffs", storage}}},
    };
}

ContractCode parse_code(const nlohmann::json& obj) {
    ContractCode code;
    code.bytecode = parse_felt_list(obj, "bytecode", false);
    if (obj.contains("abi")) {
        code.abi = obj.at("abi");
    }
    return code;
}

nlohmann::json code_to_json(const ContractCode& code) {
    return {{"bytecode", felt_list_to_json(code.bytecode)}, {"abi", code.abi}};
}

FeederBlock parse_block(const nlohmann::json& obj) {
    FeederBlock block;
    block.block_hash = parse_felt(require(obj, "block_hash"), "block_hash");
    if (obj.contains("parent_block_hash")) {
        block.parent_block_hash = parse_felt(obj.at("parent_block_hash"), "parent_block_hash");
    }
    block.block_number = parse_u64(require(obj, "block_number"), "block_number");
    if (obj.contains("state_root")) {
        block.state_root = parse_felt(obj.at("state_root"), "state_root");
    }
    block.status = obj.value("status", "");
    if (obj.contains("timestamp")) {
        block.timestamp = parse_u64(obj.at("timestamp"), "timestamp");
    }
    if (obj.contains("transactions")) {
        for (const auto& tx : obj.at("transactions")) {
            block.transaction_hashes.push_back(
                parse_felt(require(tx, "transaction_hash"), "transaction_hash"));
        }
    }
    return block;
}

nlohmann::json block_to_json(const FeederBlock& block) {
    nlohmann::json txs = nlohmann::json::array();
    for (const auto& hash : block.transaction_hashes) {
        txs.push_back({{"transaction_hash", felt_to_json_hex(hash)}});
    }
    return {
        {"block_hash", felt_to_json_hex(block.block_hash)},
        {"parent_block_hash", felt_to_json_hex(block.parent_block_hash)},
        {"block_number", block.block_number},
        {"state_root", felt_to_json_hex(block.state_root)},
        {"status", block.status},
        {"timestamp", block.timestamp},
        {"transactions", txs},
    };
}

FeederTransaction parse_transaction(const nlohmann::json& obj) {
    const nlohmann::json& body = obj.contains("transaction") ? obj.at("transaction") : obj;

    FeederTransaction tx;
    tx.hash = parse_felt(require(body, "transaction_hash"), "transaction_hash");
    tx.type = body.value("type", "");
    tx.status = obj.value("status", "");
    if (body.contains("contract_address")) {
        tx.contract_address = parse_felt(body.at("contract_address"), "contract_address");
    }
    if (body.contains("entry_point_selector")) {
        tx.entry_point_selector = parse_felt(body.at("entry_point_selector"), "entry_point_selector");
    }
    tx.calldata = parse_felt_list(body, body.contains("calldata") ? "calldata" : "constructor_calldata", true);
    tx.signature = parse_felt_list(body, "signature", true);
    return tx;
}

nlohmann::json transaction_to_json(const FeederTransaction& tx) {
    nlohmann::json body = {
        {"transaction_hash", felt_to_json_hex(tx.hash)},
        {"type", tx.type},
        {"calldata", felt_list_to_json(tx.calldata)},
        {"signature", felt_list_to_json(tx.signature)},
    };
    if (tx.contract_address) body["contract_address"] = felt_to_json_hex(*tx.contract_address);
    if (tx.entry_point_selector) body["entry_point_selector"] = felt_to_json_hex(*tx.entry_point_selector);
    return {{"status", tx.status}, {"transaction", body}};
}

} // namespace feeder
} // namespace stark_sync
