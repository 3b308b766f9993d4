#include "l1/abi.hpp"
#include "common/errors.hpp"
#include <fstream>

namespace stark_sync {
namespace abi {

namespace {

constexpr size_t WORD = 32;

Hash32 read_word(const Bytes& data, size_t offset) {
    if (offset + WORD > data.size()) {
        throw DecodeError("ABI data truncated at offset " + std::to_string(offset) +
                          " (size " + std::to_string(data.size()) + ")");
    }
    return Hash32::from_bytes(data.data() + offset, WORD);
}

// Offsets and lengths must fit comfortably in 64 bits
uint64_t word_to_size(const Hash32& word, const std::string& what) {
    for (size_t i = 0; i < WORD - 8; ++i) {
        if (word[i] != 0) {
            throw DecodeError("ABI " + what + " out of range: " + word.to_hex());
        }
    }
    uint64_t value = 0;
    for (size_t i = WORD - 8; i < WORD; ++i) {
        value = (value << 8) | word[i];
    }
    return value;
}

Hash32 size_to_word(uint64_t value) {
    std::array<uint8_t, WORD> bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[WORD - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return Hash32(bytes);
}

void append_word(Bytes& out, const Hash32& word) {
    out.insert(out.end(), word.bytes().begin(), word.bytes().end());
}

Value decode_static(const EventParam& param, const Hash32& word) {
    switch (param.type) {
        case ParamType::Bytes32:
        case ParamType::Uint256:
            return word;
        case ParamType::Address: {
            for (size_t i = 0; i < WORD - EthAddress::LEN; ++i) {
                if (word[i] != 0) {
                    throw DecodeError("ABI address '" + param.name + "' has dirty high bytes");
                }
            }
            return EthAddress::from_bytes(word.bytes().data(), WORD);
        }
        case ParamType::Bool: {
            uint64_t v = word_to_size(word, "bool '" + param.name + "'");
            if (v > 1) {
                throw DecodeError("ABI bool '" + param.name + "' is neither 0 nor 1");
            }
            return v == 1;
        }
        case ParamType::Bytes32Array:
            break;
    }
    throw DecodeError("Parameter '" + param.name + "' is not a static type");
}

EventAbi make_event(std::string name, std::vector<EventParam> inputs) {
    EventAbi event;
    event.name = std::move(name);
    event.inputs = std::move(inputs);
    return event;
}

} // namespace

ParamType parse_param_type(const std::string& type) {
    if (type == "bytes32") return ParamType::Bytes32;
    if (type == "uint256") return ParamType::Uint256;
    if (type == "address") return ParamType::Address;
    if (type == "bool") return ParamType::Bool;
    if (type == "bytes32[]") return ParamType::Bytes32Array;
    throw DecodeError("Unsupported ABI type: " + type);
}

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::Bytes32: return "bytes32";
        case ParamType::Uint256: return "uint256";
        case ParamType::Address: return "address";
        case ParamType::Bool: return "bool";
        case ParamType::Bytes32Array: return "bytes32[]";
    }
    return "unknown";
}

const EventAbi& log_state_transition_fact() {
    static const EventAbi event = make_event("LogStateTransitionFact", {
        {"stateTransitionFact", ParamType::Bytes32, false},
    });
    return event;
}

const EventAbi& log_memory_pages_hashes() {
    static const EventAbi event = make_event("LogMemoryPagesHashes", {
        {"factHash", ParamType::Bytes32, false},
        {"pagesHashes", ParamType::Bytes32Array, false},
    });
    return event;
}

const EventAbi& log_memory_page_fact_continuous() {
    static const EventAbi event = make_event("LogMemoryPageFactContinuous", {
        {"factHash", ParamType::Bytes32, false},
        {"memoryHash", ParamType::Uint256, false},
        {"prod", ParamType::Uint256, false},
    });
    return event;
}

EventAbi parse_event_abi(const nlohmann::json& contract_abi, const std::string& event_name) {
    if (!contract_abi.is_array()) {
        throw DecodeError("Contract ABI is not a JSON array");
    }
    for (const auto& entry : contract_abi) {
        if (entry.value("type", "") != "event" || entry.value("name", "") != event_name) {
            continue;
        }
        EventAbi event;
        event.name = event_name;
        for (const auto& input : entry.value("inputs", nlohmann::json::array())) {
            EventParam param;
            param.name = input.value("name", "");
            param.type = parse_param_type(input.value("type", ""));
            param.indexed = input.value("indexed", false);
            if (param.indexed && param.type == ParamType::Bytes32Array) {
                throw DecodeError("Indexed dynamic parameter '" + param.name + "' in " + event_name);
            }
            event.inputs.push_back(param);
        }
        return event;
    }
    throw DecodeError("Event " + event_name + " not found in contract ABI");
}

EventAbi load_event_abi(const std::string& path, const std::string& event_name) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    nlohmann::json contract_abi = nlohmann::json::parse(file);
    // Truffle/Hardhat artifacts wrap the ABI in an object
    if (contract_abi.is_object() && contract_abi.contains("abi")) {
        contract_abi = contract_abi.at("abi");
    }
    return parse_event_abi(contract_abi, event_name);
}

FieldMap decode_event_data(const EventAbi& event, const Bytes& data) {
    FieldMap fields;
    size_t slot = 0;
    for (const auto& param : event.inputs) {
        if (param.indexed) {
            continue;
        }
        Hash32 head = read_word(data, slot * WORD);
        ++slot;

        if (param.type != ParamType::Bytes32Array) {
            fields[param.name] = decode_static(param, head);
            continue;
        }

        uint64_t offset = word_to_size(head, "offset of '" + param.name + "'");
        if (offset > data.size()) {
            throw DecodeError("ABI offset of '" + param.name + "' past end of data");
        }
        uint64_t length = word_to_size(read_word(data, offset), "length of '" + param.name + "'");
        if (length > (data.size() - offset - WORD) / WORD) {
            throw DecodeError("ABI array '" + param.name + "' longer than data: " + std::to_string(length));
        }
        std::vector<Hash32> items;
        items.reserve(length);
        for (uint64_t i = 0; i < length; ++i) {
            items.push_back(read_word(data, offset + WORD * (i + 1)));
        }
        fields[param.name] = std::move(items);
    }
    return fields;
}

FieldMap decode_event(const EventAbi& event, const std::vector<Hash32>& topics, const Bytes& data) {
    FieldMap fields = decode_event_data(event, data);
    size_t topic_index = 1;
    for (const auto& param : event.inputs) {
        if (!param.indexed) {
            continue;
        }
        if (topic_index >= topics.size()) {
            throw DecodeError("Missing topic for indexed parameter '" + param.name + "' of " + event.name);
        }
        fields[param.name] = decode_static(param, topics[topic_index]);
        ++topic_index;
    }
    return fields;
}

const Hash32& get_word(const FieldMap& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        throw DecodeError("Missing event field '" + name + "'");
    }
    const Hash32* word = std::get_if<Hash32>(&it->second);
    if (word == nullptr) {
        throw DecodeError("Event field '" + name + "' is not a 32-byte word");
    }
    return *word;
}

const std::vector<Hash32>& get_word_array(const FieldMap& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        throw DecodeError("Missing event field '" + name + "'");
    }
    const auto* words = std::get_if<std::vector<Hash32>>(&it->second);
    if (words == nullptr) {
        throw DecodeError("Event field '" + name + "' is not a bytes32[]");
    }
    return *words;
}

Bytes encode_event_data(const EventAbi& event, const FieldMap& fields) {
    std::vector<const EventParam*> params;
    for (const auto& param : event.inputs) {
        if (!param.indexed) {
            params.push_back(&param);
        }
    }

    Bytes head;
    Bytes tail;
    const uint64_t head_size = WORD * params.size();
    for (const EventParam* param : params) {
        auto it = fields.find(param->name);
        if (it == fields.end()) {
            throw std::invalid_argument("Missing field '" + param->name + "' for " + event.name);
        }
        const Value& value = it->second;
        switch (param->type) {
            case ParamType::Bytes32:
            case ParamType::Uint256:
                append_word(head, std::get<Hash32>(value));
                break;
            case ParamType::Address:
                append_word(head, Hash32::from_bytes(Bytes(std::get<EthAddress>(value).bytes().begin(),
                                                           std::get<EthAddress>(value).bytes().end())));
                break;
            case ParamType::Bool:
                append_word(head, size_to_word(std::get<bool>(value) ? 1 : 0));
                break;
            case ParamType::Bytes32Array: {
                const auto& items = std::get<std::vector<Hash32>>(value);
                append_word(head, size_to_word(head_size + tail.size()));
                append_word(tail, size_to_word(items.size()));
                for (const auto& item : items) {
                    append_word(tail, item);
                }
                break;
            }
        }
    }
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

} // namespace abi
} // namespace stark_sync
