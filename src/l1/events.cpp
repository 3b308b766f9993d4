#include "l1/events.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <iostream>

namespace stark_sync {
namespace l1 {

namespace {

struct EventNameVisitor {
    const char* operator()(const StateTransitionFactEvent&) const { return "LogStateTransitionFact"; }
    const char* operator()(const MemoryPagesHashesEvent&) const { return "LogMemoryPagesHashes"; }
    const char* operator()(const MemoryPageFactEvent&) const { return "LogMemoryPageFactContinuous"; }
};

bool file_exists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

} // namespace

const char* event_name(const L1Event& event) {
    return std::visit(EventNameVisitor{}, event.payload);
}

EventDecoder::EventDecoder(WatchedContracts contracts)
    : contracts_(std::move(contracts)),
      state_abi_(abi::log_state_transition_fact()),
      verifier_abi_(abi::log_memory_pages_hashes()),
      registry_abi_(abi::log_memory_page_fact_continuous()) {}

void EventDecoder::load_abis(const std::string& abi_dir) {
    struct Entry {
        const char* file;
        abi::EventAbi* target;
    };
    const Entry entries[] = {
        {"state.json", &state_abi_},
        {"verifier.json", &verifier_abi_},
        {"memory_registry.json", &registry_abi_},
    };
    for (const auto& entry : entries) {
        std::string path = abi_dir + "/" + entry.file;
        if (!file_exists(path)) {
            continue;
        }
        *entry.target = abi::load_event_abi(path, entry.target->name);
        std::cout << "[abi] Loaded event=" << entry.target->name << " path=" << path << std::endl;
    }
}

std::vector<EthAddress> EventDecoder::addresses() const {
    return {contracts_.state, contracts_.verifier, contracts_.memory_registry};
}

std::vector<std::vector<Hash32>> EventDecoder::topic_filter() {
    return {{topics::state_transition_fact(), topics::memory_pages_hashes(),
             topics::memory_page_fact_continuous()}};
}

std::optional<L1Event> EventDecoder::decode(const L1Log& log) const {
    auto role = contracts_.role_of(log.address);
    if (!role || log.topics.empty()) {
        return std::nullopt;
    }

    L1Event event;
    event.block_number = log.block_number;
    event.log_index = log.log_index;
    const Hash32& topic0 = log.topics[0];

    switch (*role) {
        case ContractRole::State: {
            if (topic0 != topics::state_transition_fact()) return std::nullopt;
            abi::FieldMap fields = abi::decode_event(state_abi_, log.topics, log.data);
            event.payload = StateTransitionFactEvent{abi::get_word(fields, "stateTransitionFact")};
            break;
        }
        case ContractRole::Verifier: {
            if (topic0 != topics::memory_pages_hashes()) return std::nullopt;
            abi::FieldMap fields = abi::decode_event(verifier_abi_, log.topics, log.data);
            event.payload = MemoryPagesHashesEvent{abi::get_word(fields, "factHash"),
                                                   abi::get_word_array(fields, "pagesHashes")};
            break;
        }
        case ContractRole::MemoryRegistry: {
            if (topic0 != topics::memory_page_fact_continuous()) return std::nullopt;
            abi::FieldMap fields = abi::decode_event(registry_abi_, log.topics, log.data);
            event.payload = MemoryPageFactEvent{abi::get_word(fields, "memoryHash"),
                                                abi::get_word(fields, "prod"), log.tx_hash};
            break;
        }
    }
    return event;
}

} // namespace l1
} // namespace stark_sync
