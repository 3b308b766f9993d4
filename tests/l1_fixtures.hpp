#pragma once

#include "l1/abi.hpp"
#include "l1/contracts.hpp"
#include "l1/events.hpp"
#include "l1/types.hpp"
#include <string>
#include <vector>

namespace stark_sync {
namespace fixtures {

// Addresses used by the test fixtures
inline l1::WatchedContracts watched() {
    l1::WatchedContracts contracts;
    contracts.state = EthAddress::from_hex("0xde29d060d45901fb19ed6c6e959eb22d8626708e");
    contracts.verifier = EthAddress::from_hex("0x5ef3c980bf970fce5bbc217835743ea9f0388f4f");
    contracts.memory_registry = EthAddress::from_hex("0x743789ff2ff82bfb907009c9911a7da636d34fa7");
    return contracts;
}

inline Hash32 word(uint64_t value) {
    std::array<uint8_t, 32> bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[31 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return Hash32(bytes);
}

inline Hash32 tx_hash(uint64_t block, uint64_t index) {
    return word(0x7700000000ULL + block * 1000 + index);
}

inline l1::L1Log base_log(const EthAddress& address, const Hash32& topic, uint64_t block, uint64_t index) {
    l1::L1Log log;
    log.address = address;
    log.topics = {topic};
    log.block_number = block;
    log.block_hash = word(0xb10c0000ULL + block);
    log.tx_hash = tx_hash(block, index);
    log.log_index = index;
    return log;
}

inline l1::L1Log fact_log(const Hash32& fact, uint64_t block, uint64_t index) {
    l1::L1Log log = base_log(watched().state, l1::topics::state_transition_fact(), block, index);
    log.data = abi::encode_event_data(abi::log_state_transition_fact(), {{"stateTransitionFact", fact}});
    return log;
}

inline l1::L1Log pages_log(const Hash32& fact, const std::vector<Hash32>& pages, uint64_t block, uint64_t index) {
    l1::L1Log log = base_log(watched().verifier, l1::topics::memory_pages_hashes(), block, index);
    log.data = abi::encode_event_data(abi::log_memory_pages_hashes(),
                                      {{"factHash", fact}, {"pagesHashes", pages}});
    return log;
}

// The carrying transaction is the log's own transaction
inline l1::L1Log page_fact_log(const Hash32& memory_hash, uint64_t block, uint64_t index) {
    l1::L1Log log = base_log(watched().memory_registry, l1::topics::memory_page_fact_continuous(), block, index);
    log.data = abi::encode_event_data(abi::log_memory_page_fact_continuous(),
                                      {{"factHash", word(0)}, {"memoryHash", memory_hash}, {"prod", word(1)}});
    return log;
}

inline l1::L1Event fact_event(const Hash32& fact, uint64_t block, uint64_t index = 0) {
    return l1::L1Event{l1::StateTransitionFactEvent{fact}, block, index};
}

inline l1::L1Event pages_event(const Hash32& fact, const std::vector<Hash32>& pages, uint64_t block,
                               uint64_t index = 0) {
    return l1::L1Event{l1::MemoryPagesHashesEvent{fact, pages}, block, index};
}

inline l1::L1Event page_fact_event(const Hash32& page, const Hash32& tx, uint64_t block, uint64_t index = 0) {
    return l1::L1Event{l1::MemoryPageFactEvent{page, word(1), tx}, block, index};
}

} // namespace fixtures
} // namespace stark_sync
