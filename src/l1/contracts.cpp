#include "l1/contracts.hpp"

namespace stark_sync {
namespace l1 {

const char* role_name(ContractRole role) {
    switch (role) {
        case ContractRole::State: return "state";
        case ContractRole::Verifier: return "verifier";
        case ContractRole::MemoryRegistry: return "memory_registry";
    }
    return "unknown";
}

namespace topics {

const Hash32& state_transition_fact() {
    static const Hash32 topic = Hash32::from_hex(
        "0x9866f8ddfe70bb512b2f2b28b49d4017c43f7ba775f1a20c61c13eea8cdac111");
    return topic;
}

const Hash32& memory_pages_hashes() {
    static const Hash32 topic = Hash32::from_hex(
        "0x73b132cb33951232d83dc0f1f81c2d10f9a2598f057404ed02756716092097bb");
    return topic;
}

const Hash32& memory_page_fact_continuous() {
    static const Hash32 topic = Hash32::from_hex(
        "0xb8b9c39aeba1cfd98c38dfeebe11c2f7e02b334cbe9f05f22b442a5d9c1ea0c5");
    return topic;
}

} // namespace topics

NetworkContracts contracts_for_chain(uint64_t chain_id) {
    NetworkContracts contracts;
    contracts.chain_id = chain_id;
    if (chain_id == 1) {
        contracts.name = "mainnet";
        contracts.verifier = EthAddress::from_hex("0xa739B175325cCA7b71fcB51C3032935Ef7Ac338F");
        contracts.memory_registry = EthAddress::from_hex("0x96375087b2F6eFc59e5e0dd5111B4d090EBFDD8B");
        contracts.deployment_floor = 13627000;
    } else {
        contracts.name = "goerli";
        contracts.verifier = EthAddress::from_hex("0x5EF3C980Bf970FcE5BbC217835743ea9f0388f4F");
        contracts.memory_registry = EthAddress::from_hex("0x743789ff2fF82Bfb907009C9911a7dA636D34FA7");
        contracts.deployment_floor = 5853000;
    }
    return contracts;
}

std::optional<ContractRole> WatchedContracts::role_of(const EthAddress& address) const {
    if (address == state) return ContractRole::State;
    if (address == verifier) return ContractRole::Verifier;
    if (address == memory_registry) return ContractRole::MemoryRegistry;
    return std::nullopt;
}

} // namespace l1
} // namespace stark_sync
