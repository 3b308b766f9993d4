#pragma once

#include "types/hash32.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace stark_sync {
namespace l1 {

// Role of a watched contract, which decides how its logs are decoded
enum class ContractRole {
    State,           // StarkNet core contract: LogStateTransitionFact
    Verifier,        // GPS statement verifier: LogMemoryPagesHashes
    MemoryRegistry,  // memory page fact registry: LogMemoryPageFactContinuous
};

const char* role_name(ContractRole role);

// keccak256 of the event signatures
namespace topics {
const Hash32& state_transition_fact();     // LogStateTransitionFact(bytes32)
const Hash32& memory_pages_hashes();       // LogMemoryPagesHashes(bytes32,bytes32[])
const Hash32& memory_page_fact_continuous(); // LogMemoryPageFactContinuous(bytes32,uint256,uint256)
} // namespace topics

/**
 * Per-network contract addresses and the state contract deployment block.
 */
struct NetworkContracts {
    uint64_t chain_id = 0;
    std::string name;
    EthAddress verifier;
    EthAddress memory_registry;
    uint64_t deployment_floor = 0;
};

// Mainnet (chain id 1) or, for every other chain id, Goerli
NetworkContracts contracts_for_chain(uint64_t chain_id);

/**
 * The three watched addresses. The state contract address comes from the
 * L2 feeder (or configuration).
 */
struct WatchedContracts {
    EthAddress state;
    EthAddress verifier;
    EthAddress memory_registry;

    std::optional<ContractRole> role_of(const EthAddress& address) const;
};

} // namespace l1
} // namespace stark_sync
