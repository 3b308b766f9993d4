#pragma once

#include "l1/abi.hpp"
#include "l1/contracts.hpp"
#include "l1/types.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace stark_sync {
namespace l1 {

// State contract: a new state transition fact was accepted
struct StateTransitionFactEvent {
    Hash32 fact;
};

// Verifier: the ordered page hashes a fact is made of
struct MemoryPagesHashesEvent {
    Hash32 fact;
    std::vector<Hash32> pages;
};

// Registry: a memory page was registered by the transaction that carries it
struct MemoryPageFactEvent {
    Hash32 memory_hash;
    Hash32 prod;
    Hash32 tx_hash;
};

/**
 * L1Event - typed event with the position of the log it came from
 */
struct L1Event {
    using Payload = std::variant<StateTransitionFactEvent, MemoryPagesHashesEvent, MemoryPageFactEvent>;

    Payload payload;
    uint64_t block_number = 0;
    uint64_t log_index = 0;

    LogPosition position() const { return LogPosition{block_number, log_index}; }
};

const char* event_name(const L1Event& event);

/**
 * EventDecoder - log -> typed event, by the role of the emitting contract
 *
 * ABIs default to the built-in definitions and can be replaced with ones
 * loaded from contract ABI files.
 */
class EventDecoder {
public:
    explicit EventDecoder(WatchedContracts contracts);

    // Load "<role>.json" ABI files from a directory when present
    void load_abis(const std::string& abi_dir);

    const WatchedContracts& contracts() const { return contracts_; }

    // All watched addresses, state contract first
    std::vector<EthAddress> addresses() const;

    // topic0 filter accepting the three watched events
    static std::vector<std::vector<Hash32>> topic_filter();

    /**
     * @return nullopt for logs of unwatched addresses or other events
     * @throws DecodeError when a watched event cannot be decoded
     */
    std::optional<L1Event> decode(const L1Log& log) const;

private:
    WatchedContracts contracts_;
    abi::EventAbi state_abi_;
    abi::EventAbi verifier_abi_;
    abi::EventAbi registry_abi_;
};

} // namespace l1
} // namespace stark_sync
