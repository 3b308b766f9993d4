#pragma once

#include "types/hash32.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace stark_sync {
namespace l1 {

/**
 * Ethereum log as returned by eth_getLogs / eth_subscribe("logs").
 */
struct L1Log {
    EthAddress address;
    std::vector<Hash32> topics;
    Bytes data;
    uint64_t block_number = 0;
    Hash32 block_hash;
    Hash32 tx_hash;
    uint64_t log_index = 0;
    bool removed = false;
};

/**
 * Log filter. `topics[i]` lists the accepted values for topic i; an empty
 * inner list matches anything. `to_block` unset means "latest".
 */
struct FilterQuery {
    uint64_t from_block = 0;
    std::optional<uint64_t> to_block;
    std::vector<EthAddress> addresses;
    std::vector<std::vector<Hash32>> topics;

    bool matches(const L1Log& log) const;
};

struct L1Transaction {
    Hash32 hash;
    Bytes input;
    uint64_t block_number = 0;
};

// Position of a log in the chain, used to order and deduplicate
struct LogPosition {
    uint64_t block_number = 0;
    uint64_t log_index = 0;

    bool operator<(const LogPosition& rhs) const {
        return block_number != rhs.block_number ? block_number < rhs.block_number
                                                : log_index < rhs.log_index;
    }
    bool operator==(const LogPosition& rhs) const {
        return block_number == rhs.block_number && log_index == rhs.log_index;
    }
    bool operator<=(const LogPosition& rhs) const { return *this < rhs || *this == rhs; }
};

inline LogPosition position_of(const L1Log& log) {
    return LogPosition{log.block_number, log.log_index};
}

} // namespace l1
} // namespace stark_sync
