#pragma once

#include "feeder/types.hpp"
#include <optional>

namespace stark_sync {
namespace feeder {

/**
 * FeederClient - L2 feeder gateway
 *
 * Calls throw TransportError when the gateway cannot be reached or does not
 * know the requested object, and DecodeError when the payload is malformed.
 */
class FeederClient {
public:
    virtual ~FeederClient() = default;

    virtual ContractAddresses get_contract_addresses() = 0;

    // nullopt when the block has not been produced yet
    virtual std::optional<StateUpdate> get_state_update(uint64_t block_number) = 0;

    virtual ContractCode get_code(const FieldElement& address, const FieldElement& block_hash) = 0;
    virtual FeederBlock get_block(const FieldElement& block_hash) = 0;
    virtual FeederTransaction get_transaction(const FieldElement& tx_hash) = 0;
};

} // namespace feeder
} // namespace stark_sync
