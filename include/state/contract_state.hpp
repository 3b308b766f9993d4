#pragma once

#include "types/field_element.hpp"

namespace stark_sync {

/**
 * Leaf value of a contract in the global state tree:
 *
 *   h(h(h(contract_hash, storage_root), 0), 0)
 *
 * @throws CommitmentError naming the step that failed
 */
FieldElement contract_state_commitment(const FieldElement& contract_hash,
                                       const FieldElement& storage_root);

} // namespace stark_sync
