#include "state/contract_state.hpp"
#include "common/errors.hpp"
#include "hash/pedersen.hpp"
#include <stdexcept>

namespace stark_sync {

namespace {

FieldElement hash_step(const FieldElement& a, const FieldElement& b, const char* step,
                       const FieldElement& contract_hash, const FieldElement& storage_root) {
    try {
        return Pedersen::hash(a, b);
    } catch (const std::exception& e) {
        throw CommitmentError(std::string("Contract commitment failed at ") + step +
                              " contract_hash=0x" + contract_hash.to_hex() +
                              " storage_root=0x" + storage_root.to_hex() + ": " + e.what());
    }
}

} // namespace

FieldElement contract_state_commitment(const FieldElement& contract_hash,
                                       const FieldElement& storage_root) {
    FieldElement value = hash_step(contract_hash, storage_root, "h(contract_hash, storage_root)",
                                   contract_hash, storage_root);
    value = hash_step(value, FieldElement::zero(), "h(h(contract_hash, storage_root), 0)",
                      contract_hash, storage_root);
    value = hash_step(value, FieldElement::zero(), "h(h(h(contract_hash, storage_root), 0), 0)",
                      contract_hash, storage_root);
    return value;
}

} // namespace stark_sync
