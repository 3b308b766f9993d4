#pragma once

#include "storage/database.hpp"
#include "types/field_element.hpp"

namespace stark_sync {

/**
 * StateTree - keyed store with a root commitment
 *
 * Used both for the global contract-state tree (address -> contract
 * commitment) and for per-contract storage (storage key -> value).
 *
 * Writes are buffered until commit() stages them into a caller-owned batch;
 * mark_committed() is called once that batch is durable and discard() drops
 * the buffered writes after a failed block.
 */
class StateTree {
public:
    virtual ~StateTree() = default;

    // Zero when the key is absent
    virtual FieldElement get(const FieldElement& key) const = 0;

    // Writing zero removes the leaf
    virtual void put(const FieldElement& key, const FieldElement& value) = 0;

    virtual FieldElement root() = 0;

    virtual void commit(storage::Database::WriteBatch& batch) const = 0;
    virtual void mark_committed() = 0;
    virtual void discard() = 0;
};

} // namespace stark_sync
