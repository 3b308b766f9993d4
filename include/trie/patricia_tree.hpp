#pragma once

#include "trie/state_tree.hpp"
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace stark_sync {

/**
 * PatriciaTree - binary Merkle-Patricia tree of height 251 over Pedersen
 *
 * Root encoding follows the StarkNet state commitment:
 *   empty tree      -> 0
 *   leaf            -> value
 *   binary node     -> H(left, right)
 *   edge node       -> H(child, path) + length
 *
 * Keys are the path from the root, most significant bit first, and must be
 * below 2^251. Leaves are persisted as key -> value (32-byte big-endian each)
 * in the prefixed database the tree owns; inner nodes are recomputed from
 * the leaves.
 */
class PatriciaTree : public StateTree {
public:
    static constexpr size_t HEIGHT = 251;

    explicit PatriciaTree(std::shared_ptr<storage::PrefixedDatabase> db);

    FieldElement get(const FieldElement& key) const override;
    void put(const FieldElement& key, const FieldElement& value) override;
    FieldElement root() override;

    void commit(storage::Database::WriteBatch& batch) const override;
    void mark_committed() override;
    void discard() override;

    size_t size() const { return leaves_.size(); }
    size_t pending_writes() const { return dirty_.size(); }

private:
    struct Leaf {
        FieldElement::Limbs path;
        FieldElement key;
        FieldElement value;
    };

    void load();
    std::vector<Leaf> merged_leaves() const;

    FieldElement node_hash(const std::vector<Leaf>& leaves, size_t begin, size_t end, size_t depth) const;
    FieldElement binary_hash(const std::vector<Leaf>& leaves, size_t begin, size_t end, size_t depth) const;

    std::shared_ptr<storage::PrefixedDatabase> db_;
    std::map<FieldElement, FieldElement> leaves_;
    std::map<FieldElement, FieldElement> dirty_;
    std::optional<FieldElement> cached_root_;
};

} // namespace stark_sync
