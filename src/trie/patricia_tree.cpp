#include "trie/patricia_tree.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "hash/pedersen.hpp"
#include "types/hash32.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace stark_sync {

namespace {

// Bit `index` of the path, counted from the root (most significant first)
bool path_bit(const FieldElement::Limbs& path, size_t index) {
    size_t bit = PatriciaTree::HEIGHT - 1 - index;
    return ((path[bit / 64] >> (bit % 64)) & 1ULL) != 0;
}

// (value >> shift) masked to `len` bits
FieldElement::Limbs extract_bits(const FieldElement::Limbs& value, size_t shift, size_t len) {
    FieldElement::Limbs out{0, 0, 0, 0};
    size_t word = shift / 64;
    size_t bits = shift % 64;
    for (size_t i = 0; i < 4; ++i) {
        if (i + word < 4) {
            out[i] = value[i + word] >> bits;
            if (bits != 0 && i + word + 1 < 4) {
                out[i] |= value[i + word + 1] << (64 - bits);
            }
        }
    }
    for (size_t i = 0; i < 4; ++i) {
        if (len >= 64 * (i + 1)) {
            continue;
        }
        if (len > 64 * i) {
            out[i] &= (1ULL << (len - 64 * i)) - 1;
        } else {
            out[i] = 0;
        }
    }
    return out;
}

Bytes felt_bytes(const FieldElement& value) {
    FieldElement::Bytes32 raw = value.to_bytes_be();
    return Bytes(raw.begin(), raw.end());
}

FieldElement felt_from_stored(const Bytes& raw, const char* what) {
    if (raw.size() != FieldElement::NUM_BYTES) {
        throw PersistenceError(std::string("Corrupt trie ") + what + ": expected 32 bytes, got " +
                               std::to_string(raw.size()));
    }
    try {
        return to_felt(Hash32::from_bytes(raw));
    } catch (const std::invalid_argument& e) {
        throw PersistenceError(std::string("Corrupt trie ") + what + ": " + e.what());
    }
}

} // namespace

PatriciaTree::PatriciaTree(std::shared_ptr<storage::PrefixedDatabase> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("PatriciaTree requires a database");
    }
    load();
}

void PatriciaTree::load() {
    auto it = db_->new_iterator(Bytes{});
    for (; it->valid(); it->next()) {
        FieldElement key = felt_from_stored(it->key(), "key");
        FieldElement value = felt_from_stored(it->value(), "value");
        if (!value.is_zero()) {
            leaves_[key] = value;
        }
    }
}

FieldElement PatriciaTree::get(const FieldElement& key) const {
    auto dirty = dirty_.find(key);
    if (dirty != dirty_.end()) {
        return dirty->second;
    }
    auto it = leaves_.find(key);
    return it != leaves_.end() ? it->second : FieldElement::zero();
}

void PatriciaTree::put(const FieldElement& key, const FieldElement& value) {
    if (key.bit(HEIGHT)) {
        throw std::invalid_argument("Trie key out of range (>= 2^251): 0x" + key.to_hex());
    }
    if (get(key) == value) {
        return;
    }
    dirty_[key] = value;
    cached_root_.reset();
}

std::vector<PatriciaTree::Leaf> PatriciaTree::merged_leaves() const {
    std::map<FieldElement, FieldElement> merged = leaves_;
    for (const auto& [key, value] : dirty_) {
        if (value.is_zero()) {
            merged.erase(key);
        } else {
            merged[key] = value;
        }
    }

    std::vector<Leaf> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(Leaf{key.canonical_limbs(), key, value});
    }
    return out;
}

FieldElement PatriciaTree::root() {
    if (cached_root_) {
        return *cached_root_;
    }

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<Leaf> leaves = merged_leaves();
    FieldElement result = leaves.empty() ? FieldElement::zero()
                                         : node_hash(leaves, 0, leaves.size(), 0);
    cached_root_ = result;

    if (STARK_SYNC_PROFILE_ENABLED()) {
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count();
        std::cout << "[trie] Root computed leaves=" << leaves.size()
                  << " time_ms=" << elapsed << std::endl;
    }
    return result;
}

FieldElement PatriciaTree::node_hash(const std::vector<Leaf>& leaves, size_t begin, size_t end,
                                     size_t depth) const {
    if (depth == HEIGHT) {
        return leaves[begin].value;
    }

    // Leaves are sorted, so the common prefix of the range is that of its ends
    const FieldElement::Limbs& first = leaves[begin].path;
    const FieldElement::Limbs& last = leaves[end - 1].path;
    size_t length = 0;
    while (depth + length < HEIGHT && path_bit(first, depth + length) == path_bit(last, depth + length)) {
        ++length;
    }

    if (length == 0) {
        return binary_hash(leaves, begin, end, depth);
    }

    size_t child_depth = depth + length;
    FieldElement child = child_depth == HEIGHT ? leaves[begin].value
                                               : binary_hash(leaves, begin, end, child_depth);
    FieldElement path = FieldElement::from_canonical_limbs(
        extract_bits(first, HEIGHT - child_depth, length));
    return Pedersen::hash(child, path) + FieldElement(static_cast<uint64_t>(length));
}

FieldElement PatriciaTree::binary_hash(const std::vector<Leaf>& leaves, size_t begin, size_t end,
                                       size_t depth) const {
    auto split = std::partition_point(
        leaves.begin() + static_cast<std::ptrdiff_t>(begin),
        leaves.begin() + static_cast<std::ptrdiff_t>(end),
        [depth](const Leaf& leaf) { return !path_bit(leaf.path, depth); });
    size_t mid = static_cast<size_t>(split - leaves.begin());

    FieldElement left = node_hash(leaves, begin, mid, depth + 1);
    FieldElement right = node_hash(leaves, mid, end, depth + 1);
    return Pedersen::hash(left, right);
}

void PatriciaTree::commit(storage::Database::WriteBatch& batch) const {
    for (const auto& [key, value] : dirty_) {
        Bytes full_key = db_->full_key(felt_bytes(key));
        if (value.is_zero()) {
            batch.del(std::move(full_key));
        } else {
            batch.put(std::move(full_key), felt_bytes(value));
        }
    }
}

void PatriciaTree::mark_committed() {
    for (const auto& [key, value] : dirty_) {
        if (value.is_zero()) {
            leaves_.erase(key);
        } else {
            leaves_[key] = value;
        }
    }
    dirty_.clear();
}

void PatriciaTree::discard() {
    if (!dirty_.empty()) {
        dirty_.clear();
        cached_root_.reset();
    }
}

} // namespace stark_sync
