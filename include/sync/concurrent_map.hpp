#pragma once

#include <tbb/concurrent_hash_map.h>
#include <optional>

namespace stark_sync {

/**
 * ConcurrentMap - write-once lookup table shared between tasks
 *
 * The first add() for a key wins and later ones are ignored, matching
 * records that are immutable once published on L1. Readers never observe a
 * half-written value: the value is assigned under the entry's write lock.
 */
template <typename K, typename V>
class ConcurrentMap {
public:
    // True when this call inserted the key
    bool add(const K& key, const V& value) {
        typename Map::accessor acc;
        if (!map_.insert(acc, key)) {
            return false;
        }
        acc->second = value;
        return true;
    }

    std::optional<V> get(const K& key) const {
        typename Map::const_accessor acc;
        if (!map_.find(acc, key)) {
            return std::nullopt;
        }
        return acc->second;
    }

    bool exists(const K& key) const {
        return map_.count(key) > 0;
    }

    bool erase(const K& key) {
        return map_.erase(key);
    }

    size_t size() const {
        return map_.size();
    }

private:
    using Map = tbb::concurrent_hash_map<K, V>;
    Map map_;
};

} // namespace stark_sync
