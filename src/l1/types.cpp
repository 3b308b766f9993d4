#include "l1/types.hpp"
#include <algorithm>

namespace stark_sync {
namespace l1 {

bool FilterQuery::matches(const L1Log& log) const {
    if (log.block_number < from_block) {
        return false;
    }
    if (to_block && log.block_number > *to_block) {
        return false;
    }
    if (!addresses.empty() &&
        std::find(addresses.begin(), addresses.end(), log.address) == addresses.end()) {
        return false;
    }
    for (size_t i = 0; i < topics.size(); ++i) {
        if (topics[i].empty()) {
            continue;
        }
        if (i >= log.topics.size() ||
            std::find(topics[i].begin(), topics[i].end(), log.topics[i]) == topics[i].end()) {
            return false;
        }
    }
    return true;
}

} // namespace l1
} // namespace stark_sync
