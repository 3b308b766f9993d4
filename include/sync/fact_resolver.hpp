#pragma once

#include "common/config.hpp"
#include "l1/client.hpp"
#include "l1/events.hpp"
#include "sync/channel.hpp"
#include "sync/concurrent_map.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace stark_sync {

enum class FactState {
    Observed,    // queued, page set unknown
    PagesKnown,  // page set known, waiting for carrying transactions
    Resolving,   // transactions being fetched
    Resolved,
};

const char* fact_state_name(FactState state);

struct ResolvedPage {
    Hash32 page_hash;
    Hash32 tx_hash;
    Bytes data;  // input of the carrying transaction
};

struct ResolvedFact {
    Hash32 fact;
    uint64_t block_number = 0;
    std::vector<ResolvedPage> pages;
};

/**
 * FactResolver - fact -> page hashes -> carrying transactions
 *
 * Facts are queued in the order observed. The page set of a fact and the
 * carrying transaction of each page are published independently and may
 * arrive in any order. A fact is resolved only once every page has been
 * fetched; it is then popped and emitted as a ResolvedFact. A failed fetch
 * leaves the fact in place for the next poll.
 *
 * Once resolved, the fact's page set and the carriers no pending fact
 * still lists are dropped. Only the last RECENT_FACTS resolved facts are
 * remembered for duplicate suppression.
 *
 * By default only the head of the queue is considered, so a fact whose
 * pages are unknown blocks the ones behind it. With allow_out_of_order the
 * first ready fact anywhere in the queue is taken.
 */
class FactResolver {
public:
    static constexpr size_t RECENT_FACTS = 1024;

    FactResolver(std::shared_ptr<l1::L1Client> l1, Channel<ResolvedFact>& resolved, const Config& config);

    void dispatch(const l1::L1Event& event);

    // Resolve every fact that is ready now. Returns how many were resolved.
    size_t poll_once();

    // poll_once() every poll interval until stop()
    void run();

    // Feed events into dispatch() until the channel ends
    void run_dispatch(Channel<l1::L1Event>& events);

    void stop();

    std::optional<FactState> state_of(const Hash32& fact) const;
    size_t pending() const;
    size_t resolved_count() const;

    bool has_pages(const Hash32& fact) const { return pages_by_fact_.exists(fact); }
    bool has_carrier(const Hash32& page) const { return tx_by_page_.exists(page); }
    size_t tracked_page_sets() const { return pages_by_fact_.size(); }
    size_t tracked_carriers() const { return tx_by_page_.size(); }

private:
    // Index of the fact to resolve next, or nullopt. Caller holds mutex_.
    std::optional<size_t> pick_ready_locked() const;
    bool is_ready(const Hash32& fact) const;
    void remember_resolved_locked(const Hash32& fact);
    void forget_locked(const Hash32& fact, const std::vector<std::pair<Hash32, Hash32>>& work);

    std::shared_ptr<l1::L1Client> l1_;
    Channel<ResolvedFact>& resolved_out_;
    std::chrono::milliseconds poll_interval_;
    bool allow_out_of_order_;

    ConcurrentMap<Hash32, std::vector<Hash32>> pages_by_fact_;
    ConcurrentMap<Hash32, Hash32> tx_by_page_;

    mutable std::mutex mutex_;
    std::deque<Hash32> queue_;
    std::map<Hash32, uint64_t> queued_;  // fact -> block observed
    std::set<Hash32> resolved_;          // recently resolved
    std::deque<Hash32> resolved_order_;  // eviction order of resolved_
    size_t resolved_total_ = 0;
    std::optional<Hash32> resolving_;

    std::mutex poll_mutex_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace stark_sync
