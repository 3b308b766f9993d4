#pragma once

#include "common/config.hpp"
#include "feeder/client.hpp"
#include "state/stores.hpp"
#include "storage/checkpoint_store.hpp"
#include "sync/channel.hpp"
#include "sync/fact_resolver.hpp"
#include "trie/patricia_tree.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace stark_sync {

/**
 * StateMaterializer - applies feeder state updates to the local state tree
 *
 * One block at a time: fetch the code of deployed contracts, apply storage
 * diffs to per-contract storage trees, recompute the touched contract
 * commitments (in parallel), update the global state tree and write
 * everything as one batch. The L2 checkpoint ("latestStateUpdateSynced")
 * advances only after the batch is durable, so a crash in between replays
 * the block, which writes the same leaves again.
 *
 * A CommitmentError aborts the block with nothing written and halts the
 * materializer; the rest of the process keeps running.
 */
class StateMaterializer {
public:
    struct Stats {
        std::atomic<uint64_t> blocks{0};
        std::atomic<uint64_t> contracts{0};
        std::atomic<uint64_t> write_retries{0};
        std::atomic<uint64_t> facts_recorded{0};
    };

    StateMaterializer(std::shared_ptr<storage::Database> db,
                      std::shared_ptr<feeder::FeederClient> feeder,
                      const Config& config);

    /**
     * Apply one state update.
     *
     * @throws CommitmentError after halting, when a commitment cannot be computed
     * @throws TransportError  when contract code cannot be fetched
     * @throws PersistenceError when the batch write keeps failing
     */
    void materialize(const feeder::StateUpdate& update);

    // Persist the memory pages of a resolved fact
    void record_resolved_fact(const ResolvedFact& fact);

    // Block the next materialize() expects: 0 on a fresh database
    uint64_t next_block() const;

    /**
     * Poll the feeder for the next block every state poll interval and
     * drain `resolved` in between, until stop() or a halt. A halt aborts
     * `resolved` so that producers blocked on it return.
     */
    void run(Channel<ResolvedFact>& resolved);

    void stop();

    bool halted() const { return halted_.load(); }

    // True once the feeder reported no block beyond the last materialized one
    bool caught_up() const { return caught_up_.load(); }

    FieldElement state_root();
    FieldElement storage_root(const FieldElement& address) const;
    FieldElement storage_value(const FieldElement& address, const FieldElement& key) const;
    std::optional<FieldElement> contract_hash(const FieldElement& address) const;

    const CodeStore& code_store() const { return code_store_; }
    const BlockStore& block_store() const { return block_store_; }
    const MemoryPageStore& page_store() const { return page_store_; }
    const storage::CheckpointStore& checkpoint() const { return checkpoint_; }
    const Stats& stats() const { return stats_; }

private:
    std::unique_ptr<PatriciaTree> open_storage_tree(const FieldElement& address) const;
    void stage_block(storage::Database::WriteBatch& batch, const feeder::StateUpdate& update);
    bool write_with_retry(const storage::Database::WriteBatch& batch, const std::string& what);

    void drain_resolved(Channel<ResolvedFact>& resolved);

    // Sleeps unless stop() is called first; drains `resolved` meanwhile
    bool sleep_for(std::chrono::milliseconds duration, Channel<ResolvedFact>& resolved);

    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<feeder::FeederClient> feeder_;
    Config config_;

    CodeStore code_store_;
    ContractHashStore hash_store_;
    BlockStore block_store_;
    MemoryPageStore page_store_;
    storage::CheckpointStore checkpoint_;
    std::unique_ptr<PatriciaTree> state_tree_;

    std::mutex materialize_mutex_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> halted_{false};
    std::atomic<bool> caught_up_{false};

    Stats stats_;
};

} // namespace stark_sync
