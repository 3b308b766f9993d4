#include "state/state_materializer.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "hash/pedersen.hpp"
#include "state/contract_state.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <iostream>
#include <map>
#include <thread>
#include <vector>

namespace stark_sync {

namespace {

// Per-contract work of one block
struct ContractUpdate {
    FieldElement address;
    FieldElement contract_hash;
    std::unique_ptr<PatriciaTree> storage;
    FieldElement storage_root;
    FieldElement commitment;
};

} // namespace

StateMaterializer::StateMaterializer(std::shared_ptr<storage::Database> db,
                                     std::shared_ptr<feeder::FeederClient> feeder,
                                     const Config& config)
    : db_(std::move(db)),
      feeder_(std::move(feeder)),
      config_(config),
      code_store_(db_),
      hash_store_(db_),
      block_store_(db_),
      page_store_(db_),
      checkpoint_(db_, storage::CheckpointStore::L2_KEY) {
    if (!db_ || !feeder_) {
        throw std::invalid_argument("StateMaterializer requires a database and a feeder client");
    }
    state_tree_ = std::make_unique<PatriciaTree>(
        std::make_shared<storage::PrefixedDatabase>(db_, "state/"));
    Pedersen::warm_up();
}

std::unique_ptr<PatriciaTree> StateMaterializer::open_storage_tree(const FieldElement& address) const {
    return std::make_unique<PatriciaTree>(
        std::make_shared<storage::PrefixedDatabase>(db_, "storage/" + address.to_hex() + "/"));
}

uint64_t StateMaterializer::next_block() const {
    auto last = checkpoint_.try_load();
    return last ? *last + 1 : 0;
}

void StateMaterializer::materialize(const feeder::StateUpdate& update) {
    std::lock_guard<std::mutex> lock(materialize_mutex_);
    if (halted_.load()) {
        throw CommitmentError("Materializer halted, refusing block " + std::to_string(update.block_number));
    }
    auto start = std::chrono::steady_clock::now();
    const auto& diff = update.state_diff;
    storage::Database::WriteBatch batch;

    // Deployed contracts: code and contract hash
    std::map<FieldElement, FieldElement> new_hashes;
    for (const auto& deployed : diff.deployed_contracts) {
        feeder::ContractCode code = feeder_->get_code(deployed.address, update.block_hash);
        code_store_.stage(batch, deployed.address, code);
        hash_store_.stage(batch, deployed.address, deployed.contract_hash);
        new_hashes[deployed.address] = deployed.contract_hash;
        STARK_SYNC_DEBUG_COUT("[state] Deployed contract=0x" << deployed.address.to_hex()
                              << " hash=0x" << deployed.contract_hash.to_hex()
                              << " bytecode=" << code.bytecode.size() << std::endl);
    }

    std::vector<ContractUpdate> contracts;
    FieldElement new_root;
    try {
        std::map<FieldElement, const std::vector<feeder::KV>*> touched;
        for (const auto& deployed : new_hashes) {
            touched.emplace(deployed.first, nullptr);
        }
        for (const auto& [address, writes] : diff.storage_diffs) {
            touched[address] = &writes;
        }

        for (const auto& [address, writes] : touched) {
            ContractUpdate entry;
            entry.address = address;
            auto known = new_hashes.find(address);
            if (known != new_hashes.end()) {
                entry.contract_hash = known->second;
            } else if (auto stored = hash_store_.get(address)) {
                entry.contract_hash = *stored;
            } else {
                throw CommitmentError("Storage diff for unknown contract address=0x" + address.to_hex() +
                                      " block=" + std::to_string(update.block_number));
            }
            entry.storage = open_storage_tree(address);
            if (writes) {
                for (const auto& kv : *writes) {
                    try {
                        entry.storage->put(kv.key, kv.value);
                    } catch (const std::invalid_argument& e) {
                        throw CommitmentError("Invalid storage key=0x" + kv.key.to_hex() +
                                              " address=0x" + address.to_hex() + ": " + e.what());
                    }
                }
            }
            contracts.push_back(std::move(entry));
        }

        auto hash_start = std::chrono::steady_clock::now();
        tbb::parallel_for(tbb::blocked_range<size_t>(0, contracts.size()),
                          [&contracts](const tbb::blocked_range<size_t>& range) {
                              for (size_t i = range.begin(); i != range.end(); ++i) {
                                  ContractUpdate& entry = contracts[i];
                                  entry.storage_root = entry.storage->root();
                                  entry.commitment = contract_state_commitment(entry.contract_hash,
                                                                               entry.storage_root);
                              }
                          });
        STARK_SYNC_PROFILE_COUT("[state] Commitments contracts=" << contracts.size() << " time_ms="
                                << std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - hash_start).count()
                                << std::endl);

        for (const auto& entry : contracts) {
            state_tree_->put(entry.address, entry.commitment);
        }
        new_root = state_tree_->root();
    } catch (const CommitmentError& e) {
        state_tree_->discard();
        halted_.store(true);
        std::cerr << "[state] Commitment failed, halting block=" << update.block_number
                  << " block_hash=0x" << update.block_hash.to_hex() << " error=" << e.what() << std::endl;
        throw;
    }

    if (new_root != update.new_root) {
        std::cout << "[state] Root differs from feeder block=" << update.block_number
                  << " computed=0x" << new_root.to_hex()
                  << " reported=0x" << update.new_root.to_hex() << std::endl;
    }

    for (const auto& entry : contracts) {
        entry.storage->commit(batch);
    }
    state_tree_->commit(batch);
    if (config_.state.store_blocks) {
        stage_block(batch, update);
    }

    if (!write_with_retry(batch, "block " + std::to_string(update.block_number))) {
        state_tree_->discard();
        throw PersistenceError("Failed to write state of block " + std::to_string(update.block_number) +
                               " after " + std::to_string(config_.state.max_write_retries) + " attempts");
    }
    state_tree_->mark_committed();
    checkpoint_.advance(update.block_number);

    stats_.blocks++;
    stats_.contracts += contracts.size();
    std::cout << "[state] Materialized block=" << update.block_number
              << " contracts=" << contracts.size()
              << " deployed=" << diff.deployed_contracts.size()
              << " root=0x" << new_root.to_hex() << std::endl;
    STARK_SYNC_PROFILE_COUT("[state] Block time_ms="
                            << std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - start).count()
                            << " batch=" << batch.size() << std::endl);
}

void StateMaterializer::stage_block(storage::Database::WriteBatch& batch, const feeder::StateUpdate& update) {
    // Block data is informational; a gateway that lacks it does not stop the state
    try {
        feeder::FeederBlock block = feeder_->get_block(update.block_hash);
        std::vector<feeder::FeederTransaction> transactions;
        transactions.reserve(block.transaction_hashes.size());
        for (const auto& tx_hash : block.transaction_hashes) {
            transactions.push_back(feeder_->get_transaction(tx_hash));
        }
        block_store_.stage_block(batch, block);
        for (const auto& tx : transactions) {
            block_store_.stage_transaction(batch, tx);
        }
    } catch (const TransportError& e) {
        std::cerr << "[state] Block not stored block=" << update.block_number
                  << " block_hash=0x" << update.block_hash.to_hex() << " error=" << e.what() << std::endl;
    } catch (const DecodeError& e) {
        std::cerr << "[state] Block not stored block=" << update.block_number
                  << " block_hash=0x" << update.block_hash.to_hex() << " error=" << e.what() << std::endl;
    }
}

bool StateMaterializer::write_with_retry(const storage::Database::WriteBatch& batch, const std::string& what) {
    const uint32_t attempts = std::max<uint32_t>(1, config_.state.max_write_retries);
    auto backoff = std::chrono::milliseconds(10);
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        if (db_->write_batch(batch)) {
            return true;
        }
        std::cerr << "[state] Batch write failed op=" << what << " attempt=" << attempt
                  << " entries=" << batch.size() << std::endl;
        if (attempt < attempts) {
            stats_.write_retries++;
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return false;
}

void StateMaterializer::record_resolved_fact(const ResolvedFact& fact) {
    storage::Database::WriteBatch batch;
    page_store_.stage(batch, fact);
    if (!write_with_retry(batch, "fact " + fact.fact.to_hex())) {
        throw PersistenceError("Failed to store memory pages of fact " + fact.fact.to_hex());
    }
    stats_.facts_recorded++;
    STARK_SYNC_DEBUG_COUT("[state] Stored memory pages fact=" << fact.fact
                          << " pages=" << fact.pages.size() << std::endl);
}

void StateMaterializer::drain_resolved(Channel<ResolvedFact>& resolved) {
    while (auto fact = resolved.try_receive()) {
        try {
            record_resolved_fact(*fact);
        } catch (const PersistenceError& e) {
            std::cerr << "[state] Dropping memory pages fact=" << fact->fact
                      << " error=" << e.what() << std::endl;
        }
    }
}

bool StateMaterializer::sleep_for(std::chrono::milliseconds duration, Channel<ResolvedFact>& resolved) {
    const auto slice = std::chrono::milliseconds(100);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (true) {
        drain_resolved(resolved);
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto wait = std::min<std::chrono::steady_clock::duration>(slice, deadline - now);
        std::unique_lock<std::mutex> lock(stop_mutex_);
        if (stop_cv_.wait_for(lock, wait, [this] { return stop_requested_.load(); })) {
            return false;
        }
    }
}

void StateMaterializer::run(Channel<ResolvedFact>& resolved) {
    const auto poll_interval = std::chrono::milliseconds(config_.state.poll_interval_ms);
    const auto retry_interval = std::min(poll_interval, std::chrono::milliseconds(config_.ingest.initial_backoff_ms));
    std::cout << "[state] Materializer started next_block=" << next_block()
              << " poll_ms=" << poll_interval.count() << std::endl;

    while (!stop_requested_.load() && !halted_.load()) {
        uint64_t block_number = next_block();
        std::optional<feeder::StateUpdate> update;
        try {
            update = feeder_->get_state_update(block_number);
        } catch (const TransportError& e) {
            std::cerr << "[state] State update fetch failed block=" << block_number
                      << " error=" << e.what() << std::endl;
            if (!sleep_for(retry_interval, resolved)) break;
            continue;
        } catch (const DecodeError& e) {
            std::cerr << "[state] State update malformed block=" << block_number
                      << " error=" << e.what() << std::endl;
            if (!sleep_for(poll_interval, resolved)) break;
            continue;
        }

        if (!update) {
            if (!caught_up_.exchange(true)) {
                std::cout << "[state] Caught up next_block=" << block_number << std::endl;
            }
            if (!sleep_for(poll_interval, resolved)) break;
            continue;
        }

        try {
            materialize(*update);
        } catch (const CommitmentError&) {
            break;
        } catch (const TransportError& e) {
            std::cerr << "[state] Retrying block=" << block_number << " error=" << e.what() << std::endl;
            if (!sleep_for(retry_interval, resolved)) break;
        } catch (const DecodeError& e) {
            std::cerr << "[state] Retrying block=" << block_number << " error=" << e.what() << std::endl;
            if (!sleep_for(retry_interval, resolved)) break;
        } catch (const PersistenceError& e) {
            std::cerr << "[state] Retrying block=" << block_number << " error=" << e.what() << std::endl;
            if (!sleep_for(retry_interval, resolved)) break;
        }
        drain_resolved(resolved);
    }
    if (halted_.load()) {
        // Nothing consumes resolved facts any more; release blocked senders
        resolved.abort();
    } else {
        drain_resolved(resolved);
    }

    std::cout << "[state] Materializer stopped next_block=" << next_block()
              << " blocks=" << stats_.blocks.load()
              << " halted=" << (halted_.load() ? "true" : "false") << std::endl;
}

void StateMaterializer::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_cv_.notify_all();
}

FieldElement StateMaterializer::state_root() {
    std::lock_guard<std::mutex> lock(materialize_mutex_);
    return state_tree_->root();
}

FieldElement StateMaterializer::storage_root(const FieldElement& address) const {
    return open_storage_tree(address)->root();
}

FieldElement StateMaterializer::storage_value(const FieldElement& address, const FieldElement& key) const {
    return open_storage_tree(address)->get(key);
}

std::optional<FieldElement> StateMaterializer::contract_hash(const FieldElement& address) const {
    return hash_store_.get(address);
}

} // namespace stark_sync
