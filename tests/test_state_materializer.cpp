#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "feeder/replay_client.hpp"
#include "hash/pedersen.hpp"
#include "l1_fixtures.hpp"
#include "state/contract_state.hpp"
#include "state/state_materializer.hpp"
#include <thread>

using namespace stark_sync;

namespace {

// Rejects the next `failures` batch writes
class FlakyDatabase : public storage::MemoryDatabase {
public:
    bool write_batch(const WriteBatch& batch) override {
        if (failures > 0) {
            --failures;
            return false;
        }
        return MemoryDatabase::write_batch(batch);
    }

    std::atomic<int> failures{0};
};

const FieldElement kContract(0x1234);
const FieldElement kContractHash(0xabcd);

} // namespace

class StateMaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_shared<FlakyDatabase>();
        feeder_ = std::make_shared<feeder::ReplayFeederClient>();
        feeder::ContractCode code;
        code.bytecode = {FieldElement(1), FieldElement(2), FieldElement(3)};
        feeder_->add_code(kContract, code);

        config_.state.poll_interval_ms = 10;
        config_.ingest.initial_backoff_ms = 1;
        config_.state.max_write_retries = 3;
    }

    std::unique_ptr<StateMaterializer> make_materializer() {
        return std::make_unique<StateMaterializer>(db_, feeder_, config_);
    }

    static feeder::StateUpdate deploy_block() {
        feeder::StateUpdate update;
        update.block_number = 0;
        update.block_hash = FieldElement(0x100);
        update.state_diff.deployed_contracts.push_back({kContract, kContractHash});
        update.state_diff.storage_diffs[kContract] = {{FieldElement(5), FieldElement(0x22)}};
        return update;
    }

    static feeder::StateUpdate write_block(uint64_t number, uint64_t key, uint64_t value) {
        feeder::StateUpdate update;
        update.block_number = number;
        update.block_hash = FieldElement(0x100 + number);
        update.state_diff.storage_diffs[kContract] = {{FieldElement(key), FieldElement(value)}};
        return update;
    }

    // Root of a state holding one contract with one storage slot
    static FieldElement single_slot_root(const FieldElement& key, const FieldElement& value) {
        FieldElement storage_root = Pedersen::hash(value, key) + FieldElement(251);
        FieldElement commitment = contract_state_commitment(kContractHash, storage_root);
        return Pedersen::hash(commitment, kContract) + FieldElement(251);
    }

    std::shared_ptr<FlakyDatabase> db_;
    std::shared_ptr<feeder::ReplayFeederClient> feeder_;
    Config config_;
};

TEST_F(StateMaterializerTest, MaterializesBlockZero) {
    auto materializer = make_materializer();
    EXPECT_EQ(materializer->next_block(), 0u);

    materializer->materialize(deploy_block());

    EXPECT_EQ(materializer->next_block(), 1u);
    EXPECT_EQ(materializer->checkpoint().try_load(), std::optional<uint64_t>(0));
    EXPECT_EQ(materializer->contract_hash(kContract), std::optional<FieldElement>(kContractHash));
    EXPECT_EQ(materializer->storage_value(kContract, FieldElement(5)), FieldElement(0x22));
    EXPECT_EQ(materializer->state_root(), single_slot_root(FieldElement(5), FieldElement(0x22)));

    auto code = materializer->code_store().get(kContract);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(code->bytecode.size(), 3u);
    EXPECT_EQ(materializer->stats().blocks.load(), 1u);
}

TEST_F(StateMaterializerTest, LaterWritesReplaceEarlierOnes) {
    auto materializer = make_materializer();
    materializer->materialize(deploy_block());
    materializer->materialize(write_block(1, 5, 0x23));

    EXPECT_EQ(materializer->next_block(), 2u);
    EXPECT_EQ(materializer->state_root(), single_slot_root(FieldElement(5), FieldElement(0x23)));
}

TEST_F(StateMaterializerTest, ReplayingABlockIsIdempotent) {
    auto materializer = make_materializer();
    materializer->materialize(deploy_block());
    FieldElement root = materializer->state_root();
    size_t entries = db_->size();

    materializer->materialize(deploy_block());
    EXPECT_EQ(materializer->state_root(), root);
    EXPECT_EQ(materializer->next_block(), 1u);
    EXPECT_EQ(db_->size(), entries);
}

TEST_F(StateMaterializerTest, StateSurvivesReopen) {
    FieldElement root;
    {
        auto materializer = make_materializer();
        materializer->materialize(deploy_block());
        materializer->materialize(write_block(1, 6, 0x7));
        root = materializer->state_root();
    }
    auto reopened = make_materializer();
    EXPECT_EQ(reopened->next_block(), 2u);
    EXPECT_EQ(reopened->state_root(), root);
    EXPECT_EQ(reopened->storage_value(kContract, FieldElement(6)), FieldElement(7));
}

TEST_F(StateMaterializerTest, UnknownContractHalts) {
    auto materializer = make_materializer();
    feeder::StateUpdate update = write_block(0, 5, 1);
    update.state_diff.storage_diffs[FieldElement(0x9999)] = {{FieldElement(1), FieldElement(1)}};

    EXPECT_THROW(materializer->materialize(update), CommitmentError);
    EXPECT_TRUE(materializer->halted());
    EXPECT_EQ(materializer->next_block(), 0u);
    EXPECT_EQ(db_->size(), 0u);
    EXPECT_EQ(materializer->state_root(), FieldElement::zero());

    EXPECT_THROW(materializer->materialize(deploy_block()), CommitmentError);
}

TEST_F(StateMaterializerTest, CodeFetchFailureLeavesNothingBehind) {
    auto materializer = make_materializer();
    feeder_->fail_next_code_fetches(1);

    EXPECT_THROW(materializer->materialize(deploy_block()), TransportError);
    EXPECT_FALSE(materializer->halted());
    EXPECT_EQ(materializer->next_block(), 0u);
    EXPECT_EQ(db_->size(), 0u);

    materializer->materialize(deploy_block());
    EXPECT_EQ(materializer->next_block(), 1u);
}

TEST_F(StateMaterializerTest, BatchWriteIsRetried) {
    auto materializer = make_materializer();
    db_->failures = 2;
    materializer->materialize(deploy_block());
    EXPECT_EQ(materializer->next_block(), 1u);
    EXPECT_EQ(materializer->stats().write_retries.load(), 2u);
}

TEST_F(StateMaterializerTest, ExhaustedWriteRetriesRollBack) {
    auto materializer = make_materializer();
    materializer->materialize(deploy_block());
    FieldElement root = materializer->state_root();

    db_->failures = 3;
    EXPECT_THROW(materializer->materialize(write_block(1, 5, 0x99)), PersistenceError);
    EXPECT_FALSE(materializer->halted());
    EXPECT_EQ(materializer->next_block(), 1u);
    EXPECT_EQ(materializer->state_root(), root);

    materializer->materialize(write_block(1, 5, 0x99));
    EXPECT_EQ(materializer->state_root(), single_slot_root(FieldElement(5), FieldElement(0x99)));
}

TEST_F(StateMaterializerTest, StoresBlocksWhenAvailable) {
    feeder::FeederBlock block;
    block.block_hash = FieldElement(0x100);
    block.block_number = 0;
    block.transaction_hashes = {FieldElement(0x99)};
    feeder_->add_block(block);
    feeder::FeederTransaction tx;
    tx.hash = FieldElement(0x99);
    tx.type = "DEPLOY";
    feeder_->add_transaction(tx);

    auto materializer = make_materializer();
    materializer->materialize(deploy_block());
    materializer->materialize(write_block(1, 5, 1));

    auto stored = materializer->block_store().get_block_by_number(0);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->block_hash, FieldElement(0x100));
    EXPECT_TRUE(materializer->block_store().get_transaction(FieldElement(0x99)).has_value());
    // Block 1 is unknown to the gateway and is skipped
    EXPECT_FALSE(materializer->block_store().get_block_by_number(1).has_value());
    EXPECT_EQ(materializer->next_block(), 2u);
}

TEST_F(StateMaterializerTest, RecordsResolvedFacts) {
    auto materializer = make_materializer();
    ResolvedFact fact;
    fact.fact = fixtures::word(0xa);
    fact.pages = {ResolvedPage{fixtures::word(1), fixtures::tx_hash(9, 1), Bytes{9, 8, 7}}};

    materializer->record_resolved_fact(fact);
    EXPECT_EQ(materializer->page_store().get_page(fixtures::word(1)), std::optional<Bytes>(Bytes{9, 8, 7}));
    EXPECT_EQ(materializer->stats().facts_recorded.load(), 1u);
}

TEST_F(StateMaterializerTest, RunFollowsFeederAndDrainsFacts) {
    feeder_->add_state_update(deploy_block());
    feeder_->add_state_update(write_block(1, 5, 0x23));
    feeder_->fail_next_state_updates(1);

    auto materializer = make_materializer();
    Channel<ResolvedFact> resolved(8);
    std::thread runner([&] { materializer->run(resolved); });

    ResolvedFact fact;
    fact.fact = fixtures::word(0xa);
    fact.pages = {ResolvedPage{fixtures::word(1), fixtures::tx_hash(9, 1), Bytes{1}}};
    resolved.send(fact);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!(materializer->caught_up() && materializer->stats().facts_recorded.load() == 1) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    materializer->stop();
    runner.join();

    EXPECT_TRUE(materializer->caught_up());
    EXPECT_EQ(materializer->next_block(), 2u);
    EXPECT_EQ(materializer->state_root(), single_slot_root(FieldElement(5), FieldElement(0x23)));
    EXPECT_TRUE(materializer->page_store().get_fact_pages(fixtures::word(0xa)).has_value());
}

TEST_F(StateMaterializerTest, HaltReleasesBlockedProducers) {
    feeder::StateUpdate bad = write_block(0, 5, 1);
    bad.state_diff.storage_diffs[FieldElement(0x9999)] = {{FieldElement(1), FieldElement(1)}};
    feeder_->add_state_update(bad);

    auto materializer = make_materializer();
    Channel<ResolvedFact> resolved(1);
    std::thread runner([&] { materializer->run(resolved); });

    ResolvedFact fact;
    fact.fact = fixtures::word(0xa);
    // Blocks once the channel is full unless the halted consumer aborted it
    std::thread producer([&] {
        while (resolved.send(fact)) {
        }
    });

    runner.join();
    producer.join();

    EXPECT_TRUE(materializer->halted());
    EXPECT_FALSE(resolved.send(fact));
}
