#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "feeder/replay_client.hpp"
#include "l1/replay_client.hpp"
#include "l1_fixtures.hpp"
#include "storage/checkpoint_store.hpp"
#include "sync/event_ingestor.hpp"
#include <chrono>
#include <thread>

using namespace stark_sync;
using fixtures::word;

class EventIngestorTest : public ::testing::Test {
protected:
    void SetUp() override {
        l1_ = std::make_shared<l1::ReplayL1Client>(5);
        db_ = std::make_shared<storage::MemoryDatabase>();
        checkpoint_ = std::make_shared<storage::CheckpointStore>(db_, storage::CheckpointStore::L1_KEY);

        config_.ingest.window_size = 10;
        config_.ingest.max_retries = 2;
        config_.ingest.initial_backoff_ms = 1;
        config_.ingest.max_backoff_ms = 4;
        config_.ingest.subscription_poll_ms = 10;
    }

    std::unique_ptr<EventIngestor> make_ingestor(std::shared_ptr<feeder::FeederClient> feeder = nullptr) {
        auto ingestor = std::make_unique<EventIngestor>(l1_, feeder, checkpoint_, events_, config_);
        ingestor->set_contracts(fixtures::watched(), 100);
        return ingestor;
    }

    std::vector<l1::L1Event> drain() {
        std::vector<l1::L1Event> out;
        while (auto event = events_.try_receive()) {
            out.push_back(std::move(*event));
        }
        return out;
    }

    // Waits for `count` events or the deadline
    std::vector<l1::L1Event> receive(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::vector<l1::L1Event> out;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (out.size() < count && std::chrono::steady_clock::now() < deadline) {
            if (auto event = events_.try_receive()) {
                out.push_back(std::move(*event));
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        return out;
    }

    static void expect_strictly_ordered(const std::vector<l1::L1Event>& events) {
        for (size_t i = 1; i < events.size(); ++i) {
            EXPECT_TRUE(events[i - 1].position() < events[i].position())
                << "event " << i << " at block " << events[i].block_number;
        }
    }

    std::shared_ptr<l1::ReplayL1Client> l1_;
    std::shared_ptr<storage::MemoryDatabase> db_;
    std::shared_ptr<storage::CheckpointStore> checkpoint_;
    Channel<l1::L1Event> events_{1024};
    Config config_;
};

TEST_F(EventIngestorTest, StartBlockHonorsFloorAndCheckpoint) {
    auto ingestor = make_ingestor();
    EXPECT_EQ(ingestor->start_block(), 100u);
    checkpoint_->save(150);
    EXPECT_EQ(ingestor->start_block(), 151u);
}

TEST_F(EventIngestorTest, BackfillWindowsAreContiguous) {
    for (uint64_t block = 100; block <= 135; block += 5) {
        l1_->add_log(fixtures::fact_log(word(block), block, 0));
    }
    auto ingestor = make_ingestor();

    EXPECT_EQ(ingestor->backfill(100, 135), 135u);

    auto queries = l1_->filter_history();
    ASSERT_EQ(queries.size(), 4u);
    uint64_t expected_from = 100;
    for (const auto& query : queries) {
        EXPECT_EQ(query.from_block, expected_from);
        ASSERT_TRUE(query.to_block.has_value());
        EXPECT_LE(*query.to_block - query.from_block + 1, 10u);
        expected_from = *query.to_block + 1;
    }
    EXPECT_EQ(*queries.back().to_block, 135u);

    auto events = drain();
    EXPECT_EQ(events.size(), 8u);
    expect_strictly_ordered(events);
    EXPECT_EQ(checkpoint_->load(), 135u);
    EXPECT_EQ(ingestor->stats().windows.load(), 4u);
}

TEST_F(EventIngestorTest, TransientFailuresAreRetried) {
    l1_->add_log(fixtures::fact_log(word(1), 104, 0));
    l1_->fail_next_filter_logs(2);
    auto ingestor = make_ingestor();

    EXPECT_EQ(ingestor->backfill(100, 104), 104u);
    EXPECT_EQ(ingestor->stats().retries.load(), 2u);
    EXPECT_EQ(drain().size(), 1u);
    EXPECT_EQ(checkpoint_->load(), 104u);
}

TEST_F(EventIngestorTest, ExhaustedRetriesAreFatal) {
    l1_->add_log(fixtures::fact_log(word(1), 104, 0));
    l1_->fail_next_filter_logs(3);
    auto ingestor = make_ingestor();

    EXPECT_THROW(ingestor->backfill(100, 104), IngestionError);
    EXPECT_FALSE(checkpoint_->try_load().has_value());
    EXPECT_TRUE(drain().empty());
}

TEST_F(EventIngestorTest, UndecodableLogsAreSkipped) {
    l1::L1Log broken = fixtures::pages_log(word(1), {word(2)}, 101, 0);
    broken.data.resize(40);
    l1_->add_log(broken);
    l1_->add_log(fixtures::fact_log(word(3), 101, 1));
    auto ingestor = make_ingestor();

    ingestor->backfill(100, 101);
    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].log_index, 1u);
    EXPECT_EQ(ingestor->stats().decode_errors.load(), 1u);
    EXPECT_EQ(checkpoint_->load(), 101u);
}

TEST_F(EventIngestorTest, DiscoversStateContractFromFeeder) {
    auto feeder = std::make_shared<feeder::ReplayFeederClient>();
    feeder::ContractAddresses addresses;
    addresses.starknet = fixtures::watched().state;
    feeder->set_contract_addresses(addresses);

    EventIngestor ingestor(l1_, feeder, checkpoint_, events_, config_);
    l1::WatchedContracts contracts = ingestor.discover();
    EXPECT_EQ(contracts.state, fixtures::watched().state);
    EXPECT_EQ(contracts.verifier, l1::contracts_for_chain(5).verifier);
    EXPECT_EQ(ingestor.start_block(), l1::contracts_for_chain(5).deployment_floor);
}

TEST_F(EventIngestorTest, DiscoveryWithoutStateContractFails) {
    EventIngestor ingestor(l1_, nullptr, checkpoint_, events_, config_);
    EXPECT_THROW(ingestor.discover(), IngestionError);
}

TEST_F(EventIngestorTest, LiveTailReconnectsWithoutDuplicates) {
    l1_->add_log(fixtures::fact_log(word(1), 100, 0));
    l1_->add_log(fixtures::pages_log(word(1), {word(2)}, 100, 1));
    l1_->fail_next_subscribes(1);
    auto ingestor = make_ingestor();

    std::thread runner([&] { ingestor->run(); });

    auto backfilled = receive(2);
    ASSERT_EQ(backfilled.size(), 2u);

    l1_->add_log(fixtures::page_fact_log(word(2), 101, 0));
    l1_->add_log(fixtures::fact_log(word(5), 101, 1));
    l1_->add_log(fixtures::fact_log(word(6), 102, 0));
    auto live = receive(3);
    ASSERT_EQ(live.size(), 3u);
    EXPECT_TRUE(ingestor->caught_up());

    // Reconnect resumes from block 102, whose first log was already emitted
    l1_->break_subscriptions();
    l1_->add_log(fixtures::fact_log(word(7), 103, 0));
    auto after = receive(1);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].block_number, 103u);

    ingestor->stop();
    runner.join();

    EXPECT_TRUE(drain().empty());
    std::vector<l1::L1Event> all = backfilled;
    all.insert(all.end(), live.begin(), live.end());
    all.insert(all.end(), after.begin(), after.end());
    expect_strictly_ordered(all);

    auto subscriptions = l1_->subscribe_history();
    ASSERT_GE(subscriptions.size(), 3u);
    EXPECT_EQ(subscriptions[0].from_block, 101u);
    EXPECT_EQ(subscriptions.back().from_block, 102u);
    EXPECT_EQ(checkpoint_->load(), 102u);
    EXPECT_GE(ingestor->stats().reconnects.load(), 2u);
}
