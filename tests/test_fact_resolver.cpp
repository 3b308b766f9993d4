#include <gtest/gtest.h>
#include "l1/replay_client.hpp"
#include "l1_fixtures.hpp"
#include "sync/fact_resolver.hpp"
#include <thread>

using namespace stark_sync;
using fixtures::word;

class FactResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        l1_ = std::make_shared<l1::ReplayL1Client>(5);
        config_.resolver.poll_interval_ms = 5;
    }

    std::unique_ptr<FactResolver> make_resolver() {
        return std::make_unique<FactResolver>(l1_, resolved_, config_);
    }

    // Page `page` carried by a transaction whose input is {tag}
    void publish_page(FactResolver& resolver, const Hash32& page, uint64_t block, uint8_t tag) {
        Hash32 tx = fixtures::tx_hash(block, tag);
        l1_->add_transaction(l1::L1Transaction{tx, Bytes{tag, tag}, block});
        resolver.dispatch(fixtures::page_fact_event(page, tx, block, tag));
    }

    std::vector<ResolvedFact> drain() {
        std::vector<ResolvedFact> out;
        while (auto fact = resolved_.try_receive()) {
            out.push_back(std::move(*fact));
        }
        return out;
    }

    std::shared_ptr<l1::ReplayL1Client> l1_;
    Channel<ResolvedFact> resolved_{64};
    Config config_;
};

TEST_F(FactResolverTest, ResolvesWhenEveryPageIsCarried) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    EXPECT_EQ(resolver->state_of(word(0xa)), FactState::Observed);

    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1), word(2)}, 10, 1));
    EXPECT_EQ(resolver->state_of(word(0xa)), FactState::PagesKnown);

    publish_page(*resolver, word(1), 9, 1);
    EXPECT_EQ(resolver->poll_once(), 0u);
    EXPECT_EQ(l1_->transaction_fetches(), 0u);

    publish_page(*resolver, word(2), 9, 2);
    EXPECT_EQ(resolver->poll_once(), 1u);

    auto facts = drain();
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0].fact, word(0xa));
    EXPECT_EQ(facts[0].block_number, 10u);
    ASSERT_EQ(facts[0].pages.size(), 2u);
    EXPECT_EQ(facts[0].pages[0].page_hash, word(1));
    EXPECT_EQ(facts[0].pages[1].data, (Bytes{2, 2}));
    EXPECT_EQ(resolver->state_of(word(0xa)), FactState::Resolved);
    EXPECT_EQ(resolver->pending(), 0u);
}

TEST_F(FactResolverTest, PagesMayArriveBeforeTheFact) {
    auto resolver = make_resolver();
    publish_page(*resolver, word(1), 8, 1);
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 9));
    EXPECT_FALSE(resolver->state_of(word(0xa)).has_value());

    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    EXPECT_EQ(resolver->poll_once(), 1u);
}

TEST_F(FactResolverTest, HeadOfQueueBlocksInOrderMode) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::fact_event(word(0xb), 11));
    resolver->dispatch(fixtures::pages_event(word(0xb), {word(2)}, 11, 1));
    publish_page(*resolver, word(2), 11, 2);

    EXPECT_EQ(resolver->poll_once(), 0u);
    EXPECT_EQ(resolver->pending(), 2u);

    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 12));
    publish_page(*resolver, word(1), 12, 1);
    EXPECT_EQ(resolver->poll_once(), 2u);

    auto facts = drain();
    ASSERT_EQ(facts.size(), 2u);
    EXPECT_EQ(facts[0].fact, word(0xa));
    EXPECT_EQ(facts[1].fact, word(0xb));
}

TEST_F(FactResolverTest, OutOfOrderTakesFirstReadyFact) {
    config_.resolver.allow_out_of_order = true;
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::fact_event(word(0xb), 11));
    resolver->dispatch(fixtures::pages_event(word(0xb), {word(2)}, 11, 1));
    publish_page(*resolver, word(2), 11, 2);

    EXPECT_EQ(resolver->poll_once(), 1u);
    auto facts = drain();
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0].fact, word(0xb));
    EXPECT_EQ(resolver->state_of(word(0xa)), FactState::Observed);
}

TEST_F(FactResolverTest, FailedFetchKeepsFactQueued) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 10, 1));
    publish_page(*resolver, word(1), 9, 1);

    l1_->fail_next_transaction_fetches(1);
    EXPECT_EQ(resolver->poll_once(), 0u);
    EXPECT_EQ(resolver->state_of(word(0xa)), FactState::PagesKnown);
    EXPECT_TRUE(drain().empty());

    EXPECT_EQ(resolver->poll_once(), 1u);
    EXPECT_EQ(drain().size(), 1u);
}

TEST_F(FactResolverTest, MissingCarrierTransactionKeepsFactQueued) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 10, 1));
    resolver->dispatch(fixtures::page_fact_event(word(1), word(0xdead), 9));

    EXPECT_EQ(resolver->poll_once(), 0u);
    EXPECT_EQ(resolver->pending(), 1u);
}

TEST_F(FactResolverTest, RepeatedEventsAreIgnored) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    EXPECT_EQ(resolver->pending(), 1u);

    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 10, 1));
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(7), word(8)}, 10, 2));
    publish_page(*resolver, word(1), 9, 1);
    EXPECT_EQ(resolver->poll_once(), 1u);
    auto facts = drain();
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0].pages.size(), 1u);

    resolver->dispatch(fixtures::fact_event(word(0xa), 12));
    EXPECT_EQ(resolver->pending(), 0u);
    EXPECT_EQ(resolver->resolved_count(), 1u);
}

TEST_F(FactResolverTest, DispatcherDrainsChannel) {
    auto resolver = make_resolver();
    Channel<l1::L1Event> events(16);
    Hash32 tx = fixtures::tx_hash(9, 1);
    l1_->add_transaction(l1::L1Transaction{tx, Bytes{1}, 9});

    events.send(fixtures::page_fact_event(word(1), tx, 9, 1));
    events.send(fixtures::fact_event(word(0xa), 10));
    events.send(fixtures::pages_event(word(0xa), {word(1)}, 10, 1));
    events.close();

    resolver->run_dispatch(events);
    EXPECT_TRUE(resolver->has_pages(word(0xa)));
    EXPECT_TRUE(resolver->has_carrier(word(1)));
    EXPECT_EQ(resolver->poll_once(), 1u);
}

TEST_F(FactResolverTest, PollerResolvesInBackground) {
    auto resolver = make_resolver();
    std::thread poller([&] { resolver->run(); });

    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 10, 1));
    publish_page(*resolver, word(1), 9, 1);

    auto fact = resolved_.receive();
    resolver->stop();
    poller.join();

    ASSERT_TRUE(fact.has_value());
    EXPECT_EQ(fact->fact, word(0xa));
}

TEST_F(FactResolverTest, ResolvedFactReleasesItsTables) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1), word(2)}, 10, 1));
    publish_page(*resolver, word(1), 9, 1);
    publish_page(*resolver, word(2), 9, 2);
    EXPECT_EQ(resolver->tracked_page_sets(), 1u);
    EXPECT_EQ(resolver->tracked_carriers(), 2u);

    EXPECT_EQ(resolver->poll_once(), 1u);
    EXPECT_EQ(resolver->tracked_page_sets(), 0u);
    EXPECT_EQ(resolver->tracked_carriers(), 0u);
    EXPECT_EQ(resolver->state_of(word(0xa)), FactState::Resolved);

    // A late page set for a resolved fact is not retained
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 11, 1));
    EXPECT_FALSE(resolver->has_pages(word(0xa)));
}

TEST_F(FactResolverTest, SharedPageKeepsCarrierForPendingFact) {
    auto resolver = make_resolver();
    resolver->dispatch(fixtures::fact_event(word(0xa), 10));
    resolver->dispatch(fixtures::fact_event(word(0xb), 11));
    resolver->dispatch(fixtures::pages_event(word(0xa), {word(1)}, 10, 1));
    resolver->dispatch(fixtures::pages_event(word(0xb), {word(1), word(2)}, 11, 1));
    publish_page(*resolver, word(1), 9, 1);

    EXPECT_EQ(resolver->poll_once(), 1u);
    EXPECT_FALSE(resolver->has_pages(word(0xa)));
    EXPECT_TRUE(resolver->has_carrier(word(1)));

    publish_page(*resolver, word(2), 11, 2);
    EXPECT_EQ(resolver->poll_once(), 1u);
    EXPECT_EQ(resolver->tracked_page_sets(), 0u);
    EXPECT_EQ(resolver->tracked_carriers(), 0u);
    EXPECT_EQ(drain().size(), 2u);
}

TEST_F(FactResolverTest, DuplicateWindowIsBounded) {
    auto resolver = make_resolver();
    const size_t total = FactResolver::RECENT_FACTS + 1;
    Hash32 tx = fixtures::tx_hash(9, 1);
    l1_->add_transaction(l1::L1Transaction{tx, Bytes{1}, 9});

    for (size_t i = 0; i < total; ++i) {
        Hash32 fact = word(0x10000 + i);
        Hash32 page = word(0x20000 + i);
        resolver->dispatch(fixtures::fact_event(fact, 10));
        resolver->dispatch(fixtures::pages_event(fact, {page}, 10, 1));
        resolver->dispatch(fixtures::page_fact_event(page, tx, 9));
        ASSERT_EQ(resolver->poll_once(), 1u);
        drain();
    }

    EXPECT_EQ(resolver->resolved_count(), total);
    EXPECT_FALSE(resolver->state_of(word(0x10000)).has_value());
    EXPECT_EQ(resolver->state_of(word(0x10000 + total - 1)), FactState::Resolved);
    EXPECT_EQ(resolver->tracked_carriers(), 0u);
}
