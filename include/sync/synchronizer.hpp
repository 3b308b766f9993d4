#pragma once

#include "common/config.hpp"
#include "feeder/client.hpp"
#include "l1/client.hpp"
#include "state/state_materializer.hpp"
#include "storage/checkpoint_store.hpp"
#include "storage/database.hpp"
#include "sync/channel.hpp"
#include "sync/event_ingestor.hpp"
#include "sync/fact_resolver.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace stark_sync {

// Everything the tasks share, passed explicitly
struct SyncContext {
    Config config;
    std::shared_ptr<storage::Database> db;
    std::shared_ptr<l1::L1Client> l1;
    std::shared_ptr<feeder::FeederClient> feeder;
};

/**
 * Synchronizer - owns the four long-running tasks
 *
 *   ingestion     EventIngestor::run          -> event channel
 *   dispatch      FactResolver::run_dispatch  <- event channel
 *   poller        FactResolver::run           -> resolved channel
 *   materializer  StateMaterializer::run      <- resolved channel, feeder
 *
 * stop() shuts them down front to back so that nothing in flight is lost:
 * ingestion first, then the event channel is closed and drained by the
 * dispatcher, then the poller and the materializer, then the L1 client.
 */
class Synchronizer {
public:
    explicit Synchronizer(SyncContext context);
    ~Synchronizer();

    Synchronizer(const Synchronizer&) = delete;
    Synchronizer& operator=(const Synchronizer&) = delete;

    void start();
    void stop();

    bool running() const { return running_.load(); }

    // Backfill reached the L1 head and the feeder has no newer block
    bool caught_up() const;

    // Ingestion gave up or the materializer halted
    bool failed() const;

    // False on timeout or failure
    bool wait_until_caught_up(std::chrono::milliseconds timeout);

    EventIngestor& ingestor() { return *ingestor_; }
    FactResolver& resolver() { return *resolver_; }
    StateMaterializer& materializer() { return *materializer_; }
    const storage::CheckpointStore& l1_checkpoint() const { return *l1_checkpoint_; }

private:
    SyncContext context_;
    Channel<l1::L1Event> events_;
    Channel<ResolvedFact> resolved_;

    std::shared_ptr<storage::CheckpointStore> l1_checkpoint_;
    std::unique_ptr<EventIngestor> ingestor_;
    std::unique_ptr<FactResolver> resolver_;
    std::unique_ptr<StateMaterializer> materializer_;

    std::thread ingest_thread_;
    std::thread dispatch_thread_;
    std::thread poller_thread_;
    std::thread materializer_thread_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ingestion_failed_{false};
};

} // namespace stark_sync
