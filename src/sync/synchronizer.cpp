#include "sync/synchronizer.hpp"
#include "common/errors.hpp"
#include <iostream>

namespace stark_sync {

Synchronizer::Synchronizer(SyncContext context)
    : context_(std::move(context)),
      events_(context_.config.ingest.channel_capacity),
      resolved_(context_.config.ingest.channel_capacity) {
    if (!context_.db || !context_.l1 || !context_.feeder) {
        throw std::invalid_argument("Synchronizer requires a database, an L1 client and a feeder client");
    }
    context_.config.validate();

    l1_checkpoint_ = std::make_shared<storage::CheckpointStore>(context_.db, storage::CheckpointStore::L1_KEY);
    ingestor_ = std::make_unique<EventIngestor>(context_.l1, context_.feeder, l1_checkpoint_, events_,
                                                context_.config);
    resolver_ = std::make_unique<FactResolver>(context_.l1, resolved_, context_.config);
    materializer_ = std::make_unique<StateMaterializer>(context_.db, context_.feeder, context_.config);
}

Synchronizer::~Synchronizer() {
    stop();
}

void Synchronizer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }
    running_.store(true);
    std::cout << "[sync] Starting l1_checkpoint=" << l1_checkpoint_->load()
              << " next_l2_block=" << materializer_->next_block() << std::endl;

    ingest_thread_ = std::thread([this] {
        try {
            ingestor_->run();
        } catch (const IngestionError& e) {
            ingestion_failed_.store(true);
            std::cerr << "[sync] Ingestion failed, task stopped error=" << e.what() << std::endl;
        } catch (const std::exception& e) {
            ingestion_failed_.store(true);
            std::cerr << "[sync] Ingestion aborted error=" << e.what() << std::endl;
        }
    });
    dispatch_thread_ = std::thread([this] { resolver_->run_dispatch(events_); });
    poller_thread_ = std::thread([this] { resolver_->run(); });
    materializer_thread_ = std::thread([this] { materializer_->run(resolved_); });
}

void Synchronizer::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }
    std::cout << "[sync] Stopping" << std::endl;

    ingestor_->stop();
    if (ingest_thread_.joinable()) ingest_thread_.join();

    events_.close();
    if (dispatch_thread_.joinable()) dispatch_thread_.join();

    if (materializer_->halted()) {
        resolved_.abort();
    }
    // Resolve what the drained events completed before the poller goes away
    resolver_->poll_once();
    resolver_->stop();
    if (poller_thread_.joinable()) poller_thread_.join();

    resolved_.close();
    materializer_->stop();
    if (materializer_thread_.joinable()) materializer_thread_.join();

    context_.l1->close();
    running_.store(false);

    std::cout << "[sync] Stopped l1_checkpoint=" << l1_checkpoint_->load()
              << " next_l2_block=" << materializer_->next_block()
              << " pending_facts=" << resolver_->pending()
              << " resolved_facts=" << resolver_->resolved_count() << std::endl;
}

bool Synchronizer::caught_up() const {
    return ingestor_->caught_up() && materializer_->caught_up() && events_.size() == 0;
}

bool Synchronizer::failed() const {
    return ingestion_failed_.load() || materializer_->halted();
}

bool Synchronizer::wait_until_caught_up(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (failed()) {
            return false;
        }
        if (caught_up()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return caught_up();
}

} // namespace stark_sync
