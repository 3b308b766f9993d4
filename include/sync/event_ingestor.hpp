#pragma once

#include "common/config.hpp"
#include "feeder/client.hpp"
#include "l1/client.hpp"
#include "l1/events.hpp"
#include "storage/checkpoint_store.hpp"
#include "sync/channel.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stark_sync {

/**
 * EventIngestor - L1 log ingestion, backfill then live-tail
 *
 * Backfill walks [start, head] in non-overlapping windows with one
 * filter_logs query per window. A failing window is retried with
 * exponential backoff and gives up with IngestionError after
 * `max_retries` retries. The L1 checkpoint advances to a window's last
 * block once every log of the window was sent.
 *
 * Live-tail then subscribes from head + 1. Logs at or before the last
 * emitted (block, log_index) are dropped, so a re-established subscription
 * never duplicates; the checkpoint advances each time the stream moves to
 * a new block. A broken subscription is re-established with backoff from
 * the last fully ingested block + 1.
 */
class EventIngestor {
public:
    struct Stats {
        std::atomic<uint64_t> windows{0};
        std::atomic<uint64_t> logs{0};
        std::atomic<uint64_t> events{0};
        std::atomic<uint64_t> decode_errors{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> reconnects{0};
    };

    EventIngestor(std::shared_ptr<l1::L1Client> l1,
                  std::shared_ptr<feeder::FeederClient> feeder,
                  std::shared_ptr<storage::CheckpointStore> checkpoint,
                  Channel<l1::L1Event>& events,
                  const Config& config);

    /**
     * Resolve chain id, deployment floor and the three watched contracts.
     * The state contract comes from configuration or the feeder gateway.
     *
     * @throws IngestionError when discovery keeps failing
     */
    l1::WatchedContracts discover();

    // Skip discovery, e.g. when the addresses are known up front
    void set_contracts(const l1::WatchedContracts& contracts, uint64_t deployment_floor);

    // max(deployment floor, checkpoint + 1)
    uint64_t start_block() const;

    /**
     * Ingest [from, head]. Returns the last block fully ingested, which is
     * below `head` only when stopped early.
     *
     * @throws IngestionError when a window exhausts its retries
     */
    uint64_t backfill(uint64_t from, uint64_t head);

    // Follow new logs from `from` until stop()
    void live_tail(uint64_t from);

    /**
     * discover (if needed), backfill to the current head, live-tail.
     * Returns after stop(); throws IngestionError on fatal failure.
     */
    void run();

    void stop();
    bool stopping() const { return stop_requested_.load(); }

    // True once backfill reached the head observed at start
    bool caught_up() const { return caught_up_.load(); }

    std::optional<l1::LogPosition> last_emitted() const;
    const Stats& stats() const { return stats_; }

private:
    template <typename Fn>
    auto with_retry(const std::string& what, Fn&& fn) -> std::optional<decltype(fn())>;

    bool emit(const l1::L1Log& log);
    bool advance_checkpoint(uint64_t height);
    l1::FilterQuery make_query(uint64_t from, std::optional<uint64_t> to) const;

    // Sleeps unless stop() is called first; false when interrupted
    bool sleep_for(std::chrono::milliseconds duration);
    std::chrono::milliseconds next_backoff(std::chrono::milliseconds current) const;

    std::shared_ptr<l1::L1Client> l1_;
    std::shared_ptr<feeder::FeederClient> feeder_;
    std::shared_ptr<storage::CheckpointStore> checkpoint_;
    Channel<l1::L1Event>& events_;
    Config config_;

    std::unique_ptr<l1::EventDecoder> decoder_;
    uint64_t deployment_floor_ = 0;

    mutable std::mutex position_mutex_;
    std::optional<l1::LogPosition> last_emitted_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> caught_up_{false};

    Stats stats_;
};

} // namespace stark_sync
