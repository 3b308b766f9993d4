#include "sync/event_ingestor.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>

namespace stark_sync {

EventIngestor::EventIngestor(std::shared_ptr<l1::L1Client> l1,
                             std::shared_ptr<feeder::FeederClient> feeder,
                             std::shared_ptr<storage::CheckpointStore> checkpoint,
                             Channel<l1::L1Event>& events,
                             const Config& config)
    : l1_(std::move(l1)),
      feeder_(std::move(feeder)),
      checkpoint_(std::move(checkpoint)),
      events_(events),
      config_(config) {
    if (!l1_ || !checkpoint_) {
        throw std::invalid_argument("EventIngestor requires an L1 client and a checkpoint store");
    }
}

template <typename Fn>
auto EventIngestor::with_retry(const std::string& what, Fn&& fn) -> std::optional<decltype(fn())> {
    auto backoff = std::chrono::milliseconds(config_.ingest.initial_backoff_ms);
    for (uint32_t attempt = 0;; ++attempt) {
        std::string error;
        try {
            return fn();
        } catch (const TransportError& e) {
            error = e.what();
        } catch (const PersistenceError& e) {
            error = e.what();
        }

        if (attempt >= config_.ingest.max_retries) {
            std::cerr << "[ingest] Giving up op=" << what << " attempts=" << (attempt + 1)
                      << " error=" << error << std::endl;
            throw IngestionError(what + " failed after " + std::to_string(attempt + 1) +
                                 " attempts: " + error);
        }
        std::cerr << "[ingest] Retrying op=" << what << " attempt=" << (attempt + 1)
                  << " backoff_ms=" << backoff.count() << " error=" << error << std::endl;
        stats_.retries++;
        if (!sleep_for(backoff)) {
            return std::nullopt;
        }
        backoff = next_backoff(backoff);
    }
}

std::chrono::milliseconds EventIngestor::next_backoff(std::chrono::milliseconds current) const {
    auto doubled = current * 2;
    auto cap = std::chrono::milliseconds(config_.ingest.max_backoff_ms);
    return std::max(std::chrono::milliseconds(1), std::min(doubled, cap));
}

bool EventIngestor::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
}

void EventIngestor::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_cv_.notify_all();
}

l1::WatchedContracts EventIngestor::discover() {
    uint64_t chain_id = config_.network.chain_id_override;
    if (chain_id == 0) {
        auto id = with_retry("chain_id", [this] { return l1_->chain_id(); });
        if (!id) {
            throw IngestionError("Contract discovery interrupted by shutdown");
        }
        chain_id = *id;
    }
    l1::NetworkContracts network = l1::contracts_for_chain(chain_id);

    l1::WatchedContracts contracts;
    contracts.verifier = network.verifier;
    contracts.memory_registry = network.memory_registry;
    if (!config_.network.state_contract.empty()) {
        contracts.state = EthAddress::from_hex(config_.network.state_contract);
    } else {
        if (!feeder_) {
            throw IngestionError("No state contract configured and no feeder gateway to ask");
        }
        auto addresses = with_retry("get_contract_addresses",
                                    [this] { return feeder_->get_contract_addresses(); });
        if (!addresses) {
            throw IngestionError("Contract discovery interrupted by shutdown");
        }
        contracts.state = addresses->starknet;
    }

    std::cout << "[ingest] Discovered contracts network=" << network.name
              << " chain_id=" << chain_id
              << " state=" << contracts.state
              << " verifier=" << contracts.verifier
              << " memory_registry=" << contracts.memory_registry
              << " floor=" << network.deployment_floor << std::endl;

    set_contracts(contracts, network.deployment_floor);
    return contracts;
}

void EventIngestor::set_contracts(const l1::WatchedContracts& contracts, uint64_t deployment_floor) {
    decoder_ = std::make_unique<l1::EventDecoder>(contracts);
    if (!config_.network.abi_dir.empty()) {
        decoder_->load_abis(config_.network.abi_dir);
    }
    deployment_floor_ = deployment_floor;
}

uint64_t EventIngestor::start_block() const {
    return std::max(deployment_floor_, checkpoint_->load() + 1);
}

l1::FilterQuery EventIngestor::make_query(uint64_t from, std::optional<uint64_t> to) const {
    l1::FilterQuery query;
    query.from_block = from;
    query.to_block = to;
    query.addresses = decoder_->addresses();
    query.topics = l1::EventDecoder::topic_filter();
    return query;
}

bool EventIngestor::emit(const l1::L1Log& log) {
    stats_.logs++;
    if (log.removed) {
        STARK_SYNC_DEBUG_COUT("[ingest] Skipping removed log block=" << log.block_number
                              << " index=" << log.log_index << std::endl);
        return true;
    }

    std::optional<l1::L1Event> event;
    try {
        event = decoder_->decode(log);
    } catch (const DecodeError& e) {
        stats_.decode_errors++;
        std::cerr << "[ingest] Skipping undecodable log address=" << log.address
                  << " block=" << log.block_number << " index=" << log.log_index
                  << " tx=" << log.tx_hash << " error=" << e.what() << std::endl;
        return true;
    }
    if (!event) {
        return true;
    }

    STARK_SYNC_DEBUG_COUT("[ingest] Event " << l1::event_name(*event)
                          << " block=" << event->block_number
                          << " index=" << event->log_index << std::endl);
    if (!events_.send(std::move(*event))) {
        std::cerr << "[ingest] Event channel closed, dropping block=" << log.block_number
                  << " index=" << log.log_index << std::endl;
        return false;
    }
    stats_.events++;

    std::lock_guard<std::mutex> lock(position_mutex_);
    last_emitted_ = l1::position_of(log);
    return true;
}

bool EventIngestor::advance_checkpoint(uint64_t height) {
    auto written = with_retry("checkpoint " + std::to_string(height),
                              [this, height] { return checkpoint_->advance(height); });
    return written.has_value();
}

std::optional<l1::LogPosition> EventIngestor::last_emitted() const {
    std::lock_guard<std::mutex> lock(position_mutex_);
    return last_emitted_;
}

uint64_t EventIngestor::backfill(uint64_t from, uint64_t head) {
    if (!decoder_) {
        throw std::logic_error("EventIngestor::backfill called before contract discovery");
    }
    if (from == 0) {
        throw std::invalid_argument("EventIngestor::backfill from_block must be positive");
    }
    const uint64_t window = config_.ingest.window_size;
    uint64_t done = from - 1;

    while (from <= head && !stopping()) {
        uint64_t to = std::min(from + window - 1, head);
        auto start = std::chrono::steady_clock::now();

        l1::FilterQuery query = make_query(from, to);
        auto logs = with_retry("filter_logs " + std::to_string(from) + "-" + std::to_string(to),
                               [this, &query] { return l1_->filter_logs(query); });
        if (!logs) {
            break;
        }

        // filter_logs returns chain order; sort anyway so positions only grow
        std::sort(logs->begin(), logs->end(), [](const l1::L1Log& a, const l1::L1Log& b) {
            return l1::position_of(a) < l1::position_of(b);
        });

        bool complete = true;
        for (const auto& log : *logs) {
            if (!emit(log)) {
                complete = false;
                break;
            }
        }
        if (!complete) {
            break;
        }

        if (!advance_checkpoint(to)) {
            break;
        }
        stats_.windows++;
        done = to;

        std::cout << "[ingest] Fetched logs from_block=" << from << " to_block=" << to
                  << " count=" << logs->size() << std::endl;
        STARK_SYNC_PROFILE_COUT("[ingest] Window time_ms="
                                << std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start).count()
                                << std::endl);
        from = to + 1;
    }
    return done;
}

void EventIngestor::live_tail(uint64_t from) {
    if (!decoder_) {
        throw std::logic_error("EventIngestor::live_tail called before contract discovery");
    }
    const auto poll_timeout = std::chrono::milliseconds(config_.ingest.subscription_poll_ms);
    const auto initial_backoff = std::chrono::milliseconds(config_.ingest.initial_backoff_ms);
    auto backoff = initial_backoff;

    uint64_t next_from = from;
    std::optional<uint64_t> current_block;

    while (!stopping()) {
        std::unique_ptr<l1::LogSubscription> subscription;
        try {
            subscription = l1_->subscribe_filter_logs(make_query(next_from, std::nullopt));
            std::cout << "[ingest] Subscribed to live logs from_block=" << next_from << std::endl;
        } catch (const TransportError& e) {
            std::cerr << "[ingest] Subscribe failed from_block=" << next_from
                      << " backoff_ms=" << backoff.count() << " error=" << e.what() << std::endl;
            stats_.reconnects++;
            if (!sleep_for(backoff)) break;
            backoff = next_backoff(backoff);
            continue;
        }

        try {
            while (!stopping()) {
                std::optional<l1::L1Log> log = subscription->poll(poll_timeout);
                if (!log) {
                    continue;
                }
                backoff = initial_backoff;
                if (log->removed) {
                    continue;
                }
                auto last = last_emitted();
                if (last && l1::position_of(*log) <= *last) {
                    STARK_SYNC_DEBUG_COUT("[ingest] Dropping already emitted log block="
                                          << log->block_number << " index=" << log->log_index << std::endl);
                    continue;
                }

                // Moving to a new block completes the previous one
                if (current_block && log->block_number > *current_block) {
                    try {
                        advance_checkpoint(*current_block);
                    } catch (const IngestionError& e) {
                        // The checkpoint lags; the block is re-ingested after a restart
                        std::cerr << "[ingest] Checkpoint not advanced block=" << *current_block
                                  << " error=" << e.what() << std::endl;
                    }
                }
                current_block = log->block_number;

                if (!emit(*log)) {
                    stop();
                    break;
                }
            }
        } catch (const TransportError& e) {
            // Resume from the first block not fully ingested
            next_from = current_block ? *current_block : next_from;
            std::cerr << "[ingest] Subscription error, reconnecting from_block=" << next_from
                      << " backoff_ms=" << backoff.count() << " error=" << e.what() << std::endl;
            stats_.reconnects++;
            subscription->unsubscribe();
            if (!sleep_for(backoff)) break;
            backoff = next_backoff(backoff);
            continue;
        }
        subscription->unsubscribe();
    }
    std::cout << "[ingest] Live-tail stopped last_block="
              << (current_block ? std::to_string(*current_block) : std::string("none")) << std::endl;
}

void EventIngestor::run() {
    if (!decoder_) {
        discover();
    }
    uint64_t start = start_block();
    auto head = with_retry("block_number", [this] { return l1_->block_number(); });
    if (!head) {
        return;
    }

    std::cout << "[ingest] Starting backfill from_block=" << start << " head=" << *head
              << " window=" << config_.ingest.window_size << std::endl;
    if (start <= *head) {
        uint64_t done = backfill(start, *head);
        if (done < *head) {
            std::cout << "[ingest] Backfill interrupted last_block=" << done << std::endl;
            return;
        }
    }
    caught_up_.store(true);
    std::cout << "[ingest] Backfill complete head=" << *head << std::endl;

    if (!stopping()) {
        live_tail(std::max(*head + 1, start));
    }
}

} // namespace stark_sync
