#include "sync/fact_resolver.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace stark_sync {

const char* fact_state_name(FactState state) {
    switch (state) {
        case FactState::Observed: return "observed";
        case FactState::PagesKnown: return "pages_known";
        case FactState::Resolving: return "resolving";
        case FactState::Resolved: return "resolved";
    }
    return "unknown";
}

FactResolver::FactResolver(std::shared_ptr<l1::L1Client> l1, Channel<ResolvedFact>& resolved,
                           const Config& config)
    : l1_(std::move(l1)),
      resolved_out_(resolved),
      poll_interval_(config.resolver.poll_interval_ms),
      allow_out_of_order_(config.resolver.allow_out_of_order) {
    if (!l1_) {
        throw std::invalid_argument("FactResolver requires an L1 client");
    }
}

void FactResolver::dispatch(const l1::L1Event& event) {
    if (const auto* fact_event = std::get_if<l1::StateTransitionFactEvent>(&event.payload)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolved_.count(fact_event->fact) || queued_.count(fact_event->fact)) {
            STARK_SYNC_DEBUG_COUT("[resolver] Ignoring repeated fact=" << fact_event->fact << std::endl);
            return;
        }
        queue_.push_back(fact_event->fact);
        queued_[fact_event->fact] = event.block_number;
        std::cout << "[resolver] Observed fact=" << fact_event->fact
                  << " block=" << event.block_number << " pending=" << queue_.size() << std::endl;
    } else if (const auto* pages_event = std::get_if<l1::MemoryPagesHashesEvent>(&event.payload)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (resolved_.count(pages_event->fact)) {
                return;
            }
        }
        if (pages_by_fact_.add(pages_event->fact, pages_event->pages)) {
            STARK_SYNC_DEBUG_COUT("[resolver] Page set fact=" << pages_event->fact
                                  << " pages=" << pages_event->pages.size() << std::endl);
        }
    } else if (const auto* page_event = std::get_if<l1::MemoryPageFactEvent>(&event.payload)) {
        if (tx_by_page_.add(page_event->memory_hash, page_event->tx_hash)) {
            STARK_SYNC_DEBUG_COUT("[resolver] Page carrier page=" << page_event->memory_hash
                                  << " tx=" << page_event->tx_hash << std::endl);
        }
    }
}

bool FactResolver::is_ready(const Hash32& fact) const {
    auto pages = pages_by_fact_.get(fact);
    if (!pages) {
        return false;
    }
    return std::all_of(pages->begin(), pages->end(),
                       [this](const Hash32& page) { return tx_by_page_.exists(page); });
}

std::optional<size_t> FactResolver::pick_ready_locked() const {
    if (queue_.empty()) {
        return std::nullopt;
    }
    if (!allow_out_of_order_) {
        return is_ready(queue_.front()) ? std::optional<size_t>(0) : std::nullopt;
    }
    for (size_t i = 0; i < queue_.size(); ++i) {
        if (is_ready(queue_[i])) {
            return i;
        }
    }
    return std::nullopt;
}

void FactResolver::remember_resolved_locked(const Hash32& fact) {
    resolved_.insert(fact);
    resolved_order_.push_back(fact);
    ++resolved_total_;
    while (resolved_order_.size() > RECENT_FACTS) {
        resolved_.erase(resolved_order_.front());
        resolved_order_.pop_front();
    }
}

void FactResolver::forget_locked(const Hash32& fact, const std::vector<std::pair<Hash32, Hash32>>& work) {
    pages_by_fact_.erase(fact);

    // A page still listed by a pending fact keeps its carrier
    std::set<Hash32> still_needed;
    for (const Hash32& pending : queue_) {
        if (auto pages = pages_by_fact_.get(pending)) {
            still_needed.insert(pages->begin(), pages->end());
        }
    }
    for (const auto& entry : work) {
        if (!still_needed.count(entry.first)) {
            tx_by_page_.erase(entry.first);
        }
    }
}

size_t FactResolver::poll_once() {
    std::lock_guard<std::mutex> poll_lock(poll_mutex_);
    size_t count = 0;

    while (!stop_requested_.load()) {
        Hash32 fact;
        uint64_t block_number = 0;
        std::vector<std::pair<Hash32, Hash32>> work;  // page hash, carrying tx
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto index = pick_ready_locked();
            if (!index) {
                break;
            }
            fact = queue_[*index];
            block_number = queued_[fact];
            resolving_ = fact;
            auto fact_pages = pages_by_fact_.get(fact);
            for (const Hash32& page : *fact_pages) {
                auto carrier = tx_by_page_.get(page);
                work.emplace_back(page, *carrier);
            }
        }

        // Transactions are fetched without holding the lock
        std::vector<ResolvedPage> pages;
        pages.reserve(work.size());
        bool complete = true;
        for (const auto& [page, tx_hash] : work) {
            try {
                auto tx = l1_->transaction_by_hash(tx_hash);
                if (!tx) {
                    std::cerr << "[resolver] Carrying transaction not found fact=" << fact
                              << " page=" << page << " tx=" << tx_hash << std::endl;
                    complete = false;
                    break;
                }
                pages.push_back(ResolvedPage{page, tx_hash, std::move(tx->input)});
            } catch (const TransportError& e) {
                std::cerr << "[resolver] Fetch failed fact=" << fact << " page=" << page
                          << " tx=" << tx_hash << " error=" << e.what() << std::endl;
                complete = false;
                break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            resolving_.reset();
            if (!complete) {
                break;
            }
            queue_.erase(std::find(queue_.begin(), queue_.end(), fact));
            queued_.erase(fact);
            remember_resolved_locked(fact);
            forget_locked(fact, work);
        }

        std::cout << "[resolver] Resolved fact=" << fact << " block=" << block_number
                  << " pages=" << pages.size() << std::endl;
        if (!resolved_out_.send(ResolvedFact{fact, block_number, std::move(pages)})) {
            std::cerr << "[resolver] Resolved channel closed, not forwarding fact=" << fact << std::endl;
        }
        ++count;
    }
    return count;
}

void FactResolver::run() {
    std::cout << "[resolver] Poller started interval_ms=" << poll_interval_.count()
              << " out_of_order=" << (allow_out_of_order_ ? "true" : "false") << std::endl;
    while (!stop_requested_.load()) {
        poll_once();
        std::unique_lock<std::mutex> lock(stop_mutex_);
        stop_cv_.wait_for(lock, poll_interval_, [this] { return stop_requested_.load(); });
    }
    std::cout << "[resolver] Poller stopped pending=" << pending()
              << " resolved=" << resolved_count() << std::endl;
}

void FactResolver::run_dispatch(Channel<l1::L1Event>& events) {
    size_t dispatched = 0;
    while (auto event = events.receive()) {
        dispatch(*event);
        ++dispatched;
    }
    std::cout << "[resolver] Dispatcher drained events=" << dispatched << std::endl;
}

void FactResolver::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_cv_.notify_all();
}

std::optional<FactState> FactResolver::state_of(const Hash32& fact) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resolved_.count(fact)) {
        return FactState::Resolved;
    }
    if (!queued_.count(fact)) {
        return std::nullopt;
    }
    if (resolving_ && *resolving_ == fact) {
        return FactState::Resolving;
    }
    return pages_by_fact_.exists(fact) ? FactState::PagesKnown : FactState::Observed;
}

size_t FactResolver::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t FactResolver::resolved_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_total_;
}

} // namespace stark_sync
