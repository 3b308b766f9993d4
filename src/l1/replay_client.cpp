#include "l1/replay_client.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "l1/json_codec.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace stark_sync {
namespace l1 {

struct ReplayL1Client::SubscriptionState {
    FilterQuery query;
    std::optional<LogPosition> last;
    std::optional<size_t> remaining_before_break;
    bool broken = false;
    bool active = true;
};

class ReplayL1Client::ReplaySubscription : public LogSubscription {
public:
    ReplaySubscription(std::shared_ptr<Chain> chain, std::shared_ptr<SubscriptionState> state)
        : chain_(std::move(chain)), state_(std::move(state)) {}

    ~ReplaySubscription() override { unsubscribe(); }

    std::optional<L1Log> poll(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(chain_->mutex);
        chain_->changed.wait_for(lock, timeout, [this] {
            return !state_->active || state_->broken || chain_->closed || next_locked() != nullptr;
        });

        if (!state_->active) {
            return std::nullopt;
        }
        if (chain_->closed) {
            throw TransportError("L1 client closed");
        }
        if (state_->broken) {
            throw TransportError("Log subscription dropped by the node");
        }
        const L1Log* next = next_locked();
        if (next == nullptr) {
            return std::nullopt;
        }
        if (state_->remaining_before_break) {
            if (*state_->remaining_before_break == 0) {
                state_->broken = true;
                throw TransportError("Log subscription dropped by the node");
            }
            --*state_->remaining_before_break;
        }
        state_->last = position_of(*next);
        return *next;
    }

    void unsubscribe() override {
        std::lock_guard<std::mutex> lock(chain_->mutex);
        if (state_->active) {
            state_->active = false;
            chain_->changed.notify_all();
        }
    }

private:
    // First matching log after the last delivered position
    const L1Log* next_locked() const {
        auto it = state_->last ? chain_->logs.upper_bound(*state_->last) : chain_->logs.begin();
        for (; it != chain_->logs.end(); ++it) {
            if (state_->query.matches(it->second)) {
                return &it->second;
            }
        }
        return nullptr;
    }

    std::shared_ptr<Chain> chain_;
    std::shared_ptr<SubscriptionState> state_;
};

ReplayL1Client::ReplayL1Client(uint64_t chain_id) : chain_(std::make_shared<Chain>()) {
    chain_->chain_id = chain_id;
}

ReplayL1Client::~ReplayL1Client() = default;

std::unique_ptr<ReplayL1Client> ReplayL1Client::from_json(const nlohmann::json& fixture) {
    auto client = std::make_unique<ReplayL1Client>(fixture.value("chain_id", static_cast<uint64_t>(1)));
    if (fixture.contains("head")) {
        client->set_head(parse_quantity(fixture.at("head")));
    }
    if (fixture.contains("logs")) {
        for (const auto& entry : fixture.at("logs")) {
            client->add_log(parse_log(entry));
        }
    }
    if (fixture.contains("transactions")) {
        for (const auto& entry : fixture.at("transactions")) {
            client->add_transaction(parse_transaction(entry));
        }
    }
    std::cout << "[l1] Loaded replay chain chain_id=" << client->chain_->chain_id
              << " head=" << client->chain_->head
              << " logs=" << client->chain_->logs.size()
              << " transactions=" << client->chain_->transactions.size() << std::endl;
    return client;
}

std::unique_ptr<ReplayL1Client> ReplayL1Client::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return from_json(nlohmann::json::parse(file));
}

void ReplayL1Client::check_open_locked() const {
    if (chain_->closed) {
        throw TransportError("L1 client closed");
    }
}

uint64_t ReplayL1Client::chain_id() {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    check_open_locked();
    return chain_->chain_id;
}

uint64_t ReplayL1Client::block_number() {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    check_open_locked();
    return chain_->head;
}

std::vector<L1Log> ReplayL1Client::filter_logs(const FilterQuery& query) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    check_open_locked();
    chain_->filter_history.push_back(query);
    if (chain_->fail_filter > 0) {
        --chain_->fail_filter;
        throw TransportError("eth_getLogs failed from_block=" + std::to_string(query.from_block));
    }

    FilterQuery bounded = query;
    if (!bounded.to_block) {
        bounded.to_block = chain_->head;
    }
    std::vector<L1Log> result;
    for (auto it = chain_->logs.lower_bound(LogPosition{query.from_block, 0});
         it != chain_->logs.end(); ++it) {
        if (it->first.block_number > *bounded.to_block) {
            break;
        }
        if (bounded.matches(it->second)) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::unique_ptr<LogSubscription> ReplayL1Client::subscribe_filter_logs(const FilterQuery& query) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    check_open_locked();
    chain_->subscribe_history.push_back(query);
    if (chain_->fail_subscribe > 0) {
        --chain_->fail_subscribe;
        throw TransportError("eth_subscribe failed from_block=" + std::to_string(query.from_block));
    }

    auto state = std::make_shared<SubscriptionState>();
    state->query = query;
    state->query.to_block.reset();
    state->remaining_before_break = chain_->break_after;
    chain_->break_after.reset();

    // Drop expired entries while registering
    auto& subs = chain_->subscriptions;
    subs.erase(std::remove_if(subs.begin(), subs.end(),
                              [](const std::weak_ptr<SubscriptionState>& w) { return w.expired(); }),
               subs.end());
    subs.push_back(state);
    return std::make_unique<ReplaySubscription>(chain_, state);
}

std::optional<L1Transaction> ReplayL1Client::transaction_by_hash(const Hash32& hash) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    check_open_locked();
    ++chain_->tx_fetches;
    if (chain_->fail_tx > 0) {
        --chain_->fail_tx;
        throw TransportError("eth_getTransactionByHash failed hash=" + hash.to_hex());
    }
    auto it = chain_->transactions.find(hash);
    if (it == chain_->transactions.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ReplayL1Client::close() {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    if (!chain_->closed) {
        chain_->closed = true;
        chain_->changed.notify_all();
        STARK_SYNC_DEBUG_COUT("[l1] Replay client closed" << std::endl);
    }
}

void ReplayL1Client::add_log(const L1Log& log) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->logs[position_of(log)] = log;
    chain_->head = std::max(chain_->head, log.block_number);
    chain_->changed.notify_all();
}

void ReplayL1Client::add_transaction(const L1Transaction& tx) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->transactions[tx.hash] = tx;
}

void ReplayL1Client::set_head(uint64_t head) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->head = head;
    chain_->changed.notify_all();
}

void ReplayL1Client::fail_next_filter_logs(size_t count) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->fail_filter = count;
}

void ReplayL1Client::fail_next_transaction_fetches(size_t count) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->fail_tx = count;
}

void ReplayL1Client::fail_next_subscribes(size_t count) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->fail_subscribe = count;
}

void ReplayL1Client::break_next_subscription_after(size_t count) {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    chain_->break_after = count;
}

void ReplayL1Client::break_subscriptions() {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    for (const auto& weak : chain_->subscriptions) {
        if (auto state = weak.lock()) {
            state->broken = true;
        }
    }
    chain_->changed.notify_all();
}

std::vector<FilterQuery> ReplayL1Client::filter_history() const {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    return chain_->filter_history;
}

std::vector<FilterQuery> ReplayL1Client::subscribe_history() const {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    return chain_->subscribe_history;
}

size_t ReplayL1Client::transaction_fetches() const {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    return chain_->tx_fetches;
}

size_t ReplayL1Client::live_subscriptions() const {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    size_t count = 0;
    for (const auto& weak : chain_->subscriptions) {
        auto state = weak.lock();
        if (state && state->active && !state->broken) {
            ++count;
        }
    }
    return count;
}

bool ReplayL1Client::closed() const {
    std::lock_guard<std::mutex> lock(chain_->mutex);
    return chain_->closed;
}

} // namespace l1
} // namespace stark_sync
