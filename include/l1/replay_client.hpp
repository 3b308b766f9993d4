#pragma once

#include "l1/client.hpp"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stark_sync {
namespace l1 {

/**
 * ReplayL1Client - in-memory chain behind the L1Client interface
 *
 * Serves logs and transactions from fixtures (or built up by tests), wakes
 * live subscriptions as logs are appended, and can inject transport
 * failures on every call type.
 *
 * Fixture format:
 *   {
 *     "chain_id": 1,
 *     "head": 13627100,
 *     "logs": [ <eth_getLogs result objects> ],
 *     "transactions": [ { "hash": "0x..", "input": "0x..", "blockNumber": "0x.." } ]
 *   }
 */
class ReplayL1Client : public L1Client {
public:
    explicit ReplayL1Client(uint64_t chain_id = 1);
    ~ReplayL1Client() override;

    static std::unique_ptr<ReplayL1Client> from_json(const nlohmann::json& fixture);
    static std::unique_ptr<ReplayL1Client> from_file(const std::string& path);

    // L1Client
    uint64_t chain_id() override;
    uint64_t block_number() override;
    std::vector<L1Log> filter_logs(const FilterQuery& query) override;
    std::unique_ptr<LogSubscription> subscribe_filter_logs(const FilterQuery& query) override;
    std::optional<L1Transaction> transaction_by_hash(const Hash32& hash) override;
    void close() override;

    // Chain building. add_log raises the head to the log's block.
    void add_log(const L1Log& log);
    void add_transaction(const L1Transaction& tx);
    void set_head(uint64_t head);

    // Failure injection: the next `count` calls of that kind throw TransportError
    void fail_next_filter_logs(size_t count);
    void fail_next_transaction_fetches(size_t count);
    void fail_next_subscribes(size_t count);
    // The next subscription breaks after delivering `count` logs
    void break_next_subscription_after(size_t count);
    // Every live subscription throws on its next poll
    void break_subscriptions();

    // Observation
    std::vector<FilterQuery> filter_history() const;
    std::vector<FilterQuery> subscribe_history() const;
    size_t transaction_fetches() const;
    size_t live_subscriptions() const;
    bool closed() const;

private:
    struct SubscriptionState;
    class ReplaySubscription;

    struct Chain {
        mutable std::mutex mutex;
        std::condition_variable changed;
        uint64_t chain_id = 1;
        uint64_t head = 0;
        bool closed = false;
        std::map<LogPosition, L1Log> logs;
        std::map<Hash32, L1Transaction> transactions;

        size_t fail_filter = 0;
        size_t fail_tx = 0;
        size_t fail_subscribe = 0;
        std::optional<size_t> break_after;

        std::vector<FilterQuery> filter_history;
        std::vector<FilterQuery> subscribe_history;
        size_t tx_fetches = 0;
        std::vector<std::weak_ptr<SubscriptionState>> subscriptions;
    };

    void check_open_locked() const;

    std::shared_ptr<Chain> chain_;
};

} // namespace l1
} // namespace stark_sync
