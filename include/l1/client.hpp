#pragma once

#include "l1/types.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace stark_sync {
namespace l1 {

/**
 * LogSubscription - live stream of logs matching a filter
 */
class LogSubscription {
public:
    virtual ~LogSubscription() = default;

    /**
     * Wait up to `timeout` for the next log.
     *
     * @return nullopt when nothing arrived within the timeout
     * @throws TransportError when the subscription is broken; it must be
     *         re-established by the caller
     */
    virtual std::optional<L1Log> poll(std::chrono::milliseconds timeout) = 0;

    virtual void unsubscribe() = 0;
};

/**
 * L1Client - Ethereum node connection
 *
 * Every call may throw TransportError.
 */
class L1Client {
public:
    virtual ~L1Client() = default;

    virtual uint64_t chain_id() = 0;
    virtual uint64_t block_number() = 0;
    virtual std::vector<L1Log> filter_logs(const FilterQuery& query) = 0;
    virtual std::unique_ptr<LogSubscription> subscribe_filter_logs(const FilterQuery& query) = 0;
    virtual std::optional<L1Transaction> transaction_by_hash(const Hash32& hash) = 0;
    virtual void close() = 0;
};

} // namespace l1
} // namespace stark_sync
