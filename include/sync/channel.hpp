#pragma once

#include <tbb/concurrent_queue.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <utility>

namespace stark_sync {

/**
 * Channel - bounded multi-producer multi-consumer hand-off between tasks
 *
 * send() blocks while the channel is full. close() lets consumers drain
 * what was sent and then see the end of the stream; abort() wakes every
 * blocked sender and receiver immediately and drops pending items.
 */
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 1024) {
        queue_.set_capacity(static_cast<std::ptrdiff_t>(capacity));
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // False when the channel is closed or aborted
    bool send(T value) {
        std::shared_lock<std::shared_mutex> lock(close_mutex_);
        if (closed_.load() || aborted_.load()) {
            return false;
        }
        try {
            queue_.push(std::optional<T>(std::move(value)));
            return true;
        } catch (const tbb::user_abort&) {
            return false;
        }
    }

    // Blocks until an item arrives. nullopt once closed and drained, or aborted.
    std::optional<T> receive() {
        if (aborted_.load()) {
            return std::nullopt;
        }
        std::optional<T> item;
        try {
            queue_.pop(item);
        } catch (const tbb::user_abort&) {
            return std::nullopt;
        }
        if (aborted_.load()) {
            // Pass the wake-up on to the next late receiver
            queue_.try_push(std::nullopt);
            return std::nullopt;
        }
        if (!item) {
            end_of_stream();
        }
        return item;
    }

    // Non-blocking receive
    std::optional<T> try_receive() {
        if (aborted_.load()) {
            return std::nullopt;
        }
        std::optional<T> item;
        if (!queue_.try_pop(item)) {
            return std::nullopt;
        }
        if (!item) {
            end_of_stream();
        }
        return item;
    }

    void close() {
        std::unique_lock<std::shared_mutex> lock(close_mutex_);
        if (closed_.exchange(true) || aborted_.load()) {
            return;
        }
        try {
            queue_.push(std::nullopt);
        } catch (const tbb::user_abort&) {
            // Aborted while waiting for room; receivers are already woken
        }
    }

    void abort() {
        aborted_.store(true);
        closed_.store(true);
        // A sender past the aborted_ check holds close_mutex_ shared and may
        // start waiting after a single abort; keep aborting until none is left
        while (!close_mutex_.try_lock()) {
            queue_.abort();
            std::this_thread::yield();
        }
        close_mutex_.unlock();
        queue_.abort();
        // Wake a receiver that started waiting after the abort
        queue_.try_push(std::nullopt);
    }

    bool closed() const { return closed_.load(); }
    bool ended() const { return ended_.load(); }

    // Approximate under concurrency
    size_t size() const {
        std::ptrdiff_t n = queue_.size();
        return n > 0 ? static_cast<size_t>(n) : 0;
    }

private:
    // Re-queue the end marker so every other consumer sees it too
    void end_of_stream() {
        ended_.store(true);
        queue_.try_push(std::nullopt);
    }

    tbb::concurrent_bounded_queue<std::optional<T>> queue_;
    std::shared_mutex close_mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> aborted_{false};
    std::atomic<bool> ended_{false};
};

} // namespace stark_sync
