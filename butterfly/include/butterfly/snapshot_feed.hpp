#ifndef BUTTERFLY_SNAPSHOT_FEED_HPP
#define BUTTERFLY_SNAPSHOT_FEED_HPP

#include <butterfly/butterfly_state.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>

namespace butterfly {

/**
 * Subscription channel for ButterflyState snapshots.
 * The aggregator pushes every pass; one subscriber drains at its own pace.
 * A slow subscriber loses snapshots (counted in dropped()), it never stalls
 * the aggregator.
 *
 * Single producer, single consumer: pushes happen inside the aggregator's
 * pass lock, so only one thread writes at a time.
 */
class SnapshotFeed {
public:
    static constexpr size_t CAPACITY = 256;

    SnapshotFeed() : slots_(std::make_unique<std::array<ButterflyState, CAPACITY>>()) {}

    SnapshotFeed(const SnapshotFeed&) = delete;
    SnapshotFeed& operator=(const SnapshotFeed&) = delete;

    bool push(const ButterflyState& state) {
        std::uint64_t head = head_.load(std::memory_order_relaxed);
        if (head - tail_.load(std::memory_order_acquire) >= CAPACITY) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        (*slots_)[head % CAPACITY] = state;
        head_.store(head + 1, std::memory_order_release);
        pushed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    // Subscriber thread only
    bool try_pop(ButterflyState& out) {
        std::uint64_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) return false;
        out = (*slots_)[tail % CAPACITY];
        tail_.store(tail + 1, std::memory_order_release);
        return true;
    }

    // Subscriber thread only
    template<typename Callback>
    size_t drain(Callback&& callback, size_t max_count = SIZE_MAX) {
        size_t count = 0;
        ButterflyState state;
        while (count < max_count && try_pop(state)) {
            callback(state);
            ++count;
        }
        return count;
    }

    // Snapshots pushed but not yet drained
    size_t pending() const {
        std::uint64_t tail = tail_.load(std::memory_order_acquire);
        return static_cast<size_t>(head_.load(std::memory_order_acquire) - tail);
    }

    std::uint64_t pushed() const { return pushed_.load(std::memory_order_relaxed); }
    std::uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::unique_ptr<std::array<ButterflyState, CAPACITY>> slots_;
    alignas(64) std::atomic<std::uint64_t> head_{0};   // Next slot to write
    alignas(64) std::atomic<std::uint64_t> tail_{0};   // Next slot to read
    std::atomic<std::uint64_t> pushed_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace butterfly

#endif // BUTTERFLY_SNAPSHOT_FEED_HPP
