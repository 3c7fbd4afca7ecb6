#ifndef BUTTERFLY_VERSIONED_CELL_HPP
#define BUTTERFLY_VERSIONED_CELL_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace butterfly {

/**
 * Single-writer, multi-reader cell holding the latest published value.
 *
 * Every publish swaps in a fresh immutable object, so a reader either sees
 * the previous value or the new one, never a mixture. The lock only guards
 * the pointer copy/swap; value construction happens outside it, so neither
 * side ever waits on the other's work.
 *
 * version() increases by one per publish and can be compared before and
 * after a multi-cell read to detect concurrent updates.
 */
template<typename T>
class VersionedCell {
public:
    using Ptr = std::shared_ptr<const T>;

    VersionedCell() : value_(std::make_shared<const T>()) {}
    explicit VersionedCell(T initial) : value_(std::make_shared<const T>(std::move(initial))) {}

    VersionedCell(const VersionedCell&) = delete;
    VersionedCell& operator=(const VersionedCell&) = delete;

    void publish(T value) {
        Ptr next = std::make_shared<const T>(std::move(value));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_.swap(next);
            version_.fetch_add(1, std::memory_order_release);
        }
        // Old value (now in next) released outside the lock
    }

    Ptr load() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    // Value and the version it was published under, read together
    std::pair<Ptr, std::uint64_t> load_versioned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {value_, version_.load(std::memory_order_relaxed)};
    }

    std::uint64_t version() const {
        return version_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    Ptr value_;
    std::atomic<std::uint64_t> version_{0};
};

} // namespace butterfly

#endif // BUTTERFLY_VERSIONED_CELL_HPP
