#ifndef BUTTERFLY_METRIC_POOL_HPP
#define BUTTERFLY_METRIC_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace butterfly {

// Why the last sweep came back empty
enum class SweepError {
    None = 0,
    OutOfMemory,   // std::bad_alloc in a chunk
    Exception,     // std::exception in a chunk
    Unhandled      // Anything else thrown by a chunk
};

const char* sweep_error_description(SweepError error);

/**
 * Worker pool for the per-generation metric sweeps.
 *
 * sum_ranges() cuts [0, count) into chunks, deals them onto the workers'
 * own queues and blocks until every chunk is summed. A worker with an empty
 * queue takes the oldest chunk of another worker. One sweep runs at a time.
 *
 * A throwing chunk never takes its worker down: the first failure of a sweep
 * is kept in error() until the next sweep, and the sweep returns nullopt.
 */
class MetricPool {
public:
    // Partial result over source indices [begin, end)
    using RangeSum = std::function<std::uint64_t(size_t begin, size_t end)>;

    // 0 workers = hardware concurrency
    explicit MetricPool(size_t workers = 0);
    ~MetricPool();

    MetricPool(const MetricPool&) = delete;
    MetricPool& operator=(const MetricPool&) = delete;

    void start();
    void shutdown();
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    size_t worker_count() const { return workers_.size(); }

    // Throws std::runtime_error if the pool is not running
    std::optional<std::uint64_t> sum_ranges(size_t count, const RangeSum& range_sum);

    SweepError error() const { return error_.load(std::memory_order_acquire); }

private:
    struct Chunk {
        size_t begin;
        size_t end;
        size_t slot;
    };

    struct Worker {
        std::mutex mutex;
        std::deque<Chunk> chunks;
        std::thread thread;
    };

    void worker_loop(size_t self);
    Chunk claim_chunk(size_t self);
    void run_chunk(const Chunk& chunk);
    void record_error(SweepError error);

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool> running_{false};

    std::mutex sweep_mutex_;            // One sweep at a time

    std::mutex signal_mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    bool stopping_ = false;             // Guarded by signal_mutex_
    size_t unclaimed_ = 0;              // Chunks queued but not yet claimed; guarded
    size_t unfinished_ = 0;             // Chunks not yet summed; guarded

    const RangeSum* current_ = nullptr;
    std::vector<std::uint64_t> partial_;
    std::atomic<SweepError> error_{SweepError::None};
};

} // namespace butterfly

#endif // BUTTERFLY_METRIC_POOL_HPP
