#include <butterfly/metric_pool.hpp>
#include <algorithm>
#include <new>
#include <numeric>
#include <stdexcept>

namespace butterfly {

namespace {
constexpr size_t CHUNKS_PER_WORKER = 4;
}

const char* sweep_error_description(SweepError error) {
    switch (error) {
        case SweepError::None: return "no error";
        case SweepError::OutOfMemory: return "out of memory";
        case SweepError::Exception: return "exception in chunk";
        case SweepError::Unhandled: return "non-standard exception in chunk";
    }
    return "unknown error";
}

MetricPool::MetricPool(size_t workers) {
    size_t count = workers == 0 ? std::thread::hardware_concurrency() : workers;
    if (count == 0) count = 1;

    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

MetricPool::~MetricPool() {
    shutdown();
}

void MetricPool::start() {
    std::lock_guard<std::mutex> sweep(sweep_mutex_);
    if (is_running()) return;

    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        stopping_ = false;
        unclaimed_ = 0;
        unfinished_ = 0;
    }
    for (size_t i = 0; i < workers_.size(); ++i) {
        workers_[i]->thread = std::thread([this, i]() { worker_loop(i); });
    }
    running_.store(true, std::memory_order_release);
}

void MetricPool::shutdown() {
    std::lock_guard<std::mutex> sweep(sweep_mutex_);
    if (!is_running()) return;

    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    running_.store(false, std::memory_order_release);
}

std::optional<std::uint64_t> MetricPool::sum_ranges(size_t count, const RangeSum& range_sum) {
    std::lock_guard<std::mutex> sweep(sweep_mutex_);
    if (!is_running()) {
        throw std::runtime_error("metric pool is not running");
    }
    error_.store(SweepError::None, std::memory_order_release);
    if (count == 0) return std::uint64_t(0);

    size_t chunks = std::min(count, workers_.size() * CHUNKS_PER_WORKER);
    size_t chunk_size = (count + chunks - 1) / chunks;
    chunks = (count + chunk_size - 1) / chunk_size;

    partial_.assign(chunks, 0);
    current_ = &range_sum;

    for (size_t c = 0; c < chunks; ++c) {
        Chunk chunk{c * chunk_size, std::min(count, (c + 1) * chunk_size), c};
        Worker& worker = *workers_[c % workers_.size()];
        std::lock_guard<std::mutex> lock(worker.mutex);
        worker.chunks.push_back(chunk);
    }

    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        unclaimed_ += chunks;
        unfinished_ += chunks;
    }
    work_cv_.notify_all();

    {
        std::unique_lock<std::mutex> lock(signal_mutex_);
        done_cv_.wait(lock, [this]() { return unfinished_ == 0; });
    }
    current_ = nullptr;

    if (error() != SweepError::None) {
        return std::nullopt;
    }
    return std::accumulate(partial_.begin(), partial_.end(), std::uint64_t(0));
}

void MetricPool::worker_loop(size_t self) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(signal_mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || unclaimed_ > 0; });
            if (unclaimed_ == 0) return;
            --unclaimed_;
        }

        run_chunk(claim_chunk(self));

        std::lock_guard<std::mutex> lock(signal_mutex_);
        if (--unfinished_ == 0) {
            done_cv_.notify_all();
        }
    }
}

// The caller already holds a claim, so some queue has a chunk for it
MetricPool::Chunk MetricPool::claim_chunk(size_t self) {
    {
        Worker& own = *workers_[self];
        std::lock_guard<std::mutex> lock(own.mutex);
        if (!own.chunks.empty()) {
            Chunk chunk = own.chunks.back();
            own.chunks.pop_back();
            return chunk;
        }
    }

    for (size_t offset = 1;; ++offset) {
        Worker& victim = *workers_[(self + offset) % workers_.size()];
        std::lock_guard<std::mutex> lock(victim.mutex);
        if (!victim.chunks.empty()) {
            Chunk chunk = victim.chunks.front();
            victim.chunks.pop_front();
            return chunk;
        }
    }
}

void MetricPool::run_chunk(const Chunk& chunk) {
    try {
        partial_[chunk.slot] = (*current_)(chunk.begin, chunk.end);
    } catch (const std::bad_alloc&) {
        record_error(SweepError::OutOfMemory);
    } catch (const std::exception&) {
        record_error(SweepError::Exception);
    } catch (...) {
        record_error(SweepError::Unhandled);
    }
}

void MetricPool::record_error(SweepError error) {
    SweepError expected = SweepError::None;
    error_.compare_exchange_strong(expected, error, std::memory_order_acq_rel);
}

} // namespace butterfly
