#ifndef BUTTERFLY_PRODUCER_HPP
#define BUTTERFLY_PRODUCER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace butterfly {

/**
 * One independently paced execution context.
 *
 * Runs step() on its own thread, then sleeps for the interval unless step
 * returned true (more work is waiting). stop() wakes the sleep and joins.
 * An exception escaping step() ends this producer only: it is logged, kept
 * in failure() and handed to the failure handler, which runs once on the
 * producer's thread before it exits.
 */
class Producer {
public:
    using Step = std::function<bool()>;
    using FailureHandler = std::function<void(const std::string& what)>;

    Producer(std::string name, Step step, double interval_seconds,
             FailureHandler on_failure = nullptr);
    ~Producer() { stop(); }

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    // Throws std::runtime_error if already running
    void start();
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    bool failed() const { return failed_.load(std::memory_order_acquire); }
    std::string failure() const;

    std::uint64_t steps() const { return steps_.load(std::memory_order_relaxed); }
    const std::string& name() const { return name_; }

private:
    void run();
    void fail(std::string what);

    std::string name_;
    Step step_;
    FailureHandler on_failure_;
    std::chrono::microseconds interval_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<std::uint64_t> steps_{0};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_ = false;   // Guarded by wake_mutex_

    mutable std::mutex failure_mutex_;
    std::string failure_;
};

} // namespace butterfly

#endif // BUTTERFLY_PRODUCER_HPP
