#include <butterfly/producer.hpp>
#include <butterfly/config.hpp>
#include <butterfly/log.hpp>
#include <cmath>
#include <stdexcept>

namespace butterfly {

Producer::Producer(std::string name, Step step, double interval_seconds,
                   FailureHandler on_failure)
    : name_(std::move(name))
    , step_(std::move(step))
    , on_failure_(std::move(on_failure)) {
    if (!step_) {
        throw ConfigError("producer '" + name_ + "' needs a step function");
    }
    if (!std::isfinite(interval_seconds) || interval_seconds < 0.0) {
        throw ConfigError("producer '" + name_ + "' interval must be >= 0");
    }
    interval_ = std::chrono::microseconds(static_cast<std::int64_t>(interval_seconds * 1e6));
}

void Producer::start() {
    if (running_.load()) {
        throw std::runtime_error("producer '" + name_ + "' is already running");
    }
    if (worker_.joinable()) {
        worker_.join();  // Previous run ended on its own (failure)
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    failed_.store(false);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this]() { run(); });
}

void Producer::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
}

std::string Producer::failure() const {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    return failure_;
}

void Producer::fail(std::string what) {
    BUTTERFLY_LOG_ERROR("producer", "%s stopped after step %llu: %s", name_.c_str(),
                        static_cast<unsigned long long>(steps_.load()), what.c_str());
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        failure_ = what;
    }
    failed_.store(true, std::memory_order_release);

    if (on_failure_) {
        on_failure_(what);
    }
}

void Producer::run() {
    BUTTERFLY_LOG_DEBUG("producer", "%s started", name_.c_str());

    while (true) {
        bool more = false;
        try {
            more = step_();
        } catch (const std::exception& e) {
            fail(e.what());
            break;
        } catch (...) {
            fail("non-standard exception");
            break;
        }
        steps_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (stop_requested_) break;
        if (!more) {
            wake_cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
            if (stop_requested_) break;
        }
    }

    running_.store(false, std::memory_order_release);
    BUTTERFLY_LOG_DEBUG("producer", "%s exited", name_.c_str());
}

} // namespace butterfly
