#include <gtest/gtest.h>
#include <butterfly/producer.hpp>
#include <butterfly/config.hpp>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include "test_helpers.hpp"

using namespace butterfly;

TEST(ProducerTest, RunsUntilStopped) {
    std::atomic<int> calls{0};
    Producer producer("counter", [&calls]() { calls.fetch_add(1); return false; }, 0.001);

    producer.start();
    EXPECT_TRUE(producer.is_running());
    EXPECT_TRUE(test_utils::wait_until([&]() { return calls.load() >= 5; }));

    producer.stop();
    EXPECT_FALSE(producer.is_running());
    int after = calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(calls.load(), after);
    EXPECT_GE(producer.steps(), 5u);
}

TEST(ProducerTest, BusyStepSkipsTheSleep) {
    std::atomic<int> calls{0};
    // A one-hour interval would stall the test if busy steps slept
    Producer producer("busy", [&calls]() { return calls.fetch_add(1) < 100; }, 3600.0);

    producer.start();
    EXPECT_TRUE(test_utils::wait_until([&]() { return calls.load() >= 101; }));
    producer.stop();
}

TEST(ProducerTest, StopWakesLongSleep) {
    Producer producer("sleepy", []() { return false; }, 3600.0);
    producer.start();
    test_utils::wait_until([&]() { return producer.steps() >= 1; });

    auto begin = std::chrono::steady_clock::now();
    producer.stop();
    auto took = std::chrono::steady_clock::now() - begin;
    EXPECT_LT(took, std::chrono::seconds(2));
}

TEST(ProducerTest, ExceptionStopsOnlyThisProducer) {
    test_utils::LogCapture capture(log::Level::Error);

    std::atomic<int> healthy_calls{0};
    Producer failing("failing", []() -> bool { throw std::runtime_error("step exploded"); }, 0.001);
    Producer healthy("healthy", [&]() { healthy_calls.fetch_add(1); return false; }, 0.001);

    failing.start();
    healthy.start();

    EXPECT_TRUE(test_utils::wait_until([&]() { return failing.failed(); }));
    EXPECT_TRUE(test_utils::wait_until([&]() { return !failing.is_running(); }));
    EXPECT_EQ(failing.failure(), "step exploded");

    int seen = healthy_calls.load();
    EXPECT_TRUE(test_utils::wait_until([&]() { return healthy_calls.load() > seen + 3; }));
    EXPECT_TRUE(healthy.is_running());

    healthy.stop();
    failing.stop();
    EXPECT_TRUE(test_utils::LogCapture::contains("step exploded"));
}

TEST(ProducerTest, FailureHandlerRunsOnce) {
    std::atomic<int> handled{0};
    std::string seen;
    std::mutex seen_mutex;

    Producer failing("failing", []() -> bool { throw std::runtime_error("wing gone"); }, 0.001,
                     [&](const std::string& what) {
                         std::lock_guard<std::mutex> lock(seen_mutex);
                         seen = what;
                         handled.fetch_add(1);
                     });

    failing.start();
    EXPECT_TRUE(test_utils::wait_until([&]() { return !failing.is_running(); }));
    failing.stop();

    EXPECT_EQ(handled.load(), 1);
    std::lock_guard<std::mutex> lock(seen_mutex);
    EXPECT_EQ(seen, "wing gone");
}

TEST(ProducerTest, DoubleStartThrows) {
    Producer producer("once", []() { return false; }, 0.01);
    producer.start();
    EXPECT_THROW(producer.start(), std::runtime_error);
    producer.stop();

    // Restart after stop is fine
    producer.start();
    EXPECT_TRUE(producer.is_running());
    producer.stop();
}

TEST(ProducerTest, RejectsBadConstruction) {
    EXPECT_THROW(Producer("bad", Producer::Step{}, 0.1), ConfigError);
    EXPECT_THROW(Producer("bad", []() { return false; }, -1.0), ConfigError);
}
