#include <gtest/gtest.h>
#include <butterfly/metric_pool.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <new>
#include <stdexcept>
#include <thread>
#include "test_helpers.hpp"

using namespace butterfly;

namespace {

std::uint64_t serial_sum(size_t begin, size_t end) {
    std::uint64_t total = 0;
    for (size_t i = begin; i < end; ++i) total += i * i;
    return total;
}

} // namespace

class MetricPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<MetricPool>(4);
        pool->start();
    }

    void TearDown() override {
        pool.reset();
    }

    std::unique_ptr<MetricPool> pool;
};

TEST_F(MetricPoolTest, SumMatchesSerial) {
    std::atomic<size_t> covered{0};
    auto total = pool->sum_ranges(1000, [&covered](size_t begin, size_t end) {
        covered.fetch_add(end - begin);
        return serial_sum(begin, end);
    });

    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, serial_sum(0, 1000));
    EXPECT_EQ(covered.load(), 1000u);
    EXPECT_EQ(pool->error(), SweepError::None);
}

TEST_F(MetricPoolTest, FewerItemsThanChunks) {
    std::atomic<int> calls{0};
    auto total = pool->sum_ranges(3, [&calls](size_t begin, size_t end) {
        calls.fetch_add(1);
        return serial_sum(begin, end);
    });
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 0u + 1u + 4u);
    EXPECT_EQ(calls.load(), 3);

    total = pool->sum_ranges(0, [](size_t, size_t) -> std::uint64_t {
        throw std::runtime_error("never called");
    });
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 0u);
}

TEST_F(MetricPoolTest, ThrowingChunkEmptiesSweepAndPoolSurvives) {
    auto total = pool->sum_ranges(100, [](size_t begin, size_t end) -> std::uint64_t {
        if (begin == 0) throw std::runtime_error("boom");
        return serial_sum(begin, end);
    });
    EXPECT_FALSE(total.has_value());
    EXPECT_EQ(pool->error(), SweepError::Exception);
    EXPECT_STREQ(sweep_error_description(pool->error()), "exception in chunk");

    // Next sweep starts clean
    total = pool->sum_ranges(100, serial_sum);
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, serial_sum(0, 100));
    EXPECT_EQ(pool->error(), SweepError::None);
}

TEST_F(MetricPoolTest, BadAllocReportedAsOutOfMemory) {
    auto total = pool->sum_ranges(16, [](size_t, size_t) -> std::uint64_t {
        throw std::bad_alloc();
    });
    EXPECT_FALSE(total.has_value());
    EXPECT_EQ(pool->error(), SweepError::OutOfMemory);
}

TEST_F(MetricPoolTest, SweepAfterShutdownThrows) {
    pool->shutdown();
    EXPECT_FALSE(pool->is_running());
    EXPECT_THROW(pool->sum_ranges(10, serial_sum), std::runtime_error);
}

TEST_F(MetricPoolTest, RestartAfterShutdown) {
    pool->shutdown();
    pool->start();

    auto total = pool->sum_ranges(50, serial_sum);
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, serial_sum(0, 50));
}

TEST(MetricPoolSizing, ZeroMeansHardwareConcurrency) {
    MetricPool pool(0);
    EXPECT_GE(pool.worker_count(), 1u);
    EXPECT_EQ(MetricPool(3).worker_count(), 3u);
}

TEST(MetricPoolSizing, SlowChunksStillAllFinish) {
    MetricPool pool(4);
    pool.start();

    // Uneven chunk cost gives idle workers a chance to take from busy ones
    auto total = pool.sum_ranges(64, [](size_t begin, size_t end) {
        if (begin < 16) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return serial_sum(begin, end);
    });
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, serial_sum(0, 64));
    pool.shutdown();
}
