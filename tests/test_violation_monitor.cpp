#include <gtest/gtest.h>
#include <butterfly/violation_monitor.hpp>
#include <memory>
#include "test_helpers.hpp"

using namespace butterfly;

class ViolationMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitor = std::make_unique<ViolationMonitor>(config, std::make_shared<test_utils::ScriptedPressure>());
    }

    const VPState& feed(double vp) {
        return monitor->on_event({{"vp", vp}});
    }

    PressureConfig config;  // threshold 0.25, ceiling 1.0
    std::unique_ptr<ViolationMonitor> monitor;
};

TEST_F(ViolationMonitorTest, FreshMonitorSitsAtCeiling) {
    EXPECT_EQ(monitor->state().calculation_count, 0u);
    EXPECT_EQ(monitor->state().vp_class, VPClass::VP4);
    EXPECT_DOUBLE_EQ(monitor->proximity(), 0.0);
    EXPECT_FALSE(monitor->converged());
}

TEST_F(ViolationMonitorTest, JustBelowThresholdIsConvergence) {
    const auto& s = feed(0.24);
    EXPECT_EQ(s.vp_class, VPClass::VP0);
    EXPECT_TRUE(monitor->converged());
    EXPECT_DOUBLE_EQ(monitor->proximity(), 1.0);
}

TEST_F(ViolationMonitorTest, ThresholdItselfIsNotConvergence) {
    const auto& s = feed(0.25);
    EXPECT_EQ(s.vp_class, VPClass::VP1);
    EXPECT_FALSE(monitor->converged());
    EXPECT_LT(monitor->proximity(), 1.0);
    EXPECT_DOUBLE_EQ(monitor->proximity(), 0.75);
}

TEST_F(ViolationMonitorTest, ClassificationBands) {
    EXPECT_EQ(monitor->classify(0.0), VPClass::VP0);
    EXPECT_EQ(monitor->classify(0.49), VPClass::VP1);
    EXPECT_EQ(monitor->classify(0.5), VPClass::VP2);
    EXPECT_EQ(monitor->classify(0.74), VPClass::VP2);
    EXPECT_EQ(monitor->classify(0.75), VPClass::VP3);
    EXPECT_EQ(monitor->classify(0.99), VPClass::VP3);
    EXPECT_EQ(monitor->classify(1.0), VPClass::VP4);
    EXPECT_EQ(monitor->classify(42.0), VPClass::VP4);
}

TEST_F(ViolationMonitorTest, ProximityFallsToZeroAtCeiling) {
    EXPECT_DOUBLE_EQ(monitor->proximity(0.5), 0.5);
    EXPECT_DOUBLE_EQ(monitor->proximity(1.0), 0.0);
    EXPECT_DOUBLE_EQ(monitor->proximity(3.0), 0.0);
    // Never 1 outside convergence
    EXPECT_LT(monitor->proximity(0.25), 1.0);
}

TEST_F(ViolationMonitorTest, CountsEveryEventExactlyOnce) {
    for (int i = 0; i < 17; ++i) {
        feed(0.1 * i);
    }
    EXPECT_EQ(monitor->state().calculation_count, 17u);
}

TEST_F(ViolationMonitorTest, EmptyTraitsHoldStateButCount) {
    feed(0.6);
    auto before = monitor->state();

    const auto& s = monitor->on_event({});
    EXPECT_DOUBLE_EQ(s.current_vp, before.current_vp);
    EXPECT_EQ(s.vp_class, before.vp_class);
    EXPECT_EQ(s.calculation_count, before.calculation_count + 1);

    // Traits the strategy can't evaluate behave the same way
    monitor->on_event({{"unrelated", 3.0}});
    EXPECT_DOUBLE_EQ(monitor->state().current_vp, 0.6);
    EXPECT_EQ(monitor->state().calculation_count, before.calculation_count + 2);
    EXPECT_EQ(monitor->history().size(), 1u);
}

TEST_F(ViolationMonitorTest, FailingPressureFunctionStillCounts) {
    ViolationMonitor failing(config, std::make_shared<test_utils::ThrowingPressure>());

    const VPState* s = nullptr;
    EXPECT_NO_THROW(s = &failing.on_event({{"vp", 0.1}}));
    EXPECT_EQ(s->calculation_count, 1u);
    EXPECT_DOUBLE_EQ(s->current_vp, config.divergence_ceiling);
    EXPECT_EQ(s->vp_class, VPClass::VP4);
    EXPECT_EQ(failing.failures(), 1u);
    EXPECT_TRUE(failing.history().empty());

    failing.on_event({{"vp", 0.2}});
    failing.on_event({});
    EXPECT_EQ(failing.state().calculation_count, 3u);
    // Empty input never reaches the function
    EXPECT_EQ(failing.failures(), 2u);
}

TEST_F(ViolationMonitorTest, HistoryIsBoundedAndFeedsHealth) {
    config.history_capacity = 4;
    SetUp();

    feed(0.9);
    feed(0.1);
    feed(0.2);
    feed(0.3);
    feed(0.1);

    ASSERT_EQ(monitor->history().size(), 4u);
    EXPECT_EQ(monitor->history().front().calculation, 2u);

    auto h = monitor->health();
    EXPECT_EQ(h.samples, 4u);
    EXPECT_NEAR(h.mean_vp, (0.1 + 0.2 + 0.3 + 0.1) / 4.0, 1e-12);
    EXPECT_DOUBLE_EQ(h.convergence_ratio, 0.75);
    EXPECT_DOUBLE_EQ(h.last_vp, 0.1);
}

TEST_F(ViolationMonitorTest, InvalidThresholdsRejected) {
    PressureConfig bad;
    bad.convergence_threshold = 0.0;
    EXPECT_THROW(ViolationMonitor{bad}, ConfigError);

    bad = PressureConfig{};
    bad.divergence_ceiling = 0.2;
    EXPECT_THROW(ViolationMonitor{bad}, ConfigError);
}

// Default strategy

TEST(EnvelopePressureTest, OverflowRatio) {
    TraitEnvelope env{100.0, 10.0, 1000.0, 1.0};
    EXPECT_DOUBLE_EQ(overflow_ratio(100.0, env), 0.0);
    EXPECT_NEAR(overflow_ratio(199.0, env), 99.0 / 990.0, 1e-12);
    // Above the envelope: deviation plus overflow
    EXPECT_NEAR(overflow_ratio(1990.0, env), 1890.0 / 990.0 + 990.0 / 990.0, 1e-12);
    // Below
    EXPECT_NEAR(overflow_ratio(0.0, env), 100.0 / 990.0 + 10.0 / 990.0, 1e-12);
}

TEST(EnvelopePressureTest, ExactEnvelope) {
    TraitEnvelope env{1.0, 1.0, 1.0, 1.0};
    EXPECT_DOUBLE_EQ(overflow_ratio(1.0, env), 0.0);
    EXPECT_DOUBLE_EQ(overflow_ratio(0.99, env), 1.0);
}

TEST(EnvelopePressureTest, WeightedSumOverPresentTraits) {
    EnvelopePressure pressure({
        {"a", {0.0, 0.0, 10.0, 2.0}},
        {"b", {5.0, 0.0, 10.0, 1.0}},
    });

    auto vp = pressure.compute({{"a", 1.0}, {"b", 7.0}, {"ignored", 100.0}});
    ASSERT_TRUE(vp.has_value());
    EXPECT_NEAR(*vp, 2.0 * 0.1 + 0.2, 1e-12);

    auto partial = pressure.compute({{"b", 5.0}});
    ASSERT_TRUE(partial.has_value());
    EXPECT_DOUBLE_EQ(*partial, 0.0);

    EXPECT_FALSE(pressure.compute({{"ignored", 1.0}}).has_value());
}

TEST(EnvelopePressureTest, DefaultEnvelopesDriveMonitor) {
    ViolationMonitor monitor;
    const auto& ideal = monitor.on_event({{"speed_ms", 100.0}, {"memory_mb", 50.0}, {"reliability", 1.0}});
    EXPECT_DOUBLE_EQ(ideal.current_vp, 0.0);
    EXPECT_EQ(ideal.vp_class, VPClass::VP0);

    const auto& unreliable = monitor.on_event({{"speed_ms", 100.0}, {"memory_mb", 50.0}, {"reliability", 0.5}});
    EXPECT_DOUBLE_EQ(unreliable.current_vp, 1.0);
    EXPECT_EQ(unreliable.vp_class, VPClass::VP4);
}

TEST(EnvelopePressureTest, RejectsInvertedEnvelope) {
    EXPECT_THROW(EnvelopePressure({{"x", {0.0, 5.0, 1.0, 1.0}}}), ConfigError);
    EXPECT_THROW(EnvelopePressure({{"x", {0.0, 0.0, 1.0, -1.0}}}), ConfigError);
}
