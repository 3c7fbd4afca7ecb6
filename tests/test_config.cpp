#include <gtest/gtest.h>
#include <butterfly/config.hpp>
#include <limits>

using namespace butterfly;

TEST(ConfigTest, DefaultsAreValid) {
    EXPECT_NO_THROW(validate(ButterflyConfig{}));
}

TEST(ConfigTest, BreathRejections) {
    BreathConfig c;
    c.period_seconds = 0.0;
    EXPECT_NO_THROW(validate(c));

    c.period_seconds = -0.5;
    EXPECT_THROW(validate(c), ConfigError);
    c.period_seconds = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate(c), ConfigError);

    c = BreathConfig{};
    c.tick_seconds = 0.0;
    EXPECT_THROW(validate(c), ConfigError);

    c = BreathConfig{};
    c.precision_rate = 0.0;
    EXPECT_THROW(validate(c), ConfigError);
}

TEST(ConfigTest, NetworkRejections) {
    NetworkConfig c;
    c.collapse_threshold = c.max_organisms + 1;
    EXPECT_THROW(validate(c), ConfigError);

    c = NetworkConfig{};
    c.max_connections_per_organism = 0;
    EXPECT_THROW(validate(c), ConfigError);

    c = NetworkConfig{};
    c.closure_probability = 1.5;
    EXPECT_THROW(validate(c), ConfigError);

    c = NetworkConfig{};
    c.path_length_threshold = 0.0;
    EXPECT_THROW(validate(c), ConfigError);

    c = NetworkConfig{};
    c.initial_organisms = c.max_organisms + 1;
    EXPECT_THROW(validate(c), ConfigError);
}

TEST(ConfigTest, PressureRejections) {
    PressureConfig c;
    c.divergence_ceiling = c.convergence_threshold;
    EXPECT_THROW(validate(c), ConfigError);

    c = PressureConfig{};
    c.inbox_capacity = 0;
    EXPECT_THROW(validate(c), ConfigError);
}

TEST(ConfigTest, ErrorNamesTheField) {
    AggregatorConfig c;
    c.sustain_passes = 0;
    try {
        validate(c);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("sustain_passes"), std::string::npos);
    }
}

TEST(ConfigTest, AggregatorRejections) {
    AggregatorConfig c;
    c.network_exploration_scale = 0.0;
    EXPECT_THROW(validate(c), ConfigError);

    c = AggregatorConfig{};
    c.pressure_exploration_scale = -50.0;
    EXPECT_THROW(validate(c), ConfigError);

    c = AggregatorConfig{};
    c.consistent_read_retries = 0;
    EXPECT_THROW(validate(c), ConfigError);

    c = AggregatorConfig{};
    EXPECT_DOUBLE_EQ(c.network_exploration_scale, 500.0);
    EXPECT_DOUBLE_EQ(c.pressure_exploration_scale, 50.0);
    EXPECT_NO_THROW(validate(c));
}
