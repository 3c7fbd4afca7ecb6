#ifndef BUTTERFLY_CONFIG_HPP
#define BUTTERFLY_CONFIG_HPP

#include <butterfly/types.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace butterfly {

// Thrown when a configuration value is rejected at construction time
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

// =============================================================================
// Breath
// =============================================================================

struct BreathConfig {
    double period_seconds = 4.0;        // One inhale-exhale cycle (0 = flat, degenerate)
    double tick_seconds = 0.05;         // Producer step when driven by a thread
    double precision_rate = 0.5;        // Rate multiplier applied after the unified transition
};

// =============================================================================
// Network wing
// =============================================================================

struct NetworkConfig {
    int max_organisms = 600;
    int max_connections_per_organism = 5;
    int collapse_threshold = 500;

    // Topology thresholds for collapse
    double clustering_threshold = 0.5;      // clustering > threshold
    double modularity_threshold = 0.3;      // modularity < threshold
    double path_length_threshold = 3.0;     // 0 < path length < threshold

    // Evolution dynamics
    int initial_organisms = 10;
    int growth_per_generation = 5;
    int attachments_per_organism = 2;
    double closure_probability = 0.3;
    double prune_probability = 0.01;
    double rewire_probability = 0.02;
    std::uint32_t seed = 42;

    PostCollapsePolicy post_collapse = PostCollapsePolicy::Freeze;
    double generation_interval_seconds = 0.1;
    size_t metric_threads = 0;              // 0 = serial metrics, no metric pool
};

// =============================================================================
// Pressure wing
// =============================================================================

struct PressureConfig {
    double convergence_threshold = 0.25;    // VP0 below this
    double divergence_ceiling = 1.0;        // VP4 at or above this
    size_t history_capacity = 100;
    size_t inbox_capacity = 1024;
};

// =============================================================================
// Aggregation
// =============================================================================

struct AggregatorConfig {
    int sustain_passes = 1;                 // Consecutive ready passes before the transition latches
    int consistent_read_retries = 8;
    double interval_seconds = 0.1;

    // Exploration counts that make a wing's contribution 1.0
    double network_exploration_scale = 500.0;
    double pressure_exploration_scale = 50.0;
};

struct ButterflyConfig {
    BreathConfig breath;
    NetworkConfig network;
    PressureConfig pressure;
    AggregatorConfig aggregator;

    bool enable_network_wing = true;
    bool enable_pressure_wing = true;
};

// Each throws ConfigError naming the offending field
void validate(const BreathConfig& config);
void validate(const NetworkConfig& config);
void validate(const PressureConfig& config);
void validate(const AggregatorConfig& config);
void validate(const ButterflyConfig& config);

} // namespace butterfly

#endif // BUTTERFLY_CONFIG_HPP
