#include <butterfly/config.hpp>
#include <cmath>

namespace butterfly {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

bool is_probability(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

} // namespace

void validate(const BreathConfig& config) {
    require(std::isfinite(config.period_seconds) && config.period_seconds >= 0.0,
            "breath.period_seconds must be finite and >= 0");
    require(std::isfinite(config.tick_seconds) && config.tick_seconds > 0.0,
            "breath.tick_seconds must be > 0");
    require(std::isfinite(config.precision_rate) && config.precision_rate > 0.0,
            "breath.precision_rate must be > 0");
}

void validate(const NetworkConfig& config) {
    require(config.max_organisms > 0, "network.max_organisms must be > 0");
    require(config.max_connections_per_organism > 0,
            "network.max_connections_per_organism must be > 0");
    require(config.collapse_threshold > 0, "network.collapse_threshold must be > 0");
    require(config.collapse_threshold <= config.max_organisms,
            "network.collapse_threshold must not exceed network.max_organisms");

    require(is_probability(config.clustering_threshold),
            "network.clustering_threshold must be in [0, 1]");
    require(is_probability(config.modularity_threshold),
            "network.modularity_threshold must be in [0, 1]");
    require(std::isfinite(config.path_length_threshold) && config.path_length_threshold > 0.0,
            "network.path_length_threshold must be > 0");

    require(config.initial_organisms >= 0, "network.initial_organisms must be >= 0");
    require(config.initial_organisms <= config.max_organisms,
            "network.initial_organisms must not exceed network.max_organisms");
    require(config.growth_per_generation >= 0, "network.growth_per_generation must be >= 0");
    require(config.attachments_per_organism >= 0, "network.attachments_per_organism must be >= 0");
    require(is_probability(config.closure_probability), "network.closure_probability must be in [0, 1]");
    require(is_probability(config.prune_probability), "network.prune_probability must be in [0, 1]");
    require(is_probability(config.rewire_probability), "network.rewire_probability must be in [0, 1]");
    require(std::isfinite(config.generation_interval_seconds) && config.generation_interval_seconds >= 0.0,
            "network.generation_interval_seconds must be >= 0");
}

void validate(const PressureConfig& config) {
    require(std::isfinite(config.convergence_threshold) && config.convergence_threshold > 0.0,
            "pressure.convergence_threshold must be > 0");
    require(std::isfinite(config.divergence_ceiling),
            "pressure.divergence_ceiling must be finite");
    require(config.divergence_ceiling > config.convergence_threshold,
            "pressure.divergence_ceiling must exceed pressure.convergence_threshold");
    require(config.history_capacity > 0, "pressure.history_capacity must be > 0");
    require(config.inbox_capacity > 0, "pressure.inbox_capacity must be > 0");
}

void validate(const AggregatorConfig& config) {
    require(config.sustain_passes >= 1, "aggregator.sustain_passes must be >= 1");
    require(config.consistent_read_retries >= 1, "aggregator.consistent_read_retries must be >= 1");
    require(std::isfinite(config.interval_seconds) && config.interval_seconds > 0.0,
            "aggregator.interval_seconds must be > 0");
    require(std::isfinite(config.network_exploration_scale) && config.network_exploration_scale > 0.0,
            "aggregator.network_exploration_scale must be > 0");
    require(std::isfinite(config.pressure_exploration_scale) && config.pressure_exploration_scale > 0.0,
            "aggregator.pressure_exploration_scale must be > 0");
}

void validate(const ButterflyConfig& config) {
    validate(config.breath);
    validate(config.network);
    validate(config.pressure);
    validate(config.aggregator);
}

} // namespace butterfly
