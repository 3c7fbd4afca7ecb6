#ifndef BUTTERFLY_COLLAPSE_TRACKER_HPP
#define BUTTERFLY_COLLAPSE_TRACKER_HPP

#include <butterfly/config.hpp>
#include <butterfly/network_metrics.hpp>
#include <butterfly/types.hpp>
#include <array>
#include <optional>

namespace butterfly {

// The four conjunctive sub-conditions of network collapse
enum class CollapseCondition : std::uint8_t {
    OrganismCount = 0,   // organism_count >= collapse_threshold
    Clustering,          // clustering > clustering_threshold
    Modularity,          // modularity < modularity_threshold
    PathLength           // 0 < path length < path_length_threshold
};

constexpr size_t NUM_COLLAPSE_CONDITIONS = 4;

const char* collapse_condition_name(CollapseCondition c);

struct CollapseDiagnostics {
    std::optional<Generation> generation;                 // Last evaluated generation
    std::array<bool, NUM_COLLAPSE_CONDITIONS> met{};      // As of that generation
    // First generation from which each condition has held without a break
    std::array<std::optional<Generation>, NUM_COLLAPSE_CONDITIONS> held_since{};
    double proximity = 0.0;                               // Fraction of conditions met
    bool ready = false;                                   // All four met

    // While some condition is unmet: the first unmet one, generation absent.
    // Once all hold: the one whose streak started last, and that generation.
    CollapseCondition bottleneck_condition = CollapseCondition::OrganismCount;
    std::optional<Generation> bottleneck_generation;

    std::optional<Generation> first_collapse;             // First generation ever ready
};

/**
 * Evaluates the collapse predicate once per generation.
 * Fed one NetworkMetrics per generation in strictly increasing generation
 * order; owns no graph, so synthetic series can be replayed through it.
 */
class CollapseTracker {
public:
    explicit CollapseTracker(const NetworkConfig& config);

    const CollapseDiagnostics& update(Generation generation, const NetworkMetrics& metrics);

    std::array<bool, NUM_COLLAPSE_CONDITIONS> evaluate(const NetworkMetrics& metrics) const;

    const CollapseDiagnostics& diagnostics() const { return diagnostics_; }
    double proximity() const { return diagnostics_.proximity; }
    bool ready() const { return diagnostics_.ready; }

    void reset();

private:
    size_t collapse_threshold_;
    double clustering_threshold_;
    double modularity_threshold_;
    double path_length_threshold_;
    CollapseDiagnostics diagnostics_;
};

} // namespace butterfly

#endif // BUTTERFLY_COLLAPSE_TRACKER_HPP
