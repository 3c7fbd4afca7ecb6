#ifndef BUTTERFLY_NETWORK_EVOLUTION_HPP
#define BUTTERFLY_NETWORK_EVOLUTION_HPP

#include <butterfly/collapse_tracker.hpp>
#include <butterfly/config.hpp>
#include <butterfly/network_graph.hpp>
#include <butterfly/network_metrics.hpp>
#include <random>
#include <vector>

namespace butterfly {

/**
 * Evolving organism network.
 *
 * Each generation runs growth, triadic closure, pruning and rewiring in that
 * order, then recomputes metrics and feeds the collapse tracker. Every
 * random choice comes from one seeded generator, so a config and seed fully
 * determine the run. The organism bound and the per-organism degree cap hold
 * after every sub-step.
 *
 * Not thread-safe; generations are strictly sequential.
 */
class NetworkEvolutionEngine {
public:
    explicit NetworkEvolutionEngine(const NetworkConfig& config, MetricPool* pool = nullptr);

    // One generation. Returns false (and changes nothing) when frozen after collapse.
    bool evolve_generation();

    Generation generation() const { return generation_; }
    const NetworkGraph& graph() const { return graph_; }
    const NetworkMetrics& metrics() const { return metrics_; }
    const CollapseDiagnostics& diagnostics() const { return tracker_.diagnostics(); }
    double proximity_to_transition() const { return tracker_.proximity(); }
    bool transition_ready() const { return tracker_.ready(); }
    bool collapsed() const { return tracker_.diagnostics().first_collapse.has_value(); }
    bool frozen() const;

    const NetworkConfig& config() const { return config_; }

private:
    void grow();
    void close_triads();
    void prune();
    void rewire();

    // Attach a newcomer to up to attachments_per_organism others, degree-preferential
    void attach(OrganismId newcomer);
    bool has_capacity(OrganismId id) const;
    bool chance(double probability);

    NetworkConfig config_;
    MetricPool* pool_;
    std::mt19937 rng_;
    NetworkGraph graph_;
    NetworkMetrics metrics_;
    CollapseTracker tracker_;
    Generation generation_ = 0;
};

} // namespace butterfly

#endif // BUTTERFLY_NETWORK_EVOLUTION_HPP
