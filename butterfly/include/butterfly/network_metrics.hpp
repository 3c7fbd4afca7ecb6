#ifndef BUTTERFLY_NETWORK_METRICS_HPP
#define BUTTERFLY_NETWORK_METRICS_HPP

#include <butterfly/network_graph.hpp>
#include <butterfly/metric_pool.hpp>
#include <cstdint>
#include <limits>
#include <vector>

namespace butterfly {

/**
 * Topology summary of one generation.
 * average_path_length is infinity when the graph is disconnected or has
 * fewer than two organisms.
 */
struct NetworkMetrics {
    size_t organism_count = 0;
    size_t connection_count = 0;
    double average_degree = 0.0;
    double density = 0.0;
    double clustering_coefficient = 0.0;
    double modularity = 0.0;
    double average_path_length = std::numeric_limits<double>::infinity();
    size_t component_count = 0;
    size_t community_count = 0;
};

// Average local clustering; organisms with degree < 2 contribute 0
double clustering_coefficient(const NetworkGraph& graph);

// Community label per organism (indexed like graph.organisms()), seeded label propagation
std::vector<size_t> detect_communities(const NetworkGraph& graph, std::uint32_t seed);

// Newman Q for the given partition, clamped to [0, 1]
double modularity(const NetworkGraph& graph, const std::vector<size_t>& communities);

// Mean BFS distance over ordered pairs. When pool is non-null and running,
// sources are split across its workers; on a worker failure the sweep is
// redone serially.
double average_path_length(const NetworkGraph& graph, MetricPool* pool = nullptr);

NetworkMetrics compute_metrics(const NetworkGraph& graph,
                               std::uint32_t seed,
                               MetricPool* pool = nullptr);

} // namespace butterfly

#endif // BUTTERFLY_NETWORK_METRICS_HPP
