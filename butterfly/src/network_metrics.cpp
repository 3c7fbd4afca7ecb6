#include <butterfly/network_metrics.hpp>
#include <butterfly/log.hpp>
#include <algorithm>
#include <random>
#include <unordered_map>

namespace butterfly {

namespace {

constexpr int MAX_PROPAGATION_ROUNDS = 100;

// Sum of hop counts from every source in [begin, end)
std::uint64_t distance_sum(const NetworkGraph& graph, size_t begin, size_t end) {
    const auto& organisms = graph.organisms();
    std::uint64_t sum = 0;
    for (size_t i = begin; i < end; ++i) {
        auto dist = graph.distances_from(organisms[i]);
        for (int d : dist) {
            if (d > 0) sum += static_cast<std::uint64_t>(d);
        }
    }
    return sum;
}

} // namespace

double clustering_coefficient(const NetworkGraph& graph) {
    size_t n = graph.organism_count();
    if (n == 0) return 0.0;

    double total = 0.0;
    for (OrganismId id : graph.organisms()) {
        const auto& nbrs = graph.neighbors(id);
        size_t k = nbrs.size();
        if (k < 2) continue;

        size_t links = 0;
        for (size_t i = 0; i < k; ++i) {
            for (size_t j = i + 1; j < k; ++j) {
                if (graph.connected(nbrs[i], nbrs[j])) ++links;
            }
        }
        total += static_cast<double>(links) / (static_cast<double>(k * (k - 1)) / 2.0);
    }
    return total / static_cast<double>(n);
}

std::vector<size_t> detect_communities(const NetworkGraph& graph, std::uint32_t seed) {
    const auto& organisms = graph.organisms();
    size_t n = organisms.size();

    std::vector<size_t> labels(n);
    std::iota(labels.begin(), labels.end(), size_t(0));
    if (n == 0) return labels;

    std::mt19937 rng(seed);
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t(0));
    std::unordered_map<size_t, size_t> counts;

    for (int round = 0; round < MAX_PROPAGATION_ROUNDS; ++round) {
        std::shuffle(order.begin(), order.end(), rng);
        bool changed = false;

        for (size_t idx : order) {
            const auto& nbrs = graph.neighbors(organisms[idx]);
            if (nbrs.empty()) continue;

            counts.clear();
            for (OrganismId nb : nbrs) {
                counts[labels[graph.index_of(nb)]]++;
            }

            // Most frequent neighbour label; keep own label on a tie, else smallest
            size_t best_count = 0;
            for (const auto& [label, count] : counts) {
                best_count = std::max(best_count, count);
            }
            auto own = counts.find(labels[idx]);
            if (own != counts.end() && own->second == best_count) continue;

            size_t best_label = std::numeric_limits<size_t>::max();
            for (const auto& [label, count] : counts) {
                if (count == best_count) best_label = std::min(best_label, label);
            }
            labels[idx] = best_label;
            changed = true;
        }

        if (!changed) break;
    }

    // Compact to 0..k-1 in order of first appearance
    std::unordered_map<size_t, size_t> remap;
    for (auto& label : labels) {
        auto it = remap.find(label);
        if (it == remap.end()) {
            it = remap.emplace(label, remap.size()).first;
        }
        label = it->second;
    }
    return labels;
}

double modularity(const NetworkGraph& graph, const std::vector<size_t>& communities) {
    size_t m = graph.connection_count();
    if (m == 0 || communities.size() != graph.organism_count()) return 0.0;

    size_t num_communities = 0;
    for (size_t c : communities) num_communities = std::max(num_communities, c + 1);

    std::vector<double> internal(num_communities, 0.0);
    std::vector<double> degree_sum(num_communities, 0.0);

    for (OrganismId id : graph.organisms()) {
        size_t c = communities[graph.index_of(id)];
        degree_sum[c] += static_cast<double>(graph.degree(id));
    }
    for (const auto& conn : graph.connections()) {
        size_t ca = communities[graph.index_of(conn.a)];
        size_t cb = communities[graph.index_of(conn.b)];
        if (ca == cb) internal[ca] += 1.0;
    }

    double two_m = 2.0 * static_cast<double>(m);
    double q = 0.0;
    for (size_t c = 0; c < num_communities; ++c) {
        double share = degree_sum[c] / two_m;
        q += internal[c] / static_cast<double>(m) - share * share;
    }
    return std::clamp(q, 0.0, 1.0);
}

double average_path_length(const NetworkGraph& graph, MetricPool* pool) {
    size_t n = graph.organism_count();
    if (n < 2) return std::numeric_limits<double>::infinity();
    if (graph.components().size() > 1) return std::numeric_limits<double>::infinity();

    double pairs = static_cast<double>(n) * static_cast<double>(n - 1);

    if (pool && pool->is_running() && pool->worker_count() > 1) {
        auto total = pool->sum_ranges(n, [&graph](size_t begin, size_t end) {
            return distance_sum(graph, begin, end);
        });
        if (total) {
            return static_cast<double>(*total) / pairs;
        }
        BUTTERFLY_LOG_WARN("metrics", "distance sweep failed on pool (%s), recomputing serially",
                           sweep_error_description(pool->error()));
    }

    return static_cast<double>(distance_sum(graph, 0, n)) / pairs;
}

NetworkMetrics compute_metrics(const NetworkGraph& graph, std::uint32_t seed, MetricPool* pool) {
    NetworkMetrics m;
    m.organism_count = graph.organism_count();
    m.connection_count = graph.connection_count();

    if (m.organism_count > 0) {
        m.average_degree = 2.0 * static_cast<double>(m.connection_count) /
                           static_cast<double>(m.organism_count);
    }
    if (m.organism_count > 1) {
        double possible = static_cast<double>(m.organism_count) *
                          static_cast<double>(m.organism_count - 1) / 2.0;
        m.density = static_cast<double>(m.connection_count) / possible;
    }

    m.clustering_coefficient = clustering_coefficient(graph);

    auto communities = detect_communities(graph, seed);
    m.modularity = modularity(graph, communities);
    m.community_count = communities.empty()
        ? 0 : *std::max_element(communities.begin(), communities.end()) + 1;

    m.component_count = graph.components().size();
    m.average_path_length = average_path_length(graph, pool);

    return m;
}

} // namespace butterfly
