#include <butterfly/network_evolution.hpp>
#include <butterfly/log.hpp>
#include <algorithm>

namespace butterfly {

NetworkEvolutionEngine::NetworkEvolutionEngine(const NetworkConfig& config, MetricPool* pool)
    : config_(config)
    , pool_(pool)
    , rng_(config.seed)
    , tracker_(config) {
    for (int i = 0; i < config_.initial_organisms; ++i) {
        attach(graph_.add_organism());
    }
    metrics_ = compute_metrics(graph_, config_.seed, pool_);
    BUTTERFLY_LOG_INFO("network", "seeded %zu organisms, %zu connections (max %d, cap %d, collapse at %d)",
                       graph_.organism_count(), graph_.connection_count(),
                       config_.max_organisms, config_.max_connections_per_organism,
                       config_.collapse_threshold);
}

bool NetworkEvolutionEngine::frozen() const {
    return config_.post_collapse == PostCollapsePolicy::Freeze && collapsed();
}

bool NetworkEvolutionEngine::evolve_generation() {
    if (frozen()) {
        return false;
    }

    ++generation_;

    grow();
    close_triads();
    prune();
    rewire();

    metrics_ = compute_metrics(graph_, config_.seed + static_cast<std::uint32_t>(generation_), pool_);
    const auto& d = tracker_.update(generation_, metrics_);

    BUTTERFLY_LOG_DEBUG("network", "gen %llu: n=%zu e=%zu C=%.3f Q=%.3f L=%.3f proximity=%.2f",
                        static_cast<unsigned long long>(generation_),
                        metrics_.organism_count, metrics_.connection_count,
                        metrics_.clustering_coefficient, metrics_.modularity,
                        metrics_.average_path_length, d.proximity);

    if (d.ready && frozen()) {
        BUTTERFLY_LOG_INFO("network", "collapse reached, freezing at generation %llu",
                           static_cast<unsigned long long>(generation_));
    }
    return true;
}

bool NetworkEvolutionEngine::has_capacity(OrganismId id) const {
    return graph_.degree(id) < static_cast<size_t>(config_.max_connections_per_organism);
}

bool NetworkEvolutionEngine::chance(double probability) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_) < probability;
}

void NetworkEvolutionEngine::attach(OrganismId newcomer) {
    for (int k = 0; k < config_.attachments_per_organism && has_capacity(newcomer); ++k) {
        std::vector<OrganismId> candidates;
        std::vector<double> weights;
        for (OrganismId id : graph_.organisms()) {
            if (id == newcomer || !has_capacity(id) || graph_.connected(newcomer, id)) continue;
            candidates.push_back(id);
            weights.push_back(static_cast<double>(graph_.degree(id)) + 1.0);
        }
        if (candidates.empty()) return;

        std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
        graph_.connect(newcomer, candidates[pick(rng_)]);
    }
}

void NetworkEvolutionEngine::grow() {
    size_t max = static_cast<size_t>(config_.max_organisms);
    for (int i = 0; i < config_.growth_per_generation && graph_.organism_count() < max; ++i) {
        attach(graph_.add_organism());
    }
}

void NetworkEvolutionEngine::close_triads() {
    // Copy: connecting does not change the organism list, but keep iteration stable anyway
    std::vector<OrganismId> organisms = graph_.organisms();
    for (OrganismId id : organisms) {
        if (!chance(config_.closure_probability)) continue;

        const auto& nbrs = graph_.neighbors(id);
        if (nbrs.size() < 2) continue;

        std::uniform_int_distribution<size_t> dist(0, nbrs.size() - 1);
        size_t i = dist(rng_);
        size_t j = dist(rng_);
        if (i == j) continue;

        OrganismId a = nbrs[i];
        OrganismId b = nbrs[j];
        if (has_capacity(a) && has_capacity(b)) {
            graph_.connect(a, b);
        }
    }
}

void NetworkEvolutionEngine::prune() {
    if (config_.prune_probability <= 0.0) return;
    for (const auto& conn : graph_.connections()) {
        if (chance(config_.prune_probability)) {
            graph_.disconnect(conn.a, conn.b);
        }
    }
}

void NetworkEvolutionEngine::rewire() {
    if (config_.rewire_probability <= 0.0) return;
    for (const auto& conn : graph_.connections()) {
        if (!chance(config_.rewire_probability)) continue;
        if (!graph_.connected(conn.a, conn.b)) continue;

        // Keep one endpoint, move the other
        bool keep_a = chance(0.5);
        OrganismId kept = keep_a ? conn.a : conn.b;
        OrganismId dropped = keep_a ? conn.b : conn.a;

        std::vector<OrganismId> targets;
        for (OrganismId id : graph_.organisms()) {
            if (id == kept || id == dropped || !has_capacity(id) || graph_.connected(kept, id)) continue;
            targets.push_back(id);
        }
        if (targets.empty()) continue;

        std::uniform_int_distribution<size_t> dist(0, targets.size() - 1);
        graph_.disconnect(kept, dropped);
        graph_.connect(kept, targets[dist(rng_)]);
    }
}

} // namespace butterfly
