#include <butterfly/collapse_tracker.hpp>
#include <butterfly/log.hpp>
#include <cmath>

namespace butterfly {

const char* collapse_condition_name(CollapseCondition c) {
    switch (c) {
        case CollapseCondition::OrganismCount: return "organism_count";
        case CollapseCondition::Clustering: return "clustering";
        case CollapseCondition::Modularity: return "modularity";
        case CollapseCondition::PathLength: return "path_length";
    }
    return "unknown";
}

CollapseTracker::CollapseTracker(const NetworkConfig& config) {
    validate(config);
    collapse_threshold_ = static_cast<size_t>(config.collapse_threshold);
    clustering_threshold_ = config.clustering_threshold;
    modularity_threshold_ = config.modularity_threshold;
    path_length_threshold_ = config.path_length_threshold;
}

std::array<bool, NUM_COLLAPSE_CONDITIONS> CollapseTracker::evaluate(const NetworkMetrics& metrics) const {
    double path = metrics.average_path_length;
    return {
        metrics.organism_count >= collapse_threshold_,
        metrics.clustering_coefficient > clustering_threshold_,
        metrics.modularity < modularity_threshold_,
        // NaN and infinity both fail here
        std::isfinite(path) && path > 0.0 && path < path_length_threshold_
    };
}

const CollapseDiagnostics& CollapseTracker::update(Generation generation, const NetworkMetrics& metrics) {
    auto met = evaluate(metrics);
    auto& d = diagnostics_;

    size_t satisfied = 0;
    for (size_t i = 0; i < NUM_COLLAPSE_CONDITIONS; ++i) {
        if (met[i]) {
            ++satisfied;
            if (!d.held_since[i]) d.held_since[i] = generation;
        } else {
            d.held_since[i].reset();
        }
    }

    d.generation = generation;
    d.met = met;
    d.proximity = static_cast<double>(satisfied) / static_cast<double>(NUM_COLLAPSE_CONDITIONS);
    d.ready = satisfied == NUM_COLLAPSE_CONDITIONS;

    if (d.ready) {
        size_t last = 0;
        for (size_t i = 1; i < NUM_COLLAPSE_CONDITIONS; ++i) {
            if (*d.held_since[i] > *d.held_since[last]) last = i;
        }
        d.bottleneck_condition = static_cast<CollapseCondition>(last);
        d.bottleneck_generation = d.held_since[last];

        if (!d.first_collapse) {
            d.first_collapse = generation;
            BUTTERFLY_LOG_INFO("collapse", "network collapse at generation %llu (bottleneck %s since %llu)",
                               static_cast<unsigned long long>(generation),
                               collapse_condition_name(d.bottleneck_condition),
                               static_cast<unsigned long long>(*d.bottleneck_generation));
        }
    } else {
        for (size_t i = 0; i < NUM_COLLAPSE_CONDITIONS; ++i) {
            if (!met[i]) {
                d.bottleneck_condition = static_cast<CollapseCondition>(i);
                break;
            }
        }
        d.bottleneck_generation.reset();
    }

    return d;
}

void CollapseTracker::reset() {
    diagnostics_ = CollapseDiagnostics{};
}

} // namespace butterfly
