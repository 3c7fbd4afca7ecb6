#include <butterfly/butterfly_system.hpp>
#include <butterfly/violation_monitor.hpp>
#include <iostream>

/**
 * Basic flight: a small network that can actually collapse, driven by hand,
 * plus a pressure wing converging on the sandbox ideal.
 */
int main() {
    using namespace butterfly;

    std::cout << "=== Butterfly Basic Flight ===" << std::endl;

    ButterflyConfig config;
    // Small world with room to close triangles: reachable collapse
    config.network.max_organisms = 40;
    config.network.max_connections_per_organism = 12;
    config.network.collapse_threshold = 30;
    config.network.initial_organisms = 6;
    config.network.growth_per_generation = 2;
    config.network.attachments_per_organism = 4;
    config.network.closure_probability = 0.8;
    config.network.prune_probability = 0.0;
    config.network.rewire_probability = 0.0;
    config.aggregator.sustain_passes = 3;

    ButterflySystem core(config);

    for (int step = 0; step < 60; ++step) {
        core.step_breath();
        core.step_network();

        // Converge towards speed 100ms / 50MB / fully reliable
        double t = step / 60.0;
        core.deliver({{"speed_ms", 100.0 + (1.0 - t) * 300.0},
                      {"memory_mb", 50.0 + (1.0 - t) * 100.0},
                      {"reliability", 1.0}});
        core.step_pressure();

        ButterflyState s = core.snapshot();
        std::cout << "step " << step
                  << " breath " << (is_inhale(s.breath) ? "inhale" : "exhale")
                  << " organisms " << s.network.organism_count
                  << " net " << s.network.wing.proximity
                  << " VP " << s.pressure.current_vp
                  << " (" << vp_class_name(s.pressure.vp_class) << ")"
                  << (s.unified_transition_ready ? " ready" : "")
                  << std::endl;

        if (s.transition_triggered) {
            std::cout << "Transition triggered after " << s.ready_streak
                      << " consecutive ready passes" << std::endl;
            break;
        }
    }

    if (auto d = core.diagnostics()) {
        std::cout << "Network bottleneck: " << collapse_condition_name(d->bottleneck_condition);
        if (d->bottleneck_generation) {
            std::cout << " (since generation " << *d->bottleneck_generation << ")";
        }
        std::cout << std::endl;
    }

    return 0;
}
