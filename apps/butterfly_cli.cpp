// Command-line driver: maps flags onto ButterflyConfig and runs the system,
// either threaded for a wall-clock duration or stepped deterministically.

#include <butterfly/butterfly_system.hpp>
#include <butterfly/log.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>

using namespace butterfly;

static std::atomic<bool> g_shutdown_requested{false};

static void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_shutdown_requested.store(true);
    }
}

static void print_usage() {
    std::cout << "Butterfly coordination core" << std::endl;
    std::cout << "===========================" << std::endl;
    std::cout << std::endl;
    std::cout << "COMMANDS:" << std::endl;
    std::cout << "  run [options]     Run all producers on threads for --duration seconds," << std::endl;
    std::cout << "                    feeding synthetic trait events to the pressure wing." << std::endl;
    std::cout << "  step [options]    Single-threaded: one breath tick, one generation and" << std::endl;
    std::cout << "                    one trait event per step, --generations steps." << std::endl;
    std::cout << std::endl;
    std::cout << "OPTIONS:" << std::endl;
    std::cout << "  --max-organisms N           (default 600)" << std::endl;
    std::cout << "  --max-connections N         per organism (default 5)" << std::endl;
    std::cout << "  --collapse-threshold N      (default 500)" << std::endl;
    std::cout << "  --clustering X              collapse needs clustering > X (default 0.5)" << std::endl;
    std::cout << "  --modularity X              collapse needs modularity < X (default 0.3)" << std::endl;
    std::cout << "  --path-length X             collapse needs path length < X (default 3.0)" << std::endl;
    std::cout << "  --growth N                  organisms per generation (default 5)" << std::endl;
    std::cout << "  --seed N                    (default 42)" << std::endl;
    std::cout << "  --metric-threads N          0 = serial metrics (default)" << std::endl;
    std::cout << "  --continue-after-collapse   keep evolving after collapse" << std::endl;
    std::cout << "  --convergence-threshold X   VP0 below X (default 0.25)" << std::endl;
    std::cout << "  --divergence-ceiling X      VP4 at or above X (default 1.0)" << std::endl;
    std::cout << "  --breath-period S           seconds per cycle, 0 = flat (default 4.0)" << std::endl;
    std::cout << "  --tick S                    breath tick (default 0.05)" << std::endl;
    std::cout << "  --sustain N                 ready passes before triggering (default 1)" << std::endl;
    std::cout << "  --no-network                run without the network wing" << std::endl;
    std::cout << "  --no-pressure               run without the pressure wing" << std::endl;
    std::cout << "  --duration S                run: seconds (default 10)" << std::endl;
    std::cout << "  --generations N             step: steps (default 150)" << std::endl;
    std::cout << "  --report-every N            print every Nth snapshot (default 10)" << std::endl;
    std::cout << "  --verbose | --quiet         log level debug / warnings only" << std::endl;
}

static void print_snapshot(const ButterflyState& s) {
    std::cout << std::fixed << std::setprecision(3)
              << "#" << s.sequence
              << " cycle " << s.breath.cycle
              << " phase " << std::setw(6) << s.breath.phase
              << " " << wing_phase_name(s.body_phase);

    if (s.network.wing.available) {
        std::cout << " | net gen " << s.network.generation
                  << " n=" << s.network.organism_count
                  << " C=" << s.network.metrics.clustering_coefficient
                  << " Q=" << s.network.metrics.modularity
                  << " L=" << s.network.metrics.average_path_length
                  << " prox " << s.network.wing.proximity
                  << " flap " << s.network.wing.flap_intensity;
    } else {
        std::cout << " | net unavailable";
    }

    if (s.pressure.wing.available) {
        std::cout << " | VP " << s.pressure.current_vp
                  << " " << vp_class_name(s.pressure.vp_class)
                  << " #" << s.pressure.calculation_count
                  << " prox " << s.pressure.wing.proximity;
    } else {
        std::cout << " | pressure unavailable";
    }

    std::cout << (s.unified_transition_ready ? " | READY" : "")
              << (s.transition_triggered ? " [triggered]" : "")
              << std::endl;
}

// Execution traits drifting from noisy toward the sandbox ideal as progress goes 0 -> 1
static TraitMap synthetic_traits(std::mt19937& rng, double progress) {
    std::normal_distribution<double> noise(0.0, 1.0);
    double spread = 1.0 - std::min(1.0, std::max(0.0, progress));
    return {
        {"speed_ms", 100.0 + spread * 400.0 + noise(rng) * 5.0},
        {"memory_mb", 50.0 + spread * 200.0 + noise(rng) * 2.0},
        {"reliability", spread > 0.2 ? 0.9 : 1.0},
    };
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h" || arg == "help") {
            print_usage();
            return 0;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string mode = argv[1];
    ButterflyConfig config;
    double duration = 10.0;
    int generations = 150;
    int report_every = 10;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--max-organisms" && i + 1 < argc) {
                config.network.max_organisms = std::stoi(argv[++i]);
            } else if (arg == "--max-connections" && i + 1 < argc) {
                config.network.max_connections_per_organism = std::stoi(argv[++i]);
            } else if (arg == "--collapse-threshold" && i + 1 < argc) {
                config.network.collapse_threshold = std::stoi(argv[++i]);
            } else if (arg == "--clustering" && i + 1 < argc) {
                config.network.clustering_threshold = std::stod(argv[++i]);
            } else if (arg == "--modularity" && i + 1 < argc) {
                config.network.modularity_threshold = std::stod(argv[++i]);
            } else if (arg == "--path-length" && i + 1 < argc) {
                config.network.path_length_threshold = std::stod(argv[++i]);
            } else if (arg == "--growth" && i + 1 < argc) {
                config.network.growth_per_generation = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                config.network.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--metric-threads" && i + 1 < argc) {
                config.network.metric_threads = std::stoul(argv[++i]);
            } else if (arg == "--continue-after-collapse") {
                config.network.post_collapse = PostCollapsePolicy::Continue;
            } else if (arg == "--convergence-threshold" && i + 1 < argc) {
                config.pressure.convergence_threshold = std::stod(argv[++i]);
            } else if (arg == "--divergence-ceiling" && i + 1 < argc) {
                config.pressure.divergence_ceiling = std::stod(argv[++i]);
            } else if (arg == "--breath-period" && i + 1 < argc) {
                config.breath.period_seconds = std::stod(argv[++i]);
            } else if (arg == "--tick" && i + 1 < argc) {
                config.breath.tick_seconds = std::stod(argv[++i]);
            } else if (arg == "--sustain" && i + 1 < argc) {
                config.aggregator.sustain_passes = std::stoi(argv[++i]);
            } else if (arg == "--no-network") {
                config.enable_network_wing = false;
            } else if (arg == "--no-pressure") {
                config.enable_pressure_wing = false;
            } else if (arg == "--duration" && i + 1 < argc) {
                duration = std::stod(argv[++i]);
            } else if (arg == "--generations" && i + 1 < argc) {
                generations = std::stoi(argv[++i]);
            } else if (arg == "--report-every" && i + 1 < argc) {
                report_every = std::max(1, std::stoi(argv[++i]));
            } else if (arg == "--verbose") {
                log::set_min_level(log::Level::Debug);
            } else if (arg == "--quiet") {
                log::set_min_level(log::Level::Warn);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    if (mode != "run" && mode != "step") {
        std::cerr << "Unknown command: " << mode << std::endl;
        print_usage();
        return 1;
    }

    try {
        ButterflySystem core(config);
        std::mt19937 rng(config.network.seed);

        if (mode == "step") {
            for (int g = 0; g < generations && !g_shutdown_requested.load(); ++g) {
                core.step_breath();
                core.step_network();
                core.deliver(synthetic_traits(rng, static_cast<double>(g) / generations));
                core.step_pressure();
                ButterflyState s = core.snapshot();
                if (s.sequence % static_cast<std::uint64_t>(report_every) == 0 || s.transition_triggered) {
                    print_snapshot(s);
                }
                if (s.transition_triggered) break;
            }
        } else {
            core.start();
            auto begin = std::chrono::steady_clock::now();
            std::uint64_t seen = 0;

            while (!g_shutdown_requested.load()) {
                double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
                if (elapsed >= duration) break;

                core.deliver(synthetic_traits(rng, elapsed / duration));
                core.feed().drain([&](const ButterflyState& s) {
                    if (++seen % static_cast<std::uint64_t>(report_every) == 0) {
                        print_snapshot(s);
                    }
                });
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }

            core.stop();
            if (core.feed().dropped() > 0) {
                std::cout << "Snapshots dropped by slow consumer: " << core.feed().dropped() << std::endl;
            }
        }

        std::cout << std::endl << "Final state:" << std::endl;
        ButterflyState last = core.snapshot();
        print_snapshot(last);

        const auto& t = last.transition;
        std::cout << "Exploration: network " << t.network_explorations
                  << ", pressure " << t.pressure_explorations
                  << ", total " << t.total_exploration << std::endl;
        if (t.triggered_at_pass > 0) {
            std::cout << "Transition at pass " << t.triggered_at_pass
                      << " (cycle " << t.triggered_at_cycle << ", t=" << t.triggered_at_time << "s)"
                      << (t.network_ready ? " network ready" : "")
                      << (t.pressure_ready ? " pressure ready" : "") << std::endl;
        }
        if (core.inconsistent_passes() > 0) {
            std::cout << "Passes without a quiet read window: " << core.inconsistent_passes() << std::endl;
        }

        if (auto d = core.diagnostics()) {
            std::cout << "Collapse conditions: ";
            for (size_t i = 0; i < NUM_COLLAPSE_CONDITIONS; ++i) {
                std::cout << collapse_condition_name(static_cast<CollapseCondition>(i))
                          << (d->met[i] ? "=met " : "=unmet ");
            }
            std::cout << std::endl;
            if (d->bottleneck_generation) {
                std::cout << "Bottleneck: " << collapse_condition_name(d->bottleneck_condition)
                          << " since generation " << *d->bottleneck_generation << std::endl;
            } else {
                std::cout << "Blocking condition: " << collapse_condition_name(d->bottleneck_condition) << std::endl;
            }
        }
        if (auto h = core.pressure_health()) {
            std::cout << "Pressure: mean VP " << h->mean_vp << ", convergence ratio "
                      << h->convergence_ratio << " over " << h->samples << " events" << std::endl;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
