#ifndef BUTTERFLY_BUTTERFLY_STATE_HPP
#define BUTTERFLY_BUTTERFLY_STATE_HPP

#include <butterfly/breath_engine.hpp>
#include <butterfly/network_metrics.hpp>
#include <butterfly/types.hpp>
#include <cstdint>
#include <type_traits>

namespace butterfly {

// Fields every wing reports, whatever it wraps
struct WingState {
    WingPhase phase = WingPhase::Chaos;
    double proximity = 0.0;         // [0, 1], 1 = own readiness predicate holds
    double flap_intensity = 0.0;    // breath_pulse x proximity at publish time
    bool available = true;          // false = failed to initialise (sentinel)
    bool stopped = false;           // Producer stopped, values are last-known
    std::uint64_t version = 0;      // Publishes by the owning adapter
};

struct NetworkWingState {
    WingState wing;
    Generation generation = 0;
    size_t organism_count = 0;
    size_t connection_count = 0;
    NetworkMetrics metrics;
    bool collapsed = false;
};

struct PressureWingState {
    WingState wing;
    double current_vp = 0.0;
    VPClass vp_class = VPClass::VP4;
    std::uint64_t calculation_count = 0;
    std::uint64_t failed_calculations = 0;  // Pressure function threw
    size_t pending_events = 0;
};

// Which wings are ready this pass, how far each has explored, and when the
// transition latched. An unavailable wing contributes zero exploration.
struct TransitionDiagnostics {
    bool network_ready = false;
    bool pressure_ready = false;
    std::uint64_t network_explorations = 0;     // Generations evolved
    std::uint64_t pressure_explorations = 0;    // Pressure calculations run
    double total_exploration = 0.0;             // Mean of the per-wing counts over their scales
    std::uint64_t triggered_at_pass = 0;        // 0 = not triggered
    std::uint64_t triggered_at_cycle = 0;
    double triggered_at_time = 0.0;             // Breath elapsed seconds
};

// Placeholder reported for a wing that failed to initialise
NetworkWingState unavailable_network_state();
PressureWingState unavailable_pressure_state();

/**
 * One aggregation pass: breath plus both wings, read consistently.
 * Plain value, safe to copy across threads and through the snapshot feed.
 */
struct ButterflyState {
    std::uint64_t sequence = 0;
    BreathState breath;
    WingPhase body_phase = WingPhase::Precision;
    NetworkWingState network;
    PressureWingState pressure;
    bool unified_transition_ready = false;
    std::uint32_t ready_streak = 0;
    bool transition_triggered = false;
    TransitionDiagnostics transition;
};

static_assert(std::is_trivially_copyable_v<ButterflyState>,
              "ButterflyState travels through the lock-free snapshot feed");

} // namespace butterfly

#endif // BUTTERFLY_BUTTERFLY_STATE_HPP
