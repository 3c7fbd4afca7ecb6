#ifndef BUTTERFLY_BREATH_ENGINE_HPP
#define BUTTERFLY_BREATH_ENGINE_HPP

#include <butterfly/config.hpp>
#include <cstdint>

namespace butterfly {

/**
 * One published instant of the pacing signal.
 * Immutable once published; the next advance() supersedes it.
 */
struct BreathState {
    double phase = -1.0;        // [-1, 1], rises while inhaling, falls while exhaling
    double depth = 1.0;         // |phase|, distance from neutral
    std::uint64_t cycle = 0;    // Completed inhale-exhale periods
    double position = 0.0;      // Fraction of current cycle in [0, 1); inhale is [0, 0.5)
    bool flat = false;          // Zero-period engine, output is degenerate
    double elapsed = 0.0;       // Accumulated engine time (seconds)
    std::uint64_t tick = 0;     // Number of advance() calls
};

// Pure functions of a BreathState

// Inhaling while in the first half of the cycle. A flat breath never inhales.
bool is_inhale(const BreathState& state);

// Magnitude of the normalised rate of change of phase, in [0, 1]
double breath_pulse(const BreathState& state);

// Inhale = chaos (gathering), exhale or flat = precision (releasing)
WingPhase body_phase(const BreathState& state);

/**
 * Deterministic phase/depth/cycle generator.
 * Driven by advance(dt); no wall clock is read, so a fixed dt sequence
 * always reproduces the same states.
 * Not thread-safe: owned by a single producer, which publishes the returned
 * states for everyone else.
 */
class BreathEngine {
public:
    explicit BreathEngine(const BreathConfig& config = {});

    BreathState advance(double dt);

    const BreathState& state() const { return state_; }

    // Scales the speed of breathing from now on without a phase jump
    void set_rate_multiplier(double multiplier);
    double rate_multiplier() const { return rate_multiplier_; }

    double period() const { return period_; }
    bool is_flat() const { return period_ <= 0.0; }

    void reset();

private:
    void refresh_derived();

    double period_;
    double rate_multiplier_ = 1.0;
    BreathState state_;
};

} // namespace butterfly

#endif // BUTTERFLY_BREATH_ENGINE_HPP
