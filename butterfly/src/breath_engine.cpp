#include <butterfly/breath_engine.hpp>
#include <butterfly/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace butterfly {

namespace {
constexpr double TWO_PI = 6.28318530717958647692;
constexpr std::uint64_t MAX_CYCLE = std::numeric_limits<std::uint64_t>::max();
}

bool is_inhale(const BreathState& state) {
    return !state.flat && state.position < 0.5;
}

double breath_pulse(const BreathState& state) {
    if (state.flat) return 0.0;
    return std::min(1.0, std::fabs(std::sin(TWO_PI * state.position)));
}

WingPhase body_phase(const BreathState& state) {
    return is_inhale(state) ? WingPhase::Chaos : WingPhase::Precision;
}

BreathEngine::BreathEngine(const BreathConfig& config)
    : period_(config.period_seconds) {
    validate(config);
    if (is_flat()) {
        BUTTERFLY_LOG_WARN("breath", "zero breath period, output will be flat (always exhale)");
    }
    reset();
}

void BreathEngine::reset() {
    state_ = BreathState{};
    refresh_derived();
}

void BreathEngine::set_rate_multiplier(double multiplier) {
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        throw ConfigError("breath rate multiplier must be > 0");
    }
    rate_multiplier_ = multiplier;
}

BreathState BreathEngine::advance(double dt) {
    if (dt < 0.0 || !std::isfinite(dt)) {
        dt = 0.0;
    }

    state_.tick += 1;
    state_.elapsed += dt;

    if (!is_flat()) {
        double step = dt * rate_multiplier_ / period_;
        if (!std::isfinite(step)) step = 0.0;

        state_.position += step;
        // Whole cycles first so huge steps don't loop
        double wraps = std::floor(state_.position);
        if (wraps >= 1.0) {
            // cycle saturates instead of wrapping around
            std::uint64_t room = MAX_CYCLE - state_.cycle;
            state_.cycle = wraps >= static_cast<double>(room)
                ? MAX_CYCLE
                : state_.cycle + static_cast<std::uint64_t>(wraps);
            state_.position = std::fmod(state_.position, 1.0);
        }
    }

    refresh_derived();
    return state_;
}

void BreathEngine::refresh_derived() {
    if (is_flat()) {
        state_.flat = true;
        state_.position = 0.0;
        state_.phase = 0.0;
        state_.depth = 0.0;
        return;
    }

    state_.flat = false;
    state_.phase = -std::cos(TWO_PI * state_.position);
    state_.depth = std::clamp(std::fabs(state_.phase), 0.0, 1.0);
}

} // namespace butterfly
