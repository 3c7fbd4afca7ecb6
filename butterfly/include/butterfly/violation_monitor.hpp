#ifndef BUTTERFLY_VIOLATION_MONITOR_HPP
#define BUTTERFLY_VIOLATION_MONITOR_HPP

#include <butterfly/config.hpp>
#include <butterfly/pressure.hpp>
#include <butterfly/types.hpp>
#include <cstdint>
#include <deque>
#include <memory>

namespace butterfly {

struct VPState {
    double current_vp = 0.0;
    VPClass vp_class = VPClass::VP4;
    std::uint64_t calculation_count = 0;
};

struct VPRecord {
    std::uint64_t calculation = 0;    // calculation_count after this event
    double vp = 0.0;
    VPClass vp_class = VPClass::VP4;
};

struct VPHealth {
    size_t samples = 0;
    double mean_vp = 0.0;
    double convergence_ratio = 0.0;   // Share of recorded events in VP0
    double last_vp = 0.0;
};

/**
 * Per-event violation pressure tracker.
 *
 * A fresh monitor sits at the divergence ceiling (VP4, proximity 0) until
 * the first evaluable event arrives. Events with nothing to evaluate, and
 * events the pressure function throws on, still count as a calculation but
 * leave VP and class untouched.
 *
 * Not thread-safe; the pressure wing is its single owner.
 */
class ViolationMonitor {
public:
    explicit ViolationMonitor(const PressureConfig& config = {},
                              std::shared_ptr<const PressureFunction> pressure = nullptr);

    const VPState& on_event(const TraitMap& traits);

    VPClass classify(double vp) const;

    // 1.0 inside convergence, otherwise clamp(1 - vp / ceiling, 0, 1)
    double proximity(double vp) const;
    double proximity() const { return proximity(state_.current_vp); }

    const VPState& state() const { return state_; }
    // Events whose pressure function threw
    std::uint64_t failures() const { return failures_; }
    bool converged() const { return is_convergence(state_.vp_class); }

    const std::deque<VPRecord>& history() const { return history_; }
    VPHealth health() const;

    double convergence_threshold() const { return threshold_; }
    double divergence_ceiling() const { return ceiling_; }

private:
    double threshold_;
    double ceiling_;
    size_t history_capacity_;
    std::shared_ptr<const PressureFunction> pressure_;
    VPState state_;
    std::uint64_t failures_ = 0;
    std::deque<VPRecord> history_;
};

} // namespace butterfly

#endif // BUTTERFLY_VIOLATION_MONITOR_HPP
