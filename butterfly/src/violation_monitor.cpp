#include <butterfly/violation_monitor.hpp>
#include <butterfly/log.hpp>
#include <algorithm>
#include <cmath>

namespace butterfly {

ViolationMonitor::ViolationMonitor(const PressureConfig& config,
                                   std::shared_ptr<const PressureFunction> pressure)
    : pressure_(std::move(pressure)) {
    validate(config);
    threshold_ = config.convergence_threshold;
    ceiling_ = config.divergence_ceiling;
    history_capacity_ = config.history_capacity;

    if (!pressure_) {
        pressure_ = std::make_shared<EnvelopePressure>(EnvelopePressure::default_envelopes());
    }

    state_.current_vp = ceiling_;
    state_.vp_class = classify(ceiling_);
}

VPClass ViolationMonitor::classify(double vp) const {
    if (vp < threshold_) return VPClass::VP0;
    if (vp < 2.0 * threshold_) return VPClass::VP1;
    if (vp < 3.0 * threshold_) return VPClass::VP2;
    if (vp < ceiling_) return VPClass::VP3;
    return VPClass::VP4;
}

double ViolationMonitor::proximity(double vp) const {
    if (vp < threshold_) return 1.0;
    return std::clamp(1.0 - vp / ceiling_, 0.0, 1.0);
}

const VPState& ViolationMonitor::on_event(const TraitMap& traits) {
    state_.calculation_count += 1;

    std::optional<double> vp;
    if (!traits.empty()) {
        try {
            vp = pressure_->compute(traits);
        } catch (const std::exception& e) {
            // A failing strategy is degenerate input, not a reason to stop
            failures_ += 1;
            BUTTERFLY_LOG_WARN("pressure", "event %llu: pressure function failed, VP held at %.4f: %s",
                               static_cast<unsigned long long>(state_.calculation_count),
                               state_.current_vp, e.what());
            return state_;
        }
    }

    if (vp && std::isfinite(*vp) && *vp >= 0.0) {
        VPClass previous = state_.vp_class;
        state_.current_vp = *vp;
        state_.vp_class = classify(*vp);

        if (state_.vp_class != previous) {
            BUTTERFLY_LOG_INFO("pressure", "VP %.4f: %s -> %s", *vp,
                               vp_class_name(previous), vp_class_name(state_.vp_class));
        }

        history_.push_back({state_.calculation_count, state_.current_vp, state_.vp_class});
        while (history_.size() > history_capacity_) {
            history_.pop_front();
        }
    } else {
        BUTTERFLY_LOG_DEBUG("pressure", "event %llu carried no evaluable traits",
                            static_cast<unsigned long long>(state_.calculation_count));
    }

    return state_;
}

VPHealth ViolationMonitor::health() const {
    VPHealth h;
    h.samples = history_.size();
    if (history_.empty()) return h;

    double sum = 0.0;
    size_t converged = 0;
    for (const auto& r : history_) {
        sum += r.vp;
        if (is_convergence(r.vp_class)) ++converged;
    }
    h.mean_vp = sum / static_cast<double>(h.samples);
    h.convergence_ratio = static_cast<double>(converged) / static_cast<double>(h.samples);
    h.last_vp = history_.back().vp;
    return h;
}

} // namespace butterfly
