#include <butterfly/wing_adapter.hpp>
#include <butterfly/log.hpp>

namespace butterfly {

NetworkWingState unavailable_network_state() {
    NetworkWingState s;
    s.wing.available = false;
    s.metrics.average_path_length = 0.0;
    return s;
}

PressureWingState unavailable_pressure_state() {
    PressureWingState s;
    s.wing.available = false;
    return s;
}

// =============================================================================
// WingAdapter
// =============================================================================

BreathState WingAdapter::latest_breath() const {
    if (!breath_) {
        // No pacing source wired, behave as a flat breath
        BreathState flat;
        flat.flat = true;
        flat.phase = 0.0;
        flat.depth = 0.0;
        return flat;
    }
    return *breath_->load();
}

void WingAdapter::fill_wing(WingState& wing, double proximity, bool precision) {
    proximity_.store(proximity, std::memory_order_release);

    wing.phase = precision ? WingPhase::Precision : WingPhase::Chaos;
    wing.proximity = proximity;
    wing.flap_intensity = breath_pulse(latest_breath()) * proximity;
    wing.available = true;
    wing.stopped = stopped();
    wing.version = ++publishes_;
}

// =============================================================================
// NetworkWing
// =============================================================================

NetworkWing::NetworkWing(const NetworkConfig& config, const BreathCell* breath, MetricPool* pool)
    : WingAdapter(breath)
    , engine_(config, pool) {
    publish();
}

bool NetworkWing::advance_if_ready() {
    if (stopped()) return false;

    bool advanced = engine_.evolve_generation();
    publish();
    return advanced;
}

void NetworkWing::refresh() {
    if (stopped()) return;
    publish();
}

void NetworkWing::publish() {
    NetworkWingState s;
    fill_wing(s.wing, engine_.proximity_to_transition(), engine_.transition_ready());
    s.generation = engine_.generation();
    s.organism_count = engine_.graph().organism_count();
    s.connection_count = engine_.graph().connection_count();
    s.metrics = engine_.metrics();
    s.collapsed = engine_.collapsed();

    diagnostics_.publish(engine_.diagnostics());
    cell_.publish(s);
}

// =============================================================================
// PressureWing
// =============================================================================

PressureWing::PressureWing(const PressureConfig& config, const BreathCell* breath,
                           std::shared_ptr<const PressureFunction> pressure)
    : WingAdapter(breath)
    , monitor_(config, std::move(pressure))
    , inbox_capacity_(config.inbox_capacity) {
    publish();
}

bool PressureWing::deliver(TraitMap traits) {
    if (stopped()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    std::lock_guard<std::mutex> lock(inbox_mutex_);
    if (inbox_.size() >= inbox_capacity_) {
        std::uint64_t dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        // Power-of-two counts only, so a flood doesn't flood the log too
        if ((dropped & (dropped - 1)) == 0) {
            BUTTERFLY_LOG_WARN("pressure", "inbox full (%zu), %llu events dropped so far",
                               inbox_capacity_, static_cast<unsigned long long>(dropped));
        }
        return false;
    }
    inbox_.push_back(std::move(traits));
    return true;
}

size_t PressureWing::pending_events() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_.size();
}

bool PressureWing::advance_if_ready() {
    if (stopped()) return false;

    TraitMap traits;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (inbox_.empty()) return false;
        traits = std::move(inbox_.front());
        inbox_.pop_front();
    }

    monitor_.on_event(traits);
    publish();
    return true;
}

void PressureWing::refresh() {
    if (stopped()) return;
    publish();
}

void PressureWing::publish() {
    const VPState& vp = monitor_.state();

    PressureWingState s;
    fill_wing(s.wing, monitor_.proximity(), monitor_.converged());
    s.current_vp = vp.current_vp;
    s.vp_class = vp.vp_class;
    s.calculation_count = vp.calculation_count;
    s.failed_calculations = monitor_.failures();
    s.pending_events = pending_events();

    health_.publish(monitor_.health());
    cell_.publish(s);
}

} // namespace butterfly
