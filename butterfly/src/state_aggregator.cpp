#include <butterfly/state_aggregator.hpp>
#include <butterfly/log.hpp>
#include <array>

namespace butterfly {

namespace {

using Versions = std::array<std::uint64_t, 3>;

} // namespace

StateAggregator::StateAggregator(const AggregatorConfig& config,
                                 const BreathCell& breath,
                                 const NetworkWing* network,
                                 const PressureWing* pressure,
                                 SnapshotFeed* feed)
    : breath_(breath)
    , network_(network)
    , pressure_(pressure)
    , feed_(feed) {
    validate(config);
    sustain_passes_ = config.sustain_passes;
    retries_ = config.consistent_read_retries;
    network_scale_ = config.network_exploration_scale;
    pressure_scale_ = config.pressure_exploration_scale;

    if (!network_) {
        BUTTERFLY_LOG_WARN("aggregator", "network wing unavailable, readiness from pressure wing only");
    }
    if (!pressure_) {
        BUTTERFLY_LOG_WARN("aggregator", "pressure wing unavailable, readiness from network wing only");
    }
}

bool StateAggregator::unified_ready(const NetworkWingState& network, const PressureWingState& pressure) {
    bool network_ready = network.wing.available && network.wing.proximity >= 1.0;
    bool pressure_ready = pressure.wing.available && pressure.wing.proximity >= 1.0;
    return network_ready || pressure_ready;
}

ButterflyState StateAggregator::snapshot() {
    std::lock_guard<std::mutex> lock(pass_mutex_);

    auto collect = [this]() -> Versions {
        return {
            breath_.version(),
            network_ ? network_->cell().version() : 0,
            pressure_ ? pressure_->cell().version() : 0
        };
    };

    BreathCell::Ptr breath;
    VersionedCell<NetworkWingState>::Ptr network;
    VersionedCell<PressureWingState>::Ptr pressure;

    bool consistent = false;
    for (int attempt = 0; attempt < retries_ && !consistent; ++attempt) {
        Versions before = collect();
        auto [b, bv] = breath_.load_versioned();
        breath = std::move(b);
        Versions loaded{bv, 0, 0};
        if (network_) {
            auto [n, nv] = network_->cell().load_versioned();
            network = std::move(n);
            loaded[1] = nv;
        }
        if (pressure_) {
            auto [p, pv] = pressure_->cell().load_versioned();
            pressure = std::move(p);
            loaded[2] = pv;
        }
        Versions after = collect();
        consistent = before == loaded && loaded == after;
    }

    if (!consistent) {
        inconsistent_.fetch_add(1, std::memory_order_relaxed);
        BUTTERFLY_LOG_DEBUG("aggregator", "no quiet window after %d collects, using last", retries_);
    }

    ButterflyState s;
    s.breath = *breath;
    s.body_phase = body_phase(s.breath);

    if (network_) {
        s.network = *network;
        s.network.wing.stopped = s.network.wing.stopped || network_->stopped();
    } else {
        s.network = unavailable_network_state();
    }

    if (pressure_) {
        s.pressure = *pressure;
        s.pressure.wing.stopped = s.pressure.wing.stopped || pressure_->stopped();
    } else {
        s.pressure = unavailable_pressure_state();
    }

    auto& t = s.transition;
    t.network_ready = s.network.wing.available && s.network.wing.proximity >= 1.0;
    t.pressure_ready = s.pressure.wing.available && s.pressure.wing.proximity >= 1.0;
    t.network_explorations = s.network.wing.available ? s.network.generation : 0;
    t.pressure_explorations = s.pressure.wing.available ? s.pressure.calculation_count : 0;
    t.total_exploration = (static_cast<double>(t.network_explorations) / network_scale_ +
                           static_cast<double>(t.pressure_explorations) / pressure_scale_) / 2.0;

    s.unified_transition_ready = unified_ready(s.network, s.pressure);
    streak_ = s.unified_transition_ready ? streak_ + 1 : 0;

    if (!triggered_.load(std::memory_order_relaxed) &&
        streak_ >= static_cast<std::uint32_t>(sustain_passes_)) {
        trigger_.triggered_at_pass = sequence_ + 1;
        trigger_.triggered_at_cycle = s.breath.cycle;
        trigger_.triggered_at_time = s.breath.elapsed;
        triggered_.store(true, std::memory_order_release);
        BUTTERFLY_LOG_INFO("aggregator", "unified transition triggered at pass %llu "
                           "(network %.2f%s, pressure %.2f%s, cycle %llu, exploration %.3f)",
                           static_cast<unsigned long long>(trigger_.triggered_at_pass),
                           s.network.wing.proximity, t.network_ready ? " ready" : "",
                           s.pressure.wing.proximity, t.pressure_ready ? " ready" : "",
                           static_cast<unsigned long long>(s.breath.cycle),
                           t.total_exploration);
    }
    t.triggered_at_pass = trigger_.triggered_at_pass;
    t.triggered_at_cycle = trigger_.triggered_at_cycle;
    t.triggered_at_time = trigger_.triggered_at_time;

    s.ready_streak = streak_;
    s.transition_triggered = triggered_.load(std::memory_order_relaxed);
    s.sequence = ++sequence_;
    passes_.fetch_add(1, std::memory_order_relaxed);

    latest_.publish(s);
    if (feed_) {
        feed_->push(s);
    }
    return s;
}

} // namespace butterfly
