#include <butterfly/butterfly_system.hpp>
#include <butterfly/log.hpp>
#include <stdexcept>
#include <string>

namespace butterfly {

namespace {

WingFactories stock_factories(std::shared_ptr<const PressureFunction> pressure) {
    WingFactories factories;
    factories.pressure = [pressure](const PressureConfig& config, const BreathCell* breath) {
        return std::make_unique<PressureWing>(config, breath, pressure);
    };
    return factories;
}

} // namespace

ButterflySystem::ButterflySystem(const ButterflyConfig& config,
                                 std::shared_ptr<const PressureFunction> pressure)
    : ButterflySystem(config, stock_factories(std::move(pressure))) {}

ButterflySystem::ButterflySystem(const ButterflyConfig& config, WingFactories factories)
    : config_(config)
    , breath_engine_(config.breath)
    , breath_cell_(breath_engine_.state()) {
    validate(config_);

    build_network_wing(factories);
    build_pressure_wing(factories);

    aggregator_ = std::make_unique<StateAggregator>(
        config_.aggregator, breath_cell_, network_.get(), pressure_.get(), &feed_);

    breath_producer_ = std::make_unique<Producer>(
        "breath", [this]() { breath_tick(); return false; },
        config_.breath.tick_seconds);

    // A failed wing producer leaves its wing stopped, so snapshots and deliver() see it
    if (network_) {
        network_producer_ = std::make_unique<Producer>(
            "network", [this]() { network_->advance_if_ready(); return false; },
            config_.network.generation_interval_seconds,
            [this](const std::string&) { network_->stop(); });
    }

    if (pressure_) {
        pressure_producer_ = std::make_unique<Producer>(
            "pressure", [this]() {
                if (pressure_->advance_if_ready()) return true;
                pressure_->refresh();
                return false;
            },
            config_.breath.tick_seconds,
            [this](const std::string&) { pressure_->stop(); });
    }

    aggregation_producer_ = std::make_unique<Producer>(
        "aggregation", [this]() { aggregator_->snapshot(); return false; },
        config_.aggregator.interval_seconds);

    BUTTERFLY_LOG_INFO("system", "ready: breath period %.2fs, network %s, pressure %s",
                       config_.breath.period_seconds,
                       network_ ? "on" : "unavailable",
                       pressure_ ? "on" : "unavailable");
}

ButterflySystem::~ButterflySystem() {
    stop();
}

void ButterflySystem::build_network_wing(const WingFactories& factories) {
    if (!config_.enable_network_wing) {
        BUTTERFLY_LOG_INFO("system", "network wing disabled");
        return;
    }

    try {
        if (config_.network.metric_threads > 0) {
            metric_pool_ = std::make_unique<MetricPool>(config_.network.metric_threads);
            metric_pool_->start();
        }
        if (factories.network) {
            network_ = factories.network(config_.network, &breath_cell_, metric_pool_.get());
        } else {
            network_ = std::make_unique<NetworkWing>(config_.network, &breath_cell_, metric_pool_.get());
        }
    } catch (const std::exception& e) {
        BUTTERFLY_LOG_ERROR("system", "network wing failed to initialise, running degraded: %s", e.what());
        network_.reset();
    }

    if (!network_) {
        metric_pool_.reset();
    }
}

void ButterflySystem::build_pressure_wing(const WingFactories& factories) {
    if (!config_.enable_pressure_wing) {
        BUTTERFLY_LOG_INFO("system", "pressure wing disabled");
        return;
    }

    try {
        if (factories.pressure) {
            pressure_ = factories.pressure(config_.pressure, &breath_cell_);
        } else {
            pressure_ = std::make_unique<PressureWing>(config_.pressure, &breath_cell_);
        }
    } catch (const std::exception& e) {
        BUTTERFLY_LOG_ERROR("system", "pressure wing failed to initialise, running degraded: %s", e.what());
        pressure_.reset();
    }
}

void ButterflySystem::start_producer(Producer* producer, const WingAdapter* wing) {
    if (!producer || producer->is_running()) return;
    if (wing && wing->stopped()) {
        BUTTERFLY_LOG_DEBUG("system", "%s wing stopped, not restarting its producer", wing->name());
        return;
    }
    producer->start();
}

void ButterflySystem::start() {
    if (metric_pool_ && !metric_pool_->is_running()) {
        metric_pool_->start();
    }
    start_producer(breath_producer_.get(), nullptr);
    start_producer(network_producer_.get(), network_.get());
    start_producer(pressure_producer_.get(), pressure_.get());
    start_producer(aggregation_producer_.get(), nullptr);
}

// Halts every producer; wings are not marked stopped, so start() resumes them
void ButterflySystem::stop() {
    for (Producer* p : {aggregation_producer_.get(), network_producer_.get(),
                        pressure_producer_.get(), breath_producer_.get()}) {
        if (p) p->stop();
    }
    if (metric_pool_) {
        metric_pool_->shutdown();
    }
}

void ButterflySystem::stop_breath() {
    if (breath_producer_) breath_producer_->stop();
}

void ButterflySystem::stop_network() {
    if (network_producer_) network_producer_->stop();
    if (network_) network_->stop();
}

void ButterflySystem::stop_pressure() {
    if (pressure_producer_) pressure_producer_->stop();
    if (pressure_) pressure_->stop();
}

void ButterflySystem::stop_aggregation() {
    if (aggregation_producer_) aggregation_producer_->stop();
}

BreathState ButterflySystem::breath_tick() {
    if (!precision_applied_ && aggregator_->transition_triggered()) {
        breath_engine_.set_rate_multiplier(config_.breath.precision_rate);
        precision_applied_ = true;
        BUTTERFLY_LOG_INFO("system", "transition triggered, breath rate now %.2fx",
                           config_.breath.precision_rate);
    }

    BreathState state = breath_engine_.advance(config_.breath.tick_seconds);
    breath_cell_.publish(state);
    return state;
}

BreathState ButterflySystem::step_breath() {
    if (breath_running()) {
        throw std::runtime_error("breath producer is running");
    }
    return breath_tick();
}

bool ButterflySystem::step_network() {
    if (network_running()) {
        throw std::runtime_error("network producer is running");
    }
    return network_ ? network_->advance_if_ready() : false;
}

bool ButterflySystem::step_pressure() {
    if (pressure_running()) {
        throw std::runtime_error("pressure producer is running");
    }
    return pressure_ ? pressure_->advance_if_ready() : false;
}

bool ButterflySystem::deliver(TraitMap traits) {
    return pressure_ ? pressure_->deliver(std::move(traits)) : false;
}

ButterflyState ButterflySystem::snapshot() {
    return aggregator_->snapshot();
}

std::optional<CollapseDiagnostics> ButterflySystem::diagnostics() const {
    if (!network_) return std::nullopt;
    return network_->diagnostics();
}

std::optional<VPHealth> ButterflySystem::pressure_health() const {
    if (!pressure_) return std::nullopt;
    return pressure_->health();
}

} // namespace butterfly
