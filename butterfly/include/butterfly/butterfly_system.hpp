#ifndef BUTTERFLY_BUTTERFLY_SYSTEM_HPP
#define BUTTERFLY_BUTTERFLY_SYSTEM_HPP

#include <butterfly/breath_engine.hpp>
#include <butterfly/butterfly_state.hpp>
#include <butterfly/config.hpp>
#include <butterfly/network_metrics.hpp>
#include <butterfly/producer.hpp>
#include <butterfly/snapshot_feed.hpp>
#include <butterfly/state_aggregator.hpp>
#include <butterfly/wing_adapter.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace butterfly {

/**
 * How the system builds its wings. An empty hook builds the stock wing.
 * A hook that throws leaves that wing out (degraded mode).
 */
struct WingFactories {
    std::function<std::unique_ptr<NetworkWing>(const NetworkConfig&, const BreathCell*, MetricPool*)> network;
    std::function<std::unique_ptr<PressureWing>(const PressureConfig&, const BreathCell*)> pressure;
};

/**
 * Breath engine, both wings and the aggregator wired from one config.
 *
 * start() launches four producers: breath (every tick_seconds), network (one
 * generation per generation_interval_seconds), pressure (drains delivered
 * events, idles for tick_seconds), aggregation (every interval_seconds).
 * Each can be stopped on its own; the others keep running.
 *
 * A disabled wing, or one whose construction throws, is left out and shows
 * as unavailable in every snapshot. A wing whose producer fails is marked
 * stopped and reported with its last-known state; start() leaves stopped
 * wings alone. Once the unified transition triggers the breath slows to
 * precision_rate.
 *
 * The step_* calls drive the same components by hand for single-threaded
 * use; they throw std::runtime_error while the matching producer runs.
 */
class ButterflySystem {
public:
    explicit ButterflySystem(const ButterflyConfig& config,
                             std::shared_ptr<const PressureFunction> pressure = nullptr);
    ButterflySystem(const ButterflyConfig& config, WingFactories factories);
    ~ButterflySystem();

    ButterflySystem(const ButterflySystem&) = delete;
    ButterflySystem& operator=(const ButterflySystem&) = delete;

    void start();
    void stop();

    void stop_breath();
    void stop_network();
    void stop_pressure();
    void stop_aggregation();

    bool breath_running() const { return breath_producer_ && breath_producer_->is_running(); }
    bool network_running() const { return network_producer_ && network_producer_->is_running(); }
    bool pressure_running() const { return pressure_producer_ && pressure_producer_->is_running(); }
    bool aggregation_running() const { return aggregation_producer_ && aggregation_producer_->is_running(); }

    // Manual drive
    BreathState step_breath();
    bool step_network();
    bool step_pressure();

    // Hand a trait event to the pressure wing; false if unavailable, stopped or full
    bool deliver(TraitMap traits);

    // Runs an aggregation pass now
    ButterflyState snapshot();
    // Last pass, from whichever thread ran it
    ButterflyState latest() const { return aggregator_->latest(); }

    BreathState breath() const { return *breath_cell_.load(); }
    std::optional<CollapseDiagnostics> diagnostics() const;
    std::optional<VPHealth> pressure_health() const;

    bool network_available() const { return network_ != nullptr; }
    bool pressure_available() const { return pressure_ != nullptr; }
    bool transition_triggered() const { return aggregator_->transition_triggered(); }
    std::uint64_t inconsistent_passes() const { return aggregator_->inconsistent_passes(); }

    SnapshotFeed& feed() { return feed_; }
    const ButterflyConfig& config() const { return config_; }

private:
    BreathState breath_tick();
    void build_network_wing(const WingFactories& factories);
    void build_pressure_wing(const WingFactories& factories);
    void start_producer(Producer* producer, const WingAdapter* wing);

    ButterflyConfig config_;

    BreathEngine breath_engine_;
    BreathCell breath_cell_;
    bool precision_applied_ = false;    // Breath producer (or manual caller) only

    std::unique_ptr<MetricPool> metric_pool_;
    std::unique_ptr<NetworkWing> network_;
    std::unique_ptr<PressureWing> pressure_;

    SnapshotFeed feed_;
    std::unique_ptr<StateAggregator> aggregator_;

    std::unique_ptr<Producer> breath_producer_;
    std::unique_ptr<Producer> network_producer_;
    std::unique_ptr<Producer> pressure_producer_;
    std::unique_ptr<Producer> aggregation_producer_;
};

} // namespace butterfly

#endif // BUTTERFLY_BUTTERFLY_SYSTEM_HPP
