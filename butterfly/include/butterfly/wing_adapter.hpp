#ifndef BUTTERFLY_WING_ADAPTER_HPP
#define BUTTERFLY_WING_ADAPTER_HPP

#include <butterfly/breath_engine.hpp>
#include <butterfly/butterfly_state.hpp>
#include <butterfly/collapse_tracker.hpp>
#include <butterfly/config.hpp>
#include <butterfly/network_evolution.hpp>
#include <butterfly/versioned_cell.hpp>
#include <butterfly/violation_monitor.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace butterfly {

using BreathCell = VersionedCell<BreathState>;

/**
 * Uniform face of a reactive subsystem.
 *
 * The owning producer calls advance_if_ready() at the subsystem's own rhythm
 * and refresh() when idle; both republish the wing state with a flap
 * intensity taken from the latest published breath. Breath never decides
 * whether the subsystem advances.
 *
 * sample() and proximity() may be called from any thread.
 */
class WingAdapter {
public:
    explicit WingAdapter(const BreathCell* breath) : breath_(breath) {}
    virtual ~WingAdapter() = default;

    WingAdapter(const WingAdapter&) = delete;
    WingAdapter& operator=(const WingAdapter&) = delete;

    virtual const char* name() const = 0;

    // Advance the wrapped subsystem by one unit if it has work; true if it did
    virtual bool advance_if_ready() = 0;

    // Republish current state against the latest breath, subsystem untouched
    virtual void refresh() = 0;

    // breath_pulse(breath) x proximity; O(1), no side effects
    double sample(const BreathState& breath) const {
        return breath_pulse(breath) * proximity();
    }

    double proximity() const { return proximity_.load(std::memory_order_acquire); }

    // After stop() the wing keeps its last published state and ignores advance requests
    void stop() { stopped_.store(true, std::memory_order_release); }
    bool stopped() const { return stopped_.load(std::memory_order_acquire); }

protected:
    BreathState latest_breath() const;

    // Fill the common fields and bump the version; call from the owner thread
    void fill_wing(WingState& wing, double proximity, bool precision);

private:
    const BreathCell* breath_;
    std::atomic<double> proximity_{0.0};
    std::atomic<bool> stopped_{false};
    std::uint64_t publishes_ = 0;
};

/**
 * Network evolution wing: one generation per advance.
 */
class NetworkWing : public WingAdapter {
public:
    NetworkWing(const NetworkConfig& config, const BreathCell* breath, MetricPool* pool = nullptr);

    const char* name() const override { return "network"; }
    bool advance_if_ready() override;
    void refresh() override;

    NetworkWingState state() const { return *cell_.load(); }
    const VersionedCell<NetworkWingState>& cell() const { return cell_; }
    CollapseDiagnostics diagnostics() const { return *diagnostics_.load(); }

    // Owner thread only
    const NetworkEvolutionEngine& engine() const { return engine_; }

private:
    void publish();

    NetworkEvolutionEngine engine_;
    VersionedCell<NetworkWingState> cell_;
    VersionedCell<CollapseDiagnostics> diagnostics_;
};

/**
 * Violation pressure wing: one delivered trait event per advance.
 * deliver() may be called from any thread and never waits on processing.
 */
class PressureWing : public WingAdapter {
public:
    PressureWing(const PressureConfig& config, const BreathCell* breath,
                 std::shared_ptr<const PressureFunction> pressure = nullptr);

    const char* name() const override { return "pressure"; }
    bool advance_if_ready() override;
    void refresh() override;

    // False when the inbox is full or the wing is stopped; the event is dropped
    bool deliver(TraitMap traits);

    size_t pending_events() const;
    std::uint64_t dropped_events() const { return dropped_.load(std::memory_order_relaxed); }

    PressureWingState state() const { return *cell_.load(); }
    const VersionedCell<PressureWingState>& cell() const { return cell_; }
    VPHealth health() const { return *health_.load(); }

    // Owner thread only
    const ViolationMonitor& monitor() const { return monitor_; }

private:
    void publish();

    ViolationMonitor monitor_;
    size_t inbox_capacity_;
    mutable std::mutex inbox_mutex_;
    std::deque<TraitMap> inbox_;
    std::atomic<std::uint64_t> dropped_{0};
    VersionedCell<PressureWingState> cell_;
    VersionedCell<VPHealth> health_;
};

} // namespace butterfly

#endif // BUTTERFLY_WING_ADAPTER_HPP
