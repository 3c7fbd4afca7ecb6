#ifndef BUTTERFLY_STATE_AGGREGATOR_HPP
#define BUTTERFLY_STATE_AGGREGATOR_HPP

#include <butterfly/butterfly_state.hpp>
#include <butterfly/config.hpp>
#include <butterfly/snapshot_feed.hpp>
#include <butterfly/versioned_cell.hpp>
#include <butterfly/wing_adapter.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>

namespace butterfly {

/**
 * Merges breath and both wings into one ButterflyState per pass.
 *
 * A pass collects the three cell versions, loads the three states, and
 * collects the versions again; it accepts the read when nothing moved in
 * between, retrying a bounded number of times. Producers are never blocked
 * by a pass: the cells only lock for a pointer copy.
 *
 * A null wing pointer means that wing failed to initialise; it is reported
 * with the unavailable sentinel and ignored for readiness.
 */
class StateAggregator {
public:
    StateAggregator(const AggregatorConfig& config,
                    const BreathCell& breath,
                    const NetworkWing* network,
                    const PressureWing* pressure,
                    SnapshotFeed* feed = nullptr);

    // One aggregation pass; updates the readiness streak and feeds subscribers
    ButterflyState snapshot();

    // Result of the most recent pass, without running a new one
    ButterflyState latest() const { return *latest_.load(); }

    bool transition_triggered() const { return triggered_.load(std::memory_order_acquire); }
    std::uint64_t passes() const { return passes_.load(std::memory_order_relaxed); }

    // Passes that ran out of retries and used their last collect
    std::uint64_t inconsistent_passes() const { return inconsistent_.load(std::memory_order_relaxed); }

    // OR over available wings of proximity == 1
    static bool unified_ready(const NetworkWingState& network, const PressureWingState& pressure);

private:
    int sustain_passes_;
    int retries_;
    double network_scale_;
    double pressure_scale_;
    const BreathCell& breath_;
    const NetworkWing* network_;
    const PressureWing* pressure_;
    SnapshotFeed* feed_;

    std::mutex pass_mutex_;    // Serialises passes, never taken by producers
    std::uint64_t sequence_ = 0;
    std::uint32_t streak_ = 0;
    TransitionDiagnostics trigger_;     // Trigger fields, fixed once latched

    std::atomic<bool> triggered_{false};
    std::atomic<std::uint64_t> passes_{0};
    std::atomic<std::uint64_t> inconsistent_{0};
    VersionedCell<ButterflyState> latest_;
};

} // namespace butterfly

#endif // BUTTERFLY_STATE_AGGREGATOR_HPP
