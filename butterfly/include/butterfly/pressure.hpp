#ifndef BUTTERFLY_PRESSURE_HPP
#define BUTTERFLY_PRESSURE_HPP

#include <map>
#include <optional>
#include <string>

namespace butterfly {

// Named trait measurements for one event
using TraitMap = std::map<std::string, double>;

// Stability envelope of one trait
struct TraitEnvelope {
    double ideal = 0.0;
    double lo = 0.0;
    double hi = 1.0;
    double weight = 1.0;
};

/**
 * Deviation of x from the ideal relative to the envelope width, plus the
 * same-scaled overflow past either bound. A zero-width envelope is exact:
 * 0 at the ideal, 1 anywhere else.
 */
double overflow_ratio(double x, const TraitEnvelope& envelope);

// Strategy mapping one trait event to a scalar pressure
class PressureFunction {
public:
    virtual ~PressureFunction() = default;

    // nullopt when the event carries nothing this strategy can evaluate
    virtual std::optional<double> compute(const TraitMap& traits) const = 0;
};

/**
 * Weighted sum of overflow_ratio over every enveloped trait present in the
 * event. Traits missing from the event, or without an envelope, are skipped.
 */
class EnvelopePressure : public PressureFunction {
public:
    explicit EnvelopePressure(std::map<std::string, TraitEnvelope> envelopes);

    std::optional<double> compute(const TraitMap& traits) const override;

    const std::map<std::string, TraitEnvelope>& envelopes() const { return envelopes_; }

    // speed_ms, memory_mb and reliability envelopes of an execution sandbox
    static std::map<std::string, TraitEnvelope> default_envelopes();

private:
    std::map<std::string, TraitEnvelope> envelopes_;
};

} // namespace butterfly

#endif // BUTTERFLY_PRESSURE_HPP
