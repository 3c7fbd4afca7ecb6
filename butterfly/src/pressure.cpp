#include <butterfly/pressure.hpp>
#include <butterfly/config.hpp>
#include <cmath>

namespace butterfly {

namespace {
constexpr double EPSILON = 1e-10;
}

double overflow_ratio(double x, const TraitEnvelope& envelope) {
    double width = envelope.hi - envelope.lo;
    if (std::fabs(width) < EPSILON) {
        return std::fabs(x - envelope.ideal) < EPSILON ? 0.0 : 1.0;
    }

    double ratio = std::fabs(x - envelope.ideal) / width;
    if (x < envelope.lo) {
        ratio += (envelope.lo - x) / width;
    } else if (x > envelope.hi) {
        ratio += (x - envelope.hi) / width;
    }
    return ratio;
}

EnvelopePressure::EnvelopePressure(std::map<std::string, TraitEnvelope> envelopes)
    : envelopes_(std::move(envelopes)) {
    for (const auto& [name, env] : envelopes_) {
        if (!std::isfinite(env.lo) || !std::isfinite(env.hi) || env.lo > env.hi) {
            throw ConfigError("envelope for '" + name + "' must satisfy lo <= hi");
        }
        if (!std::isfinite(env.ideal)) {
            throw ConfigError("envelope for '" + name + "' has a non-finite ideal");
        }
        if (!std::isfinite(env.weight) || env.weight < 0.0) {
            throw ConfigError("envelope for '" + name + "' must have weight >= 0");
        }
    }
}

std::optional<double> EnvelopePressure::compute(const TraitMap& traits) const {
    double vp = 0.0;
    bool any = false;

    for (const auto& [name, env] : envelopes_) {
        auto it = traits.find(name);
        if (it == traits.end() || !std::isfinite(it->second)) continue;
        vp += overflow_ratio(it->second, env) * env.weight;
        any = true;
    }

    if (!any) return std::nullopt;
    return vp;
}

std::map<std::string, TraitEnvelope> EnvelopePressure::default_envelopes() {
    return {
        {"speed_ms",    {100.0, 10.0, 1000.0, 1.0}},
        {"memory_mb",   {50.0, 1.0, 500.0, 1.0}},
        {"reliability", {1.0, 1.0, 1.0, 1.0}},
    };
}

} // namespace butterfly
