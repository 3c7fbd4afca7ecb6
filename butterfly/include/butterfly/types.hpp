#ifndef BUTTERFLY_TYPES_HPP
#define BUTTERFLY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

namespace butterfly {

using OrganismId = std::uint32_t;
using Generation = std::uint64_t;

constexpr OrganismId INVALID_ORGANISM = std::numeric_limits<OrganismId>::max();

// Phase a wing (or the body) reports.
// Chaos = still exploring, Precision = transition criteria met
enum class WingPhase : std::uint8_t {
    Chaos,
    Precision
};

inline const char* wing_phase_name(WingPhase p) {
    switch (p) {
        case WingPhase::Chaos: return "chaos";
        case WingPhase::Precision: return "precision";
    }
    return "unknown";
}

// Violation pressure bands, VP0 (lawful) to VP4 (divergent)
enum class VPClass : std::uint8_t {
    VP0 = 0,  // convergence
    VP1,
    VP2,
    VP3,
    VP4       // divergence, at or above ceiling
};

inline const char* vp_class_name(VPClass c) {
    switch (c) {
        case VPClass::VP0: return "VP0";
        case VPClass::VP1: return "VP1";
        case VPClass::VP2: return "VP2";
        case VPClass::VP3: return "VP3";
        case VPClass::VP4: return "VP4";
    }
    return "VP?";
}

inline bool is_convergence(VPClass c) {
    return c == VPClass::VP0;
}

// What a post-collapse network engine does with further generations
enum class PostCollapsePolicy : std::uint8_t {
    Freeze,    // Stop advancing once collapse is first detected
    Continue   // Keep evolving past the threshold
};

} // namespace butterfly

#endif // BUTTERFLY_TYPES_HPP
