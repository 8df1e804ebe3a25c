// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion Functions
// ==============================================================================
// Power and amplitude ratio conversions used by the spectrum and metrics code.
// Ratios that would produce +/- infinity saturate at the metric ceiling so
// that results stay finite and comparable.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <cmath>

namespace Primer {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Largest magnitude any dB quantity reported by the analysis code may take.
/// Zero noise (or zero distortion) saturates here instead of reaching infinity.
inline constexpr double kMetricCeilingDb = 200.0;

// ==============================================================================
// Functions
// ==============================================================================

/// Convert a power ratio (numerator / denominator) to dB.
///
/// @formula dB = 10 * log10(numerator / denominator)
/// @return Value in [-kMetricCeilingDb, kMetricCeilingDb].
///         A zero denominator gives +kMetricCeilingDb, a zero numerator gives
///         -kMetricCeilingDb, both zero gives 0 dB.
[[nodiscard]] inline double powerRatioDb(double numerator, double denominator) noexcept {
    if (numerator <= 0.0 && denominator <= 0.0) {
        return 0.0;
    }
    if (denominator <= 0.0) {
        return kMetricCeilingDb;
    }
    if (numerator <= 0.0) {
        return -kMetricCeilingDb;
    }
    const double dB = 10.0 * std::log10(numerator / denominator);
    if (dB > kMetricCeilingDb) return kMetricCeilingDb;
    if (dB < -kMetricCeilingDb) return -kMetricCeilingDb;
    return dB;
}

} // namespace DSP
} // namespace Primer
