// ==============================================================================
// Layer 0: Core Utility - Interpolation
// ==============================================================================
// Interpolation kernels used to rebuild a continuous-time approximation from
// uniformly spaced samples: zero-order hold, linear, cubic Hermite
// (Catmull-Rom) and the band-limited sinc kernel.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <primer/dsp/core/math_constants.h>

#include <cmath>

namespace Primer {
namespace DSP {
namespace Interpolation {

// =============================================================================
// Linear Interpolation
// =============================================================================

/// @brief Linear interpolation between two samples.
///
/// @param y0 Sample at position 0
/// @param y1 Sample at position 1
/// @param t Fractional position in [0, 1]
/// @return Interpolated value (extrapolates linearly for t outside [0, 1])
///
/// @formula y = y0 + t * (y1 - y0)
[[nodiscard]] constexpr float linearInterpolate(float y0, float y1, float t) noexcept {
    return y0 + t * (y1 - y0);
}

// =============================================================================
// Cubic Hermite (Catmull-Rom) Interpolation
// =============================================================================

/// @brief Cubic Hermite (Catmull-Rom) interpolation using 4 samples.
///
/// Continuous first derivative; passes through y0 at t=0 and y1 at t=1.
///
/// @param ym1 Sample at position -1
/// @param y0 Sample at position 0
/// @param y1 Sample at position 1
/// @param y2 Sample at position 2
/// @param t Fractional position in [0, 1] between y0 and y1
///
/// @formula
/// c0 = y0
/// c1 = 0.5 * (y1 - ym1)
/// c2 = ym1 - 2.5*y0 + 2*y1 - 0.5*y2
/// c3 = 0.5*(y2 - ym1) + 1.5*(y0 - y1)
/// y = ((c3*t + c2)*t + c1)*t + c0
[[nodiscard]] constexpr float cubicHermiteInterpolate(
    float ym1, float y0, float y1, float y2, float t) noexcept {
    const float c0 = y0;
    const float c1 = 0.5f * (y1 - ym1);
    const float c2 = ym1 - 2.5f * y0 + 2.0f * y1 - 0.5f * y2;
    const float c3 = 0.5f * (y2 - ym1) + 1.5f * (y0 - y1);
    return ((c3 * t + c2) * t + c1) * t + c0;
}

// =============================================================================
// Band-limited (sinc) Kernel
// =============================================================================

/// @brief Normalized sinc: sin(pi*x) / (pi*x), with sinc(0) = 1
///
/// Whittaker-Shannon reconstruction weights sample n at time t by
/// sinc(t*fs - n).
[[nodiscard]] inline double sinc(double x) noexcept {
    if (std::abs(x) < 1e-12) return 1.0;
    const double px = kPiD * x;
    return std::sin(px) / px;
}

} // namespace Interpolation
} // namespace DSP
} // namespace Primer
