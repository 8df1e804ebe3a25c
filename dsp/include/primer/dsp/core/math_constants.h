// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
// All DSP components should import these constants instead of defining locally.
//
// Float constants are used on the per-sample paths; the double variants are
// used by analysis and filter design code, where the extra precision matters
// (pole placement, phase accumulation over long records).
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Primer {
namespace DSP {

// =============================================================================
// Mathematical Constants (float)
// =============================================================================

/// Pi constant for DSP calculations
/// Provides full float precision: 3.14159265358979323846
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr float kHalfPi = kPi / 2.0f;

// =============================================================================
// Mathematical Constants (double)
// =============================================================================

/// Pi in double precision
inline constexpr double kPiD = 3.14159265358979323846;

/// Two times Pi in double precision
inline constexpr double kTwoPiD = 2.0 * kPiD;

/// 1 / sqrt(2): magnitude of a -3.01 dB point
inline constexpr double kInvSqrt2 = 0.70710678118654752440;

// =============================================================================
// Converter Constants
// =============================================================================

/// SNR gained per bit of an ideal quantizer, in dB (20 * log10(2))
inline constexpr double kDbPerBit = 6.02;

/// Full-scale sine correction term of the ideal quantizer SNR, in dB
/// (10 * log10(3/2))
inline constexpr double kFullScaleSineDb = 1.76;

} // namespace DSP
} // namespace Primer
