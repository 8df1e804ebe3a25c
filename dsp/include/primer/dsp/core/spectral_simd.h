// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude/phase, power and dB conversion of spectrum bins using
// Google Highway for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These are the vectorized equivalents of per-bin sqrt/atan2/log10. The
// Spectrum views call them once per analysis over all N/2+1 bins.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Primer {
namespace DSP {

/// Smallest magnitude converted to dB; zero and negative values clamp here
inline constexpr float kMinMagnitude = 1e-10f;

/// @brief Bulk compute magnitude and phase from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
/// @param phases Output phase array in radians (must hold numBins floats)
void computePolarBulk(const float* complexData, size_t numBins,
                      float* mags, float* phases) noexcept;

/// @brief Bulk compute scale * (re^2 + im^2) for each bin
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins
/// @param scale Factor applied to every bin (e.g. 1/N)
/// @param power Output array (must hold numBins floats)
void computePowerBulk(const float* complexData, size_t numBins, float scale,
                      float* power) noexcept;

/// @brief Batch convert magnitudes to dB: 20 * log10(max(x, kMinMagnitude))
/// @param input Magnitudes
/// @param output dB values (must hold count floats)
/// @param count Number of elements
void batchMagnitudeToDb(const float* input, float* output, std::size_t count) noexcept;

} // namespace DSP
} // namespace Primer
