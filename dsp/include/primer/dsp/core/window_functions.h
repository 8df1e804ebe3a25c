// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis windows applied before the DFT to trade main-lobe width for
// side-lobe leakage. All windows are the periodic (DFT-even) variant.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <primer/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported analysis windows
enum class WindowType : uint8_t {
    Rectangular,  ///< No window (plain DFT)
    Hann,         ///< Hann (Hanning), -31 dB side lobes
    Hamming,      ///< Hamming, -43 dB side lobes
    Blackman      ///< Blackman, -58 dB side lobes
};

/// @brief Human-readable window name
[[nodiscard]] inline const char* windowName(WindowType type) noexcept {
    switch (type) {
        case WindowType::Rectangular: return "Rectangular";
        case WindowType::Hann:        return "Hann";
        case WindowType::Hamming:     return "Hamming";
        case WindowType::Blackman:    return "Blackman";
    }
    return "Unknown";
}

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

/// @brief Window coefficient at index n of a size-N window
/// @note Formulas (periodic, divide by N):
///   Hann:     0.5 - 0.5*cos(2*pi*n/N)
///   Hamming:  0.54 - 0.46*cos(2*pi*n/N)
///   Blackman: 0.42 - 0.5*cos(2*pi*n/N) + 0.08*cos(4*pi*n/N)
[[nodiscard]] inline double coefficient(WindowType type, size_t n, size_t size) noexcept {
    if (size == 0) return 0.0;
    const double phase = kTwoPiD * static_cast<double>(n) / static_cast<double>(size);
    switch (type) {
        case WindowType::Rectangular:
            return 1.0;
        case WindowType::Hann:
            return 0.5 - 0.5 * std::cos(phase);
        case WindowType::Hamming:
            return 0.54 - 0.46 * std::cos(phase);
        case WindowType::Blackman:
            return 0.42 - 0.5 * std::cos(phase) + 0.08 * std::cos(2.0 * phase);
    }
    return 1.0;
}

/// @brief Fill buffer with the given window
inline void generate(WindowType type, float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    for (size_t n = 0; n < size; ++n) {
        output[n] = static_cast<float>(coefficient(type, n, size));
    }
}

/// @brief Create a window as a vector
/// @note NOT real-time safe (allocates)
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size);
    generate(type, window.data(), size);
    return window;
}

/// @brief Coherent gain (mean of the coefficients)
/// @note Divide |X[k]| by N*coherentGain to recover a tone's amplitude.
[[nodiscard]] inline double coherentGain(WindowType type, size_t size) noexcept {
    if (size == 0) return 0.0;
    double sum = 0.0;
    for (size_t n = 0; n < size; ++n) {
        sum += coefficient(type, n, size);
    }
    return sum / static_cast<double>(size);
}

/// @brief Sum of squared coefficients divided by N (noise power gain)
[[nodiscard]] inline double powerGain(WindowType type, size_t size) noexcept {
    if (size == 0) return 0.0;
    double sum = 0.0;
    for (size_t n = 0; n < size; ++n) {
        const double w = coefficient(type, n, size);
        sum += w * w;
    }
    return sum / static_cast<double>(size);
}

} // namespace Window

} // namespace DSP
} // namespace Primer
