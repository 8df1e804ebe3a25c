// ==============================================================================
// Layer 0: Core Utilities
// filter_design.h - IIR Filter Design
// ==============================================================================
// Shared pole/zero design routine for every IIR family and kind:
//
//   analog prototype (Butterworth / Chebyshev I / Bessel, -3 dB at 1 rad/s)
//     -> frequency transform to lowpass/highpass/bandpass/bandstop using
//        prewarped band edges
//     -> bilinear transform to the z-plane
//
// The digital pole/zero set is paired into second-order sections by the
// IirFilter processor.
//
// Layer 0: depends only on math_constants.h, dsp_error.h
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/math_constants.h>

#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Filter Specification
// =============================================================================

/// Highest prototype order accepted by the designer
inline constexpr int kMaxFilterOrder = 12;

/// Chebyshev passband ripple used when none is given (dB)
inline constexpr double kDefaultRippleDb = 1.0;

/// @brief Magnitude-response family
enum class FilterFamily : uint8_t {
    Butterworth,  ///< Maximally flat passband
    Chebyshev,    ///< Type I, equiripple passband
    Bessel        ///< Maximally flat group delay
};

/// @brief Response kind
enum class FilterKind : uint8_t {
    Lowpass,
    Highpass,
    Bandpass,
    Notch  ///< Band-stop between two cutoffs
};

[[nodiscard]] const char* familyName(FilterFamily family) noexcept;
[[nodiscard]] const char* kindName(FilterKind kind) noexcept;

/// @brief Complete description of a filter to design
///
/// Lowpass and highpass take one cutoff; bandpass and notch take two in
/// ascending order. Bandpass and notch designs have 2 * order poles.
struct FilterSpec {
    FilterFamily family = FilterFamily::Butterworth;
    FilterKind kind = FilterKind::Lowpass;
    int order = 4;
    std::vector<double> cutoffs;       ///< Hz, each in (0, sampleRate / 2)
    double sampleRate = 0.0;           ///< Hz
    double rippleDb = kDefaultRippleDb;///< Chebyshev only, in (0, 3)
};

// =============================================================================
// Pole/Zero Representation
// =============================================================================

/// @brief Zeros, poles and gain of a rational transfer function
///
/// H(x) = gain * prod(x - zeros) / prod(x - poles), with x = s (analog)
/// or x = z (digital).
struct PoleZeroLocations {
    std::vector<std::complex<double>> zeros;
    std::vector<std::complex<double>> poles;
    double gain = 1.0;
};

/// @brief Evaluate a pole/zero set at a point of the s- or z-plane
[[nodiscard]] std::complex<double> evaluate(const PoleZeroLocations& pz,
                                            std::complex<double> x) noexcept;

namespace FilterDesign {

// =============================================================================
// Validation
// =============================================================================

/// @brief Check every FilterSpec constraint
/// @throws InvalidSpec naming the first violated field
void validate(const FilterSpec& spec);

// =============================================================================
// Frequency Prewarping
// =============================================================================

/// @brief Analog angular frequency that the bilinear transform maps to freqHz
/// @formula omega = 2 * fs * tan(pi * f / fs)   [rad/s]
[[nodiscard]] double prewarpFrequency(double freqHz, double sampleRate) noexcept;

// =============================================================================
// Analog Prototypes (lowpass, -3 dB at 1 rad/s)
// =============================================================================

/// Poles evenly spaced on the left half of the unit circle, DC gain 1
[[nodiscard]] PoleZeroLocations butterworthPrototype(int order);

/// Poles on an ellipse; ripple peaks at 0 dB, so even orders have
/// DC gain 1/sqrt(1 + eps^2)
[[nodiscard]] PoleZeroLocations chebyshevPrototype(int order, double rippleDb);

/// Roots of the reverse Bessel polynomial, DC gain 1
[[nodiscard]] PoleZeroLocations besselPrototype(int order);

/// Dispatch on family
[[nodiscard]] PoleZeroLocations analogPrototype(FilterFamily family, int order,
                                                double rippleDb);

// =============================================================================
// Frequency Transforms (analog -> analog)
// =============================================================================

/// s -> s / wc
[[nodiscard]] PoleZeroLocations lowpassToLowpass(const PoleZeroLocations& proto, double wc);

/// s -> wc / s
[[nodiscard]] PoleZeroLocations lowpassToHighpass(const PoleZeroLocations& proto, double wc);

/// s -> (s^2 + w0^2) / (s * bw)
[[nodiscard]] PoleZeroLocations lowpassToBandpass(const PoleZeroLocations& proto,
                                                  double w0, double bw);

/// s -> s * bw / (s^2 + w0^2)
[[nodiscard]] PoleZeroLocations lowpassToBandstop(const PoleZeroLocations& proto,
                                                  double w0, double bw);

// =============================================================================
// Bilinear Transform (analog -> digital)
// =============================================================================

/// z = (2fs + s) / (2fs - s); zeros at infinity land on z = -1
[[nodiscard]] PoleZeroLocations bilinearTransform(const PoleZeroLocations& analog,
                                                  double sampleRate);

// =============================================================================
// Complete Design
// =============================================================================

/// @brief Digital pole/zero set for a validated spec
/// @throws InvalidSpec if the spec is invalid
[[nodiscard]] PoleZeroLocations designDigital(const FilterSpec& spec);

/// @brief Point on the unit circle where the passband gain is referenced
///
/// Lowpass and notch: z = 1 (DC). Highpass: z = -1 (Nyquist).
/// Bandpass: the digital image of the geometric centre frequency.
[[nodiscard]] std::complex<double> passbandReference(const FilterSpec& spec);

} // namespace FilterDesign

} // namespace DSP
} // namespace Primer
