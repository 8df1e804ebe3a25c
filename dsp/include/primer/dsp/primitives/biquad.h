// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Second-order IIR section in Transposed Direct Form II, plus a cascade of
// sections. Coefficients and state are double precision; the IIR designs
// place poles close to the unit circle at high orders and low cutoffs.
//
// Notch formula: Robert Bristow-Johnson's Audio EQ Cookbook.
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/math_constants.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// BiquadCoefficients
// =============================================================================

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
struct BiquadCoefficients {
    double b0 = 1.0;  ///< Feedforward coefficient 0
    double b1 = 0.0;  ///< Feedforward coefficient 1
    double b2 = 0.0;  ///< Feedforward coefficient 2
    double a1 = 0.0;  ///< Feedback coefficient 1
    double a2 = 0.0;  ///< Feedback coefficient 2

    /// Band-reject section with a zero pair on the unit circle at frequency
    /// @param frequency Center frequency in Hz, in (0, sampleRate/2)
    /// @param Q Quality factor, > 0
    /// @param sampleRate Sample rate in Hz, > 0
    /// @throws InvalidParameter for out-of-range arguments
    [[nodiscard]] static BiquadCoefficients notch(
        double frequency,
        double Q,
        double sampleRate);

    /// Transfer function at a point of the z-plane
    /// @formula H(z) = (b0 + b1 z^-1 + b2 z^-2) / (1 + a1 z^-1 + a2 z^-2)
    [[nodiscard]] std::complex<double> evaluate(std::complex<double> z) const noexcept {
        const std::complex<double> zi = 1.0 / z;
        const std::complex<double> num = b0 + (b1 + b2 * zi) * zi;
        const std::complex<double> den = 1.0 + (a1 + a2 * zi) * zi;
        return num / den;
    }

    /// Frequency response at normalized angular frequency omega (rad/sample)
    [[nodiscard]] std::complex<double> response(double omega) const noexcept {
        return evaluate(std::polar(1.0, omega));
    }

    /// Multiply the numerator by a constant
    void scale(double gain) noexcept {
        b0 *= gain;
        b1 *= gain;
        b2 *= gain;
    }

    /// Check if coefficients represent a stable filter
    /// @return true if both poles lie inside the unit circle
    [[nodiscard]] bool isStable() const noexcept {
        // Jury stability criterion for a second-order section:
        // 1. |a2| < 1
        // 2. |a1| < 1 + a2
        return std::abs(a2) < 1.0 && std::abs(a1) < 1.0 + a2;
    }
};

// =============================================================================
// Biquad Filter Class
// =============================================================================

/// @brief Transposed Direct Form II biquad filter.
///
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept {
        coeffs_ = coeffs;
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept {
        return coeffs_;
    }

    /// Process single sample using TDF2
    [[nodiscard]] double process(double input) noexcept {
        const double output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;
        return output;
    }

    /// Clear filter state
    void reset() noexcept {
        z1_ = 0.0;
        z2_ = 0.0;
    }

private:
    BiquadCoefficients coeffs_;
    double z1_ = 0.0;
    double z2_ = 0.0;
};

// =============================================================================
// Biquad Cascade
// =============================================================================

/// @brief Series connection of biquad sections; order set at construction
class BiquadCascade {
public:
    BiquadCascade() = default;

    explicit BiquadCascade(const std::vector<BiquadCoefficients>& sections) {
        stages_.reserve(sections.size());
        for (const auto& c : sections) stages_.emplace_back(c);
    }

    /// Process one sample through all stages in order
    [[nodiscard]] double process(double input) noexcept {
        double x = input;
        for (auto& stage : stages_) x = stage.process(x);
        return x;
    }

    /// Filter a whole buffer from zero state
    void processBlock(const float* input, float* output, size_t numSamples) noexcept {
        reset();
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = static_cast<float>(process(static_cast<double>(input[i])));
        }
    }

    void reset() noexcept {
        for (auto& stage : stages_) stage.reset();
    }

    /// Product of the section responses at omega (rad/sample)
    [[nodiscard]] std::complex<double> response(double omega) const noexcept {
        std::complex<double> h(1.0, 0.0);
        for (const auto& stage : stages_) h *= stage.coefficients().response(omega);
        return h;
    }

    [[nodiscard]] size_t numStages() const noexcept { return stages_.size(); }

    [[nodiscard]] const Biquad& stage(size_t index) const noexcept { return stages_[index]; }

private:
    std::vector<Biquad> stages_;
};

// =============================================================================
// Coefficient Calculation Implementation
// =============================================================================

inline BiquadCoefficients BiquadCoefficients::notch(
    double frequency,
    double Q,
    double sampleRate
) {
    requirePositive("Biquad", "sampleRate", sampleRate);
    requirePositive("Biquad", "Q", Q);
    if (!std::isfinite(frequency) || frequency <= 0.0 || frequency >= sampleRate * 0.5) {
        throw InvalidParameter("Biquad", "frequency", frequency,
                               "must be in (0, sampleRate / 2)");
    }

    const double omega = kTwoPiD * frequency / sampleRate;
    const double cosOmega = std::cos(omega);
    const double alpha = std::sin(omega) / (2.0 * Q);
    const double a0 = 1.0 + alpha;

    return BiquadCoefficients{1.0 / a0, -2.0 * cosOmega / a0, 1.0 / a0,
                              -2.0 * cosOmega / a0, (1.0 - alpha) / a0};
}

} // namespace DSP
} // namespace Primer
