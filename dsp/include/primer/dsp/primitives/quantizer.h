// ==============================================================================
// Layer 1: DSP Primitive - Quantizer
// ==============================================================================
// Finite-resolution ADC/DAC model: clip to +/- referenceVoltage, map each
// sample to the nearest of 2^bitDepth mid-rise levels, convert back.
//
// LSB = full-scale range / 2^bitDepth = 2 * referenceVoltage / 2^bitDepth.
// Code k in [-2^(b-1), 2^(b-1) - 1] covers [k * LSB, (k + 1) * LSB) and
// reconstructs to its centre (k + 1/2) * LSB, so the levels span
// +/- (referenceVoltage - LSB/2) and every sample in [-Vref, Vref] lands
// within LSB/2 of its level. There is no level at zero.
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/math_constants.h>
#include <primer/dsp/core/random.h>
#include <primer/dsp/core/signal.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Converter resolution and range
struct QuantizerConfig {
    static constexpr int kMinBitDepth = 1;
    static constexpr int kMaxBitDepth = 24;
    static constexpr uint32_t kDefaultSeed = 1;

    int bitDepth = 16;
    double referenceVoltage = 1.0;
    double dither = 0.0;            ///< TPDF dither amount in LSBs, [0, 1]
    uint32_t seed = kDefaultSeed;   ///< Dither PRNG seed
};

/// @brief Output of Quantizer::quantize
struct QuantizationResult {
    Signal quantized;       ///< Reconstructed (DAC) signal
    Signal error;           ///< original - quantized
    size_t clippedSamples;  ///< Samples outside [-referenceVoltage, referenceVoltage]
};

/// @brief Idealized SNR of a b-bit converter for a full-scale sine
///
/// @formula SNR = 6.02 * b + 1.76 dB
/// @note An upper bound under the full-scale sinusoid assumption, not a
///       measurement of any particular input.
[[nodiscard]] constexpr double theoreticalSnrDb(int bitDepth) noexcept {
    return kDbPerBit * static_cast<double>(bitDepth) + kFullScaleSineDb;
}

// =============================================================================
// Quantizer
// =============================================================================

/// @brief Uniform mid-rise quantizer with optional TPDF dither
///
/// @par Usage
/// @code
/// Quantizer q(QuantizerConfig{8, 1.0});
/// auto result = q.quantize(sine);
/// // |result.error[i]| <= q.lsb() / 2 wherever the input was not clipped
/// @endcode
class Quantizer {
public:
    /// @throws InvalidParameter for bitDepth outside [1, 24], a non-positive
    ///         reference voltage or dither outside [0, 1]
    explicit Quantizer(const QuantizerConfig& config)
        : config_(config)
        , rng_(config.seed) {
        if (config.bitDepth < QuantizerConfig::kMinBitDepth
            || config.bitDepth > QuantizerConfig::kMaxBitDepth) {
            throw InvalidParameter("Quantizer", "bitDepth", config.bitDepth, "must be in [1, 24]");
        }
        requirePositive("Quantizer", "referenceVoltage", config.referenceVoltage);
        if (!std::isfinite(config.dither) || config.dither < 0.0 || config.dither > 1.0) {
            throw InvalidParameter("Quantizer", "dither", config.dither, "must be in [0, 1]");
        }

        levels_ = int64_t{1} << config.bitDepth;
        lsb_ = 2.0 * config.referenceVoltage / static_cast<double>(levels_);
        minCode_ = static_cast<int32_t>(-(levels_ / 2));
        maxCode_ = static_cast<int32_t>(levels_ / 2 - 1);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const QuantizerConfig& config() const noexcept { return config_; }

    /// Step size between adjacent levels
    [[nodiscard]] double lsb() const noexcept { return lsb_; }

    /// Number of levels (2^bitDepth)
    [[nodiscard]] int64_t levels() const noexcept { return levels_; }

    [[nodiscard]] int32_t minCode() const noexcept { return minCode_; }
    [[nodiscard]] int32_t maxCode() const noexcept { return maxCode_; }

    [[nodiscard]] double theoreticalSnrDb() const noexcept {
        return DSP::theoreticalSnrDb(config_.bitDepth);
    }

    // =========================================================================
    // Conversion
    // =========================================================================

    /// @brief ADC: one integer code per sample
    [[nodiscard]] std::vector<int32_t> toCodes(const Signal& input) {
        std::vector<int32_t> codes(input.size());
        for (size_t i = 0; i < input.size(); ++i) {
            codes[i] = encode(input[i]);
        }
        return codes;
    }

    /// @brief DAC: (code + 1/2) * LSB
    /// @throws InvalidInput if codes is empty
    /// @throws InvalidParameter if a code is outside [minCode, maxCode] or
    ///         the sample rate is invalid
    [[nodiscard]] Signal fromCodes(const std::vector<int32_t>& codes, double sampleRate) const {
        if (codes.empty()) {
            throw InvalidInput("Quantizer", "codes.size", 0, "must be >= 1");
        }
        std::vector<float> samples(codes.size());
        for (size_t i = 0; i < codes.size(); ++i) {
            if (codes[i] < minCode_ || codes[i] > maxCode_) {
                throw InvalidParameter("Quantizer", "code", codes[i],
                                       "must be in [" + std::to_string(minCode_) + ", "
                                           + std::to_string(maxCode_) + "]");
            }
            samples[i] = static_cast<float>(decode(codes[i]));
        }
        return Signal(std::move(samples), sampleRate);
    }

    /// @brief ADC followed by DAC, with the error signal
    [[nodiscard]] QuantizationResult quantize(const Signal& input) {
        const double vref = config_.referenceVoltage;
        std::vector<float> quantized(input.size());
        std::vector<float> error(input.size());
        size_t clipped = 0;

        for (size_t i = 0; i < input.size(); ++i) {
            const double x = input[i];
            if (x > vref || x < -vref) ++clipped;
            const auto q = static_cast<float>(decode(encode(input[i])));
            quantized[i] = q;
            error[i] = input[i] - q;
        }

        return QuantizationResult{Signal(std::move(quantized), input.sampleRate()),
                                  Signal(std::move(error), input.sampleRate()),
                                  clipped};
    }

private:
    [[nodiscard]] int32_t encode(float sample) noexcept {
        const double vref = config_.referenceVoltage;
        double x = std::clamp(static_cast<double>(sample), -vref, vref);

        if (config_.dither > 0.0) {
            // TPDF: sum of two uniform [-0.5, 0.5] LSB draws
            const double tpdf = (rng_.nextUnit() - 0.5) + (rng_.nextUnit() - 0.5);
            x += tpdf * config_.dither * lsb_;
        }

        // The top edge x == Vref belongs to the last code
        const double code = std::floor(x / lsb_);
        return static_cast<int32_t>(
            std::clamp(code, static_cast<double>(minCode_), static_cast<double>(maxCode_)));
    }

    [[nodiscard]] double decode(int32_t code) const noexcept {
        return (static_cast<double>(code) + 0.5) * lsb_;
    }

    QuantizerConfig config_;
    Xorshift32 rng_;
    int64_t levels_ = 0;
    double lsb_ = 0.0;
    int32_t minCode_ = 0;
    int32_t maxCode_ = 0;
};

} // namespace DSP
} // namespace Primer
