// ==============================================================================
// Layer 2: DSP Processor - Sampling / Aliasing Evaluator
// ==============================================================================
// Nyquist and aliasing predictions for a tone sampled at a given rate, and
// illustrative reconstruction of a continuous-time approximation from
// uniformly spaced samples.
//
// Alias of a tone at f sampled at fs: |f - round(f / fs) * fs|, which always
// lies in [0, fs / 2].
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/interpolation.h>
#include <primer/dsp/core/signal.h>
#include <primer/dsp/primitives/signal_generator.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Primer {
namespace DSP {

/// @brief How reconstruct() fills the time between samples
enum class ReconstructionMethod : uint8_t {
    ZeroOrderHold,  ///< Hold each sample until the next
    Linear,         ///< Straight lines between samples
    Cubic,          ///< Catmull-Rom spline through the samples
    Sinc            ///< Whittaker-Shannon sum over the whole record
};

/// @brief Sampling prediction for one tone at one sample rate
struct SamplingReport {
    double nyquistHz = 0.0;      ///< fs / 2
    bool aliased = false;        ///< |f| > fs / 2
    double aliasHz = 0.0;        ///< Apparent frequency after sampling
    double minimumRateHz = 0.0;  ///< Lowest alias-free rate, 2 * |f|
};

namespace Sampling {

/// @throws InvalidParameter if sampleRate is not finite and > 0
[[nodiscard]] inline double nyquistFrequency(double sampleRate) {
    requirePositive("Sampling", "sampleRate", sampleRate);
    return sampleRate * 0.5;
}

/// @brief True when a tone at frequencyHz lies above the Nyquist frequency
/// @throws InvalidParameter for an invalid sample rate or non-finite frequency
[[nodiscard]] inline bool isAliased(double frequencyHz, double sampleRate) {
    const double nyquist = nyquistFrequency(sampleRate);
    requireFinite("Sampling", "frequencyHz", frequencyHz);
    return std::abs(frequencyHz) > nyquist;
}

/// @brief Apparent frequency of a tone after sampling
/// @return Value in [0, sampleRate / 2]; negative input is treated as |f|
/// @throws InvalidParameter for an invalid sample rate or non-finite frequency
[[nodiscard]] inline double aliasedFrequency(double frequencyHz, double sampleRate) {
    requirePositive("Sampling", "sampleRate", sampleRate);
    requireFinite("Sampling", "frequencyHz", frequencyHz);
    const double f = std::abs(frequencyHz);
    return std::abs(f - std::round(f / sampleRate) * sampleRate);
}

/// @brief All predictions for one tone at one rate
[[nodiscard]] inline SamplingReport analyzeSampling(double frequencyHz, double sampleRate) {
    SamplingReport report;
    report.nyquistHz = nyquistFrequency(sampleRate);
    report.aliased = isAliased(frequencyHz, sampleRate);
    report.aliasHz = aliasedFrequency(frequencyHz, sampleRate);
    report.minimumRateHz = 2.0 * std::abs(frequencyHz);
    return report;
}

/// @brief Sample a continuous-model waveform at the given rate
/// @note Noise waveforms use a SignalGenerator with the default seed
/// @throws InvalidParameter as SignalGenerator::generate
[[nodiscard]] inline Signal sample(WaveformParams params, double sampleRate) {
    params.sampleRate = sampleRate;
    SignalGenerator generator;
    return generator.generate(params);
}

/// @brief Continuous-time approximation of x at fractional sample position u
[[nodiscard]] inline float valueAt(const std::vector<float>& x, double u,
                                   ReconstructionMethod method) noexcept {
    const size_t N = x.size();
    const auto last = static_cast<std::ptrdiff_t>(N) - 1;
    const auto clampIndex = [last](std::ptrdiff_t i) {
        return static_cast<size_t>(std::clamp<std::ptrdiff_t>(i, 0, last));
    };

    switch (method) {
        case ReconstructionMethod::ZeroOrderHold:
            return x[clampIndex(static_cast<std::ptrdiff_t>(std::floor(u)))];

        case ReconstructionMethod::Linear: {
            if (N == 1) return x[0];
            // Past the last sample, keep extrapolating the final segment
            const auto i = std::min(static_cast<std::ptrdiff_t>(std::floor(u)), last - 1);
            const auto t = static_cast<float>(u - static_cast<double>(i));
            return Interpolation::linearInterpolate(x[clampIndex(i)], x[clampIndex(i + 1)], t);
        }

        case ReconstructionMethod::Cubic: {
            const auto i = std::min(static_cast<std::ptrdiff_t>(std::floor(u)), last);
            const auto t = static_cast<float>(u - static_cast<double>(i));
            return Interpolation::cubicHermiteInterpolate(
                x[clampIndex(i - 1)], x[clampIndex(i)], x[clampIndex(i + 1)],
                x[clampIndex(i + 2)], t);
        }

        case ReconstructionMethod::Sinc: {
            double acc = 0.0;
            for (size_t n = 0; n < N; ++n) {
                acc += static_cast<double>(x[n]) * Interpolation::sinc(u - static_cast<double>(n));
            }
            return static_cast<float>(acc);
        }
    }
    return 0.0f;
}

/// @brief Resample a record onto a denser (or sparser) time grid
///
/// The result covers the same duration: round(duration * outputRate)
/// samples, sample m at t = m / outputRate. Illustrative only; the sinc sum
/// is truncated to the record.
///
/// @throws InvalidParameter if outputRate is not finite and > 0
[[nodiscard]] inline Signal reconstruct(const Signal& samples, double outputRate,
                                        ReconstructionMethod method = ReconstructionMethod::Sinc) {
    requirePositive("Sampling", "outputRate", outputRate);

    const double count = std::max(1.0, std::round(samples.duration() * outputRate));
    const auto length = static_cast<size_t>(count);
    const double ratio = samples.sampleRate() / outputRate;

    std::vector<float> out(length);
    for (size_t m = 0; m < length; ++m) {
        out[m] = valueAt(samples.samples(), static_cast<double>(m) * ratio, method);
    }
    return Signal(std::move(out), outputRate);
}

} // namespace Sampling

} // namespace DSP
} // namespace Primer
