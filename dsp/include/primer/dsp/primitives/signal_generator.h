// ==============================================================================
// Layer 1: DSP Primitive - Signal Generator
// ==============================================================================
// Whole-record generation of the classic test waveforms from semantic
// parameters: sine, cosine, square, triangle, sawtooth and white noise, plus
// multi-tone sums, harmonic test signals and unit impulses.
//
// Sample n is taken at t_n = n / sampleRate; a record has
// round(duration * sampleRate) samples.
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/math_constants.h>
#include <primer/dsp/core/random.h>
#include <primer/dsp/core/signal.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Parameters
// =============================================================================

/// Seed used by a default-constructed SignalGenerator
inline constexpr uint32_t kDefaultGeneratorSeed = 42;

/// @brief Waveform shapes
enum class WaveformType : uint8_t {
    Sine,       ///< A*sin(2*pi*f*t + phase)
    Cosine,     ///< A*cos(2*pi*f*t + phase)
    Square,     ///< +A first half of each period, -A second half
    Triangle,   ///< -A -> +A over the first half period, back over the second
    Sawtooth,   ///< -A -> +A ramp, then reset
    WhiteNoise  ///< Flat-spectrum noise, see NoiseDistribution
};

/// @brief Amplitude distribution of WhiteNoise
enum class NoiseDistribution : uint8_t {
    Uniform,  ///< Uniform in [-A, A]
    Gaussian  ///< Zero mean, standard deviation A
};

/// @brief Everything that defines one generated waveform
struct WaveformParams {
    WaveformType type = WaveformType::Sine;
    double amplitude = 1.0;
    double frequencyHz = 1000.0;   ///< Ignored by WhiteNoise
    double phaseRadians = 0.0;     ///< Ignored by WhiteNoise
    double durationSeconds = 1.0;
    double sampleRate = 8000.0;
    NoiseDistribution noise = NoiseDistribution::Gaussian;
};

/// @brief One sinusoidal component of a multi-tone signal
struct Tone {
    double frequencyHz = 0.0;
    double amplitude = 1.0;
    double phaseRadians = 0.0;
};

/// @brief Harmonic added on top of a fundamental
/// @note amplitude is absolute, not relative to the fundamental
struct Harmonic {
    int multiple = 2;
    double amplitude = 0.0;
};

// =============================================================================
// SignalGenerator
// =============================================================================

/// @brief Deterministic waveform generator with an instance-owned PRNG
///
/// Two generators constructed with the same seed produce identical noise.
/// Periodic waveforms do not touch the PRNG.
///
/// @par Usage
/// @code
/// SignalGenerator gen(1234);
/// Signal tone = gen.generate({WaveformType::Sine, 1.0, 1000.0, 0.0, 1.0, 8000.0});
/// @endcode
class SignalGenerator {
public:
    explicit SignalGenerator(uint32_t seed = kDefaultGeneratorSeed) noexcept
        : rng_(seed) {}

    /// Restart the noise sequence
    void reseed(uint32_t seed) noexcept { rng_.seed(seed); }

    /// @brief Generate one waveform
    /// @throws InvalidParameter if sampleRate <= 0, duration <= 0,
    ///         amplitude < 0, any value is non-finite, or the record would be
    ///         empty
    [[nodiscard]] Signal generate(const WaveformParams& params) {
        const size_t length = validatedLength(params.durationSeconds, params.sampleRate);
        requireNonNegative("SignalGenerator", "amplitude", params.amplitude);
        requireFinite("SignalGenerator", "frequencyHz", params.frequencyHz);
        requireFinite("SignalGenerator", "phaseRadians", params.phaseRadians);

        std::vector<float> samples(length);
        const double A = params.amplitude;

        if (params.type == WaveformType::WhiteNoise) {
            for (auto& s : samples) {
                s = static_cast<float>(A * nextNoise(params.noise));
            }
            return Signal(std::move(samples), params.sampleRate);
        }

        for (size_t n = 0; n < length; ++n) {
            const double t = static_cast<double>(n) / params.sampleRate;
            const double angle = kTwoPiD * params.frequencyHz * t + params.phaseRadians;
            samples[n] = static_cast<float>(A * periodic(params.type, angle));
        }
        return Signal(std::move(samples), params.sampleRate);
    }

    /// @brief Sum of sinusoids
    /// @throws InvalidParameter for an empty tone list or invalid timing
    [[nodiscard]] Signal generateMultiTone(const std::vector<Tone>& tones,
                                           double durationSeconds, double sampleRate) const {
        const size_t length = validatedLength(durationSeconds, sampleRate);
        if (tones.empty()) {
            throw InvalidParameter("SignalGenerator", "tones", 0, "must contain at least one tone");
        }
        for (const auto& tone : tones) {
            requireNonNegative("SignalGenerator", "tone.amplitude", tone.amplitude);
            requireFinite("SignalGenerator", "tone.frequencyHz", tone.frequencyHz);
            requireFinite("SignalGenerator", "tone.phaseRadians", tone.phaseRadians);
        }

        std::vector<float> samples(length);
        for (size_t n = 0; n < length; ++n) {
            const double t = static_cast<double>(n) / sampleRate;
            double acc = 0.0;
            for (const auto& tone : tones) {
                acc += tone.amplitude
                     * std::sin(kTwoPiD * tone.frequencyHz * t + tone.phaseRadians);
            }
            samples[n] = static_cast<float>(acc);
        }
        return Signal(std::move(samples), sampleRate);
    }

    /// @brief Fundamental sine plus harmonics plus optional Gaussian noise
    ///
    /// x(t) = A*sin(2*pi*f*t) + sum_h a_h*sin(2*pi*h*f*t) + N(0, noiseStd^2)
    ///
    /// @throws InvalidParameter for invalid timing, negative amplitudes,
    ///         harmonic multiples < 2 or negative noiseStd
    [[nodiscard]] Signal generateHarmonicTestSignal(double fundamentalHz, double amplitude,
                                                    const std::vector<Harmonic>& harmonics,
                                                    double noiseStd, double durationSeconds,
                                                    double sampleRate) {
        std::vector<Tone> tones;
        tones.push_back({fundamentalHz, amplitude, 0.0});
        for (const auto& h : harmonics) {
            if (h.multiple < 2) {
                throw InvalidParameter("SignalGenerator", "harmonic.multiple", h.multiple,
                                       "must be >= 2");
            }
            tones.push_back({fundamentalHz * h.multiple, h.amplitude, 0.0});
        }
        requireNonNegative("SignalGenerator", "noiseStd", noiseStd);

        Signal clean = generateMultiTone(tones, durationSeconds, sampleRate);
        if (noiseStd == 0.0) {
            return clean;
        }

        std::vector<float> samples(clean.samples());
        for (auto& s : samples) {
            s += static_cast<float>(noiseStd * rng_.nextGaussian());
        }
        return Signal(std::move(samples), sampleRate);
    }

    /// @brief Unit impulse: 1 at n = 0, zero elsewhere
    /// @throws InvalidParameter if length == 0 or sampleRate <= 0
    [[nodiscard]] static Signal generateImpulse(size_t length, double sampleRate) {
        if (length == 0) {
            throw InvalidParameter("SignalGenerator", "length", length, "must be >= 1");
        }
        requirePositive("SignalGenerator", "sampleRate", sampleRate);
        std::vector<float> samples(length, 0.0f);
        samples[0] = 1.0f;
        return Signal(std::move(samples), sampleRate);
    }

    /// @brief Value of a periodic waveform of unit amplitude at a phase angle
    [[nodiscard]] static double periodic(WaveformType type, double angle) noexcept {
        // Fraction of the current period in [0, 1)
        const double cycles = angle / kTwoPiD;
        const double frac = cycles - std::floor(cycles);

        switch (type) {
            case WaveformType::Sine:
                return std::sin(angle);
            case WaveformType::Cosine:
                return std::cos(angle);
            case WaveformType::Square:
                return frac < 0.5 ? 1.0 : -1.0;
            case WaveformType::Triangle:
                return frac < 0.5 ? -1.0 + 4.0 * frac : 3.0 - 4.0 * frac;
            case WaveformType::Sawtooth:
                return -1.0 + 2.0 * frac;
            case WaveformType::WhiteNoise:
                return 0.0;
        }
        return 0.0;
    }

private:
    /// round(duration * fs) after validating both
    static size_t validatedLength(double durationSeconds, double sampleRate) {
        requirePositive("SignalGenerator", "sampleRate", sampleRate);
        requirePositive("SignalGenerator", "durationSeconds", durationSeconds);
        const double count = std::round(durationSeconds * sampleRate);
        if (count < 1.0) {
            throw InvalidParameter("SignalGenerator", "length", count,
                                   "duration * sampleRate must round to >= 1 sample");
        }
        return static_cast<size_t>(count);
    }

    double nextNoise(NoiseDistribution distribution) noexcept {
        if (distribution == NoiseDistribution::Gaussian) {
            return rng_.nextGaussian();
        }
        // nextUnit() is in (0, 1]; map to [-1, 1)
        return 1.0 - 2.0 * rng_.nextUnit();
    }

    Xorshift32 rng_;
};

} // namespace DSP
} // namespace Primer
