// ==============================================================================
// Layer 2: DSP Processor - Spectrum Analyzer
// ==============================================================================
// Whole-record discrete Fourier analysis of a Signal.
//
// The Spectrum holds bins 0..N/2 of an N-sample real signal; bins above N/2
// follow from conjugate symmetry. Views:
//   magnitude  |X[k]|
//   power      |X[k]|^2 / N
//   phase      arg X[k], principal value in (-pi, pi]
//   amplitude  single-sided tone amplitude 2|X[k]| / (N * coherentGain)
//   frequency  k * fs / N
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/math_constants.h>
#include <primer/dsp/core/signal.h>
#include <primer/dsp/core/spectral_simd.h>
#include <primer/dsp/core/window_functions.h>
#include <primer/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Spectrum
// =============================================================================

/// @brief Discrete spectrum of a real record
class Spectrum {
public:
    /// @param bins Complex bins 0..size/2 (size/2 + 1 of them)
    /// @param size Length N of the analyzed record
    /// @param sampleRate Sample rate of the analyzed record
    /// @param window Window applied before the transform
    /// @throws InvalidInput if size < 2 or the bin count does not match
    /// @throws InvalidParameter if sampleRate is not finite and > 0
    Spectrum(std::vector<Complex> bins, size_t size, double sampleRate,
             WindowType window = WindowType::Rectangular)
        : bins_(std::move(bins))
        , size_(size)
        , sampleRate_(sampleRate)
        , window_(window) {
        if (size_ < 2) {
            throw InvalidInput("Spectrum", "size", size_, "must be >= 2");
        }
        if (bins_.size() != size_ / 2 + 1) {
            throw InvalidInput("Spectrum", "bins.size", bins_.size(),
                               "must equal size / 2 + 1 = " + std::to_string(size_ / 2 + 1));
        }
        requirePositive("Spectrum", "sampleRate", sampleRate_);
        coherentGain_ = Window::coherentGain(window_, size_);

        interleaved_.resize(bins_.size() * 2);
        for (size_t k = 0; k < bins_.size(); ++k) {
            interleaved_[2 * k] = bins_[k].real;
            interleaved_[2 * k + 1] = bins_[k].imag;
        }
    }

    // =========================================================================
    // Shape
    // =========================================================================

    /// Length N of the analyzed record
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// Number of stored bins (N/2 + 1)
    [[nodiscard]] size_t numBins() const noexcept { return bins_.size(); }

    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] WindowType window() const noexcept { return window_; }
    [[nodiscard]] double coherentGain() const noexcept { return coherentGain_; }

    /// Bin spacing in Hz (fs / N)
    [[nodiscard]] double resolution() const noexcept {
        return sampleRate_ / static_cast<double>(size_);
    }

    [[nodiscard]] const std::vector<Complex>& bins() const noexcept { return bins_; }

    /// Bin k for any k in [0, N): bins past N/2 are conjugates of N - k
    /// @throws InvalidParameter if k >= N
    [[nodiscard]] Complex binAt(size_t k) const {
        if (k >= size_) {
            throw InvalidParameter("Spectrum", "bin", k,
                                   "must be < size = " + std::to_string(size_));
        }
        return (k < bins_.size()) ? bins_[k] : bins_[size_ - k].conjugate();
    }

    // =========================================================================
    // Views
    // =========================================================================

    [[nodiscard]] std::vector<float> magnitude() const {
        std::vector<float> mags(bins_.size());
        std::vector<float> phases(bins_.size());
        computePolarBulk(interleaved_.data(), bins_.size(), mags.data(), phases.data());
        return mags;
    }

    /// 20*log10 |X[k]|, floored at kMinMagnitude
    [[nodiscard]] std::vector<float> magnitudeDb() const {
        std::vector<float> mags = magnitude();
        std::vector<float> dB(mags.size());
        batchMagnitudeToDb(mags.data(), dB.data(), mags.size());
        return dB;
    }

    /// |X[k]|^2 / N
    [[nodiscard]] std::vector<float> power() const {
        std::vector<float> out(bins_.size());
        computePowerBulk(interleaved_.data(), bins_.size(),
                         1.0f / static_cast<float>(size_), out.data());
        return out;
    }

    /// Principal value in (-pi, pi]
    [[nodiscard]] std::vector<float> phase() const {
        std::vector<float> mags(bins_.size());
        std::vector<float> phases(bins_.size());
        computePolarBulk(interleaved_.data(), bins_.size(), mags.data(), phases.data());
        for (auto& p : phases) {
            if (p <= -kPi) p = kPi;
        }
        return phases;
    }

    /// k * fs / N for each stored bin
    [[nodiscard]] std::vector<double> frequencies() const {
        std::vector<double> freqs(bins_.size());
        const double df = resolution();
        for (size_t k = 0; k < freqs.size(); ++k) {
            freqs[k] = static_cast<double>(k) * df;
        }
        return freqs;
    }

    /// Single-sided amplitude: a coherent tone of amplitude A reads A at its bin
    [[nodiscard]] std::vector<float> amplitude() const {
        std::vector<float> amps = magnitude();
        const double scale = 1.0 / (static_cast<double>(size_) * coherentGain_);
        for (size_t k = 0; k < amps.size(); ++k) {
            const bool unpaired = (k == 0) || (size_ % 2 == 0 && k == size_ / 2);
            amps[k] = static_cast<float>(amps[k] * scale * (unpaired ? 1.0 : 2.0));
        }
        return amps;
    }

    /// Index of the largest-magnitude bin excluding DC (lowest index on ties)
    [[nodiscard]] size_t peakBin() const noexcept {
        size_t best = 1;
        double bestNorm = -1.0;
        for (size_t k = 1; k < bins_.size(); ++k) {
            const double n = bins_[k].norm();
            if (n > bestNorm) {
                bestNorm = n;
                best = k;
            }
        }
        return best;
    }

    /// Frequency of peakBin()
    [[nodiscard]] double peakFrequency() const noexcept {
        return static_cast<double>(peakBin()) * resolution();
    }

    /// Nearest stored bin to a frequency, clamped to [0, N/2]
    [[nodiscard]] size_t binForFrequency(double frequencyHz) const noexcept {
        const double k = std::round(std::abs(frequencyHz) / resolution());
        const auto last = static_cast<double>(bins_.size() - 1);
        return static_cast<size_t>(std::min(k, last));
    }

private:
    std::vector<Complex> bins_;
    std::vector<float> interleaved_;  ///< {re, im} pairs for the SIMD kernels
    size_t size_;
    double sampleRate_;
    WindowType window_;
    double coherentGain_ = 1.0;
};

// =============================================================================
// SpectrumAnalyzer
// =============================================================================

/// @brief Analyzer settings
struct AnalyzerConfig {
    WindowType window = WindowType::Rectangular;  ///< Rectangular = plain DFT
};

/// @brief Computes the Spectrum of a Signal
///
/// @par Usage
/// @code
/// SpectrumAnalyzer analyzer(AnalyzerConfig{WindowType::Hann});
/// Spectrum s = analyzer.analyze(signal);
/// double f = s.peakFrequency();
/// @endcode
class SpectrumAnalyzer {
public:
    SpectrumAnalyzer() = default;

    explicit SpectrumAnalyzer(const AnalyzerConfig& config) noexcept
        : config_(config) {}

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

    /// @throws InvalidInput if the signal has fewer than 2 samples
    [[nodiscard]] Spectrum analyze(const Signal& signal) const {
        const size_t N = signal.size();
        if (N < 2) {
            throw InvalidInput("SpectrumAnalyzer", "length", N, "must be >= 2");
        }

        std::vector<float> windowed(signal.samples());
        if (config_.window != WindowType::Rectangular) {
            const std::vector<float> w = Window::generate(config_.window, N);
            for (size_t n = 0; n < N; ++n) windowed[n] *= w[n];
        }

        return Spectrum(realSpectrum(windowed.data(), N), N, signal.sampleRate(),
                        config_.window);
    }

private:
    AnalyzerConfig config_;
};

} // namespace DSP
} // namespace Primer
