// ==============================================================================
// Layer 0: Core - Signal
// ==============================================================================
// Immutable sampled waveform: an ordered sequence of real samples plus the
// sample rate they were taken at. Created by generators, filters and the
// quantizer; consumed by the analysis processors. Every transformation
// returns a new Signal.
//
// Invariants: size() >= 1, sampleRate() finite and > 0.
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace Primer {
namespace DSP {

/// @brief Sampled real-valued signal with its sample rate
///
/// @par Usage
/// @code
/// Signal s({0.0f, 1.0f, 0.0f, -1.0f}, 4.0);
/// double fN = s.nyquist();          // 2 Hz
/// Signal louder = s.scaled(2.0f);   // s is unchanged
/// @endcode
class Signal {
public:
    /// @throws InvalidInput if samples is empty
    /// @throws InvalidParameter if sampleRate is not finite and > 0
    Signal(std::vector<float> samples, double sampleRate)
        : samples_(std::move(samples))
        , sampleRate_(sampleRate) {
        if (samples_.empty()) {
            throw InvalidInput("Signal", "length", 0, "must be >= 1");
        }
        requirePositive("Signal", "sampleRate", sampleRate_);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] const std::vector<float>& samples() const noexcept { return samples_; }
    [[nodiscard]] const float* data() const noexcept { return samples_.data(); }

    [[nodiscard]] float operator[](size_t index) const noexcept { return samples_[index]; }

    [[nodiscard]] auto begin() const noexcept { return samples_.begin(); }
    [[nodiscard]] auto end() const noexcept { return samples_.end(); }

    /// Duration in seconds (size / sampleRate)
    [[nodiscard]] double duration() const noexcept {
        return static_cast<double>(samples_.size()) / sampleRate_;
    }

    /// Nyquist frequency in Hz (sampleRate / 2)
    [[nodiscard]] double nyquist() const noexcept { return sampleRate_ * 0.5; }

    /// Time of sample index in seconds
    [[nodiscard]] double timeAt(size_t index) const noexcept {
        return static_cast<double>(index) / sampleRate_;
    }

    /// Root-mean-square value
    [[nodiscard]] double rms() const noexcept {
        double sum = 0.0;
        for (float x : samples_) {
            sum += static_cast<double>(x) * static_cast<double>(x);
        }
        return std::sqrt(sum / static_cast<double>(samples_.size()));
    }

    /// Mean power (mean of squared samples)
    [[nodiscard]] double power() const noexcept {
        const double r = rms();
        return r * r;
    }

    /// Largest absolute sample value
    [[nodiscard]] float peak() const noexcept {
        float p = 0.0f;
        for (float x : samples_) {
            p = std::max(p, std::abs(x));
        }
        return p;
    }

    // =========================================================================
    // Transformations (each returns a new Signal)
    // =========================================================================

    [[nodiscard]] Signal scaled(float gain) const {
        std::vector<float> out(samples_);
        for (float& x : out) x *= gain;
        return Signal(std::move(out), sampleRate_);
    }

    [[nodiscard]] Signal withOffset(float offset) const {
        std::vector<float> out(samples_);
        for (float& x : out) x += offset;
        return Signal(std::move(out), sampleRate_);
    }

    /// Sample-wise sum
    /// @throws InvalidInput if lengths or sample rates differ
    [[nodiscard]] Signal operator+(const Signal& other) const {
        requireCompatible(other);
        std::vector<float> out(samples_);
        for (size_t i = 0; i < out.size(); ++i) out[i] += other.samples_[i];
        return Signal(std::move(out), sampleRate_);
    }

    /// Sample-wise difference
    /// @throws InvalidInput if lengths or sample rates differ
    [[nodiscard]] Signal operator-(const Signal& other) const {
        requireCompatible(other);
        std::vector<float> out(samples_);
        for (size_t i = 0; i < out.size(); ++i) out[i] -= other.samples_[i];
        return Signal(std::move(out), sampleRate_);
    }

    /// @throws InvalidInput if lengths or sample rates differ
    void requireCompatible(const Signal& other) const {
        if (other.size() != size()) {
            throw InvalidInput("Signal", "length", other.size(),
                               "must equal " + detail::formatValue(size()));
        }
        if (other.sampleRate() != sampleRate_) {
            throw InvalidInput("Signal", "sampleRate", other.sampleRate(),
                               "must equal " + detail::formatValue(sampleRate_));
        }
    }

private:
    std::vector<float> samples_;
    double sampleRate_;
};

} // namespace DSP
} // namespace Primer
