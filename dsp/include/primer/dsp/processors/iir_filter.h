// ==============================================================================
// Layer 2: DSP Processor - IIR Filter
// ==============================================================================
// Designed IIR filter (Butterworth, Chebyshev I or Bessel; lowpass, highpass,
// bandpass or notch) realized as a cascade of biquad sections, applied to
// whole Signals.
//
// Design: FilterDesign::designDigital() yields the digital pole/zero set;
// poles are paired into second-order sections (conjugate pairs together,
// real poles two at a time, one first-order section for an odd leftover)
// and every section is scaled to unity gain at the passband reference point.
// The first section then carries the overall passband gain.
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/filter_design.h>
#include <primer/dsp/core/signal.h>
#include <primer/dsp/primitives/biquad.h>

#include <complex>
#include <cstddef>
#include <vector>

namespace Primer {
namespace DSP {

/// @brief One point of a frequency response
struct FrequencyPoint {
    double frequencyHz = 0.0;
    double magnitudeDb = 0.0;
    double phaseRadians = 0.0;
};

/// @brief Designed IIR filter, immutable after construction
///
/// @par Usage
/// @code
/// FilterSpec spec;
/// spec.family = FilterFamily::Butterworth;
/// spec.kind = FilterKind::Lowpass;
/// spec.order = 4;
/// spec.cutoffs = {1000.0};
/// spec.sampleRate = 48000.0;
/// IirFilter lp(spec);
/// Signal y = lp.processZeroPhase(x);
/// @endcode
class IirFilter {
public:
    /// @throws InvalidSpec if the spec violates any constraint
    explicit IirFilter(const FilterSpec& spec);

    /// @brief Single-biquad notch at centerHz with quality factor q
    /// @throws InvalidParameter for q <= 0, centerHz outside (0, fs/2) or
    ///         an invalid sample rate
    [[nodiscard]] static IirFilter notch(double centerHz, double q, double sampleRate);

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Causal filtering from zero initial state
    /// @throws InvalidInput if the signal's sample rate differs from the design rate
    [[nodiscard]] Signal process(const Signal& input) const;

    /// @brief Forward-backward filtering: zero phase, squared magnitude
    /// @throws InvalidInput if the signal's sample rate differs from the design rate
    [[nodiscard]] Signal processZeroPhase(const Signal& input) const;

    /// @brief First length samples of the response to a unit impulse
    /// @throws InvalidParameter if length == 0
    [[nodiscard]] Signal impulseResponse(size_t length) const;

    // =========================================================================
    // Analysis
    // =========================================================================

    /// Complex response at a frequency in Hz
    [[nodiscard]] std::complex<double> response(double frequencyHz) const noexcept;

    /// 20*log10 |H(f)|, floored at -200 dB
    [[nodiscard]] double magnitudeDb(double frequencyHz) const noexcept;

    /// @brief Response at `points` frequencies k * (fs/2) / points, k = 0..points-1
    /// @throws InvalidParameter if points == 0
    [[nodiscard]] std::vector<FrequencyPoint> frequencyResponse(size_t points) const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Number of poles (2 * spec order for bandpass and notch designs)
    [[nodiscard]] int order() const noexcept { return order_; }

    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

    [[nodiscard]] const std::vector<BiquadCoefficients>& sections() const noexcept {
        return sections_;
    }

    /// All poles strictly inside the unit circle
    [[nodiscard]] bool isStable() const noexcept;

private:
    IirFilter(std::vector<BiquadCoefficients> sections, int order, double sampleRate);

    void requireMatchingRate(const Signal& input) const;

    std::vector<BiquadCoefficients> sections_;
    int order_ = 0;
    double sampleRate_ = 0.0;
};

/// @brief Pair a digital pole/zero set into normalized biquad sections
/// @param pz Digital design from FilterDesign::designDigital()
/// @param kind Response kind (decides where each section's zeros go)
/// @param reference Passband reference point on the unit circle
[[nodiscard]] std::vector<BiquadCoefficients> toSections(const PoleZeroLocations& pz,
                                                         FilterKind kind,
                                                         std::complex<double> reference);

} // namespace DSP
} // namespace Primer
