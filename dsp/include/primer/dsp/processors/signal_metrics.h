// ==============================================================================
// Layer 2: DSP Processor - Signal Quality Metrics
// ==============================================================================
// SNR, THD, SINAD, SFDR and ENOB of a tone, measured from its spectrum or
// from an ideal/measured signal pair.
//
// Spectral bins are classified as:
//   DC region     bins [0, dcBins), never counted
//   fundamental   fundamental bin +/- fundamentalBinWindow
//   harmonics     bins of 2f .. (harmonicCount+1)f +/- harmonicBinWindow,
//                 folded into [0, fs/2] when they alias
//   noise         everything else
//
//   SNR   = 10 log10(signal / noise)
//   THD   = 10 log10(distortion / signal)
//   SINAD = 10 log10(signal / (noise + distortion))
//   SFDR  = 10 log10(signal / largest spurious bin)
//   ENOB  = (SINAD - 1.76) / 6.02
//
// Zero denominators saturate at +/- kMetricCeilingDb.
// ==============================================================================

#pragma once

#include <primer/dsp/core/db_utils.h>
#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/math_constants.h>
#include <primer/dsp/core/signal.h>
#include <primer/dsp/processors/sampling_evaluator.h>
#include <primer/dsp/processors/spectrum_analyzer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Configuration / Result
// =============================================================================

/// @brief Bin classification settings
struct MetricsConfig {
    double fundamentalHz = 0.0;      ///< 0 = largest bin above the DC region
    int harmonicCount = 5;           ///< Harmonics 2 .. harmonicCount + 1
    int fundamentalBinWindow = 2;    ///< Hann main lobe is +/- 2 bins
    int harmonicBinWindow = 1;
    int dcBins = 3;                  ///< Excluded low bins (DC leakage)
};

/// @brief Quality metrics of one measurement
struct MetricsResult {
    double snrDb = 0.0;
    double thdDb = 0.0;
    double sinadDb = 0.0;
    double sfdrDb = 0.0;
    double enob = 0.0;

    // Spectral diagnostics (single-sided bin power of the analyzed spectrum)
    size_t fundamentalBin = 0;
    double fundamentalHz = 0.0;
    double signalPower = 0.0;
    double distortionPower = 0.0;
    double noisePower = 0.0;
    size_t spurBin = 0;
    std::vector<double> harmonicFrequenciesHz;  ///< After folding

    // Time-domain diagnostics, set only by the ideal/measured evaluation
    double idealPower = 0.0;   ///< Mean square of the ideal signal
    double errorPower = 0.0;   ///< Mean square of measured - ideal
};

/// @brief ENOB from SINAD
/// @formula ENOB = (SINAD - 1.76) / 6.02
[[nodiscard]] constexpr double enobFromSinad(double sinadDb) noexcept {
    return (sinadDb - kFullScaleSineDb) / kDbPerBit;
}

// =============================================================================
// MetricsEvaluator
// =============================================================================

/// @brief Computes MetricsResult from spectra or signal pairs
///
/// @par Usage
/// @code
/// MetricsEvaluator eval;                       // auto-detect the fundamental
/// MetricsResult m = eval.evaluate(ideal, quantized);
/// // m.enob ~= bit depth for a full-scale sine
/// @endcode
class MetricsEvaluator {
public:
    MetricsEvaluator() = default;

    /// @throws InvalidParameter for negative windows or harmonic count
    explicit MetricsEvaluator(const MetricsConfig& config)
        : config_(config) {
        requireNonNegative("MetricsEvaluator", "fundamentalHz", config.fundamentalHz);
        if (config.harmonicCount < 0) {
            throw InvalidParameter("MetricsEvaluator", "harmonicCount", config.harmonicCount,
                                   "must be >= 0");
        }
        if (config.fundamentalBinWindow < 0) {
            throw InvalidParameter("MetricsEvaluator", "fundamentalBinWindow",
                                   config.fundamentalBinWindow, "must be >= 0");
        }
        if (config.harmonicBinWindow < 0) {
            throw InvalidParameter("MetricsEvaluator", "harmonicBinWindow",
                                   config.harmonicBinWindow, "must be >= 0");
        }
        if (config.dcBins < 0) {
            throw InvalidParameter("MetricsEvaluator", "dcBins", config.dcBins, "must be >= 0");
        }
    }

    [[nodiscard]] const MetricsConfig& config() const noexcept { return config_; }

    /// @brief Metrics from a spectrum
    /// @throws InvalidSpectrum if the spectrum has fewer than 3 bins or no
    ///         fundamental can be located
    /// @throws InvalidParameter if a requested fundamental is outside (0, fs/2)
    [[nodiscard]] MetricsResult evaluate(const Spectrum& spectrum) const {
        const size_t numBins = spectrum.numBins();
        if (numBins < 3) {
            throw InvalidSpectrum("MetricsEvaluator", "bins", numBins, "must be >= 3");
        }

        const std::vector<double> power = singleSidedPower(spectrum);
        const auto dcEnd = std::min(static_cast<size_t>(config_.dcBins), numBins - 1);

        MetricsResult result;
        result.fundamentalBin = locateFundamental(spectrum, power, dcEnd);
        result.fundamentalHz = (config_.fundamentalHz > 0.0)
            ? config_.fundamentalHz
            : static_cast<double>(result.fundamentalBin) * spectrum.resolution();

        // Bin roles
        std::vector<Role> role(numBins, Role::Noise);
        for (size_t k = 0; k < dcEnd; ++k) role[k] = Role::Dc;
        markWindow(role, result.fundamentalBin, config_.fundamentalBinWindow, Role::Fundamental,
                   true);

        for (int h = 2; h <= config_.harmonicCount + 1; ++h) {
            const double folded = Sampling::aliasedFrequency(
                result.fundamentalHz * h, spectrum.sampleRate());
            result.harmonicFrequenciesHz.push_back(folded);

            const size_t bin = spectrum.binForFrequency(folded);
            if (role[bin] == Role::Dc || role[bin] == Role::Fundamental) continue;
            markWindow(role, bin, config_.harmonicBinWindow, Role::Harmonic, false);
        }

        double largestSpur = 0.0;
        for (size_t k = 0; k < numBins; ++k) {
            switch (role[k]) {
                case Role::Dc:
                    break;
                case Role::Fundamental:
                    result.signalPower += power[k];
                    break;
                case Role::Harmonic:
                    result.distortionPower += power[k];
                    break;
                case Role::Noise:
                    result.noisePower += power[k];
                    break;
            }
            if ((role[k] == Role::Harmonic || role[k] == Role::Noise) && power[k] > largestSpur) {
                largestSpur = power[k];
                result.spurBin = k;
            }
        }

        if (result.signalPower <= 0.0) {
            throw InvalidSpectrum("MetricsEvaluator", "fundamentalPower", result.signalPower,
                                  "fundamental bin carries no energy");
        }

        result.snrDb = powerRatioDb(result.signalPower, result.noisePower);
        result.thdDb = powerRatioDb(result.distortionPower, result.signalPower);
        result.sinadDb = powerRatioDb(result.signalPower,
                                      result.noisePower + result.distortionPower);
        result.sfdrDb = powerRatioDb(result.signalPower, largestSpur);
        result.enob = enobFromSinad(result.sinadDb);
        return result;
    }

    /// @brief Metrics of a measured signal against its ideal
    ///
    /// SNR and SINAD come from the time-domain error (measured - ideal), as
    /// an ADC test measures them, and are reported with idealPower and
    /// errorPower. THD, SFDR and the spectral diagnostics come from the
    /// Hann-windowed spectrum of the measured signal.
    ///
    /// @throws InvalidInput if the signals differ in length or sample rate
    /// @throws InvalidSpectrum as evaluate(const Spectrum&)
    [[nodiscard]] MetricsResult evaluate(const Signal& ideal, const Signal& measured) const {
        ideal.requireCompatible(measured);

        const SpectrumAnalyzer analyzer(AnalyzerConfig{WindowType::Hann});
        MetricsResult result = evaluate(analyzer.analyze(measured));

        result.idealPower = ideal.power();
        result.errorPower = (measured - ideal).power();

        result.snrDb = powerRatioDb(result.idealPower, result.errorPower);
        result.sinadDb = result.snrDb;
        result.enob = enobFromSinad(result.sinadDb);
        return result;
    }

private:
    enum class Role : uint8_t { Dc, Fundamental, Harmonic, Noise };

    /// |X[k]|^2 with interior bins doubled (they stand for +/- k)
    static std::vector<double> singleSidedPower(const Spectrum& spectrum) {
        const auto& bins = spectrum.bins();
        const size_t N = spectrum.size();
        std::vector<double> power(bins.size());
        for (size_t k = 0; k < bins.size(); ++k) {
            const bool unpaired = (k == 0) || (N % 2 == 0 && k == N / 2);
            power[k] = bins[k].norm() * (unpaired ? 1.0 : 2.0);
        }
        return power;
    }

    size_t locateFundamental(const Spectrum& spectrum, const std::vector<double>& power,
                             size_t dcEnd) const {
        if (config_.fundamentalHz > 0.0) {
            const double nyquist = spectrum.sampleRate() * 0.5;
            if (config_.fundamentalHz >= nyquist) {
                throw InvalidParameter("MetricsEvaluator", "fundamentalHz", config_.fundamentalHz,
                                       "must be in (0, " + detail::formatValue(nyquist) + ")");
            }
            return spectrum.binForFrequency(config_.fundamentalHz);
        }

        const size_t start = std::max<size_t>(dcEnd, 1);
        size_t best = start;
        double largest = power[start];
        for (size_t k = start + 1; k < power.size(); ++k) {
            if (power[k] > largest) {
                largest = power[k];
                best = k;
            }
        }

        if (largest <= 0.0) {
            throw InvalidSpectrum("MetricsEvaluator", "peakPower", largest,
                                  "no fundamental: spectrum is zero");
        }

        // Flatness is judged on raw |X[k]|, where the Nyquist bin is not doubled
        const auto& bins = spectrum.bins();
        double lowest = bins[start].magnitude();
        double highest = lowest;
        for (size_t k = start + 1; k < bins.size(); ++k) {
            lowest = std::min(lowest, static_cast<double>(bins[k].magnitude()));
            highest = std::max(highest, static_cast<double>(bins[k].magnitude()));
        }
        if (bins.size() - start > 1 && highest <= lowest * (1.0 + 1e-6)) {
            throw InvalidSpectrum("MetricsEvaluator", "peakPower", largest,
                                  "no fundamental: spectrum is flat");
        }
        return best;
    }

    /// Assign role to center +/- halfWidth. Only noise bins are taken unless
    /// overwrite is set; the DC region is never reassigned.
    static void markWindow(std::vector<Role>& role, size_t center, int halfWidth, Role value,
                           bool overwrite) {
        const auto lo = static_cast<std::ptrdiff_t>(center) - halfWidth;
        const auto hi = static_cast<std::ptrdiff_t>(center) + halfWidth;
        const auto last = static_cast<std::ptrdiff_t>(role.size()) - 1;
        for (auto k = std::max<std::ptrdiff_t>(lo, 0); k <= std::min(hi, last); ++k) {
            auto& r = role[static_cast<size_t>(k)];
            if (r == Role::Dc) continue;
            if (overwrite || r == Role::Noise) r = value;
        }
    }

    MetricsConfig config_;
};

} // namespace DSP
} // namespace Primer
