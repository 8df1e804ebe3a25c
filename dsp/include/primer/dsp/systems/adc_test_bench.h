// ==============================================================================
// Layer 3: System Component - ADC Test Bench
// ==============================================================================
// Automated converter characterization: for every combination of bit depth,
// input noise level and tone amplitude, generate a harmonic test tone,
// quantize it, analyze the Hann-windowed spectrum and record SNR, THD, SINAD
// and ENOB. Results export as CSV.
//
// Composes: SignalGenerator (L1), Quantizer (L1), SpectrumAnalyzer (L2),
//           MetricsEvaluator (L2)
// ==============================================================================

#pragma once

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/signal.h>
#include <primer/dsp/primitives/quantizer.h>
#include <primer/dsp/primitives/signal_generator.h>
#include <primer/dsp/processors/signal_metrics.h>
#include <primer/dsp/processors/spectrum_analyzer.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <vector>

namespace Primer {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Sweep definition (defaults reproduce the reference RF ADC sweep)
struct AdcTestConfig {
    static constexpr double kDefaultSampleRate = 200e3;
    static constexpr double kDefaultDuration = 0.01;
    static constexpr double kDefaultFundamental = 10e3;
    static constexpr uint32_t kDefaultSeed = 2024;

    double sampleRate = kDefaultSampleRate;
    double durationSeconds = kDefaultDuration;
    double fundamentalHz = kDefaultFundamental;
    std::vector<Harmonic> harmonics{{2, 0.05}, {3, 0.02}};
    std::vector<int> bitDepths{8, 10, 12};
    std::vector<double> noiseStds{1e-4, 1e-3, 5e-3, 1e-2};
    std::vector<double> amplitudes{0.8, 0.5};

    /// Full scale follows the signal peak, so the peak sample falls in the top
    /// code without clipping; when false, referenceVoltage is used as is
    bool scaleToPeak = true;
    double referenceVoltage = 1.0;

    int harmonicCount = 5;  ///< Harmonics counted by THD: 2 .. harmonicCount + 1
    uint32_t seed = kDefaultSeed;
};

/// @brief Metrics of one sweep point
struct AdcTestRow {
    int bits = 0;
    double noiseStd = 0.0;
    double amplitude = 0.0;
    double snrDb = 0.0;
    double thdDb = 0.0;
    double sinadDb = 0.0;
    double enob = 0.0;
};

// =============================================================================
// Sweep
// =============================================================================

/// @brief Run every (bits, noise, amplitude) combination, bits outermost
/// @throws InvalidParameter for empty sweep lists or invalid values
[[nodiscard]] inline std::vector<AdcTestRow> runAdcSweep(const AdcTestConfig& config) {
    if (config.bitDepths.empty()) {
        throw InvalidParameter("AdcTestBench", "bitDepths.size", 0, "must be >= 1");
    }
    if (config.noiseStds.empty()) {
        throw InvalidParameter("AdcTestBench", "noiseStds.size", 0, "must be >= 1");
    }
    if (config.amplitudes.empty()) {
        throw InvalidParameter("AdcTestBench", "amplitudes.size", 0, "must be >= 1");
    }
    for (double a : config.amplitudes) requirePositive("AdcTestBench", "amplitude", a);
    if (!config.scaleToPeak) {
        requirePositive("AdcTestBench", "referenceVoltage", config.referenceVoltage);
    }

    MetricsConfig metricsConfig;
    metricsConfig.fundamentalHz = config.fundamentalHz;
    metricsConfig.harmonicCount = config.harmonicCount;
    const MetricsEvaluator evaluator(metricsConfig);
    const SpectrumAnalyzer analyzer(AnalyzerConfig{WindowType::Hann});

    SignalGenerator generator(config.seed);
    std::vector<AdcTestRow> rows;
    rows.reserve(config.bitDepths.size() * config.noiseStds.size() * config.amplitudes.size());

    for (int bits : config.bitDepths) {
        for (double noiseStd : config.noiseStds) {
            for (double amplitude : config.amplitudes) {
                const Signal input = generator.generateHarmonicTestSignal(
                    config.fundamentalHz, amplitude, config.harmonics, noiseStd,
                    config.durationSeconds, config.sampleRate);

                QuantizerConfig qc;
                qc.bitDepth = bits;
                qc.referenceVoltage = config.scaleToPeak
                    ? static_cast<double>(input.peak())
                    : config.referenceVoltage;
                Quantizer quantizer(qc);

                const Signal output = quantizer.quantize(input).quantized;
                const MetricsResult m = evaluator.evaluate(analyzer.analyze(output));

                rows.push_back({bits, noiseStd, amplitude, m.snrDb, m.thdDb, m.sinadDb, m.enob});
            }
        }
    }
    return rows;
}

// =============================================================================
// CSV Export
// =============================================================================

/// Header row of writeCsv()
inline constexpr const char* kAdcCsvHeader = "bits,noise_std,amplitude,snr_db,thd_db,sinad_db,enob";

/// @brief Write rows as CSV (header + one line per row, dB values to 3 decimals)
inline void writeCsv(const std::vector<AdcTestRow>& rows, std::ostream& os) {
    os << kAdcCsvHeader << '\n';
    for (const auto& r : rows) {
        std::ostringstream line;
        line << r.bits << ',' << r.noiseStd << ',' << r.amplitude << ','
             << std::fixed << std::setprecision(3)
             << r.snrDb << ',' << r.thdDb << ',' << r.sinadDb << ',' << r.enob;
        os << line.str() << '\n';
    }
}

} // namespace DSP
} // namespace Primer
