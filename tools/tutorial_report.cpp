// ==============================================================================
// Tutorial Report Tool
// ==============================================================================
// Prints the numeric results behind the six teaching walkthroughs:
//   1. basic waveforms          4. IIR filtering
//   2. Fourier analysis         5. quantization
//   3. sampling and aliasing    6. quality metrics
//
// Usage: tutorial_report [section]   (1-6, default: all)
// ==============================================================================

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/window_functions.h>
#include <primer/dsp/primitives/quantizer.h>
#include <primer/dsp/primitives/signal_generator.h>
#include <primer/dsp/processors/iir_filter.h>
#include <primer/dsp/processors/sampling_evaluator.h>
#include <primer/dsp/processors/signal_metrics.h>
#include <primer/dsp/processors/spectrum_analyzer.h>

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace Primer::DSP;

namespace {

void printHeading(int number, const char* title) {
    std::cout << "\n=== " << number << ". " << title << " ===" << std::endl;
}

const char* waveformName(WaveformType type) {
    switch (type) {
        case WaveformType::Sine:       return "sine";
        case WaveformType::Cosine:     return "cosine";
        case WaveformType::Square:     return "square";
        case WaveformType::Triangle:   return "triangle";
        case WaveformType::Sawtooth:   return "sawtooth";
        case WaveformType::WhiteNoise: return "white noise";
    }
    return "unknown";
}

// fs 1000 Hz, 2 s, 5 Hz
void basicSignals() {
    printHeading(1, "Basic signals");
    SignalGenerator generator;

    const WaveformType types[] = {WaveformType::Sine, WaveformType::Cosine,
                                  WaveformType::Square, WaveformType::Triangle,
                                  WaveformType::Sawtooth, WaveformType::WhiteNoise};
    for (WaveformType type : types) {
        WaveformParams params;
        params.type = type;
        params.frequencyHz = 5.0;
        params.durationSeconds = 2.0;
        params.sampleRate = 1000.0;
        const Signal s = generator.generate(params);

        std::cout << "  " << std::left << std::setw(12) << waveformName(type) << std::right
                  << " samples " << s.size() << std::fixed << std::setprecision(4)
                  << "  peak " << s.peak() << "  rms " << s.rms() << std::defaultfloat
                  << std::endl;
    }
}

// fs 1000 Hz, 1 s; 50 Hz + 0.5 * 120 Hz
void fourierAnalysis() {
    printHeading(2, "Fourier transform");
    const SignalGenerator generator;
    const Signal twoTones = generator.generateMultiTone({{50.0, 1.0, 0.0}, {120.0, 0.5, 0.0}},
                                                        1.0, 1000.0);

    const WindowType windows[] = {WindowType::Rectangular, WindowType::Hann};
    for (WindowType window : windows) {
        const SpectrumAnalyzer analyzer(AnalyzerConfig{window});
        const Spectrum spectrum = analyzer.analyze(twoTones);
        const std::vector<float> amps = spectrum.amplitude();

        std::cout << "  " << std::left << std::setw(12) << windowName(window) << std::right
                  << " resolution " << spectrum.resolution() << " Hz  peak "
                  << spectrum.peakFrequency() << " Hz" << std::fixed << std::setprecision(4)
                  << "  |A(50)| " << amps[spectrum.binForFrequency(50.0)]
                  << "  |A(120)| " << amps[spectrum.binForFrequency(120.0)]
                  << std::defaultfloat << std::endl;
    }
}

// 5 Hz at several rates; 25 Hz at 60 Hz and 30 Hz
void samplingAndAliasing() {
    printHeading(3, "Sampling and aliasing");

    const auto report = [](double f, double fs) {
        const SamplingReport r = Sampling::analyzeSampling(f, fs);
        std::cout << "  f " << std::setw(4) << f << " Hz @ fs " << std::setw(4) << fs
                  << " Hz  nyquist " << std::setw(4) << r.nyquistHz << "  "
                  << (r.aliased ? "ALIASED" : "ok     ") << "  apparent " << r.aliasHz
                  << " Hz" << std::endl;
    };

    for (double fs : {50.0, 20.0, 10.0, 8.0}) report(5.0, fs);
    report(25.0, 60.0);
    report(25.0, 30.0);

    // Reconstruction error of 5 Hz sampled at 50 Hz, measured on a 1 kHz grid
    WaveformParams params;
    params.frequencyHz = 5.0;
    params.durationSeconds = 1.0;
    const Signal sampled = Sampling::sample(params, 50.0);
    const Signal reference = Sampling::sample(params, 1000.0);

    const ReconstructionMethod methods[] = {ReconstructionMethod::ZeroOrderHold,
                                            ReconstructionMethod::Linear,
                                            ReconstructionMethod::Cubic,
                                            ReconstructionMethod::Sinc};
    const char* names[] = {"zero-order", "linear", "cubic", "sinc"};
    for (size_t i = 0; i < 4; ++i) {
        const Signal rebuilt = Sampling::reconstruct(sampled, 1000.0, methods[i]);
        const double errorRms = (rebuilt - reference).rms();
        std::cout << "  reconstruct " << std::left << std::setw(10) << names[i] << std::right
                  << " rms error " << std::fixed << std::setprecision(4) << errorRms
                  << std::defaultfloat << std::endl;
    }
}

// fs 1000 Hz, 2 s; 5 + 50 + 150 Hz plus noise
void filtering() {
    printHeading(4, "Filtering");
    constexpr double fs = 1000.0;

    SignalGenerator generator;
    const Signal tones = generator.generateMultiTone(
        {{5.0, 1.0, 0.0}, {50.0, 0.5, 0.0}, {150.0, 0.3, 0.0}}, 2.0, fs);
    WaveformParams noiseParams;
    noiseParams.type = WaveformType::WhiteNoise;
    noiseParams.amplitude = 0.2;
    noiseParams.durationSeconds = 2.0;
    noiseParams.sampleRate = fs;
    const Signal input = tones + generator.generate(noiseParams);

    struct Case {
        const char* label;
        FilterFamily family;
        FilterKind kind;
        std::vector<double> cutoffs;
    };
    const std::vector<Case> cases = {
        {"LPF 30 Hz", FilterFamily::Butterworth, FilterKind::Lowpass, {30.0}},
        {"LPF 30 Hz", FilterFamily::Chebyshev, FilterKind::Lowpass, {30.0}},
        {"LPF 30 Hz", FilterFamily::Bessel, FilterKind::Lowpass, {30.0}},
        {"HPF 100 Hz", FilterFamily::Butterworth, FilterKind::Highpass, {100.0}},
        {"BPF 40-80 Hz", FilterFamily::Butterworth, FilterKind::Bandpass, {40.0, 80.0}},
        {"BSF 40-60 Hz", FilterFamily::Butterworth, FilterKind::Notch, {40.0, 60.0}},
    };

    for (const auto& c : cases) {
        FilterSpec spec;
        spec.family = c.family;
        spec.kind = c.kind;
        spec.order = 4;
        spec.cutoffs = c.cutoffs;
        spec.sampleRate = fs;
        const IirFilter filter(spec);
        const Signal output = filter.processZeroPhase(input);

        std::cout << "  " << std::left << std::setw(13) << c.label << std::setw(12)
                  << familyName(c.family) << std::right << std::fixed << std::setprecision(2)
                  << " |H(5)| " << std::setw(7) << filter.magnitudeDb(5.0)
                  << "  |H(50)| " << std::setw(7) << filter.magnitudeDb(50.0)
                  << "  |H(150)| " << std::setw(7) << filter.magnitudeDb(150.0)
                  << " dB  out rms " << std::setprecision(4) << output.rms()
                  << std::defaultfloat << std::endl;
    }

    const IirFilter notch = IirFilter::notch(50.0, 30.0, fs);
    std::cout << "  Notch 50 Hz Q=30" << std::fixed << std::setprecision(2)
              << "  |H(45)| " << notch.magnitudeDb(45.0) << "  |H(50)| "
              << notch.magnitudeDb(50.0) << " dB" << std::defaultfloat << std::endl;
}

// fs 10 kHz, 0.1 s, 100 Hz at 0.9
void quantization() {
    printHeading(5, "Quantization");
    const SignalGenerator generator;
    const Signal input = generator.generateMultiTone({{100.0, 0.9, 0.0}}, 0.1, 10000.0);

    for (int bits = 4; bits <= 16; bits += 2) {
        QuantizerConfig config;
        config.bitDepth = bits;
        Quantizer quantizer(config);
        const QuantizationResult result = quantizer.quantize(input);

        const double snr = powerRatioDb(input.power(), result.error.power());
        std::cout << "  " << std::setw(2) << bits << " bits  LSB " << std::setw(12)
                  << quantizer.lsb() << std::fixed << std::setprecision(2) << "  SNR "
                  << std::setw(6) << snr << " dB  theory " << std::setw(6)
                  << quantizer.theoreticalSnrDb() << " dB" << std::defaultfloat << std::endl;
    }
}

// fs 10 kHz, 0.5 s, 100 Hz
void signalMetrics() {
    printHeading(6, "Signal quality metrics");
    constexpr double fs = 10000.0;
    constexpr double duration = 0.5;
    constexpr double f0 = 100.0;

    SignalGenerator generator;
    MetricsConfig metricsConfig;
    metricsConfig.fundamentalHz = f0;
    const MetricsEvaluator evaluator(metricsConfig);
    const SpectrumAnalyzer analyzer(AnalyzerConfig{WindowType::Hann});

    QuantizerConfig qc;
    qc.bitDepth = 8;
    Quantizer quantizer(qc);
    const Signal pure = generator.generateMultiTone({{f0, 1.0, 0.0}}, duration, fs);

    struct Case {
        const char* label;
        Signal signal;
    };
    const std::vector<Case> cases = {
        {"ideal", generator.generateHarmonicTestSignal(f0, 1.0, {}, 0.001, duration, fs)},
        {"distorted",
         generator.generateHarmonicTestSignal(f0, 1.0, {{2, 0.1}, {3, 0.05}}, 0.001, duration,
                                              fs)},
        {"noisy", generator.generateHarmonicTestSignal(f0, 1.0, {}, 0.1, duration, fs)},
        {"8-bit", quantizer.quantize(pure).quantized},
    };

    for (const auto& c : cases) {
        const MetricsResult m = evaluator.evaluate(analyzer.analyze(c.signal));
        std::cout << "  " << std::left << std::setw(10) << c.label << std::right << std::fixed
                  << std::setprecision(2) << " SNR " << std::setw(7) << m.snrDb
                  << "  THD " << std::setw(7) << m.thdDb << "  SINAD " << std::setw(7)
                  << m.sinadDb << "  SFDR " << std::setw(7) << m.sfdrDb << "  ENOB "
                  << m.enob << std::defaultfloat << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    int section = 0;
    if (argc > 1) {
        section = std::atoi(argv[1]);
        if (section < 1 || section > 6) {
            std::cerr << "Usage: tutorial_report [1-6]" << std::endl;
            return 1;
        }
    }

    try {
        if (section == 0 || section == 1) basicSignals();
        if (section == 0 || section == 2) fourierAnalysis();
        if (section == 0 || section == 3) samplingAndAliasing();
        if (section == 0 || section == 4) filtering();
        if (section == 0 || section == 5) quantization();
        if (section == 0 || section == 6) signalMetrics();
    } catch (const DspError& e) {
        std::cerr << "tutorial_report: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "tutorial_report: unexpected error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
