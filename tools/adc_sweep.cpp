// ==============================================================================
// ADC Sweep Tool
// ==============================================================================
// Runs the converter characterization sweep (bit depth x input noise x tone
// amplitude) and writes the metrics table as CSV.
//
// Usage: adc_sweep [output.csv]     (default: adc_test_results.csv)
// ==============================================================================

#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/systems/adc_test_bench.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[]) {
    using namespace Primer::DSP;

    std::filesystem::path outputPath = "adc_test_results.csv";
    if (argc > 1) {
        outputPath = argv[1];
    }

    try {
        const AdcTestConfig config;
        std::cout << "Running ADC sweep: " << config.bitDepths.size() << " bit depths x "
                  << config.noiseStds.size() << " noise levels x "
                  << config.amplitudes.size() << " amplitudes" << std::endl;

        const auto rows = runAdcSweep(config);

        for (const auto& r : rows) {
            std::cout << "  " << std::setw(2) << r.bits << " bits  noise " << std::setw(7)
                      << r.noiseStd << "  amp " << r.amplitude << std::fixed
                      << std::setprecision(2) << "  SNR " << r.snrDb << " dB  THD " << r.thdDb
                      << " dB  ENOB " << r.enob << std::defaultfloat << std::endl;
        }

        std::ofstream file(outputPath);
        if (!file) {
            std::cerr << "Failed to open " << outputPath << " for writing" << std::endl;
            return 1;
        }
        writeCsv(rows, file);
        if (!file) {
            std::cerr << "Failed to write " << outputPath << std::endl;
            return 1;
        }

        std::cout << "\nWrote " << rows.size() << " rows to "
                  << std::filesystem::absolute(outputPath) << std::endl;
    } catch (const DspError& e) {
        std::cerr << "adc_sweep: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "adc_sweep: unexpected error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
