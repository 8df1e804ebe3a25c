// ==============================================================================
// Layer 0: Core Tests - SIMD-Accelerated Spectral Math
// ==============================================================================
// Tests for computePolarBulk(), computePowerBulk() and batchMagnitudeToDb().
// Verifies SIMD results match scalar std::sqrt/atan2/log10, including the
// scalar tail for sizes that are not a multiple of the vector width.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <primer/dsp/core/spectral_simd.h>

#include <cmath>
#include <vector>

using namespace Primer::DSP;
using Catch::Approx;

TEST_CASE("computePolarBulk known values", "[spectral_simd][polar]") {
    std::vector<float> complex_data = {
        3.0f, 4.0f,    // bin 0: mag=5
        0.0f, 0.0f,    // bin 1: mag=0
        1.0f, 0.0f,    // bin 2: phase=0
        0.0f, 5.0f,    // bin 3: phase=pi/2
        -3.0f, -4.0f,  // bin 4: third quadrant
        6.0f, 8.0f,    // bin 5: mag=10
        0.0f, -2.0f    // bin 6: phase=-pi/2
    };
    const size_t numBins = 7;

    std::vector<float> mags(numBins);
    std::vector<float> phases(numBins);
    computePolarBulk(complex_data.data(), numBins, mags.data(), phases.data());

    CHECK(mags[0] == Approx(5.0f).margin(0.001f));
    CHECK(mags[1] == Approx(0.0f).margin(0.001f));
    CHECK(phases[2] == Approx(0.0f).margin(0.001f));
    CHECK(phases[3] == Approx(std::atan2(5.0f, 0.0f)).margin(0.001f));
    CHECK(phases[4] == Approx(std::atan2(-4.0f, -3.0f)).margin(0.001f));
    CHECK(mags[5] == Approx(10.0f).margin(0.001f));
    CHECK(phases[6] == Approx(std::atan2(-2.0f, 0.0f)).margin(0.001f));
}

TEST_CASE("computePolarBulk matches scalar on a long buffer", "[spectral_simd][polar]") {
    const size_t numBins = 257;
    std::vector<float> data(numBins * 2);
    for (size_t k = 0; k < numBins; ++k) {
        data[k * 2] = std::cos(0.37f * static_cast<float>(k)) * static_cast<float>(k % 11);
        data[k * 2 + 1] = std::sin(0.91f * static_cast<float>(k)) * 3.0f;
    }

    std::vector<float> mags(numBins);
    std::vector<float> phases(numBins);
    computePolarBulk(data.data(), numBins, mags.data(), phases.data());

    for (size_t k = 0; k < numBins; ++k) {
        const float re = data[k * 2];
        const float im = data[k * 2 + 1];
        REQUIRE(mags[k] == Approx(std::sqrt(re * re + im * im)).margin(1e-4f));
        if (std::sqrt(re * re + im * im) > 1e-3f) {
            REQUIRE(phases[k] == Approx(std::atan2(im, re)).margin(1e-4f));
        }
    }
}

TEST_CASE("computePowerBulk scales squared magnitudes", "[spectral_simd][power]") {
    const size_t numBins = 19;
    std::vector<float> data(numBins * 2);
    for (size_t k = 0; k < numBins; ++k) {
        data[k * 2] = static_cast<float>(k);
        data[k * 2 + 1] = -0.5f * static_cast<float>(k);
    }

    std::vector<float> power(numBins);
    computePowerBulk(data.data(), numBins, 0.25f, power.data());

    for (size_t k = 0; k < numBins; ++k) {
        const float expected = 0.25f * 1.25f * static_cast<float>(k * k);
        REQUIRE(power[k] == Approx(expected).margin(1e-4f));
    }
}

TEST_CASE("batchMagnitudeToDb clamps at the floor", "[spectral_simd][db]") {
    const std::vector<float> input = {1.0f, 10.0f, 0.1f, 0.0f, -1.0f, 1e-12f, 0.5f,
                                      2.0f, 100.0f, 1e-3f, 1e-10f};
    std::vector<float> output(input.size());
    batchMagnitudeToDb(input.data(), output.data(), input.size());

    CHECK(output[0] == Approx(0.0f).margin(1e-4f));
    CHECK(output[1] == Approx(20.0f).margin(1e-3f));
    CHECK(output[2] == Approx(-20.0f).margin(1e-3f));
    CHECK(output[3] == Approx(-200.0f).margin(0.01f));
    CHECK(output[4] == Approx(-200.0f).margin(0.01f));
    CHECK(output[5] == Approx(-200.0f).margin(0.01f));
    CHECK(output[6] == Approx(-6.0206f).margin(1e-3f));
    CHECK(output[8] == Approx(40.0f).margin(1e-3f));
    CHECK(output[9] == Approx(-60.0f).margin(1e-3f));
}
