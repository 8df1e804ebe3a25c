// ==============================================================================
// Layer 1: DSP Primitive Tests - Quantizer
// ==============================================================================
// Tests for: dsp/include/primer/dsp/primitives/quantizer.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <primer/dsp/core/db_utils.h>
#include <primer/dsp/primitives/quantizer.h>
#include <primer/dsp/primitives/signal_generator.h>

#include <cmath>
#include <cstdint>
#include <vector>

using namespace Primer::DSP;
using Catch::Approx;

namespace {

QuantizerConfig makeConfig(int bits, double vref = 1.0) {
    QuantizerConfig c;
    c.bitDepth = bits;
    c.referenceVoltage = vref;
    return c;
}

} // namespace

TEST_CASE("Quantizer geometry", "[quantizer]") {
    const Quantizer q(makeConfig(8));
    CHECK(q.lsb() == Approx(2.0 / 256.0));
    CHECK(q.levels() == 256);
    CHECK(q.minCode() == -128);
    CHECK(q.maxCode() == 127);

    const Quantizer wide(makeConfig(24, 2.5));
    CHECK(wide.lsb() == Approx(5.0 / 16777216.0));
    CHECK(wide.levels() == 16777216);

    const Quantizer one(makeConfig(1));
    CHECK(one.minCode() == -1);
    CHECK(one.maxCode() == 0);
}

TEST_CASE("Theoretical SNR is 6.02 b + 1.76", "[quantizer][snr]") {
    static_assert(theoreticalSnrDb(8) > 49.9 && theoreticalSnrDb(8) < 49.95);
    CHECK(theoreticalSnrDb(16) == Approx(98.08));
    CHECK(Quantizer(makeConfig(12)).theoreticalSnrDb() == Approx(74.0));
}

TEST_CASE("Quantizer rejects invalid configuration", "[quantizer][error]") {
    CHECK_THROWS_AS(Quantizer(makeConfig(0)), InvalidParameter);
    CHECK_THROWS_AS(Quantizer(makeConfig(25)), InvalidParameter);
    CHECK_THROWS_AS(Quantizer(makeConfig(8, 0.0)), InvalidParameter);
    CHECK_THROWS_AS(Quantizer(makeConfig(8, -1.0)), InvalidParameter);

    auto c = makeConfig(8);
    c.dither = 1.5;
    CHECK_THROWS_AS(Quantizer(c), InvalidParameter);
}

TEST_CASE("Codes select the enclosing step and clamp", "[quantizer][codes]") {
    Quantizer q(makeConfig(3));  // LSB = 0.25, codes -4..3, levels -0.875..0.875
    const Signal in({0.0f, 0.1f, 0.3f, -0.3f, 0.74f, 1.0f, -1.0f, 5.0f, -5.0f}, 10.0);
    const auto codes = q.toCodes(in);

    const std::vector<int32_t> expected{0, 0, 1, -2, 2, 3, -4, 3, -4};
    CHECK(codes == expected);

    const Signal out = q.fromCodes(codes, 10.0);
    CHECK(out[0] == Approx(0.125f));
    CHECK(out[2] == Approx(0.375f));
    CHECK(out[3] == Approx(-0.375f));
    CHECK(out[5] == Approx(0.875f));
    CHECK(out[6] == Approx(-0.875f));
}

TEST_CASE("Reconstruction levels are symmetric about zero", "[quantizer][codes]") {
    const Quantizer q(makeConfig(4));
    const Signal out = q.fromCodes({q.minCode(), -1, 0, q.maxCode()}, 10.0);
    CHECK(out[0] == Approx(-1.0 + q.lsb() / 2.0));
    CHECK(out[1] == Approx(-q.lsb() / 2.0));
    CHECK(out[2] == Approx(q.lsb() / 2.0));
    CHECK(out[3] == Approx(1.0 - q.lsb() / 2.0));
}

TEST_CASE("fromCodes validates its input", "[quantizer][codes][error]") {
    const Quantizer q(makeConfig(4));
    CHECK_THROWS_AS(q.fromCodes({}, 100.0), InvalidInput);
    CHECK_THROWS_AS(q.fromCodes({8}, 100.0), InvalidParameter);
    CHECK_THROWS_AS(q.fromCodes({-9}, 100.0), InvalidParameter);
    CHECK_NOTHROW(q.fromCodes({7, -8}, 100.0));
}

TEST_CASE("Quantization error is bounded by half an LSB", "[quantizer][error_signal]") {
    const SignalGenerator gen;
    for (int bits : {4, 8, 12, 16}) {
        INFO(bits << " bits");
        Quantizer q(makeConfig(bits));
        const double amplitude = 1.0;
        const Signal input = gen.generateMultiTone({{37.0, amplitude, 0.3}}, 0.25, 4000.0);
        const QuantizationResult r = q.quantize(input);

        CHECK(r.clippedSamples == 0);
        for (size_t n = 0; n < input.size(); ++n) {
            REQUIRE(std::abs(r.error[n]) <= q.lsb() / 2.0 + 1e-6);
            REQUIRE(r.error[n] == Approx(input[n] - r.quantized[n]).margin(1e-7));
        }
    }
}

TEST_CASE("Full-range edges stay within half an LSB", "[quantizer][error_signal]") {
    for (int bits : {1, 3, 8, 16}) {
        INFO(bits << " bits");
        Quantizer q(makeConfig(bits));
        const Signal in({1.0f, 0.999f, -1.0f, -0.999f}, 100.0);
        const QuantizationResult r = q.quantize(in);

        CHECK(r.clippedSamples == 0);
        for (size_t n = 0; n < in.size(); ++n) {
            CHECK(std::abs(r.error[n]) <= q.lsb() / 2.0 + 1e-6);
        }
        CHECK(r.quantized[0] == Approx(1.0 - q.lsb() / 2.0));
        CHECK(r.quantized[2] == Approx(-1.0 + q.lsb() / 2.0));
    }
}

TEST_CASE("8-bit quantization SNR is near the ideal", "[quantizer][snr]") {
    // Full-scale sine; 1009 cycles in 8192 samples spread the error over many codes
    Quantizer q(makeConfig(8));
    const SignalGenerator gen;
    const Signal input = gen.generateMultiTone({{1009.0, 1.0, 0.0}}, 1.0, 8192.0);
    REQUIRE(input.size() == 8192);

    const QuantizationResult r = q.quantize(input);
    const double snr = powerRatioDb(input.power(), r.error.power());
    CHECK(snr == Approx(49.92).margin(3.0));
}

TEST_CASE("Out-of-range samples are counted and clipped", "[quantizer][clipping]") {
    Quantizer q(makeConfig(8));
    const Signal in({0.5f, 1.5f, -2.0f, 1.0f}, 100.0);
    const QuantizationResult r = q.quantize(in);

    CHECK(r.clippedSamples == 2);
    CHECK(r.quantized[1] == Approx(127.5 / 128.0));
    CHECK(r.quantized[2] == Approx(-127.5 / 128.0));
    CHECK(r.quantized[3] == Approx(127.5 / 128.0));
}

TEST_CASE("Dither is deterministic and bounded", "[quantizer][dither]") {
    auto c = makeConfig(6);
    c.dither = 1.0;
    c.seed = 77;
    Quantizer a(c);
    Quantizer b(c);
    Quantizer plain(makeConfig(6));

    const SignalGenerator gen;
    const Signal input = gen.generateMultiTone({{13.0, 0.8, 0.0}}, 1.0, 1000.0);

    const auto ra = a.quantize(input);
    const auto rb = b.quantize(input);
    CHECK(ra.quantized.samples() == rb.quantized.samples());
    CHECK(ra.quantized.samples() != plain.quantize(input).quantized.samples());

    for (size_t n = 0; n < input.size(); ++n) {
        REQUIRE(std::abs(ra.error[n]) <= 1.5 * a.lsb() + 1e-6);
    }
}
