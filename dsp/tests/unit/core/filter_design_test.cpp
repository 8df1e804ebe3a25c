// ==============================================================================
// Layer 0: Core Utilities - Filter Design Tests
// ==============================================================================
// Tests for: dsp/include/primer/dsp/core/filter_design.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <primer/dsp/core/filter_design.h>

#include <cmath>
#include <complex>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace Primer::DSP;
using Catch::Approx;

namespace {

FilterSpec makeSpec(FilterFamily family, FilterKind kind, int order,
                    std::vector<double> cutoffs, double fs) {
    FilterSpec spec;
    spec.family = family;
    spec.kind = kind;
    spec.order = order;
    spec.cutoffs = std::move(cutoffs);
    spec.sampleRate = fs;
    return spec;
}

double analogMagnitudeDb(const PoleZeroLocations& pz, double omega) {
    return 20.0 * std::log10(std::abs(evaluate(pz, {0.0, omega})));
}

} // namespace

// ==============================================================================
// Validation
// ==============================================================================

TEST_CASE("validate accepts well-formed specs", "[filter_design][validate]") {
    CHECK_NOTHROW(FilterDesign::validate(
        makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 4, {1000.0}, 48000.0)));
    CHECK_NOTHROW(FilterDesign::validate(
        makeSpec(FilterFamily::Bessel, FilterKind::Bandpass, 2, {300.0, 3400.0}, 8000.0)));
    CHECK_NOTHROW(FilterDesign::validate(
        makeSpec(FilterFamily::Chebyshev, FilterKind::Notch, 12, {40.0, 60.0}, 1000.0)));
}

TEST_CASE("validate rejects every malformed field", "[filter_design][validate][error]") {
    SECTION("sample rate") {
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 4, {100.0}, 0.0)),
            InvalidSpec);
    }

    SECTION("order outside [1, 12]") {
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 0, {100.0}, 1000.0)),
            InvalidSpec);
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 13, {100.0}, 1000.0)),
            InvalidSpec);
    }

    SECTION("wrong number of cutoffs") {
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 4, {100.0, 200.0}, 1000.0)),
            InvalidSpec);
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Bandpass, 4, {100.0}, 1000.0)),
            InvalidSpec);
    }

    SECTION("cutoff at or above Nyquist") {
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Highpass, 4, {500.0}, 1000.0)),
            InvalidSpec);
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Highpass, 4, {-10.0}, 1000.0)),
            InvalidSpec);
    }

    SECTION("band edges out of order") {
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Bandpass, 4, {80.0, 40.0}, 1000.0)),
            InvalidSpec);
        CHECK_THROWS_AS(FilterDesign::validate(
            makeSpec(FilterFamily::Butterworth, FilterKind::Notch, 4, {50.0, 50.0}, 1000.0)),
            InvalidSpec);
    }

    SECTION("Chebyshev ripple outside (0, 3)") {
        auto spec = makeSpec(FilterFamily::Chebyshev, FilterKind::Lowpass, 4, {100.0}, 1000.0);
        spec.rippleDb = 0.0;
        CHECK_THROWS_AS(FilterDesign::validate(spec), InvalidSpec);
        spec.rippleDb = 3.0;
        CHECK_THROWS_AS(FilterDesign::validate(spec), InvalidSpec);

        // Ripple is ignored by the other families
        spec.family = FilterFamily::Butterworth;
        CHECK_NOTHROW(FilterDesign::validate(spec));
    }

    SECTION("errors name the offending field") {
        try {
            FilterDesign::validate(
                makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 20, {100.0}, 1000.0));
            FAIL("expected InvalidSpec");
        } catch (const InvalidSpec& e) {
            CHECK(e.component() == "FilterSpec");
            CHECK(e.parameter() == "order");
            CHECK(e.value() == "20");
        }
    }
}

// ==============================================================================
// Prewarping
// ==============================================================================

TEST_CASE("prewarpFrequency compensates for bilinear warping", "[filter_design][prewarp]") {
    const double fs = 44100.0;
    const double w = FilterDesign::prewarpFrequency(1000.0, fs);
    CHECK(w == Approx(2.0 * fs * std::tan(kPiD * 1000.0 / fs)));

    // Barely warped far below Nyquist
    CHECK(FilterDesign::prewarpFrequency(10.0, fs) == Approx(kTwoPiD * 10.0).epsilon(1e-6));
    // Warped upwards near Nyquist
    CHECK(FilterDesign::prewarpFrequency(15000.0, fs) > kTwoPiD * 15000.0);
}

// ==============================================================================
// Analog Prototypes
// ==============================================================================

TEST_CASE("Analog prototypes are -3 dB at 1 rad/s", "[filter_design][prototype]") {
    for (int order = 1; order <= kMaxFilterOrder; ++order) {
        INFO("order " << order);
        CHECK(analogMagnitudeDb(FilterDesign::butterworthPrototype(order), 1.0)
              == Approx(-3.0103).margin(1e-6));
        CHECK(analogMagnitudeDb(FilterDesign::chebyshevPrototype(order, 1.0), 1.0)
              == Approx(-3.0103).margin(1e-6));
        CHECK(analogMagnitudeDb(FilterDesign::besselPrototype(order), 1.0)
              == Approx(-3.0103).margin(1e-6));
    }
}

TEST_CASE("Analog prototype poles lie in the left half plane", "[filter_design][prototype]") {
    for (auto family : {FilterFamily::Butterworth, FilterFamily::Chebyshev,
                        FilterFamily::Bessel}) {
        for (int order = 1; order <= kMaxFilterOrder; ++order) {
            const auto proto = FilterDesign::analogPrototype(family, order, 1.0);
            REQUIRE(proto.poles.size() == static_cast<size_t>(order));
            REQUIRE(proto.zeros.empty());
            for (const auto& p : proto.poles) {
                REQUIRE(p.real() < 0.0);
            }
        }
    }
}

TEST_CASE("Prototype DC gain", "[filter_design][prototype]") {
    SECTION("Butterworth and Bessel are unity at DC") {
        CHECK(std::abs(evaluate(FilterDesign::butterworthPrototype(5), {0.0, 0.0}))
              == Approx(1.0));
        CHECK(std::abs(evaluate(FilterDesign::besselPrototype(6), {0.0, 0.0})) == Approx(1.0));
    }

    SECTION("Chebyshev even orders start at the bottom of the ripple") {
        CHECK(analogMagnitudeDb(FilterDesign::chebyshevPrototype(4, 1.0), 0.0)
              == Approx(-1.0).margin(1e-9));
        CHECK(analogMagnitudeDb(FilterDesign::chebyshevPrototype(3, 1.0), 0.0)
              == Approx(0.0).margin(1e-9));
    }
}

TEST_CASE("Butterworth poles sit on the unit circle", "[filter_design][prototype]") {
    const auto proto = FilterDesign::butterworthPrototype(6);
    for (const auto& p : proto.poles) {
        CHECK(std::abs(p) == Approx(1.0));
    }
}

// ==============================================================================
// Digital Designs
// ==============================================================================

TEST_CASE("designDigital places the -3 dB point on every cutoff", "[filter_design][digital]") {
    constexpr double fs = 1000.0;
    const double expectedDb = -3.0103;
    const auto digitalDb = [](const PoleZeroLocations& pz, double f) {
        return 20.0 * std::log10(std::abs(evaluate(pz, std::polar(1.0, kTwoPiD * f / fs))));
    };

    for (auto family : {FilterFamily::Butterworth, FilterFamily::Chebyshev,
                        FilterFamily::Bessel}) {
        INFO(familyName(family));

        const auto lp = FilterDesign::designDigital(
            makeSpec(family, FilterKind::Lowpass, 4, {30.0}, fs));
        CHECK(lp.poles.size() == 4);
        CHECK(digitalDb(lp, 30.0) == Approx(expectedDb).margin(0.1));

        const auto hp = FilterDesign::designDigital(
            makeSpec(family, FilterKind::Highpass, 3, {100.0}, fs));
        CHECK(hp.poles.size() == 3);
        CHECK(digitalDb(hp, 100.0) == Approx(expectedDb).margin(0.1));

        const auto bp = FilterDesign::designDigital(
            makeSpec(family, FilterKind::Bandpass, 2, {40.0, 80.0}, fs));
        CHECK(bp.poles.size() == 4);
        CHECK(digitalDb(bp, 40.0) == Approx(expectedDb).margin(0.1));
        CHECK(digitalDb(bp, 80.0) == Approx(expectedDb).margin(0.1));

        const auto bs = FilterDesign::designDigital(
            makeSpec(family, FilterKind::Notch, 2, {40.0, 60.0}, fs));
        CHECK(bs.poles.size() == 4);
        CHECK(digitalDb(bs, 40.0) == Approx(expectedDb).margin(0.1));
        CHECK(digitalDb(bs, 60.0) == Approx(expectedDb).margin(0.1));
    }
}

TEST_CASE("Digital poles are inside the unit circle", "[filter_design][digital][stability]") {
    for (int order = 1; order <= kMaxFilterOrder; ++order) {
        const auto pz = FilterDesign::designDigital(
            makeSpec(FilterFamily::Chebyshev, FilterKind::Lowpass, order, {20.0}, 48000.0));
        for (const auto& p : pz.poles) {
            REQUIRE(std::abs(p) < 1.0);
        }
    }
}

TEST_CASE("Bilinear transform sends zeros at infinity to Nyquist", "[filter_design][bilinear]") {
    const auto pz = FilterDesign::designDigital(
        makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 5, {1000.0}, 8000.0));
    REQUIRE(pz.zeros.size() == 5);
    for (const auto& z : pz.zeros) {
        CHECK(z.real() == Approx(-1.0));
        CHECK(z.imag() == Approx(0.0).margin(1e-12));
    }
    CHECK(std::abs(evaluate(pz, {1.0, 0.0})) == Approx(1.0));
}

TEST_CASE("Band-stop zeros lie on the unit circle at the centre", "[filter_design][notch]") {
    constexpr double fs = 1000.0;
    const auto spec = makeSpec(FilterFamily::Butterworth, FilterKind::Notch, 2, {40.0, 60.0}, fs);
    const auto pz = FilterDesign::designDigital(spec);

    REQUIRE(pz.zeros.size() == 4);
    const double w0 = std::sqrt(FilterDesign::prewarpFrequency(40.0, fs)
                                * FilterDesign::prewarpFrequency(60.0, fs));
    const double theta0 = 2.0 * std::atan(w0 / (2.0 * fs));
    for (const auto& z : pz.zeros) {
        CHECK(std::abs(z) == Approx(1.0));
        CHECK(std::abs(std::arg(z)) == Approx(theta0));
    }
}

TEST_CASE("passbandReference points at the passband", "[filter_design][reference]") {
    auto spec = makeSpec(FilterFamily::Butterworth, FilterKind::Lowpass, 2, {100.0}, 1000.0);
    CHECK(FilterDesign::passbandReference(spec) == std::complex<double>(1.0, 0.0));

    spec.kind = FilterKind::Highpass;
    CHECK(FilterDesign::passbandReference(spec) == std::complex<double>(-1.0, 0.0));

    spec.kind = FilterKind::Bandpass;
    spec.cutoffs = {40.0, 80.0};
    const auto ref = FilterDesign::passbandReference(spec);
    CHECK(std::abs(ref) == Approx(1.0));
    const double centerHz = std::arg(ref) * 1000.0 / kTwoPiD;
    CHECK(centerHz > 40.0);
    CHECK(centerHz < 80.0);
}
