// ==============================================================================
// Layer 0: Core Tests - Signal
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <primer/dsp/core/signal.h>

#include <cmath>
#include <vector>

using namespace Primer::DSP;
using Catch::Approx;

TEST_CASE("Signal exposes samples and timing", "[signal]") {
    const Signal s({0.0f, 1.0f, 0.0f, -1.0f}, 4.0);

    CHECK(s.size() == 4);
    CHECK(s.sampleRate() == 4.0);
    CHECK(s.duration() == Approx(1.0));
    CHECK(s.nyquist() == Approx(2.0));
    CHECK(s.timeAt(2) == Approx(0.5));
    CHECK(s[3] == -1.0f);
    CHECK(s.peak() == 1.0f);
    CHECK(s.power() == Approx(0.5));
    CHECK(s.rms() == Approx(std::sqrt(0.5)));
}

TEST_CASE("Signal rejects invalid construction", "[signal][error]") {
    CHECK_THROWS_AS(Signal({}, 1000.0), InvalidInput);
    CHECK_THROWS_AS(Signal({1.0f}, 0.0), InvalidParameter);
    CHECK_THROWS_AS(Signal({1.0f}, -48000.0), InvalidParameter);
}

TEST_CASE("Signal transformations return new signals", "[signal]") {
    const Signal s({1.0f, -2.0f}, 10.0);

    const Signal louder = s.scaled(2.0f);
    CHECK(louder[0] == 2.0f);
    CHECK(louder[1] == -4.0f);
    CHECK(s[0] == 1.0f);

    const Signal shifted = s.withOffset(0.5f);
    CHECK(shifted[0] == 1.5f);
    CHECK(shifted[1] == -1.5f);

    const Signal sum = s + louder;
    CHECK(sum[0] == 3.0f);
    const Signal diff = louder - s;
    CHECK(diff[1] == -2.0f);
}

TEST_CASE("Signal arithmetic requires matching length and rate", "[signal][error]") {
    const Signal a({1.0f, 2.0f}, 10.0);
    const Signal shorter({1.0f}, 10.0);
    const Signal otherRate({1.0f, 2.0f}, 20.0);

    CHECK_THROWS_AS(a + shorter, InvalidInput);
    CHECK_THROWS_AS(a - otherRate, InvalidInput);
}
