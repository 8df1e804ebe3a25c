// ==============================================================================
// Layer 0: Core Tests - Error Types
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <primer/dsp/core/dsp_error.h>

#include <limits>
#include <stdexcept>
#include <string>

using namespace Primer::DSP;

TEST_CASE("DspError carries its diagnostic fields", "[error]") {
    const InvalidParameter e("Quantizer", "bitDepth", 32, "must be in [1, 24]");

    CHECK(e.kind() == ErrorKind::InvalidParameter);
    CHECK(e.component() == "Quantizer");
    CHECK(e.parameter() == "bitDepth");
    CHECK(e.value() == "32");
    CHECK(e.constraint() == "must be in [1, 24]");
    CHECK(std::string(e.what()) == "InvalidParameter: Quantizer: bitDepth = 32 (must be in [1, 24])");
}

TEST_CASE("Error hierarchy can be caught at every level", "[error]") {
    SECTION("InvalidSpec is an InvalidParameter") {
        try {
            throw InvalidSpec("order", 0, "must be in [1, 12]");
        } catch (const InvalidParameter& e) {
            CHECK(e.component() == "FilterSpec");
            CHECK(e.kind() == ErrorKind::InvalidParameter);
        }
    }

    SECTION("every error is a std::invalid_argument") {
        CHECK_THROWS_AS(throw InvalidInput("Signal", "length", 0, "must be >= 1"),
                        std::invalid_argument);
        CHECK_THROWS_AS(throw InvalidSpectrum("MetricsEvaluator", "bins", 2, "must be >= 3"),
                        DspError);
    }
}

TEST_CASE("errorKindName names every kind", "[error]") {
    CHECK(std::string(errorKindName(ErrorKind::InvalidParameter)) == "InvalidParameter");
    CHECK(std::string(errorKindName(ErrorKind::InvalidInput)) == "InvalidInput");
    CHECK(std::string(errorKindName(ErrorKind::InvalidSpectrum)) == "InvalidSpectrum");
}

TEST_CASE("Validation helpers reject out-of-range values", "[error][validation]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    CHECK_NOTHROW(requirePositive("Test", "x", 1.0));
    CHECK_THROWS_AS(requirePositive("Test", "x", 0.0), InvalidParameter);
    CHECK_THROWS_AS(requirePositive("Test", "x", -1.0), InvalidParameter);
    CHECK_THROWS_AS(requirePositive("Test", "x", nan), InvalidParameter);
    CHECK_THROWS_AS(requirePositive("Test", "x", inf), InvalidParameter);

    CHECK_NOTHROW(requireNonNegative("Test", "x", 0.0));
    CHECK_THROWS_AS(requireNonNegative("Test", "x", -1e-9), InvalidParameter);

    CHECK_NOTHROW(requireFinite("Test", "x", -5.0));
    CHECK_THROWS_AS(requireFinite("Test", "x", nan), InvalidParameter);
}
