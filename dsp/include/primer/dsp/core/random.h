// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seeded Pseudo-Random Number Generation
// ==============================================================================
// Instance-scoped PRNG for noise generation and dither. There is no global
// generator: every component that needs randomness owns one, seeded from its
// config, so results are reproducible and independent runs never share state.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <primer/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Primer {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using Marsaglia's xorshift
/// (shifts 13, 17, 5). Period 2^32-1.
///
/// @note NOT cryptographically secure - for noise/dither use only
///
/// @example
///     Xorshift32 rng(12345);
///     double u = rng.nextUnit();      // (0.0, 1.0]
///     double g = rng.nextGaussian();  // N(0, 1)
///
class Xorshift32 {
public:
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Random double in range (0.0, 1.0]
    [[nodiscard]] constexpr double nextUnit() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

    /// Standard normal deviate via the Box-Muller transform.
    /// Consumes two uniform draws per call; the cosine branch is discarded so
    /// the sequence depends only on the seed and the number of calls.
    [[nodiscard]] double nextGaussian() noexcept {
        const double u1 = nextUnit();  // (0, 1], log is finite
        const double u2 = nextUnit();
        return std::sqrt(-2.0 * std::log(u1)) * std::sin(kTwoPiD * u2);
    }

    /// Reseed the generator (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept { return state_; }

private:
    /// Used when 0 is passed (0 would make the generator output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1 / (2^32 - 1)
    static constexpr double kToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
};

} // namespace DSP
} // namespace Primer
