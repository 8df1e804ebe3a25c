// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Highway self-inclusion pattern: foreach_target.h re-includes this file once
// per ISA target. HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE)
// select the best kernel at runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "primer/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Primer {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputePolarImpl: Complex[] -> mags[] + phases[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputePolarImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                      float* HWY_RESTRICT mags, float* HWY_RESTRICT phases) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        const auto mag = hn::Sqrt(hn::MulAdd(im, im, hn::Mul(re, re)));
        const auto phase = hn::Atan2(d, im, re);

        hn::StoreU(mag, d, mags + k);
        hn::StoreU(phase, d, phases + k);
    }

    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
        phases[k] = std::atan2(im, re);
    }
}

// -----------------------------------------------------------------------------
// ComputePowerImpl: Complex[] -> scale * |X|^2
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputePowerImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                      float scale, float* HWY_RESTRICT power) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto vScale = hn::Set(d, scale);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);
        const auto p = hn::MulAdd(im, im, hn::Mul(re, re));
        hn::StoreU(hn::Mul(p, vScale), d, power + k);
    }

    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        power[k] = (re * re + im * im) * scale;
    }
}

// -----------------------------------------------------------------------------
// MagnitudeToDbImpl: 20 * log10(max(x, floor))
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MagnitudeToDbImpl(const float* HWY_RESTRICT input,
                       float* HWY_RESTRICT output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto floorVal = hn::Set(d, 1e-10f);  // kMinMagnitude
    const auto twenty = hn::Set(d, 20.0f);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        auto v = hn::LoadU(d, input + k);
        v = hn::Max(v, floorVal);
        hn::StoreU(hn::Mul(twenty, hn::Log10(d, v)), d, output + k);
    }
    for (; k < count; ++k) {
        output[k] = 20.0f * std::log10(std::max(input[k], 1e-10f));
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Primer

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "primer/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Primer {
namespace DSP {

HWY_EXPORT(ComputePolarImpl);
HWY_EXPORT(ComputePowerImpl);
HWY_EXPORT(MagnitudeToDbImpl);

void computePolarBulk(const float* complexData, size_t numBins,
                      float* mags, float* phases) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputePolarImpl)(complexData, numBins, mags, phases);
}

void computePowerBulk(const float* complexData, size_t numBins, float scale,
                      float* power) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputePowerImpl)(complexData, numBins, scale, power);
}

void batchMagnitudeToDb(const float* input, float* output, std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(MagnitudeToDbImpl)(input, output, count);
}

}  // namespace DSP
}  // namespace Primer

#endif  // HWY_ONCE
