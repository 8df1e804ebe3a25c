// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Real-input DFT of a whole record.
//
// Backend: pffft (marton78 fork, BSD license), SIMD-accelerated. pffft only
// handles sizes that are a multiple of 32 whose remaining factors are 2, 3 or
// 5; every other length goes through the direct O(N^2) DFT with double
// accumulation, so any record length >= 2 is accepted.
// ==============================================================================

#pragma once

#include <primer/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

#include <pffft.h>

namespace Primer {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// pffft real transforms need N to be a multiple of this
inline constexpr size_t kFFTSizeMultiple = 32;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for spectrum bins
/// @note Laid out as {real, imag} so arrays can be read as interleaved floats
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex conjugate() const noexcept {
        return {real, -imag};
    }

    /// |z|^2 in double precision
    [[nodiscard]] constexpr double norm() const noexcept {
        return static_cast<double>(real) * real + static_cast<double>(imag) * imag;
    }

    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }

    [[nodiscard]] float phase() const noexcept {
        return std::atan2(imag, real);
    }
};

// =============================================================================
// Size Support
// =============================================================================

/// @brief True if pffft can transform a real record of this length
[[nodiscard]] constexpr bool isFFTSize(size_t n) noexcept {
    if (n == 0 || n % kFFTSizeMultiple != 0) return false;
    size_t m = n / kFFTSizeMultiple;
    for (size_t f : {2u, 3u, 5u}) {
        while (m % f == 0) m /= f;
    }
    return m == 1;
}

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

/// Allocate a SIMD-aligned float buffer via pffft
inline std::unique_ptr<float, PffftAlignedDeleter> makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Forward real FFT of a fixed size (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    /// @brief Allocate the pffft setup and aligned buffers
    /// @return false if fftSize is not supported by pffft
    [[nodiscard]] bool prepare(size_t fftSize) noexcept {
        size_ = 0;
        if (!isFFTSize(fftSize)) return false;

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) return false;

        input_ = detail::makeAlignedBuffer(fftSize);
        output_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!input_ || !output_ || !work_) return false;

        size_ = fftSize;
        return true;
    }

    /// @brief Forward FFT: N real samples -> N/2+1 complex bins (DC to Nyquist)
    /// @pre prepare() returned true
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        std::copy_n(input, N, input_.get());

        pffft_transform_ordered(setup_.get(), input_.get(), output_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered layout: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
        const float* out = output_.get();
        output[0] = {out[0], 0.0f};
        output[N / 2] = {out[1], 0.0f};
        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {out[2 * k], out[2 * k + 1]};
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> input_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> output_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> work_;
};

// =============================================================================
// Direct DFT
// =============================================================================

/// @brief Direct DFT of a real record, bins 0..N/2
/// @formula X[k] = sum_n x[n] * exp(-j*2*pi*k*n/N)
/// @note O(N^2); twiddles come from an exact table indexed by (k*n) mod N
inline void directDFT(const float* input, size_t size, Complex* output) {
    if (input == nullptr || output == nullptr || size == 0) return;

    std::vector<double> cosTable(size);
    std::vector<double> sinTable(size);
    for (size_t i = 0; i < size; ++i) {
        const double angle = kTwoPiD * static_cast<double>(i) / static_cast<double>(size);
        cosTable[i] = std::cos(angle);
        sinTable[i] = std::sin(angle);
    }

    for (size_t k = 0; k <= size / 2; ++k) {
        double re = 0.0;
        double im = 0.0;
        size_t index = 0;
        for (size_t n = 0; n < size; ++n) {
            re += static_cast<double>(input[n]) * cosTable[index];
            im -= static_cast<double>(input[n]) * sinTable[index];
            index += k;
            if (index >= size) index -= size;
        }
        output[k] = {static_cast<float>(re), static_cast<float>(im)};
    }
}

// =============================================================================
// Whole-record Transform
// =============================================================================

/// @brief DFT bins 0..N/2 of a real record, choosing pffft when it can
/// @note Allocates; not real-time safe
[[nodiscard]] inline std::vector<Complex> realSpectrum(const float* input, size_t size) {
    std::vector<Complex> bins(size / 2 + 1);
    FFT fft;
    if (fft.prepare(size)) {
        fft.forward(input, bins.data());
    } else {
        directDFT(input, size, bins.data());
    }
    return bins;
}

} // namespace DSP
} // namespace Primer
