// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Real FFT via pffft (Pretty Fast FFT) with a direct DFT for the sizes below
// pffft's real-transform minimum. FFTBank holds one prepared transform per
// power-of-two size so that a spectral node can change its frame size on the
// render thread without allocating.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, allocations only in prepare())
// - Principle III: Modern C++ (C++20, RAII, constexpr)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include "weft/dsp/core/math_constants.h"

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

#include <pffft.h>

namespace Weft {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (frame sizes must be powers of two above 4)
inline constexpr size_t kMinFFTSize = 8;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 65536;

/// Storage bound of a spectral node when no larger frame size is requested
inline constexpr size_t kDefaultMaxFFTSize = 8192;

/// Number of power-of-two sizes in [kMinFFTSize, kMaxFFTSize]
inline constexpr size_t kNumFFTSizes =
    static_cast<size_t>(std::countr_zero(kMaxFFTSize) - std::countr_zero(kMinFFTSize)) + 1;

/// Smallest size pffft accepts for real transforms
inline constexpr size_t kMinPffftRealSize = 32;

/// @brief True if size is a power of two within [kMinFFTSize, kMaxFFTSize].
[[nodiscard]] constexpr bool isValidFFTSize(size_t size) noexcept {
    return size >= kMinFFTSize && size <= kMaxFFTSize && std::has_single_bit(size);
}

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Complex bin. Layout is {real, imag} so an array of Complex can be
/// passed to the interleaved SIMD kernels as float pairs.
struct Complex {
    float real = 0.0f;
    float imag = 0.0f;

    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }

    [[nodiscard]] float phase() const noexcept {
        return std::atan2(imag, real);
    }
};

static_assert(sizeof(Complex) == 2 * sizeof(float), "Complex must be two packed floats");

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

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

inline AlignedBuffer makeAlignedBuffer(size_t numFloats) {
    return AlignedBuffer{static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float)))};
}

} // namespace detail

// =============================================================================
// FFT
// =============================================================================

/// @brief Real forward/inverse FFT of one fixed size.
///
/// Sizes >= 32 go through pffft's ordered real transform; smaller sizes use a
/// direct DFT over precomputed twiddles.
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare for the given size (allocates setup and buffers).
    /// @param fftSize Power of 2 in [kMinFFTSize, kMaxFFTSize]
    /// @note NOT real-time safe. An invalid size leaves the FFT unprepared.
    void prepare(size_t fftSize) {
        size_ = 0;
        setup_.reset();
        if (!isValidFFTSize(fftSize)) return;

        if (fftSize >= kMinPffftRealSize) {
            setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
            if (!setup_) return;
            work_ = detail::makeAlignedBuffer(fftSize);
        } else {
            cosTable_.resize(fftSize);
            sinTable_.resize(fftSize);
            for (size_t n = 0; n < fftSize; ++n) {
                const double angle = kTwoPiD * static_cast<double>(n) / static_cast<double>(fftSize);
                cosTable_[n] = static_cast<float>(std::cos(angle));
                sinTable_[n] = static_cast<float>(std::sin(angle));
            }
        }

        buf1_ = detail::makeAlignedBuffer(fftSize);
        buf2_ = detail::makeAlignedBuffer(fftSize);
        size_ = fftSize;
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: N real samples -> N/2+1 complex bins (unscaled)
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        if (!setup_) {
            directForward(input, output);
            return;
        }

        std::copy_n(input, N, buf1_.get());
        pffft_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
        const float* fftOut = buf2_.get();
        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};
        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    /// @brief Inverse FFT: N/2+1 complex bins -> N real samples (scaled by 1/N)
    /// @note Imaginary parts of DC and Nyquist are ignored
    void inverse(const Complex* input, float* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        if (!setup_) {
            directInverse(input, output);
            return;
        }

        float* fftIn = buf1_.get();
        fftIn[0] = input[0].real;
        fftIn[1] = input[N / 2].real;
        for (size_t k = 1; k < N / 2; ++k) {
            fftIn[2 * k] = input[k].real;
            fftIn[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), fftIn, buf2_.get(),
                                work_.get(), PFFFT_BACKWARD);

        const float scale = 1.0f / static_cast<float>(N);
        const float* fftOut = buf2_.get();
        for (size_t i = 0; i < N; ++i) {
            output[i] = fftOut[i] * scale;
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0; }

private:
    void directForward(const float* input, Complex* output) const noexcept {
        const size_t N = size_;
        for (size_t k = 0; k <= N / 2; ++k) {
            float re = 0.0f;
            float im = 0.0f;
            for (size_t n = 0; n < N; ++n) {
                const size_t idx = (k * n) % N;
                re += input[n] * cosTable_[idx];
                im -= input[n] * sinTable_[idx];
            }
            output[k] = {re, im};
        }
    }

    void directInverse(const Complex* input, float* output) const noexcept {
        const size_t N = size_;
        const float scale = 1.0f / static_cast<float>(N);
        for (size_t n = 0; n < N; ++n) {
            // DC and Nyquist once, the other bins twice (Hermitian symmetry)
            float sum = input[0].real + input[N / 2].real * ((n % 2 == 0) ? 1.0f : -1.0f);
            for (size_t k = 1; k < N / 2; ++k) {
                const size_t idx = (k * n) % N;
                sum += 2.0f * (input[k].real * cosTable_[idx] - input[k].imag * sinTable_[idx]);
            }
            output[n] = sum * scale;
        }
    }

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer buf1_;  // Input staging
    detail::AlignedBuffer buf2_;  // Output staging
    detail::AlignedBuffer work_;  // pffft work buffer
    std::vector<float> cosTable_;
    std::vector<float> sinTable_;
};

// =============================================================================
// FFTBank
// =============================================================================

/// @brief One prepared FFT per power-of-two size up to a maximum.
///
/// Frame-size changes on the render thread select a different member instead
/// of preparing a new transform.
class FFTBank {
public:
    /// @brief Prepare every power-of-two size in [kMinFFTSize, maxFftSize].
    /// @note NOT real-time safe
    void prepare(size_t maxFftSize) {
        maxSize_ = std::min(maxFftSize, kMaxFFTSize);
        size_t slot = 0;
        for (size_t size = kMinFFTSize; size <= maxSize_ && slot < ffts_.size(); size *= 2, ++slot) {
            ffts_[slot].prepare(size);
        }
    }

    /// @brief Prepared transform for a size, or nullptr if out of range.
    [[nodiscard]] FFT* get(size_t fftSize) noexcept {
        if (!isValidFFTSize(fftSize) || fftSize > maxSize_) return nullptr;
        const auto slot = static_cast<size_t>(std::countr_zero(fftSize) - std::countr_zero(kMinFFTSize));
        return &ffts_[slot];
    }

    [[nodiscard]] size_t maxSize() const noexcept { return maxSize_; }

private:
    std::array<FFT, kNumFFTSizes> ffts_{};
    size_t maxSize_ = 0;
};

} // namespace DSP
} // namespace Weft
