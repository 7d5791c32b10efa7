// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis/synthesis windows for the phase vocoder.
//
// All generators use the periodic (DFT-even) form, dividing by N rather than
// N-1, so that Hanning/Hamming/Bartlett at overlap >= 2 satisfy COLA.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (in-place generators are noexcept and
//   allocation-free; only the vector factory allocates)
// - Principle IX: Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include "weft/dsp/core/math_constants.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Weft {
namespace DSP {

/// Tukey taper ratio used by WindowType::Tukey
inline constexpr float kTukeyAlpha = 0.66f;

/// @brief Window shapes selectable for analysis and resynthesis.
/// The numeric order is the control order exposed to automation surfaces.
enum class WindowType : uint8_t {
    Rectangular = 0,
    Hamming,
    Hanning,
    Bartlett,
    Blackman3,   ///< 3-term Blackman
    Blackman4,   ///< 4-term Blackman-Harris
    Blackman7,   ///< 7-term Blackman-Harris
    Tukey,       ///< Tukey, alpha = 0.66
    HalfSine
};

inline constexpr size_t kNumWindowTypes = 9;

namespace Window {

namespace detail {

/// Sum of cosines: a0 - a1 cos(x) + a2 cos(2x) - a3 cos(3x) + ...
inline void generateCosineSum(float* output, size_t size, const double* coeffs,
                              size_t numCoeffs) noexcept {
    const double N = static_cast<double>(size);
    for (size_t n = 0; n < size; ++n) {
        const double x = kTwoPiD * static_cast<double>(n) / N;
        double value = 0.0;
        double sign = 1.0;
        for (size_t k = 0; k < numCoeffs; ++k) {
            value += sign * coeffs[k] * std::cos(static_cast<double>(k) * x);
            sign = -sign;
        }
        output[n] = static_cast<float>(value);
    }
}

} // namespace detail

inline void generateRectangular(float* output, size_t size) noexcept {
    for (size_t n = 0; n < size; ++n) output[n] = 1.0f;
}

/// @note Formula: 0.54 - 0.46*cos(2*pi*n/N)
inline void generateHamming(float* output, size_t size) noexcept {
    static constexpr double kCoeffs[] = {0.54, 0.46};
    detail::generateCosineSum(output, size, kCoeffs, 2);
}

/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N)
inline void generateHanning(float* output, size_t size) noexcept {
    static constexpr double kCoeffs[] = {0.5, 0.5};
    detail::generateCosineSum(output, size, kCoeffs, 2);
}

/// @note Triangle peaking at n = N/2: 1 - |2n/N - 1|
inline void generateBartlett(float* output, size_t size) noexcept {
    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        output[n] = 1.0f - std::abs(2.0f * static_cast<float>(n) / N - 1.0f);
    }
}

inline void generateBlackman3(float* output, size_t size) noexcept {
    static constexpr double kCoeffs[] = {0.42, 0.5, 0.08};
    detail::generateCosineSum(output, size, kCoeffs, 3);
}

inline void generateBlackman4(float* output, size_t size) noexcept {
    static constexpr double kCoeffs[] = {0.35875, 0.48829, 0.14128, 0.01168};
    detail::generateCosineSum(output, size, kCoeffs, 4);
}

inline void generateBlackman7(float* output, size_t size) noexcept {
    static constexpr double kCoeffs[] = {0.2712203606, 0.4334446123, 0.21800412,
                                         0.0657853433, 0.0107618673, 0.0007700127,
                                         0.00001368088};
    detail::generateCosineSum(output, size, kCoeffs, 7);
}

/// @note Flat top with cosine tapers over alpha/2 of the window at each end
inline void generateTukey(float* output, size_t size, float alpha = kTukeyAlpha) noexcept {
    const float N = static_cast<float>(size);
    const float halfAlpha = alpha * 0.5f;
    for (size_t n = 0; n < size; ++n) {
        const float x = static_cast<float>(n) / N;
        if (x < halfAlpha) {
            output[n] = 0.5f * (1.0f + std::cos(kTwoPi / alpha * (x - halfAlpha)));
        } else if (x > 1.0f - halfAlpha) {
            output[n] = 0.5f * (1.0f + std::cos(kTwoPi / alpha * (x - 1.0f + halfAlpha)));
        } else {
            output[n] = 1.0f;
        }
    }
}

/// @note Formula: sin(pi*n/N)
inline void generateHalfSine(float* output, size_t size) noexcept {
    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        output[n] = std::sin(kPi * static_cast<float>(n) / N);
    }
}

/// @brief Fill a preallocated buffer with the given window.
/// @note Real-time safe (no allocation); O(size) trig evaluations
inline void generate(WindowType type, float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    switch (type) {
        case WindowType::Rectangular: generateRectangular(output, size); break;
        case WindowType::Hamming:     generateHamming(output, size); break;
        case WindowType::Hanning:     generateHanning(output, size); break;
        case WindowType::Bartlett:    generateBartlett(output, size); break;
        case WindowType::Blackman3:   generateBlackman3(output, size); break;
        case WindowType::Blackman4:   generateBlackman4(output, size); break;
        case WindowType::Blackman7:   generateBlackman7(output, size); break;
        case WindowType::Tukey:       generateTukey(output, size); break;
        case WindowType::HalfSine:    generateHalfSine(output, size); break;
    }
}

/// @brief Generate window coefficients into a new vector.
/// @note NOT real-time safe (allocates memory)
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size, 0.0f);
    generate(type, window.data(), size);
    return window;
}

/// @brief Clamp an integer control value onto a window type.
[[nodiscard]] constexpr WindowType fromIndex(int index) noexcept {
    if (index < 0) return WindowType::Rectangular;
    if (index >= static_cast<int>(kNumWindowTypes)) return WindowType::HalfSine;
    return static_cast<WindowType>(index);
}

} // namespace Window

} // namespace DSP
} // namespace Weft
