// ==============================================================================
// Layer 0: Core Utility - Crossfade Utilities
// ==============================================================================
// Shared crossfade math for input replacement and source selection.
//
// Used by:
// - InputFader: squared-cosine input replacement
// - SourceSelector / EqualPowerPan: equal-power pair blend
//
// Constitution Compliance:
// - Principle IX: Layer 0 (no dependencies except standard library)
// ==============================================================================

#pragma once

#include "weft/dsp/core/math_constants.h"

#include <cmath>
#include <cstddef>
#include <utility>

namespace Weft {
namespace DSP {

/// @brief Equal-power crossfade gains (fadeOut^2 + fadeIn^2 = 1).
///
/// At position 0.0: {1, 0}. At 0.5: {0.707, 0.707}. At 1.0: {0, 1}.
///
/// @param position Crossfade position [0.0 = start, 1.0 = complete]
/// @return {fadeOut, fadeIn}
/// @note Does NOT clamp position
[[nodiscard]] inline std::pair<float, float> equalPowerGains(float position) noexcept {
    return {std::cos(position * kHalfPi), std::sin(position * kHalfPi)};
}

/// @brief Squared-cosine crossfade gains (fadeOut + fadeIn = 1).
///
/// Gains are cos^2(theta) and sin^2(theta) with theta = position * pi/2. The
/// gains sum to one, so a source blended against itself passes unchanged.
///
/// @param position Crossfade position [0.0 = start, 1.0 = complete]
/// @return {fadeOut, fadeIn}
[[nodiscard]] inline std::pair<float, float> squaredCosineGains(float position) noexcept {
    const float c = std::cos(position * kHalfPi);
    const float s = std::sin(position * kHalfPi);
    return {c * c, s * s};
}

/// @brief Number of samples a crossfade of the given duration spans.
/// @return 0 for a zero or negative duration (hard switch)
[[nodiscard]] inline size_t crossfadeLengthSamples(float durationSeconds,
                                                   double sampleRate) noexcept {
    const double samples = static_cast<double>(durationSeconds) * sampleRate;
    return samples > 0.0 ? static_cast<size_t>(std::llround(samples)) : 0;
}

} // namespace DSP
} // namespace Weft
