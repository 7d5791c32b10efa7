// ==============================================================================
// Layer 2: DSP Processor - Pan Laws
// ==============================================================================
// Gain laws for distributing one signal over N channels, or selecting among
// M sources.
//
// - cosinePanGains: raised-cosine window around a circle of N speakers (a line
//   for N = 2), narrowed by spread, power-normalized
// - equalPowerPanGains: cos/sin law between the adjacent pair bracketing
//   pan * (N - 1)
// - switchGains: triangular kernel centred on a voice pointer
// - selectorBracket: equal-power blend of the two sources bracketing a voice
//   pointer
//
// All functions clamp their inputs and are noexcept and allocation-free.
// ==============================================================================

#pragma once

#include "weft/dsp/core/crossfade_utils.h"
#include "weft/dsp/core/math_constants.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Weft {
namespace DSP {

/// Window exponent at spread = 0 (narrowest beam before hard panning)
inline constexpr float kMaxSpreadExponent = 20.0f;

// =============================================================================
// Cosine Pan
// =============================================================================

/// @brief Spread-controlled cosine pan.
///
/// Speaker i sits at position i/N on a circle (N >= 3) or at i on the line
/// [0, 1] (N = 2). The raw weight of speaker i is
///
///   w_i = (0.5 + 0.5 * cos(2*pi * d_i)) ^ e,    e = 20 * (1 - sqrt(spread))
///
/// with d_i the distance between pan and the speaker (half-distance on the
/// line). Gains are w_i / sqrt(sum w^2). spread = 0 hard-pans to the nearest
/// speaker; spread = 1 gives every speaker 1/sqrt(N).
///
/// @param gains Output, numChannels floats
inline void cosinePanGains(float pan, float spread, float* gains, size_t numChannels) noexcept {
    if (gains == nullptr || numChannels == 0) return;
    if (numChannels == 1) {
        gains[0] = 1.0f;
        return;
    }

    pan = std::clamp(pan, 0.0f, 1.0f);
    spread = std::clamp(spread, 0.0f, 1.0f);
    const bool line = numChannels == 2;
    const float n = static_cast<float>(numChannels);

    if (spread <= 0.0f) {
        std::fill_n(gains, numChannels, 0.0f);
        const size_t nearest = line
            ? static_cast<size_t>(std::lround(pan))
            : static_cast<size_t>(std::lround(pan * n)) % numChannels;
        gains[nearest] = 1.0f;
        return;
    }

    const float exponent = kMaxSpreadExponent * (1.0f - std::sqrt(spread));
    float sumSquares = 0.0f;
    for (size_t i = 0; i < numChannels; ++i) {
        const float position = line ? static_cast<float>(i) : static_cast<float>(i) / n;
        const float distance = line ? 0.5f * (pan - position) : pan - position;
        const float raised = 0.5f + 0.5f * std::cos(kTwoPi * distance);
        gains[i] = std::pow(raised, exponent);
        sumSquares += gains[i] * gains[i];
    }

    if (sumSquares <= 0.0f) return;
    const float norm = 1.0f / std::sqrt(sumSquares);
    for (size_t i = 0; i < numChannels; ++i) gains[i] *= norm;
}

// =============================================================================
// Equal-Power Pan
// =============================================================================

/// @brief Equal-power law between the adjacent pair bracketing pan*(N-1).
///
/// With j = min(floor(pan*(N-1)), N-2) and f = pan*(N-1) - j:
/// gain[j] = cos(f*pi/2), gain[j+1] = sin(f*pi/2), all others 0.
inline void equalPowerPanGains(float pan, float* gains, size_t numChannels) noexcept {
    if (gains == nullptr || numChannels == 0) return;
    std::fill_n(gains, numChannels, 0.0f);
    if (numChannels == 1) {
        gains[0] = 1.0f;
        return;
    }

    const float position = std::clamp(pan, 0.0f, 1.0f) * static_cast<float>(numChannels - 1);
    const size_t lower = std::min(static_cast<size_t>(position), numChannels - 2);
    const float frac = position - static_cast<float>(lower);
    const auto [fadeOut, fadeIn] = equalPowerGains(frac);
    gains[lower] = fadeOut;
    gains[lower + 1] = fadeIn;
}

// =============================================================================
// Channel Switch
// =============================================================================

/// @brief Gain of output `channel` for a voice pointer: max(0, 1 - |voice - j|).
[[nodiscard]] inline float switchGain(float voice, size_t channel) noexcept {
    return std::max(0.0f, 1.0f - std::abs(voice - static_cast<float>(channel)));
}

/// @brief Triangular switch gains for all outputs; voice clamped to [0, N-1].
inline void switchGains(float voice, float* gains, size_t numChannels) noexcept {
    if (gains == nullptr || numChannels == 0) return;
    voice = std::clamp(voice, 0.0f, static_cast<float>(numChannels - 1));
    for (size_t j = 0; j < numChannels; ++j) gains[j] = switchGain(voice, j);
}

// =============================================================================
// Source Selector
// =============================================================================

struct SelectorBracket {
    size_t lower = 0;
    size_t upper = 0;
    float lowerGain = 1.0f;
    float upperGain = 0.0f;
};

/// @brief Bracketing sources and equal-power weights for a voice pointer.
///
/// j = min(floor(voice), M-2), f = voice - j; the output is
/// src[j]*cos(f*pi/2) + src[j+1]*sin(f*pi/2). Voice is clamped to [0, M-1];
/// with a single source the output is that source.
[[nodiscard]] inline SelectorBracket selectorBracket(float voice, size_t numSources) noexcept {
    if (numSources <= 1) return {};

    voice = std::clamp(voice, 0.0f, static_cast<float>(numSources - 1));
    const size_t lower = std::min(static_cast<size_t>(voice), numSources - 2);
    const float frac = voice - static_cast<float>(lower);
    const auto [fadeOut, fadeIn] = equalPowerGains(frac);
    return {lower, lower + 1, fadeOut, fadeIn};
}

} // namespace DSP
} // namespace Weft
