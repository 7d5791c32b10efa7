// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (constexpr, no allocations)
// - Principle IX: Layer 0 (no dependencies on other DSP layers)
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units.
// ==============================================================================

#pragma once

namespace Weft {
namespace DSP {

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
inline constexpr float kTwoPi = 2.0f * kPi;

/// Half Pi (quarter circle in radians)
/// Used by the equal-power gain laws: cos/sin over [0, kHalfPi]
inline constexpr float kHalfPi = kPi / 2.0f;

/// Double-precision Two Pi for phase accumulators
inline constexpr double kTwoPiD = 6.28318530717958647692;

} // namespace DSP
} // namespace Weft
