// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk kernels for the phase vocoder, vectorized with Google Highway and
// dispatched at runtime to the best ISA (SSE2/AVX2/AVX-512/NEON).
//
// - polar <-> Cartesian conversion at the FFT boundaries
// - phase difference -> true frequency (analysis)
// - true frequency -> accumulated phase (resynthesis)
// - batch log10 for per-bin level comparison
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocations)
// - Principle IX: Layer 0 (no DSP dependencies)
// ==============================================================================

#pragma once

#include <cstddef>

namespace Weft {
namespace DSP {

/// Minimum input value for log operations. Clamps zero/negative to avoid NaN/inf.
inline constexpr float kMinLogInput = 1e-10f;

/// @brief Bulk compute magnitude and phase from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
/// @param phases Output phase array in radians (must hold numBins floats)
void computePolarBulk(const float* complexData, size_t numBins,
                      float* mags, float* phases) noexcept;

/// @brief Bulk reconstruct interleaved Complex data from magnitude and phase
/// @param complexData Output interleaved {real, imag} float pairs (2*numBins floats)
void reconstructCartesianBulk(const float* mags, const float* phases,
                              size_t numBins, float* complexData) noexcept;

/// @brief Convert frame phases to per-bin true frequencies.
///
/// For each bin k:
///   delta        = wrap(phases[k] - lastPhases[k])   (wrapped to [-pi, pi])
///   lastPhases[k] = phases[k]
///   freqs[k]     = (delta + k * expectedAdvance) * hzPerRadian
///
/// @param expectedAdvance Phase advance of bin 1 over one hop (2*pi*hop/size)
/// @param hzPerRadian     sampleRate / (2*pi*hop)
void phaseToTrueFrequency(const float* phases, float* lastPhases, float* freqs,
                          size_t numBins, float expectedAdvance,
                          float hzPerRadian) noexcept;

/// @brief Advance per-bin synthesis phases from true frequencies.
///
/// For each bin k:
///   sumPhases[k] = wrap(sumPhases[k] + (freqs[k] - k * binWidthHz) * radiansPerHz)
///
/// @param binWidthHz   sampleRate / size
/// @param radiansPerHz 2*pi*hop / sampleRate
void trueFrequencyToPhase(const float* freqs, float* sumPhases, size_t numBins,
                          float binWidthHz, float radiansPerHz) noexcept;

/// @brief Batch compute log10(x); non-positive inputs are clamped to kMinLogInput
void batchLog10(const float* input, float* output, size_t count) noexcept;

} // namespace DSP
} // namespace Weft
