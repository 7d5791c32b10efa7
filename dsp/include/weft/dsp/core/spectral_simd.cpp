// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Highway self-inclusion: foreach_target.h re-includes this file once per ISA
// target. The kernels compile for each target; HWY_EXPORT and
// HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best one at runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "weft/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Weft {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

constexpr float kTwoPiF = 6.283185307f;
constexpr float kInvTwoPiF = 0.159154943f;

inline float wrapScalar(float x) {
    return x - std::round(x * kInvTwoPiF) * kTwoPiF;
}

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
// ReconstructCartesianImpl: mags[] + phases[] -> Complex[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ReconstructCartesianImpl(const float* HWY_RESTRICT mags,
                              const float* HWY_RESTRICT phases,
                              size_t numBins,
                              float* HWY_RESTRICT complexData) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        const auto mag = hn::LoadU(d, mags + k);
        const auto phase = hn::LoadU(d, phases + k);

        const auto re = hn::Mul(mag, hn::Cos(d, phase));
        const auto im = hn::Mul(mag, hn::Sin(d, phase));

        hn::StoreInterleaved2(re, im, d, complexData + k * 2);
    }

    for (; k < numBins; ++k) {
        complexData[k * 2] = mags[k] * std::cos(phases[k]);
        complexData[k * 2 + 1] = mags[k] * std::sin(phases[k]);
    }
}

// -----------------------------------------------------------------------------
// PhaseToTrueFrequencyImpl: phase difference per hop -> Hz
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void PhaseToTrueFrequencyImpl(const float* HWY_RESTRICT phases,
                              float* HWY_RESTRICT lastPhases,
                              float* HWY_RESTRICT freqs, size_t numBins,
                              float expectedAdvance, float hzPerRadian) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto twoPi = hn::Set(d, kTwoPiF);
    const auto invTwoPi = hn::Set(d, kInvTwoPiF);
    const auto advance = hn::Set(d, expectedAdvance);
    const auto factor = hn::Set(d, hzPerRadian);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        const auto phase = hn::LoadU(d, phases + k);
        const auto delta = hn::Sub(phase, hn::LoadU(d, lastPhases + k));
        hn::StoreU(phase, d, lastPhases + k);

        const auto n = hn::Round(hn::Mul(delta, invTwoPi));
        const auto wrapped = hn::NegMulAdd(n, twoPi, delta);
        const auto binIndex = hn::Iota(d, static_cast<float>(k));

        hn::StoreU(hn::Mul(hn::MulAdd(binIndex, advance, wrapped), factor), d, freqs + k);
    }

    for (; k < numBins; ++k) {
        const float delta = wrapScalar(phases[k] - lastPhases[k]);
        lastPhases[k] = phases[k];
        freqs[k] = (delta + static_cast<float>(k) * expectedAdvance) * hzPerRadian;
    }
}

// -----------------------------------------------------------------------------
// TrueFrequencyToPhaseImpl: Hz -> accumulated synthesis phase
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void TrueFrequencyToPhaseImpl(const float* HWY_RESTRICT freqs,
                              float* HWY_RESTRICT sumPhases, size_t numBins,
                              float binWidthHz, float radiansPerHz) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto twoPi = hn::Set(d, kTwoPiF);
    const auto invTwoPi = hn::Set(d, kInvTwoPiF);
    const auto binWidth = hn::Set(d, binWidthHz);
    const auto factor = hn::Set(d, radiansPerHz);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        const auto binIndex = hn::Iota(d, static_cast<float>(k));
        const auto deviation = hn::NegMulAdd(binIndex, binWidth, hn::LoadU(d, freqs + k));
        const auto phase = hn::MulAdd(deviation, factor, hn::LoadU(d, sumPhases + k));

        const auto n = hn::Round(hn::Mul(phase, invTwoPi));
        hn::StoreU(hn::NegMulAdd(n, twoPi, phase), d, sumPhases + k);
    }

    for (; k < numBins; ++k) {
        const float deviation = freqs[k] - static_cast<float>(k) * binWidthHz;
        sumPhases[k] = wrapScalar(sumPhases[k] + deviation * radiansPerHz);
    }
}

// -----------------------------------------------------------------------------
// BatchLog10Impl
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void BatchLog10Impl(const float* HWY_RESTRICT input,
                    float* HWY_RESTRICT output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto minVal = hn::Set(d, 1e-10f);  // kMinLogInput

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::Max(hn::LoadU(d, input + k), minVal);
        hn::StoreU(hn::Log10(d, v), d, output + k);
    }
    for (; k < count; ++k) {
        output[k] = std::log10(std::max(input[k], 1e-10f));
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Weft

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "weft/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Weft {
namespace DSP {

HWY_EXPORT(ComputePolarImpl);
HWY_EXPORT(ReconstructCartesianImpl);
HWY_EXPORT(PhaseToTrueFrequencyImpl);
HWY_EXPORT(TrueFrequencyToPhaseImpl);
HWY_EXPORT(BatchLog10Impl);

void computePolarBulk(const float* complexData, size_t numBins,
                      float* mags, float* phases) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputePolarImpl)(complexData, numBins, mags, phases);
}

void reconstructCartesianBulk(const float* mags, const float* phases,
                              size_t numBins, float* complexData) noexcept {
    HWY_DYNAMIC_DISPATCH(ReconstructCartesianImpl)(mags, phases, numBins, complexData);
}

void phaseToTrueFrequency(const float* phases, float* lastPhases, float* freqs,
                          size_t numBins, float expectedAdvance,
                          float hzPerRadian) noexcept {
    HWY_DYNAMIC_DISPATCH(PhaseToTrueFrequencyImpl)(phases, lastPhases, freqs, numBins,
                                                   expectedAdvance, hzPerRadian);
}

void trueFrequencyToPhase(const float* freqs, float* sumPhases, size_t numBins,
                          float binWidthHz, float radiansPerHz) noexcept {
    HWY_DYNAMIC_DISPATCH(TrueFrequencyToPhaseImpl)(freqs, sumPhases, numBins,
                                                   binWidthHz, radiansPerHz);
}

void batchLog10(const float* input, float* output, size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(BatchLog10Impl)(input, output, count);
}

}  // namespace DSP
}  // namespace Weft

#endif  // HWY_ONCE
