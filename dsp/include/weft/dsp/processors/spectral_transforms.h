// ==============================================================================
// Layer 2: DSP Processor - Spectral Transforms
// ==============================================================================
// Frame-to-frame transforms on (magnitude, true frequency) spectra. Output
// frames always have the same bin count as their input.
//
// - transposeFrame: nearest-bin reassignment with frequency scaling
// - gateFrame: attenuate bins below a dB threshold
// - SpectralDecay: per-bin decaying maximum ("spectral reverb")
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocation after prepare())
// - Principle IX: Layer 2 (depends on Layer 0-1)
// ==============================================================================

#pragma once

#include "weft/dsp/core/spectral_simd.h"
#include "weft/dsp/primitives/spectral_frame.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Weft {
namespace DSP {

// =============================================================================
// Transpose
// =============================================================================

/// @brief Move bin k to bin round(k * factor), scaling its frequency.
///
/// Magnitudes landing on the same bin are summed; the last contribution sets
/// the frequency. Bins mapped outside [0, numBins) are dropped.
/// @pre in.numBins() == out.numBins(); in and out do not alias
inline void transposeFrame(const SpectralFrame& in, SpectralFrame& out, float factor) noexcept {
    const size_t bins = in.numBins();
    std::fill(out.magnitude.begin(), out.magnitude.end(), 0.0f);
    std::fill(out.frequency.begin(), out.frequency.end(), 0.0f);

    for (size_t k = 0; k < bins; ++k) {
        const float target = std::round(static_cast<float>(k) * factor);
        if (target < 0.0f || target >= static_cast<float>(bins)) continue;
        const auto index = static_cast<size_t>(target);
        out.magnitude[index] += in.magnitude[k];
        out.frequency[index] = in.frequency[k] * factor;
    }
    out.index = in.index;
    out.geometry = in.geometry;
}

// =============================================================================
// Gate
// =============================================================================

/// @brief Multiply bins quieter than thresholdDb by damp; pass the rest.
/// @param levelScratch At least numBins floats of scratch
inline void gateFrame(const SpectralFrame& in, SpectralFrame& out, float thresholdDb,
                      float damp, float* levelScratch) noexcept {
    const size_t bins = in.numBins();
    batchLog10(in.magnitude.data(), levelScratch, bins);

    // 20*log10(mag) < thresh  <=>  log10(mag) < thresh/20
    const float threshold = thresholdDb / 20.0f;
    for (size_t k = 0; k < bins; ++k) {
        const float mag = in.magnitude[k];
        out.magnitude[k] = levelScratch[k] < threshold ? mag * damp : mag;
        out.frequency[k] = in.frequency[k];
    }
    out.index = in.index;
    out.geometry = in.geometry;
}

// =============================================================================
// SpectralDecay
// =============================================================================

/// @brief Per-bin decaying maximum.
///
/// Each bin remembers its level. A louder input resets the memory; a quieter
/// one lets the memory decay towards it with feedback `revtime`, scaled by a
/// damping factor that compounds bin by bin, so high bins decay faster.
///
///   feedback = 0.75 + 0.25 * revtime      (revtime in [0, 1])
///   dampStep = 0.997 + 0.003 * damp       (damp in [0, 1], 1 = no extra loss)
class SpectralDecay {
public:
    /// @note NOT real-time safe
    void prepare(size_t maxBins) {
        memory_.assign(maxBins, 0.0f);
    }

    void reset() noexcept {
        std::fill(memory_.begin(), memory_.end(), 0.0f);
    }

    void process(const SpectralFrame& in, SpectralFrame& out, float revtime,
                 float damp) noexcept {
        const float feedback = 0.75f + 0.25f * std::clamp(revtime, 0.0f, 1.0f);
        const float dampStep = 0.997f + 0.003f * std::clamp(damp, 0.0f, 1.0f);

        const size_t bins = std::min(in.numBins(), memory_.size());
        float amp = 1.0f;
        for (size_t k = 0; k < bins; ++k) {
            const float mag = in.magnitude[k];
            if (mag > memory_[k]) {
                memory_[k] = mag;
            } else {
                memory_[k] = mag + (memory_[k] - mag) * feedback * amp;
            }
            out.magnitude[k] = memory_[k];
            out.frequency[k] = in.frequency[k];
            amp *= dampStep;
        }
        out.index = in.index;
        out.geometry = in.geometry;
    }

private:
    std::vector<float> memory_;
};

} // namespace DSP
} // namespace Weft
