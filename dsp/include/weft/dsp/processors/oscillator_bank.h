// ==============================================================================
// Layer 2: DSP Processor - Oscillator Bank
// ==============================================================================
// Additive resynthesis from spectral frames. Oscillator k follows bin
// first + k*inc: on every frame its amplitude and frequency targets are set
// from that bin (frequency scaled by `pitch`), and both glide linearly to the
// target over one hop. Oscillators whose bin is out of range, or whose
// frequency would exceed Nyquist, glide to silence.
//
// Sine lookup uses a 8192-point table with linear interpolation.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (tables and state allocated in prepare())
// - Principle IX: Layer 2 (depends on Layer 0-1)
// ==============================================================================

#pragma once

#include "weft/dsp/core/math_constants.h"
#include "weft/dsp/primitives/spectral_frame.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Weft {
namespace DSP {

class OscillatorBank {
public:
    static constexpr size_t kSineTableSize = 8192;

    /// @brief Ramp/oscillator configuration applied on each frame.
    struct Mapping {
        size_t num = 100;
        size_t first = 0;
        size_t inc = 1;
        float pitch = 1.0f;
    };

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @note NOT real-time safe
    void prepare(size_t maxOscillators, double sampleRate) {
        sampleRate_ = sampleRate;
        nyquist_ = static_cast<float>(sampleRate * 0.5);
        sineTable_.resize(kSineTableSize + 1);
        for (size_t i = 0; i <= kSineTableSize; ++i) {
            sineTable_[i] = static_cast<float>(
                std::sin(kTwoPiD * static_cast<double>(i) / static_cast<double>(kSineTableSize)));
        }
        oscillators_.assign(maxOscillators, Oscillator{});
        active_ = 0;
    }

    void reset() noexcept {
        std::fill(oscillators_.begin(), oscillators_.end(), Oscillator{});
        active_ = 0;
        stepsRemaining_ = 0;
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Retarget the oscillators from a frame; ramps last `hop` samples.
    void setTargets(const SpectralFrame& frame, const Mapping& mapping, size_t hop) noexcept {
        const size_t num = std::min(mapping.num, oscillators_.size());
        const size_t bins = frame.numBins();
        const float rampScale = 1.0f / static_cast<float>(std::max<size_t>(hop, 1));

        // Oscillators dropped by a smaller `num` restart from silence
        for (size_t k = num; k < active_; ++k) {
            oscillators_[k] = Oscillator{};
        }

        for (size_t k = 0; k < num; ++k) {
            Oscillator& osc = oscillators_[k];
            // first + k*inc computed only when it stays below bins
            const bool inRange =
                mapping.first < bins &&
                (mapping.inc == 0 || k <= (bins - 1 - mapping.first) / mapping.inc);
            const size_t bin = inRange ? mapping.first + k * mapping.inc : bins;

            float targetAmp = 0.0f;
            float targetFreq = osc.freq;
            if (bin < bins) {
                const float freq = frame.frequency[bin] * mapping.pitch;
                if (std::abs(freq) < nyquist_) {
                    targetAmp = frame.magnitude[bin];
                    targetFreq = freq;
                }
            }
            if (osc.amp == 0.0f) {
                osc.freq = targetFreq;  // no glide from an idle oscillator
            }
            osc.ampInc = (targetAmp - osc.amp) * rampScale;
            osc.freqInc = (targetFreq - osc.freq) * rampScale;
        }

        active_ = num;
        stepsRemaining_ = hop;
    }

    /// @brief Sum of all oscillators for one sample.
    [[nodiscard]] float nextSample() noexcept {
        const bool ramping = stepsRemaining_ > 0;
        if (ramping) --stepsRemaining_;

        const double invSampleRate = 1.0 / sampleRate_;
        float sum = 0.0f;
        for (size_t k = 0; k < active_; ++k) {
            Oscillator& osc = oscillators_[k];
            if (ramping) {
                osc.amp += osc.ampInc;
                osc.freq += osc.freqInc;
            }
            if (osc.amp <= 0.0f) {
                osc.amp = 0.0f;
                continue;
            }
            sum += osc.amp * lookup(osc.phase);
            osc.phase += static_cast<double>(osc.freq) * invSampleRate;
            osc.phase -= std::floor(osc.phase);
        }
        return sum;
    }

    [[nodiscard]] size_t capacity() const noexcept { return oscillators_.size(); }

private:
    struct Oscillator {
        double phase = 0.0;   ///< Normalized [0, 1)
        float amp = 0.0f;
        float freq = 0.0f;
        float ampInc = 0.0f;
        float freqInc = 0.0f;
    };

    [[nodiscard]] float lookup(double phase) const noexcept {
        const double position = phase * static_cast<double>(kSineTableSize);
        const auto index = static_cast<size_t>(position);
        const auto frac = static_cast<float>(position - static_cast<double>(index));
        const float a = sineTable_[index];
        const float b = sineTable_[index + 1];
        return a + (b - a) * frac;
    }

    std::vector<float> sineTable_;
    std::vector<Oscillator> oscillators_;
    size_t active_ = 0;
    size_t stepsRemaining_ = 0;
    double sampleRate_ = 44100.0;
    float nyquist_ = 22050.0f;
};

} // namespace DSP
} // namespace Weft
