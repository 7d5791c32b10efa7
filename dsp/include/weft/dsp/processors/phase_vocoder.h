// ==============================================================================
// Layer 2: DSP Processor - Phase Vocoder Analysis / Resynthesis
// ==============================================================================
// Sample-synchronous phase vocoder engines.
//
// PhaseVocoderAnalyzer collects input one sample at a time and completes a
// frame every hop. Each frame is windowed and circularly rotated by
// (hop * frameCount) mod size so that bin phases are referenced to absolute
// time; the phase difference between frames is then the deviation from the
// bin centre, which is wrapped and converted to a true frequency in Hz.
// Magnitudes are normalized so that a sinusoid centred on a bin reads as its
// peak amplitude.
//
// PhaseVocoderSynthesizer accumulates the per-bin phase from the true
// frequencies, inverse-transforms, undoes the rotation (derived from the
// frame index, so a synthesizer attached mid-stream stays aligned), applies the synthesis
// window and overlap-adds. Output is read one sample at a time; the analysis
// -> resynthesis chain has a latency of exactly one frame size.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (allocation only in prepare(); configure()
//   and the per-sample/per-frame calls are noexcept and allocation-free)
// - Principle IX: Layer 2 (depends on Layer 0-1)
// ==============================================================================

#pragma once

#include "weft/dsp/core/math_constants.h"
#include "weft/dsp/core/spectral_simd.h"
#include "weft/dsp/core/window_functions.h"
#include "weft/dsp/primitives/fft.h"
#include "weft/dsp/primitives/spectral_frame.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

namespace Weft {
namespace DSP {

/// @brief Sum of a window's coefficients for a given type and size.
/// @param scratch Buffer of at least `size` floats
[[nodiscard]] inline float windowSum(WindowType type, size_t size, float* scratch) noexcept {
    Window::generate(type, scratch, size);
    return std::accumulate(scratch, scratch + size, 0.0f);
}

// =============================================================================
// PhaseVocoderAnalyzer
// =============================================================================

class PhaseVocoderAnalyzer {
public:
    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @note NOT real-time safe
    void prepare(size_t maxFftSize) {
        const size_t maxBins = maxFftSize / 2 + 1;
        fftBank_.prepare(maxFftSize);
        inputBuffer_.assign(maxFftSize, 0.0f);
        window_.assign(maxFftSize, 0.0f);
        frame_.assign(maxFftSize, 0.0f);
        spectrum_.assign(maxBins, Complex{});
        phases_.assign(maxBins, 0.0f);
        lastPhases_.assign(maxBins, 0.0f);
    }

    /// @brief Switch to a new geometry and reset all frame state.
    /// @pre geometry.fftSize <= the prepared maximum
    void configure(const FrameGeometry& geometry) noexcept {
        geometry_ = geometry;
        fft_ = fftBank_.get(geometry.fftSize);
        const size_t size = geometry.fftSize;
        const float sum = windowSum(geometry.window, size, window_.data());
        amplitudeScale_ = sum > 0.0f ? 2.0f / sum : 0.0f;

        const size_t hop = geometry.hopSize();
        expectedAdvance_ = kTwoPi * static_cast<float>(hop) / static_cast<float>(size);
        hzPerRadian_ = static_cast<float>(geometry.sampleRate /
                                          (kTwoPiD * static_cast<double>(hop)));
        reset();
    }

    void reset() noexcept {
        std::fill(inputBuffer_.begin(), inputBuffer_.end(), 0.0f);
        std::fill(lastPhases_.begin(), lastPhases_.end(), 0.0f);
        inputCount_ = geometry_.fftSize - geometry_.hopSize();
        rotation_ = 0;
        framesAnalyzed_ = 0;
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Append one input sample.
    /// @return true if a frame is complete and analyze() must be called
    [[nodiscard]] bool pushSample(float sample) noexcept {
        inputBuffer_[inputCount_++] = sample;
        return inputCount_ >= geometry_.fftSize;
    }

    /// @brief Analyze the completed frame into `out` and advance one hop.
    /// @pre out.numBins() == geometry().numBins()
    void analyze(SpectralFrame& out) noexcept {
        const size_t size = geometry_.fftSize;
        const size_t hop = geometry_.hopSize();
        const size_t bins = geometry_.numBins();

        for (size_t n = 0; n < size; ++n) {
            frame_[(n + rotation_) % size] = inputBuffer_[n] * window_[n];
        }

        if (fft_ != nullptr) {
            fft_->forward(frame_.data(), spectrum_.data());
        }

        computePolarBulk(reinterpret_cast<const float*>(spectrum_.data()), bins,
                         out.magnitude.data(), phases_.data());
        phaseToTrueFrequency(phases_.data(), lastPhases_.data(), out.frequency.data(),
                             bins, expectedAdvance_, hzPerRadian_);
        for (size_t k = 0; k < bins; ++k) {
            out.magnitude[k] *= amplitudeScale_;
        }
        out.index = framesAnalyzed_++;
        out.geometry = geometry_;

        std::copy(inputBuffer_.begin() + static_cast<std::ptrdiff_t>(hop),
                  inputBuffer_.begin() + static_cast<std::ptrdiff_t>(size),
                  inputBuffer_.begin());
        inputCount_ = size - hop;
        rotation_ = (rotation_ + hop) % size;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const FrameGeometry& geometry() const noexcept { return geometry_; }
    [[nodiscard]] uint64_t framesAnalyzed() const noexcept { return framesAnalyzed_; }

private:
    FrameGeometry geometry_{};
    FFTBank fftBank_;
    FFT* fft_ = nullptr;

    std::vector<float> inputBuffer_;
    std::vector<float> window_;
    std::vector<float> frame_;
    std::vector<Complex> spectrum_;
    std::vector<float> phases_;
    std::vector<float> lastPhases_;

    size_t inputCount_ = 0;
    size_t rotation_ = 0;
    uint64_t framesAnalyzed_ = 0;
    float amplitudeScale_ = 0.0f;
    float expectedAdvance_ = 0.0f;
    float hzPerRadian_ = 0.0f;
};

// =============================================================================
// PhaseVocoderSynthesizer
// =============================================================================

class PhaseVocoderSynthesizer {
public:
    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @note NOT real-time safe
    void prepare(size_t maxFftSize) {
        const size_t maxBins = maxFftSize / 2 + 1;
        fftBank_.prepare(maxFftSize);
        window_.assign(maxFftSize, 0.0f);
        scratch_.assign(maxFftSize, 0.0f);
        frame_.assign(maxFftSize, 0.0f);
        accumulator_.assign(maxFftSize, 0.0f);
        outputBuffer_.assign(maxFftSize, 0.0f);
        spectrum_.assign(maxBins, Complex{});
        sumPhases_.assign(maxBins, 0.0f);
    }

    /// @brief Adopt the analysis geometry and reset all overlap-add state.
    void configure(const FrameGeometry& geometry, WindowType synthesisWindow) noexcept {
        geometry_ = geometry;
        fft_ = fftBank_.get(geometry.fftSize);
        const size_t hop = geometry.hopSize();
        binWidthHz_ = static_cast<float>(geometry.sampleRate / static_cast<double>(geometry.fftSize));
        radiansPerHz_ = static_cast<float>(kTwoPiD * static_cast<double>(hop) / geometry.sampleRate);
        setWindow(synthesisWindow);
        reset();
    }

    /// @brief Change the synthesis window. Call between frames.
    void setWindow(WindowType type) noexcept {
        windowType_ = type;
        const size_t size = geometry_.fftSize;
        const size_t hop = geometry_.hopSize();

        // Undo the analysis amplitude normalization and the overlap gain:
        // output = sum(frame * w_a * w_s) / (sum(w_a * w_s) / hop)
        const float analysisSum = windowSum(geometry_.window, size, scratch_.data());
        Window::generate(type, window_.data(), size);
        float productSum = 0.0f;
        for (size_t n = 0; n < size; ++n) {
            productSum += scratch_[n] * window_[n];
        }
        gain_ = productSum > 0.0f
                    ? (analysisSum * 0.5f) * static_cast<float>(hop) / productSum
                    : 0.0f;
    }

    void reset() noexcept {
        std::fill(accumulator_.begin(), accumulator_.end(), 0.0f);
        std::fill(outputBuffer_.begin(), outputBuffer_.end(), 0.0f);
        std::fill(sumPhases_.begin(), sumPhases_.end(), 0.0f);
        readPos_ = 0;
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Next output sample; zero until the first frame arrives.
    [[nodiscard]] float nextSample() noexcept {
        return readPos_ < geometry_.hopSize() ? outputBuffer_[readPos_++] : 0.0f;
    }

    /// @brief Resynthesize one frame and overlap-add it into the output.
    void synthesize(const SpectralFrame& in) noexcept {
        const size_t size = geometry_.fftSize;
        const size_t hop = geometry_.hopSize();
        const size_t bins = std::min(in.numBins(), geometry_.numBins());

        trueFrequencyToPhase(in.frequency.data(), sumPhases_.data(), bins,
                             binWidthHz_, radiansPerHz_);
        reconstructCartesianBulk(in.magnitude.data(), sumPhases_.data(), bins,
                                 reinterpret_cast<float*>(spectrum_.data()));
        for (size_t k = bins; k < geometry_.numBins(); ++k) {
            spectrum_[k] = {};
        }

        if (fft_ != nullptr) {
            fft_->inverse(spectrum_.data(), frame_.data());
        }

        // Same rotation the analysis applied to this frame
        const size_t rotation = static_cast<size_t>((in.index * hop) % size);
        for (size_t n = 0; n < size; ++n) {
            accumulator_[n] += frame_[(n + rotation) % size] * window_[n] * gain_;
        }

        std::copy_n(accumulator_.begin(), hop, outputBuffer_.begin());
        std::copy(accumulator_.begin() + static_cast<std::ptrdiff_t>(hop),
                  accumulator_.begin() + static_cast<std::ptrdiff_t>(size),
                  accumulator_.begin());
        std::fill(accumulator_.begin() + static_cast<std::ptrdiff_t>(size - hop),
                  accumulator_.begin() + static_cast<std::ptrdiff_t>(size), 0.0f);

        readPos_ = 0;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const FrameGeometry& geometry() const noexcept { return geometry_; }
    [[nodiscard]] WindowType window() const noexcept { return windowType_; }

private:
    FrameGeometry geometry_{};
    WindowType windowType_ = WindowType::Hanning;
    FFTBank fftBank_;
    FFT* fft_ = nullptr;

    std::vector<float> window_;
    std::vector<float> scratch_;
    std::vector<float> frame_;
    std::vector<float> accumulator_;
    std::vector<float> outputBuffer_;
    std::vector<Complex> spectrum_;
    std::vector<float> sumPhases_;

    size_t readPos_ = 0;
    float gain_ = 0.0f;
    float binWidthHz_ = 0.0f;
    float radiansPerHz_ = 0.0f;
};

} // namespace DSP
} // namespace Weft
