// ==============================================================================
// Layer 2: Processor Tests - PhaseVocoderAnalyzer / PhaseVocoderSynthesizer
// ==============================================================================
// Driven sample by sample the way the spectral nodes drive them: the
// synthesizer output for a sample is read before a frame completing at that
// sample is resynthesized.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <weft/dsp/core/math_constants.h>
#include <weft/dsp/processors/phase_vocoder.h>

#include <cmath>
#include <cstdint>
#include <span>
#include <vector>

using namespace Weft::DSP;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 44100.0;

struct FrameStorage {
    explicit FrameStorage(size_t bins) : magnitude(bins, 0.0f), frequency(bins, 0.0f) {}

    SpectralFrame view() {
        return SpectralFrame{std::span<float>(magnitude), std::span<float>(frequency), 0, {}};
    }

    std::vector<float> magnitude;
    std::vector<float> frequency;
};

std::vector<float> sine(double freq, float amp, size_t length) {
    std::vector<float> out(length);
    for (size_t n = 0; n < length; ++n) {
        out[n] = amp * static_cast<float>(std::sin(kTwoPiD * freq * static_cast<double>(n) / kSampleRate));
    }
    return out;
}

/// Analyze `input` and keep the last frame.
SpectralFrame analyzeAll(PhaseVocoderAnalyzer& analyzer, FrameStorage& storage,
                         const std::vector<float>& input, size_t& frames) {
    SpectralFrame frame = storage.view();
    frames = 0;
    for (float x : input) {
        if (analyzer.pushSample(x)) {
            analyzer.analyze(frame);
            ++frames;
        }
    }
    return frame;
}

} // namespace

TEST_CASE("PhaseVocoderAnalyzer completes a frame every hop", "[phase_vocoder][analysis]") {
    const FrameGeometry geometry{64, 4, WindowType::Hanning, kSampleRate};
    PhaseVocoderAnalyzer analyzer;
    analyzer.prepare(64);
    analyzer.configure(geometry);

    std::vector<size_t> completions;
    FrameStorage storage(geometry.numBins());
    SpectralFrame frame = storage.view();
    for (size_t n = 0; n < 80; ++n) {
        if (analyzer.pushSample(0.0f)) {
            analyzer.analyze(frame);
            completions.push_back(n);
        }
    }

    REQUIRE(completions == std::vector<size_t>{15, 31, 47, 63, 79});
    REQUIRE(analyzer.framesAnalyzed() == 5);
    REQUIRE(frame.index == 4);
    REQUIRE(frame.geometry == geometry);
}

TEST_CASE("PhaseVocoderAnalyzer normalizes magnitudes to peak amplitude",
          "[phase_vocoder][analysis]") {
    const FrameGeometry geometry{1024, 4, WindowType::Hanning, kSampleRate};
    const size_t bin = 40;
    const double freq = static_cast<double>(bin) * kSampleRate / 1024.0;

    PhaseVocoderAnalyzer analyzer;
    analyzer.prepare(1024);
    analyzer.configure(geometry);
    FrameStorage storage(geometry.numBins());

    size_t frames = 0;
    const SpectralFrame frame = analyzeAll(analyzer, storage, sine(freq, 0.5f, 8192), frames);
    REQUIRE(frames > 4);

    REQUIRE(frame.magnitude[bin] == Approx(0.5f).margin(1e-3f));
    REQUIRE(frame.magnitude[bin + 1] == Approx(0.25f).margin(1e-3f));
    REQUIRE(frame.magnitude[bin + 5] == Approx(0.0f).margin(1e-3f));
}

TEST_CASE("PhaseVocoderAnalyzer estimates true frequency", "[phase_vocoder][analysis]") {
    const FrameGeometry geometry{1024, 4, WindowType::Hanning, kSampleRate};
    PhaseVocoderAnalyzer analyzer;
    analyzer.prepare(1024);
    analyzer.configure(geometry);
    FrameStorage storage(geometry.numBins());

    // 1000 Hz falls between bins 23 and 24
    size_t frames = 0;
    const SpectralFrame frame = analyzeAll(analyzer, storage, sine(1000.0, 1.0f, 8192), frames);

    REQUIRE(frame.frequency[23] == Approx(1000.0f).margin(0.5f));
    REQUIRE(frame.frequency[24] == Approx(1000.0f).margin(0.5f));
}

TEST_CASE("Analysis followed by resynthesis restores the input delayed by one frame",
          "[phase_vocoder][roundtrip]") {
    for (size_t overlaps : {size_t{4}, size_t{8}}) {
        DYNAMIC_SECTION("1024 / " << overlaps) {
            const size_t size = 1024;
            const FrameGeometry geometry{size, overlaps, WindowType::Hanning, kSampleRate};

            PhaseVocoderAnalyzer analyzer;
            analyzer.prepare(size);
            analyzer.configure(geometry);
            PhaseVocoderSynthesizer synth;
            synth.prepare(size);
            synth.configure(geometry, WindowType::Hanning);

            FrameStorage storage(geometry.numBins());
            SpectralFrame frame = storage.view();

            std::vector<float> input(16384);
            for (size_t n = 0; n < input.size(); ++n) {
                const double t = static_cast<double>(n) / kSampleRate;
                input[n] = static_cast<float>(0.5 * std::sin(kTwoPiD * 440.0 * t) +
                                              0.25 * std::sin(kTwoPiD * 1234.5 * t));
            }

            std::vector<float> output(input.size());
            for (size_t n = 0; n < input.size(); ++n) {
                output[n] = synth.nextSample();
                if (analyzer.pushSample(input[n])) {
                    analyzer.analyze(frame);
                    synth.synthesize(frame);
                }
            }

            for (size_t n = 3 * size; n < input.size(); ++n) {
                REQUIRE(output[n] == Approx(input[n - size]).margin(2e-3f));
            }
        }
    }
}

TEST_CASE("PhaseVocoderSynthesizer is silent before the first frame", "[phase_vocoder][synthesis]") {
    PhaseVocoderSynthesizer synth;
    synth.prepare(256);
    synth.configure({256, 4, WindowType::Hanning, kSampleRate}, WindowType::Hanning);

    for (int i = 0; i < 1000; ++i) {
        REQUIRE(synth.nextSample() == 0.0f);
    }
}

TEST_CASE("PhaseVocoderSynthesizer reconfigures between geometries", "[phase_vocoder][synthesis]") {
    PhaseVocoderSynthesizer synth;
    synth.prepare(2048);

    synth.configure({512, 4, WindowType::Hanning, kSampleRate}, WindowType::Hamming);
    REQUIRE(synth.geometry().fftSize == 512);
    REQUIRE(synth.window() == WindowType::Hamming);

    synth.configure({2048, 8, WindowType::Hanning, kSampleRate}, WindowType::Hanning);
    REQUIRE(synth.geometry().hopSize() == 256);

    synth.setWindow(WindowType::Blackman3);
    REQUIRE(synth.window() == WindowType::Blackman3);
}

TEST_CASE("Small frame sizes use the direct transform", "[phase_vocoder][edge]") {
    const FrameGeometry geometry{16, 2, WindowType::Hanning, 1000.0};
    PhaseVocoderAnalyzer analyzer;
    analyzer.prepare(16);
    analyzer.configure(geometry);

    FrameStorage storage(geometry.numBins());
    std::vector<float> input(256);
    for (size_t n = 0; n < input.size(); ++n) {
        input[n] = static_cast<float>(std::cos(kTwoPiD * 4.0 * static_cast<double>(n) / 16.0));
    }

    size_t frames = 0;
    const SpectralFrame frame = analyzeAll(analyzer, storage, input, frames);
    REQUIRE(frames == 32);
    REQUIRE(frame.magnitude[4] == Approx(1.0f).margin(1e-3f));
    REQUIRE(frame.frequency[4] == Approx(250.0f).margin(0.1f));
}
