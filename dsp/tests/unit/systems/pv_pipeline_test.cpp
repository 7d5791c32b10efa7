// ==============================================================================
// Layer 3: System Tests - Phase Vocoder Pipeline
// ==============================================================================
// PVAnalysis feeding transforms and resynthesis, driven block by block through
// the synthesis channel.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <weft/dsp/core/dsp_errors.h>
#include <weft/dsp/systems/pv_add_synth.h>
#include <weft/dsp/systems/pv_analysis.h>
#include <weft/dsp/systems/pv_synth.h>
#include <weft/dsp/systems/pv_transforms.h>

#include "test_helpers/test_nodes.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

using Catch::Approx;
using namespace Weft::DSP;
using namespace TestHelpers;

namespace {

const StreamFormat kFormat{44100.0, 256};
constexpr double kSineHz = 441.0;
constexpr float kSineAmp = 0.5f;

float sineAt(size_t n) {
    return kSineAmp * static_cast<float>(std::sin(6.283185307179586 * kSineHz *
                                                  static_cast<double>(n) / kFormat.sampleRate));
}

float rms(const std::vector<float>& x, size_t begin, size_t end) {
    double sum = 0.0;
    for (size_t n = begin; n < end; ++n) sum += static_cast<double>(x[n]) * x[n];
    return static_cast<float>(std::sqrt(sum / static_cast<double>(end - begin)));
}

float maxAbs(const std::vector<float>& x, size_t begin, size_t end) {
    float peak = 0.0f;
    for (size_t n = begin; n < end; ++n) peak = std::max(peak, std::abs(x[n]));
    return peak;
}

size_t upwardCrossings(const std::vector<float>& x, size_t begin, size_t end) {
    size_t count = 0;
    for (size_t n = begin + 1; n < end; ++n) {
        if (x[n - 1] < 0.0f && x[n] >= 0.0f) ++count;
    }
    return count;
}

std::vector<float> renderChannel(const AudioComponent& component, size_t blocks) {
    NodePtr node = component.channel(0);
    return render(*node, kFormat, blocks);
}

/// Frames and reconfigure events seen on a spectral channel.
struct StreamLog {
    std::vector<size_t> frameBins;
    std::vector<FrameGeometry> reconfigures;
};

void collect(SpectralNode& node, uint64_t first, size_t count, StreamLog& log) {
    for (uint64_t b = first; b < first + count; ++b) {
        const SpectralStream& stream = node.pull(BlockContext::forBlock(kFormat, b));
        for (const FrameEvent& event : stream.events()) {
            if (event.kind == FrameEventKind::Reconfigure) {
                log.reconfigures.push_back(event.geometry);
            } else {
                log.frameBins.push_back(stream.frame(event.frame).numBins());
            }
        }
    }
}

} // namespace

// ==============================================================================
// Analysis -> Synthesis
// ==============================================================================

TEST_CASE("PVAnalysis into PVSynth reproduces the input one frame late", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    PVAnalysis analysis(kFormat, {sine});
    PVSynth synth(kFormat, analysis);

    REQUIRE(synth.channelCount() == 1);
    REQUIRE(analysis.geometry(0).fftSize == 1024);

    const std::vector<float> out = renderChannel(synth, 40);

    SECTION("the first window of output is the zero-padded start") {
        CHECK(maxAbs(out, 0, 256) == 0.0f);
        CHECK(maxAbs(out, 256, 1024) < 1e-4f);
    }

    SECTION("steady state matches the delayed input") {
        for (size_t n = 3072; n < out.size(); ++n) {
            INFO("sample " << n);
            REQUIRE(out[n] == Approx(sineAt(n - 1024)).margin(2e-3));
        }
    }
}

TEST_CASE("PVSynth mul and add scale the resynthesis", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    PVAnalysis analysis(kFormat, {sine});
    PVSynth synth(kFormat, analysis, {WindowType::Hanning}, {2.0f}, {0.25f});

    const std::vector<float> out = renderChannel(synth, 40);
    for (size_t n = 3072; n < out.size(); n += 37) {
        REQUIRE(out[n] == Approx(2.0f * sineAt(n - 1024) + 0.25f).margin(5e-3));
    }
}

TEST_CASE("PVSynth keeps rendering after its analysis is destroyed", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    auto analysis = std::make_unique<PVAnalysis>(kFormat, std::vector<NodePtr>{sine});
    PVSynth synth(kFormat, *analysis);
    NodePtr node = synth.channel(0);

    std::vector<float> out;
    renderBlocks(*node, kFormat, 0, 20, out);
    analysis.reset();
    REQUIRE_NOTHROW(renderBlocks(*node, kFormat, 20, 20, out));

    for (size_t n = 3072; n < out.size(); n += 29) {
        REQUIRE(out[n] == Approx(sineAt(n - 1024)).margin(2e-3));
    }
}

// ==============================================================================
// Attachment rules
// ==============================================================================

TEST_CASE("Spectral stages check frame sizes when they attach", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz);
    PVAnalysis analysis(kFormat, {sine}, {2048});
    PVTranspose transpose(kFormat, analysis, {1.5f});

    SECTION("a synth built for another size is rejected") {
        CHECK_THROWS_AS(PVSynth(kFormat, transpose, {WindowType::Hanning}, {1.0f}, {0.0f}, 1024),
                        ConfigurationError);
        CHECK_FALSE(transpose.spectralChannel(0)->isClaimed());
    }

    SECTION("a matching size attaches") {
        PVSynth synth(kFormat, transpose, {WindowType::Hanning}, {1.0f}, {0.0f}, 2048);
        CHECK(transpose.spectralChannel(0)->isClaimed());
    }

    SECTION("size 0 accepts any size") {
        CHECK_NOTHROW(PVSynth(kFormat, transpose));
    }
}

TEST_CASE("A spectral channel feeds a single consumer", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz);
    PVAnalysis analysis(kFormat, {sine});

    SECTION("a second synth is rejected") {
        PVSynth first(kFormat, analysis);
        CHECK_THROWS_AS(PVSynth(kFormat, analysis), ConfigurationError);
        CHECK_THROWS_AS(PVGate(kFormat, analysis), ConfigurationError);
    }

    SECTION("the channel frees when its consumer goes away") {
        {
            PVVerb verb(kFormat, analysis);
            CHECK(analysis.spectralChannel(0)->isClaimed());
        }
        CHECK_FALSE(analysis.spectralChannel(0)->isClaimed());
        CHECK_NOTHROW(PVAddSynth(kFormat, analysis));
    }
}

TEST_CASE("Spectral stages never fan one stream out to several members", "[systems][pv]") {
    auto left = makeNode<SineNode>(kFormat, kSineHz);
    auto right = makeNode<SineNode>(kFormat, 2.0 * kSineHz);

    SECTION("a longer parameter list than the input has channels is rejected") {
        PVAnalysis analysis(kFormat, {left});
        CHECK_THROWS_AS(PVTranspose(kFormat, analysis, {1.0f, 2.0f}), ConfigurationError);
        CHECK_THROWS_AS(PVSynth(kFormat, analysis, {WindowType::Hanning}, {1.0f, 0.5f}),
                        ConfigurationError);
        CHECK_THROWS_AS(PVAddSynth(kFormat, analysis, {1.0f}, {100, 50}), ConfigurationError);
        CHECK_FALSE(analysis.spectralChannel(0)->isClaimed());
    }

    SECTION("matching channel counts pair up") {
        PVAnalysis analysis(kFormat, {left, right});
        REQUIRE(analysis.spectralChannelCount() == 2);

        PVTranspose transpose(kFormat, analysis, {1.0f, 2.0f});
        PVSynth synth(kFormat, transpose);
        CHECK(transpose.spectralChannelCount() == 2);
        CHECK(synth.channelCount() == 2);
    }

    SECTION("analysis expands over its size list") {
        PVAnalysis analysis(kFormat, {left}, {1024, 512});
        REQUIRE(analysis.spectralChannelCount() == 2);
        CHECK(analysis.geometry(0).fftSize == 1024);
        CHECK(analysis.geometry(1).fftSize == 512);
    }
}

TEST_CASE("setInput moves a stage to another spectral source", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz);
    PVAnalysis a(kFormat, {sine});
    PVAnalysis b(kFormat, {sine}, {512});
    PVAnalysis c(kFormat, {sine});
    PVSynth synth(kFormat, a);

    SECTION("a size mismatch leaves the stage where it was") {
        CHECK_THROWS_AS(synth.setInput(b), ConfigurationError);
        CHECK(a.spectralChannel(0)->isClaimed());
        CHECK_FALSE(b.spectralChannel(0)->isClaimed());
    }

    SECTION("a matching source takes over the claim") {
        synth.setInput(c);
        CHECK_FALSE(a.spectralChannel(0)->isClaimed());
        CHECK(c.spectralChannel(0)->isClaimed());
    }

    SECTION("a source held by another stage is rejected") {
        PVGate gate(kFormat, c);
        CHECK_THROWS_AS(synth.setInput(c), ConfigurationError);
        CHECK(a.spectralChannel(0)->isClaimed());
    }

    SECTION("transforms re-attach the same way") {
        PVTranspose transpose(kFormat, c);
        CHECK_THROWS_AS(transpose.setInput(b), ConfigurationError);
        PVAnalysis d(kFormat, {sine});
        transpose.setInput(d);
        CHECK_FALSE(c.spectralChannel(0)->isClaimed());
        CHECK(d.spectralChannel(0)->isClaimed());
    }
}

// ==============================================================================
// Reconfiguration
// ==============================================================================

TEST_CASE("PVAnalysis applies a new size at a hop boundary", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz);
    PVAnalysis analysis(kFormat, {sine});
    SpectralNodePtr channel = analysis.spectralChannel(0);

    StreamLog before;
    collect(*channel, 0, 12, before);
    REQUIRE_FALSE(before.frameBins.empty());
    CHECK(std::all_of(before.frameBins.begin(), before.frameBins.end(),
                      [](size_t bins) { return bins == 513; }));
    CHECK(before.reconfigures.empty());

    analysis.setSize({512});
    CHECK(analysis.geometry(0).fftSize == 512);

    StreamLog after;
    collect(*channel, 12, 20, after);
    REQUIRE(after.reconfigures.size() == 1);
    CHECK(after.reconfigures[0].fftSize == 512);
    CHECK(after.reconfigures[0].overlaps == 4);
    REQUIRE_FALSE(after.frameBins.empty());
    CHECK(after.frameBins.back() == 257);

    SECTION("an invalid size changes nothing") {
        CHECK_THROWS_AS(analysis.setSize({1000}), ConfigurationError);
        CHECK_THROWS_AS(analysis.setOverlaps({3}), ConfigurationError);
        CHECK(analysis.geometry(0).fftSize == 512);
    }
}

TEST_CASE("PVAnalysis sizes its channels for frames above the default bound",
          "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);

    SECTION("a 16384-point analysis resynthesizes one frame late") {
        PVAnalysis analysis(kFormat, {sine}, {16384});
        REQUIRE(analysis.geometry(0).fftSize == 16384);
        REQUIRE(analysis.spectralChannel(0)->maxFftSize() == 16384);

        PVSynth synth(kFormat, analysis);
        const std::vector<float> out = renderChannel(synth, 256);
        for (size_t n = 3 * 16384; n < out.size(); n += 101) {
            INFO("sample " << n);
            REQUIRE(out[n] == Approx(sineAt(n - 16384)).margin(2e-3));
        }
    }

    SECTION("default channels reject a larger size later") {
        PVAnalysis analysis(kFormat, {sine});
        CHECK(analysis.spectralChannel(0)->maxFftSize() == kDefaultMaxFFTSize);
        CHECK_THROWS_AS(analysis.setSize({16384}), ConfigurationError);
        CHECK(analysis.geometry(0).fftSize == 1024);
    }

    SECTION("an explicit bound leaves room to grow") {
        PVAnalysis analysis(kFormat, {sine}, {1024}, {4}, {WindowType::Hanning}, 32768);
        CHECK_NOTHROW(analysis.setSize({32768}));
        CHECK(analysis.geometry(0).fftSize == 32768);
    }

    SECTION("sizes beyond the supported maximum are rejected") {
        CHECK_THROWS_AS(PVAnalysis(kFormat, {sine}, {kMaxFFTSize * 2}), ConfigurationError);
    }
}

TEST_CASE("PVSynth follows a size change upstream", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    PVAnalysis analysis(kFormat, {sine});
    PVSynth synth(kFormat, analysis);
    NodePtr out = synth.channel(0);

    std::vector<float> samples;
    renderBlocks(*out, kFormat, 0, 16, samples);
    analysis.setSize({512});
    renderBlocks(*out, kFormat, 16, 32, samples);

    // Settled at the new size
    const float expected = kSineAmp / std::sqrt(2.0f);
    CHECK(rms(samples, 40 * 256, samples.size()) == Approx(expected).epsilon(0.05));
}

// ==============================================================================
// Transforms
// ==============================================================================

TEST_CASE("PVGate removes or keeps bins by level", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    PVAnalysis analysis(kFormat, {sine});

    SECTION("bins below the threshold are damped to silence") {
        PVGate gate(kFormat, analysis, {0.0f}, {0.0f});
        PVSynth synth(kFormat, gate);
        const std::vector<float> out = renderChannel(synth, 40);
        CHECK(maxAbs(out, 0, out.size()) < 1e-6f);
    }

    SECTION("damp 1 is transparent") {
        PVGate gate(kFormat, analysis, {0.0f}, {1.0f});
        PVSynth synth(kFormat, gate);
        const std::vector<float> out = renderChannel(synth, 40);
        for (size_t n = 3072; n < out.size(); n += 11) {
            REQUIRE(out[n] == Approx(sineAt(n - 1024)).margin(2e-3));
        }
    }
}

TEST_CASE("PVVerb sustains the spectrum after the input stops", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    sine->play(0.1f);

    PVAnalysis analysis(kFormat, {sine});

    SECTION("without reverb the tail is silent") {
        PVSynth synth(kFormat, analysis);
        const std::vector<float> out = renderChannel(synth, 40);
        CHECK(rms(out, 3072, 5000) > 0.2f);
        CHECK(maxAbs(out, 8192, out.size()) < 1e-4f);
    }

    SECTION("full reverb time holds the tail") {
        PVVerb verb(kFormat, analysis, {1.0f}, {1.0f});
        PVSynth synth(kFormat, verb);
        const std::vector<float> out = renderChannel(synth, 40);
        CHECK(rms(out, 8192, out.size()) > 0.05f);
    }
}

TEST_CASE("PVTranspose at 1 passes frames through", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    PVAnalysis analysis(kFormat, {sine});
    PVTranspose transpose(kFormat, analysis);
    PVSynth synth(kFormat, transpose);

    const std::vector<float> out = renderChannel(synth, 40);
    for (size_t n = 3072; n < out.size(); n += 13) {
        REQUIRE(out[n] == Approx(sineAt(n - 1024)).margin(2e-3));
    }
}

// ==============================================================================
// Additive resynthesis
// ==============================================================================

TEST_CASE("PVAddSynth resynthesizes at the analyzed frequency", "[systems][pv]") {
    auto sine = makeNode<SineNode>(kFormat, kSineHz, kSineAmp);
    PVAnalysis analysis(kFormat, {sine});

    // 6144 samples of 441 Hz hold 61.44 cycles
    SECTION("pitch 1") {
        PVAddSynth synth(kFormat, analysis);
        const std::vector<float> out = renderChannel(synth, 40);
        const size_t crossings = upwardCrossings(out, 4096, out.size());
        CHECK(crossings >= 59);
        CHECK(crossings <= 64);
    }

    SECTION("pitch 2 doubles it") {
        PVAddSynth synth(kFormat, analysis, {2.0f});
        const std::vector<float> out = renderChannel(synth, 40);
        const size_t crossings = upwardCrossings(out, 4096, out.size());
        CHECK(crossings >= 120);
        CHECK(crossings <= 126);
    }

    SECTION("oscillators starting above the partial stay silent") {
        PVAddSynth synth(kFormat, analysis, {1.0f}, {10}, {100});
        const std::vector<float> out = renderChannel(synth, 40);
        CHECK(rms(out, 4096, out.size()) < 0.01f);
    }
}
