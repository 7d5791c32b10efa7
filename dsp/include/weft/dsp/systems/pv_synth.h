// ==============================================================================
// Layer 3: System Component - PVSynth
// ==============================================================================
// Overlap-add resynthesis of spectral frames back to audio. Each member reads
// one spectral channel, inverse-transforms every frame with its own synthesis
// window (which need not match the analysis window) and overlap-adds the hops
// into its output.
//
// Frames are consumed at the sample they were emitted, after that sample's
// output has been read, which gives the analysis -> synthesis chain a latency
// of exactly one frame size.
//
// Channel layout: lmax(input channels, mul, add) members; each input channel
// feeds exactly one member.
// ==============================================================================

#pragma once

#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/core/window_functions.h"
#include "weft/dsp/primitives/output_node.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/primitives/spectral_frame.h"
#include "weft/dsp/primitives/spectral_input.h"
#include "weft/dsp/primitives/spectral_node.h"
#include "weft/dsp/processors/phase_vocoder.h"
#include "weft/dsp/systems/audio_component.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/spectral_component.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

// =============================================================================
// PVSynthNode
// =============================================================================

class PVSynthNode : public OutputNode {
public:
    /// @throws ConfigurationError for a null input or one already consumed
    PVSynthNode(const StreamFormat& format, const SpectralNodePtr& input,
                WindowType window = WindowType::Hanning)
        : OutputNode(format)
        , input_(input, this)
        , maxFftSize_(input_.node().maxFftSize())
        , window_(window) {
        synth_.prepare(maxFftSize_);
        synth_.configure(input_.node().frameGeometry(), window);
    }

    /// @throws ConfigurationError on an FFT-size mismatch or if `input`
    /// already feeds another stage
    void setInput(SpectralNodePtr input) { input_.attach(std::move(input), maxFftSize_); }

    /// @brief Synthesis window, applied before the next frame.
    void setWindow(WindowType window) noexcept { window_.store(window, std::memory_order_release); }

    [[nodiscard]] WindowType window() const noexcept {
        return window_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const SpectralInput& input() const noexcept { return input_; }

protected:
    void renderSignal(const BlockContext& ctx, AudioStream& out) override {
        const SpectralStream& in = input_.pull(ctx);
        const std::span<const FrameEvent> events = in.events();
        const WindowType window = window_.load(std::memory_order_acquire);

        size_t next = 0;
        for (size_t i = 0; i < ctx.blockSize; ++i) {
            out[i] = synth_.nextSample();
            for (; next < events.size() && events[next].offset <= i; ++next) {
                handleEvent(in, events[next], window);
            }
        }
    }

private:
    void handleEvent(const SpectralStream& in, const FrameEvent& event, WindowType window) noexcept {
        if (event.kind == FrameEventKind::Reconfigure) {
            synth_.configure(event.geometry, window);
            return;
        }
        const SpectralFrame& frame = in.frame(event.frame);
        if (!(frame.geometry == synth_.geometry())) {
            WEFT_DSP_LOG("pvsynth", "frame geometry %zu/%zu differs, resetting",
                         frame.geometry.fftSize, frame.geometry.overlaps);
            synth_.configure(frame.geometry, window);
        } else if (window != synth_.window()) {
            synth_.setWindow(window);
        }
        synth_.synthesize(frame);
    }

    SpectralInput input_;
    size_t maxFftSize_;
    std::atomic<WindowType> window_;
    PhaseVocoderSynthesizer synth_;
};

// =============================================================================
// PVSynth
// =============================================================================

class PVSynth : public AudioComponent {
public:
    static constexpr WindowType kDefaultWindow = WindowType::Hanning;

    /// @param expectedFftSize Frame size this stage is built for; 0 accepts
    /// whatever the input delivers
    /// @throws ConfigurationError on an FFT-size mismatch, an empty operand
    /// list, or an input channel that already feeds another stage
    PVSynth(const StreamFormat& format, const SpectralSource& input,
            const std::vector<WindowType>& windows = {kDefaultWindow},
            const ParameterList& mul = {1.0f}, const ParameterList& add = {0.0f},
            size_t expectedFftSize = 0)
        : AudioComponent(format) {
        const size_t count =
            std::max(input.spectralChannelCount(), Multichannel::lmax(windows, mul, add));
        validateSpectralAttach(input, count, expectedFftSize);

        setOutputs(ChannelGroup<OutputNode>(count, [&](size_t i) {
            auto member = std::make_shared<PVSynthNode>(format, input.spectralChannel(i),
                                                        Multichannel::wrap(windows, i));
            member->setMul(Multichannel::wrap(mul, i));
            member->setAdd(Multichannel::wrap(add, i));
            return member;
        }));
    }

    ~PVSynth() override { releaseOutputs(); }

    /// @throws ConfigurationError; no member changes in that case
    void setInput(const SpectralSource& input) {
        validateSpectralReattach(input, channelCount(), [&](size_t i) -> const SpectralInput& {
            return outputAs<PVSynthNode>(i).input();
        });
        for (size_t i = 0; i < channelCount(); ++i) {
            outputAs<PVSynthNode>(i).setInput(input.spectralChannel(i));
        }
    }

    void setWinType(const std::vector<WindowType>& windows) {
        Multichannel::requireNonEmpty(windows, "windows");
        for (size_t i = 0; i < channelCount(); ++i) {
            outputAs<PVSynthNode>(i).setWindow(Multichannel::wrap(windows, i));
        }
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override { return {mulSpec()}; }
};

} // namespace DSP
} // namespace Weft
