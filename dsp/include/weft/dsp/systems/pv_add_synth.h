// ==============================================================================
// Layer 3: System Component - PVAddSynth
// ==============================================================================
// Additive resynthesis: an oscillator bank driven by spectral frames.
// Oscillator k follows bin first + k*inc, its frequency scaled by `pitch`;
// amplitude and frequency glide linearly over each hop. Bins outside the
// frame, and frequencies at or above Nyquist, are silent.
//
// `pitch` is read at each frame's offset. `num`, `first` and `inc` are
// structural and take effect at the next frame.
//
// Channel layout: lmax(input channels, pitch, num, first, inc, mul, add)
// members; each input channel feeds exactly one member.
// ==============================================================================

#pragma once

#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/primitives/output_node.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/primitives/spectral_frame.h"
#include "weft/dsp/primitives/spectral_input.h"
#include "weft/dsp/primitives/spectral_node.h"
#include "weft/dsp/processors/oscillator_bank.h"
#include "weft/dsp/systems/audio_component.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/spectral_component.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

// =============================================================================
// PVAddSynthNode
// =============================================================================

class PVAddSynthNode : public OutputNode {
public:
    static constexpr float kDefaultPitch = 1.0f;
    static constexpr size_t kDefaultNum = 100;
    static constexpr size_t kDefaultFirst = 0;
    static constexpr size_t kDefaultInc = 1;

    /// @throws ConfigurationError for a null input or one already consumed
    PVAddSynthNode(const StreamFormat& format, const SpectralNodePtr& input,
                   Parameter pitch = kDefaultPitch)
        : OutputNode(format)
        , input_(input, this)
        , maxFftSize_(input_.node().maxFftSize())
        , pitch_(std::move(pitch)) {
        bank_.prepare(maxFftSize_ / 2 + 1, format.sampleRate);
    }

    void setInput(SpectralNodePtr input) { input_.attach(std::move(input), maxFftSize_); }

    void setPitch(Parameter value) { pitch_.publish(std::move(value)); }
    void setNum(size_t num) noexcept { num_.store(num, std::memory_order_release); }
    void setFirst(size_t first) noexcept { first_.store(first, std::memory_order_release); }

    /// @brief Bin stride between oscillators; at least 1.
    void setInc(size_t inc) noexcept {
        inc_.store(std::max<size_t>(inc, 1), std::memory_order_release);
    }

    bool setParameter(std::string_view name, const Parameter& value) override {
        if (name == "pitch") {
            setPitch(value);
            return true;
        }
        return OutputNode::setParameter(name, value);
    }

    [[nodiscard]] const SpectralInput& input() const noexcept { return input_; }

protected:
    void renderSignal(const BlockContext& ctx, AudioStream& out) override {
        const SpectralStream& in = input_.pull(ctx);
        const std::span<const FrameEvent> events = in.events();
        pitch_.update();

        OscillatorBank::Mapping mapping;
        mapping.num = num_.load(std::memory_order_acquire);
        mapping.first = first_.load(std::memory_order_acquire);
        mapping.inc = inc_.load(std::memory_order_acquire);

        size_t next = 0;
        for (size_t i = 0; i < ctx.blockSize; ++i) {
            out[i] = bank_.nextSample();
            for (; next < events.size() && events[next].offset <= i; ++next) {
                const FrameEvent& event = events[next];
                if (event.kind != FrameEventKind::Frame) continue;
                const SpectralFrame& frame = in.frame(event.frame);
                mapping.pitch = pitch_.valueAt(ctx, event.offset);
                bank_.setTargets(frame, mapping, frame.geometry.hopSize());
            }
        }
    }

private:
    SpectralInput input_;
    size_t maxFftSize_;
    ParameterSlot pitch_;
    OscillatorBank bank_;
    std::atomic<size_t> num_{kDefaultNum};
    std::atomic<size_t> first_{kDefaultFirst};
    std::atomic<size_t> inc_{kDefaultInc};
};

// =============================================================================
// PVAddSynth
// =============================================================================

class PVAddSynth : public AudioComponent {
public:
    /// @throws ConfigurationError for an empty operand list or an input
    /// channel that already feeds another stage
    PVAddSynth(const StreamFormat& format, const SpectralSource& input,
               const ParameterList& pitch = {PVAddSynthNode::kDefaultPitch},
               const std::vector<size_t>& num = {PVAddSynthNode::kDefaultNum},
               const std::vector<size_t>& first = {PVAddSynthNode::kDefaultFirst},
               const std::vector<size_t>& inc = {PVAddSynthNode::kDefaultInc},
               const ParameterList& mul = {1.0f}, const ParameterList& add = {0.0f})
        : AudioComponent(format) {
        const size_t count = std::max(input.spectralChannelCount(),
                                      Multichannel::lmax(pitch, num, first, inc, mul, add));
        validateSpectralAttach(input, count);

        setOutputs(ChannelGroup<OutputNode>(count, [&](size_t i) {
            auto member = std::make_shared<PVAddSynthNode>(format, input.spectralChannel(i),
                                                           Multichannel::wrap(pitch, i));
            member->setNum(Multichannel::wrap(num, i));
            member->setFirst(Multichannel::wrap(first, i));
            member->setInc(Multichannel::wrap(inc, i));
            member->setMul(Multichannel::wrap(mul, i));
            member->setAdd(Multichannel::wrap(add, i));
            return member;
        }));
    }

    ~PVAddSynth() override { releaseOutputs(); }

    /// @throws ConfigurationError; no member changes in that case
    void setInput(const SpectralSource& input) {
        validateSpectralReattach(input, channelCount(), [&](size_t i) -> const SpectralInput& {
            return member(i).input();
        });
        for (size_t i = 0; i < channelCount(); ++i) member(i).setInput(input.spectralChannel(i));
    }

    void setPitch(const ParameterList& pitch) {
        Multichannel::requireNonEmpty(pitch, "pitch");
        for (size_t i = 0; i < channelCount(); ++i) member(i).setPitch(Multichannel::wrap(pitch, i));
    }

    void setNum(const std::vector<size_t>& num) {
        Multichannel::requireNonEmpty(num, "num");
        for (size_t i = 0; i < channelCount(); ++i) member(i).setNum(Multichannel::wrap(num, i));
    }

    void setFirst(const std::vector<size_t>& first) {
        Multichannel::requireNonEmpty(first, "first");
        for (size_t i = 0; i < channelCount(); ++i) member(i).setFirst(Multichannel::wrap(first, i));
    }

    void setInc(const std::vector<size_t>& inc) {
        Multichannel::requireNonEmpty(inc, "inc");
        for (size_t i = 0; i < channelCount(); ++i) member(i).setInc(Multichannel::wrap(inc, i));
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"pitch", 0.25f, 4.0f, ControlScale::Linear, PVAddSynthNode::kDefaultPitch},
                mulSpec()};
    }

private:
    [[nodiscard]] PVAddSynthNode& member(size_t i) const noexcept {
        return outputAs<PVAddSynthNode>(i);
    }
};

} // namespace DSP
} // namespace Weft
