// ==============================================================================
// Layer 3: System Component - ChannelSwitch
// ==============================================================================
// Sends each input to `outs` outputs through a triangular kernel centred on a
// continuous voice pointer:
//
//   gain_j = max(0, 1 - |voice - j|),   voice clamped to [0, outs-1]
//
// At integer positions exactly one output carries the full signal. A
// modulated voice pointer is followed sample by sample.
//
// Channel layout: lmax(inputs, voice, mul, add) voices of `outs` members each;
// member v*outs + j is voice v on channel j.
// ==============================================================================

#pragma once

#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/channel_tap.h"
#include "weft/dsp/primitives/input_fader.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/processors/pan_laws.h"
#include "weft/dsp/systems/audio_component.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/input_group.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

class ChannelSwitch : public AudioComponent {
public:
    static constexpr float kDefaultVoice = 0.0f;

    /// @throws ConfigurationError for empty operand lists or zero outputs
    ChannelSwitch(const StreamFormat& format, const std::vector<NodePtr>& inputs,
                  size_t outs = 2, const ParameterList& voice = {kDefaultVoice},
                  const ParameterList& mul = {1.0f}, const ParameterList& add = {0.0f})
        : AudioComponent(format)
        , outs_(outs) {
        if (outs_ == 0) {
            throw ConfigurationError("ChannelSwitch needs at least one output channel");
        }
        faders_ = InputGroup::make(format, inputs);

        const size_t voices = Multichannel::lmax(inputs, voice, mul, add);
        voices_ = ChannelGroup<Voice>(voices, [&](size_t v) {
            auto node = std::make_shared<Voice>(format, InputGroup::forVoice(faders_, v), outs_);
            node->setVoice(Multichannel::wrap(voice, v));
            return node;
        });
        for (const auto& node : voices_) addTransportNode(*node);

        setOutputs(ChannelGroup<OutputNode>(voices * outs_, [&](size_t i) {
            auto tap = std::make_shared<ChannelTap>(format, voices_.node(i / outs_), i % outs_);
            tap->setMul(Multichannel::wrap(mul, i / outs_));
            tap->setAdd(Multichannel::wrap(add, i / outs_));
            return tap;
        }));
    }

    ~ChannelSwitch() override { releaseOutputs(); }

    void setInput(const std::vector<NodePtr>& inputs,
                  float fadeTimeSeconds = InputFader::kDefaultFadeTime) {
        InputGroup::retarget(faders_, inputs, fadeTimeSeconds);
    }

    void setVoice(const ParameterList& voice) {
        Multichannel::requireNonEmpty(voice, "voice");
        for (size_t v = 0; v < voices_.size(); ++v) {
            voices_[v].setVoice(Multichannel::wrap(voice, v));
        }
    }

    [[nodiscard]] size_t outs() const noexcept { return outs_; }
    [[nodiscard]] size_t voiceCount() const noexcept { return voices_.size(); }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"voice", 0.0f, static_cast<float>(outs_ - 1), ControlScale::Linear,
                 kDefaultVoice},
                mulSpec()};
    }

private:
    class Voice : public AudioNode {
    public:
        Voice(const StreamFormat& format, NodePtr input, size_t outs)
            : AudioNode(format, outs)
            , input_(std::move(input))
            , pointer_(format.blockSize, 0.0f) {}

        void setVoice(Parameter value) { voice_.publish(std::move(value)); }

        bool setParameter(std::string_view name, const Parameter& value) override {
            if (name == "voice") {
                setVoice(value);
                return true;
            }
            return false;
        }

    protected:
        void processBlock(const BlockContext& ctx) override {
            voice_.update();
            const float top = static_cast<float>(numOutputs() - 1);
            const AudioStream& in = input_->pull(ctx);

            if (!voice_.isModulated()) {
                const float voice = clampParameter(voice_.current().scalar(), 0.0f, top, "voice");
                for (size_t j = 0; j < numOutputs(); ++j) {
                    AudioStream& out = output(j);
                    const float gain = switchGain(voice, j);
                    for (size_t i = 0; i < ctx.blockSize; ++i) out[i] = in[i] * gain;
                }
                return;
            }

            voice_.fill(ctx, pointer_.data());
            for (size_t i = 0; i < ctx.blockSize; ++i) {
                pointer_[i] = std::clamp(pointer_[i], 0.0f, top);
            }
            for (size_t j = 0; j < numOutputs(); ++j) {
                AudioStream& out = output(j);
                for (size_t i = 0; i < ctx.blockSize; ++i) {
                    out[i] = in[i] * switchGain(pointer_[i], j);
                }
            }
        }

    private:
        NodePtr input_;
        ParameterSlot voice_{kDefaultVoice};
        std::vector<float> pointer_;
    };

    size_t outs_;
    ChannelGroup<InputFader> faders_;
    ChannelGroup<Voice> voices_;
};

} // namespace DSP
} // namespace Weft
