// ==============================================================================
// Layer 3: System Component - EqualPowerPan
// ==============================================================================
// Pans each input between the two adjacent outputs bracketing pan * (outs-1)
// with the cos/sin equal-power law. All other outputs are silent.
//
// Channel layout: lmax(inputs, pan, mul, add) voices of `outs` members each;
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

#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

class EqualPowerPan : public AudioComponent {
public:
    static constexpr float kDefaultPan = 0.5f;

    /// @throws ConfigurationError for empty operand lists or zero outputs
    EqualPowerPan(const StreamFormat& format, const std::vector<NodePtr>& inputs,
                  size_t outs = 2, const ParameterList& pan = {kDefaultPan},
                  const ParameterList& mul = {1.0f}, const ParameterList& add = {0.0f})
        : AudioComponent(format)
        , outs_(outs) {
        if (outs_ == 0) {
            throw ConfigurationError("EqualPowerPan needs at least one output channel");
        }
        faders_ = InputGroup::make(format, inputs);

        const size_t voices = Multichannel::lmax(inputs, pan, mul, add);
        voices_ = ChannelGroup<Voice>(voices, [&](size_t v) {
            auto voice = std::make_shared<Voice>(format, InputGroup::forVoice(faders_, v), outs_);
            voice->setPan(Multichannel::wrap(pan, v));
            return voice;
        });
        for (const auto& voice : voices_) addTransportNode(*voice);

        setOutputs(ChannelGroup<OutputNode>(voices * outs_, [&](size_t i) {
            auto tap = std::make_shared<ChannelTap>(format, voices_.node(i / outs_), i % outs_);
            tap->setMul(Multichannel::wrap(mul, i / outs_));
            tap->setAdd(Multichannel::wrap(add, i / outs_));
            return tap;
        }));
    }

    ~EqualPowerPan() override { releaseOutputs(); }

    void setInput(const std::vector<NodePtr>& inputs,
                  float fadeTimeSeconds = InputFader::kDefaultFadeTime) {
        InputGroup::retarget(faders_, inputs, fadeTimeSeconds);
    }

    void setPan(const ParameterList& pan) {
        Multichannel::requireNonEmpty(pan, "pan");
        for (size_t v = 0; v < voices_.size(); ++v) voices_[v].setPan(Multichannel::wrap(pan, v));
    }

    [[nodiscard]] size_t outs() const noexcept { return outs_; }
    [[nodiscard]] size_t voiceCount() const noexcept { return voices_.size(); }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"pan", 0.0f, 1.0f, ControlScale::Linear, kDefaultPan}, mulSpec()};
    }

private:
    class Voice : public AudioNode {
    public:
        Voice(const StreamFormat& format, NodePtr input, size_t outs)
            : AudioNode(format, outs)
            , input_(std::move(input))
            , gains_(outs, 0.0f) {}

        void setPan(Parameter value) { pan_.publish(std::move(value)); }

        bool setParameter(std::string_view name, const Parameter& value) override {
            if (name == "pan") {
                setPan(value);
                return true;
            }
            return false;
        }

    protected:
        void processBlock(const BlockContext& ctx) override {
            pan_.update();
            const float pan = clampParameter(pan_.blockValue(ctx), 0.0f, 1.0f, "pan");
            equalPowerPanGains(pan, gains_.data(), gains_.size());

            const AudioStream& in = input_->pull(ctx);
            for (size_t j = 0; j < gains_.size(); ++j) {
                AudioStream& out = output(j);
                if (gains_[j] == 0.0f) {
                    out.clear();
                    continue;
                }
                for (size_t i = 0; i < ctx.blockSize; ++i) out[i] = in[i] * gains_[j];
            }
        }

    private:
        NodePtr input_;
        ParameterSlot pan_{kDefaultPan};
        std::vector<float> gains_;
    };

    size_t outs_;
    ChannelGroup<InputFader> faders_;
    ChannelGroup<Voice> voices_;
};

} // namespace DSP
} // namespace Weft
