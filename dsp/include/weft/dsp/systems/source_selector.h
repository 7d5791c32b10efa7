// ==============================================================================
// Layer 3: System Component - SourceSelector
// ==============================================================================
// Crossfades among M sources with a continuous voice pointer in [0, M-1]. The
// two sources bracketing the pointer are blended with the equal-power law:
//
//   j = min(floor(voice), M-2),  f = voice - j
//   out = src[j] * cos(f*pi/2) + src[j+1] * sin(f*pi/2)
//
// Sources may have different channel counts. With L the largest count, the
// component has lmax(voice, mul, add) * L members; member v*L + c reads
// channel c of every source (wrapped per source) under voice pointer v.
// ==============================================================================

#pragma once

#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/output_node.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/processors/pan_laws.h"
#include "weft/dsp/systems/audio_component.h"
#include "weft/dsp/systems/channel_group.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

/// One multichannel source: its channels as node handles.
using SourceChannels = std::vector<NodePtr>;

class SourceSelector : public AudioComponent {
public:
    static constexpr float kDefaultVoice = 0.0f;

    /// @throws ConfigurationError if there are no sources, a source has no
    /// channels, or an operand list is empty
    SourceSelector(const StreamFormat& format, const std::vector<SourceChannels>& sources,
                   const ParameterList& voice = {kDefaultVoice},
                   const ParameterList& mul = {1.0f}, const ParameterList& add = {0.0f})
        : AudioComponent(format) {
        validateSources(sources);
        numSources_ = sources.size();
        for (const auto& source : sources) length_ = std::max(length_, source.size());

        const size_t voices = Multichannel::lmax(voice, mul, add);
        setOutputs(ChannelGroup<OutputNode>(voices * length_, [&](size_t i) {
            auto member = std::make_shared<Member>(format, numSources_);
            member->setSources(column(sources, i % length_));
            member->setVoice(Multichannel::wrap(voice, i / length_));
            member->setMul(Multichannel::wrap(mul, i / length_));
            member->setAdd(Multichannel::wrap(add, i / length_));
            return member;
        }));
    }

    ~SourceSelector() override { releaseOutputs(); }

    /// @brief Replace the source list. The member count does not change;
    /// channels are mapped onto the existing members by the wrap rule.
    void setInputs(const std::vector<SourceChannels>& sources) {
        validateSources(sources);
        numSources_ = sources.size();
        for (size_t i = 0; i < channelCount(); ++i) {
            outputAs<Member>(i).setSources(column(sources, i % length_));
        }
    }

    void setVoice(const ParameterList& voice) {
        Multichannel::requireNonEmpty(voice, "voice");
        for (size_t i = 0; i < channelCount(); ++i) {
            outputAs<Member>(i).setVoice(Multichannel::wrap(voice, i / length_));
        }
    }

    [[nodiscard]] size_t numSources() const noexcept { return numSources_; }

    /// @brief Largest channel count among the sources at construction.
    [[nodiscard]] size_t sourceLength() const noexcept { return length_; }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"voice", 0.0f, static_cast<float>(numSources_ - 1), ControlScale::Linear,
                 kDefaultVoice},
                mulSpec()};
    }

private:
    class Member : public OutputNode {
    public:
        Member(const StreamFormat& format, size_t numSources)
            : OutputNode(format)
            , pointer_(format.blockSize, 0.0f) {
            sources_.reserve(numSources);
        }

        void setSources(SourceChannels sources) { sourceSlot_.publish(std::move(sources)); }
        void setVoice(Parameter value) { voice_.publish(std::move(value)); }

        bool setParameter(std::string_view name, const Parameter& value) override {
            if (name == "voice") {
                setVoice(value);
                return true;
            }
            return OutputNode::setParameter(name, value);
        }

    protected:
        void renderSignal(const BlockContext& ctx, AudioStream& out) override {
            sourceSlot_.consume(sources_);
            voice_.update();

            const size_t count = sources_.size();
            if (count == 0) {
                out.clear();
                return;
            }
            const float top = static_cast<float>(count - 1);

            // Every source advances each block, selected or not
            for (const auto& source : sources_) (void)source->pull(ctx);

            if (!voice_.isModulated()) {
                const float voice = clampParameter(voice_.current().scalar(), 0.0f, top, "voice");
                const SelectorBracket bracket = selectorBracket(voice, count);
                const AudioStream& lower = sources_[bracket.lower]->pull(ctx);
                if (count == 1) {
                    std::copy_n(lower.data(), ctx.blockSize, out.data());
                    return;
                }
                const AudioStream& upper = sources_[bracket.upper]->pull(ctx);
                for (size_t i = 0; i < ctx.blockSize; ++i) {
                    out[i] = lower[i] * bracket.lowerGain + upper[i] * bracket.upperGain;
                }
                return;
            }

            voice_.fill(ctx, pointer_.data());
            for (size_t i = 0; i < ctx.blockSize; ++i) {
                const SelectorBracket bracket = selectorBracket(pointer_[i], count);
                float sample = sources_[bracket.lower]->pull(ctx)[i] * bracket.lowerGain;
                if (bracket.upperGain != 0.0f) {
                    sample += sources_[bracket.upper]->pull(ctx)[i] * bracket.upperGain;
                }
                out[i] = sample;
            }
        }

    private:
        PublishSlot<SourceChannels> sourceSlot_;
        SourceChannels sources_;
        ParameterSlot voice_{kDefaultVoice};
        std::vector<float> pointer_;
    };

    static void validateSources(const std::vector<SourceChannels>& sources) {
        Multichannel::requireNonEmpty(sources, "sources");
        for (const auto& source : sources) {
            Multichannel::requireNonEmpty(source, "source channels");
            for (const auto& channel : source) {
                if (!channel) {
                    throw ConfigurationError("selector source channel is null");
                }
            }
        }
    }

    /// Channel c of every source, wrapped per source.
    [[nodiscard]] static SourceChannels column(const std::vector<SourceChannels>& sources,
                                               size_t c) {
        SourceChannels choice;
        choice.reserve(sources.size());
        for (const auto& source : sources) choice.push_back(Multichannel::wrap(source, c));
        return choice;
    }

    size_t numSources_ = 0;
    size_t length_ = 1;
};

} // namespace DSP
} // namespace Weft
