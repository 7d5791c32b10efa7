// ==============================================================================
// Layer 3: System Component - Phase Vocoder Transforms
// ==============================================================================
// Frame-to-frame spectral stages. Each member consumes one spectral channel
// of its input and produces one: frames are transformed at the offset they
// arrive, Reconfigure events are passed on and reset any per-bin state.
//
// - PVTranspose (transpo): bin k -> round(k * transpo), frequency scaled
// - PVGate (thresh, damp): bins below thresh dB are multiplied by damp
// - PVVerb (revtime, damp): per-bin decaying maximum
//
// Parameters are read at each frame's offset, so a modulated parameter takes
// effect at the next hop boundary.
//
// Channel layout: lmax(input channels, parameters...) members. Each input
// channel feeds exactly one member, so a parameter list longer than the
// input's channel count is a ConfigurationError.
// ==============================================================================

#pragma once

#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/primitives/spectral_frame.h"
#include "weft/dsp/primitives/spectral_input.h"
#include "weft/dsp/primitives/spectral_node.h"
#include "weft/dsp/processors/spectral_transforms.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/spectral_component.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

// =============================================================================
// SpectralTransformNode
// =============================================================================

class SpectralTransformNode : public SpectralNode {
public:
    /// @throws ConfigurationError for a null input or one already consumed
    SpectralTransformNode(const StreamFormat& format, const SpectralNodePtr& input)
        : SpectralNode(format, input ? input->maxFftSize() : kDefaultMaxFFTSize)
        , input_(input, this) {}

    [[nodiscard]] FrameGeometry frameGeometry() const override {
        return input_.node().frameGeometry();
    }

    /// @brief Read from `input` from the next block on.
    /// @throws ConfigurationError on an FFT-size mismatch or if `input`
    /// already feeds another stage
    void setInput(SpectralNodePtr input) { input_.attach(std::move(input), maxFftSize()); }

    [[nodiscard]] const SpectralInput& input() const noexcept { return input_; }

protected:
    /// @brief Pick up parameter changes for the block.
    virtual void updateParameters() noexcept {}

    virtual void transformFrame(const BlockContext& ctx, size_t offset,
                                const SpectralFrame& in, SpectralFrame& out) = 0;

    /// @brief Drop per-bin state; the next frame uses a new geometry.
    virtual void resetState() noexcept {}

    void processBlock(const BlockContext& ctx, SpectralStream& out) override {
        const SpectralStream& in = input_.pull(ctx);
        updateParameters();

        for (const FrameEvent& event : in.events()) {
            if (event.kind == FrameEventKind::Reconfigure) {
                forwardReconfigure(event, out);
                continue;
            }
            const SpectralFrame& frame = in.frame(event.frame);
            SpectralFrame* result = out.appendFrame(event.offset, frame.numBins(), frame.index);
            if (result == nullptr) {
                WEFT_DSP_LOG("pv", "frame storage exhausted at offset %zu, frame dropped",
                             event.offset);
                continue;
            }
            transformFrame(ctx, event.offset, frame, *result);
        }
    }

    /// Stopped stages still follow geometry changes upstream.
    void idleBlock(const BlockContext& ctx, SpectralStream& out) override {
        const SpectralStream& in = input_.pull(ctx);
        for (const FrameEvent& event : in.events()) {
            if (event.kind == FrameEventKind::Reconfigure) forwardReconfigure(event, out);
        }
    }

private:
    void forwardReconfigure(const FrameEvent& event, SpectralStream& out) noexcept {
        resetState();
        if (!out.appendReconfigure(event.offset, event.geometry)) {
            WEFT_DSP_LOG("pv", "event storage exhausted, reconfigure lost");
        }
    }

    SpectralInput input_;
};

// =============================================================================
// Transform nodes
// =============================================================================

class PVTransposeNode : public SpectralTransformNode {
public:
    static constexpr float kDefaultTranspo = 1.0f;

    PVTransposeNode(const StreamFormat& format, const SpectralNodePtr& input,
                    Parameter transpo = kDefaultTranspo)
        : SpectralTransformNode(format, input)
        , transpo_(std::move(transpo)) {}

    void setTranspo(Parameter value) { transpo_.publish(std::move(value)); }

    bool setParameter(std::string_view name, const Parameter& value) override {
        if (name == "transpo") {
            setTranspo(value);
            return true;
        }
        return false;
    }

protected:
    void updateParameters() noexcept override { transpo_.update(); }

    void transformFrame(const BlockContext& ctx, size_t offset, const SpectralFrame& in,
                        SpectralFrame& out) override {
        transposeFrame(in, out, transpo_.valueAt(ctx, offset));
    }

private:
    ParameterSlot transpo_;
};

class PVGateNode : public SpectralTransformNode {
public:
    static constexpr float kDefaultThresh = -20.0f;
    static constexpr float kDefaultDamp = 0.0f;

    PVGateNode(const StreamFormat& format, const SpectralNodePtr& input,
               Parameter thresh = kDefaultThresh, Parameter damp = kDefaultDamp)
        : SpectralTransformNode(format, input)
        , thresh_(std::move(thresh))
        , damp_(std::move(damp))
        , levels_(maxFftSize() / 2 + 1, 0.0f) {}

    void setThresh(Parameter value) { thresh_.publish(std::move(value)); }
    void setDamp(Parameter value) { damp_.publish(std::move(value)); }

    bool setParameter(std::string_view name, const Parameter& value) override {
        if (name == "thresh") {
            setThresh(value);
            return true;
        }
        if (name == "damp") {
            setDamp(value);
            return true;
        }
        return false;
    }

protected:
    void updateParameters() noexcept override {
        thresh_.update();
        damp_.update();
    }

    void transformFrame(const BlockContext& ctx, size_t offset, const SpectralFrame& in,
                        SpectralFrame& out) override {
        const float damp = clampParameter(damp_.valueAt(ctx, offset), 0.0f, 1.0f, "damp");
        gateFrame(in, out, thresh_.valueAt(ctx, offset), damp, levels_.data());
    }

private:
    ParameterSlot thresh_;
    ParameterSlot damp_;
    std::vector<float> levels_;
};

class PVVerbNode : public SpectralTransformNode {
public:
    static constexpr float kDefaultRevtime = 0.75f;
    static constexpr float kDefaultDamp = 0.75f;

    PVVerbNode(const StreamFormat& format, const SpectralNodePtr& input,
               Parameter revtime = kDefaultRevtime, Parameter damp = kDefaultDamp)
        : SpectralTransformNode(format, input)
        , revtime_(std::move(revtime))
        , damp_(std::move(damp)) {
        decay_.prepare(maxFftSize() / 2 + 1);
    }

    void setRevtime(Parameter value) { revtime_.publish(std::move(value)); }
    void setDamp(Parameter value) { damp_.publish(std::move(value)); }

    bool setParameter(std::string_view name, const Parameter& value) override {
        if (name == "revtime") {
            setRevtime(value);
            return true;
        }
        if (name == "damp") {
            setDamp(value);
            return true;
        }
        return false;
    }

protected:
    void updateParameters() noexcept override {
        revtime_.update();
        damp_.update();
    }

    void transformFrame(const BlockContext& ctx, size_t offset, const SpectralFrame& in,
                        SpectralFrame& out) override {
        const float revtime = clampParameter(revtime_.valueAt(ctx, offset), 0.0f, 1.0f, "revtime");
        const float damp = clampParameter(damp_.valueAt(ctx, offset), 0.0f, 1.0f, "damp");
        decay_.process(in, out, revtime, damp);
    }

    void resetState() noexcept override { decay_.reset(); }

private:
    ParameterSlot revtime_;
    ParameterSlot damp_;
    SpectralDecay decay_;
};

// =============================================================================
// SpectralTransform components
// =============================================================================

template <typename NodeT>
class SpectralTransform : public SpectralComponent<NodeT> {
public:
    using SpectralComponent<NodeT>::SpectralComponent;

    /// @brief Re-attach every member to the matching channel of `input`.
    /// @throws ConfigurationError on an FFT-size mismatch or if a channel
    /// already feeds another stage; no member changes in that case
    void setInput(const SpectralSource& input) {
        const auto& members = this->nodes();
        validateSpectralReattach(input, members.size(),
                                 [&](size_t i) -> const SpectralInput& { return members[i].input(); });
        for (size_t i = 0; i < members.size(); ++i) {
            members[i].setInput(input.spectralChannel(i));
        }
    }

protected:
    /// @brief Create lmax members, member i reading input channel i.
    template <typename Factory>
    void build(const SpectralSource& input, size_t count, Factory&& make) {
        validateSpectralAttach(input, count);
        this->setNodes(ChannelGroup<NodeT>(count, [&](size_t i) {
            return make(input.spectralChannel(i), i);
        }));
    }

    template <typename Setter>
    void forEachMember(const ParameterList& values, const char* name, Setter&& set) {
        Multichannel::requireNonEmpty(values, name);
        const auto& members = this->nodes();
        for (size_t i = 0; i < members.size(); ++i) set(members[i], Multichannel::wrap(values, i));
    }
};

class PVTranspose : public SpectralTransform<PVTransposeNode> {
public:
    /// @throws ConfigurationError
    PVTranspose(const StreamFormat& format, const SpectralSource& input,
                const ParameterList& transpo = {PVTransposeNode::kDefaultTranspo})
        : SpectralTransform(format) {
        const size_t count = std::max(input.spectralChannelCount(), Multichannel::lmax(transpo));
        build(input, count, [&](const SpectralNodePtr& channel, size_t i) {
            return std::make_shared<PVTransposeNode>(format, channel,
                                                     Multichannel::wrap(transpo, i));
        });
    }

    ~PVTranspose() override { releaseNodes(); }

    void setTranspo(const ParameterList& transpo) {
        forEachMember(transpo, "transpo",
                      [](PVTransposeNode& node, const Parameter& v) { node.setTranspo(v); });
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"transpo", 0.25f, 4.0f, ControlScale::Linear, PVTransposeNode::kDefaultTranspo}};
    }
};

class PVGate : public SpectralTransform<PVGateNode> {
public:
    /// @throws ConfigurationError
    PVGate(const StreamFormat& format, const SpectralSource& input,
           const ParameterList& thresh = {PVGateNode::kDefaultThresh},
           const ParameterList& damp = {PVGateNode::kDefaultDamp})
        : SpectralTransform(format) {
        const size_t count =
            std::max(input.spectralChannelCount(), Multichannel::lmax(thresh, damp));
        build(input, count, [&](const SpectralNodePtr& channel, size_t i) {
            return std::make_shared<PVGateNode>(format, channel, Multichannel::wrap(thresh, i),
                                                Multichannel::wrap(damp, i));
        });
    }

    ~PVGate() override { releaseNodes(); }

    void setThresh(const ParameterList& thresh) {
        forEachMember(thresh, "thresh",
                      [](PVGateNode& node, const Parameter& v) { node.setThresh(v); });
    }

    void setDamp(const ParameterList& damp) {
        forEachMember(damp, "damp", [](PVGateNode& node, const Parameter& v) { node.setDamp(v); });
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"thresh", -120.0f, 18.0f, ControlScale::Linear, PVGateNode::kDefaultThresh},
                {"damp", 0.0f, 1.0f, ControlScale::Linear, PVGateNode::kDefaultDamp}};
    }
};

class PVVerb : public SpectralTransform<PVVerbNode> {
public:
    /// @throws ConfigurationError
    PVVerb(const StreamFormat& format, const SpectralSource& input,
           const ParameterList& revtime = {PVVerbNode::kDefaultRevtime},
           const ParameterList& damp = {PVVerbNode::kDefaultDamp})
        : SpectralTransform(format) {
        const size_t count =
            std::max(input.spectralChannelCount(), Multichannel::lmax(revtime, damp));
        build(input, count, [&](const SpectralNodePtr& channel, size_t i) {
            return std::make_shared<PVVerbNode>(format, channel, Multichannel::wrap(revtime, i),
                                                Multichannel::wrap(damp, i));
        });
    }

    ~PVVerb() override { releaseNodes(); }

    void setRevtime(const ParameterList& revtime) {
        forEachMember(revtime, "revtime",
                      [](PVVerbNode& node, const Parameter& v) { node.setRevtime(v); });
    }

    void setDamp(const ParameterList& damp) {
        forEachMember(damp, "damp", [](PVVerbNode& node, const Parameter& v) { node.setDamp(v); });
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override {
        return {{"revtime", 0.0f, 1.0f, ControlScale::Linear, PVVerbNode::kDefaultRevtime},
                {"damp", 0.0f, 1.0f, ControlScale::Linear, PVVerbNode::kDefaultDamp}};
    }
};

} // namespace DSP
} // namespace Weft
