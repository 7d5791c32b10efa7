// ==============================================================================
// Layer 3: System Component - AudioComponent
// ==============================================================================
// Base of every user-facing component with audio output (the panning family
// and the resynthesis stages). Owns the group of output members, each an
// OutputNode with its own mul/add, and provides the shared surface:
//
// - play(duration, delay) / stop() on every transport node of the component
// - out(loop, channel, increment, duration, delay) bus routing
// - setMul / setAdd, expanded over the output members by the wrap rule
// - controlSpecs() automation metadata
//
// Derived classes build their groups in their constructors, register the
// transport nodes, and call releaseOutputs() first thing in their destructor
// so the output members go before the voices they read from.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/output_node.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/systems/bus_router.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/render_loop.h"

#include <cstddef>
#include <memory>
#include <system_error>
#include <vector>

namespace Weft {
namespace DSP {

class AudioComponent {
public:
    explicit AudioComponent(const StreamFormat& format) : format_(format) {}

    virtual ~AudioComponent() { releaseOutputs(); }

    AudioComponent(const AudioComponent&) = delete;
    AudioComponent& operator=(const AudioComponent&) = delete;

    // -------------------------------------------------------------------------
    // Channels
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t channelCount() const noexcept { return outputs_.size(); }

    /// @brief Output member i (wraps around channelCount()).
    [[nodiscard]] NodePtr channel(size_t i) const {
        if (outputs_.empty()) {
            throw ConfigurationError("component has no output channels");
        }
        return outputs_.node(i % outputs_.size());
    }

    /// @brief All output members, for use as another component's inputs.
    [[nodiscard]] std::vector<NodePtr> channels() const {
        return std::vector<NodePtr>(outputs_.begin(), outputs_.end());
    }

    // -------------------------------------------------------------------------
    // Transport
    // -------------------------------------------------------------------------

    AudioComponent& play(float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        for (GraphNode* node : transportNodes_) node->play(durationSeconds, delaySeconds);
        return *this;
    }

    AudioComponent& stop() {
        for (GraphNode* node : transportNodes_) node->stop();
        return *this;
    }

    /// @brief Start the component and route its members to output buses.
    ///
    /// Member i goes to bus channel + i*increment; a negative channel draws a
    /// random permutation from the loop's routing generator. Calling out()
    /// again replaces the previous routing.
    AudioComponent& out(RenderLoop& loop, int channel = 0, int increment = 1,
                        float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        if (loop_ != nullptr) {
            for (const auto& member : outputs_) loop_->disconnect(member.get());
        }
        play(durationSeconds, delaySeconds);

        const auto buses = BusRouter::assign(outputs_.size(), channel, increment,
                                             loop.numBuses(), loop.routingRng());
        for (size_t i = 0; i < outputs_.size(); ++i) {
            loop.connect(outputs_.node(i), buses[i]);
        }
        loop_ = &loop;
        return *this;
    }

    // -------------------------------------------------------------------------
    // Output modifiers
    // -------------------------------------------------------------------------

    void setMul(const ParameterList& mul) {
        Multichannel::requireNonEmpty(mul, "mul");
        for (size_t i = 0; i < outputs_.size(); ++i) {
            outputs_[i].setMul(Multichannel::wrap(mul, i));
        }
    }

    void setAdd(const ParameterList& add) {
        Multichannel::requireNonEmpty(add, "add");
        for (size_t i = 0; i < outputs_.size(); ++i) {
            outputs_[i].setAdd(Multichannel::wrap(add, i));
        }
    }

    // -------------------------------------------------------------------------
    // Metadata
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual std::vector<ControlSpec> controlSpecs() const = 0;

    [[nodiscard]] const StreamFormat& format() const noexcept { return format_; }

protected:
    void setOutputs(ChannelGroup<OutputNode> outputs) {
        outputs_ = std::move(outputs);
        for (const auto& member : outputs_) transportNodes_.push_back(member.get());
    }

    void addTransportNode(GraphNode& node) { transportNodes_.push_back(&node); }

    template <typename T>
    [[nodiscard]] T& outputAs(size_t i) const noexcept {
        return static_cast<T&>(outputs_[i]);
    }

    /// @brief Unroute and release the output members. Idempotent.
    void releaseOutputs() noexcept {
        if (loop_ != nullptr) {
            for (const auto& member : outputs_) {
                try {
                    loop_->disconnect(member.get());
                } catch (const std::system_error& e) {
                    WEFT_DSP_LOG("component", "disconnect failed: %s", e.what());
                }
            }
            loop_ = nullptr;
        }
        transportNodes_.clear();
        outputs_.release();
    }

    /// mul control metadata shared by every audio component
    [[nodiscard]] static ControlSpec mulSpec() {
        return {"mul", 0.0f, 2.0f, ControlScale::Linear, 1.0f};
    }

private:
    StreamFormat format_;
    ChannelGroup<OutputNode> outputs_;
    std::vector<GraphNode*> transportNodes_;
    RenderLoop* loop_ = nullptr;
};

} // namespace DSP
} // namespace Weft
