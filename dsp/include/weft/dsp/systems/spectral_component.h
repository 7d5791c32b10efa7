// ==============================================================================
// Layer 3: System Component - Spectral Components
// ==============================================================================
// SpectralSource is what a spectral consumer attaches to: a group of spectral
// channels, one SpectralNode each. SpectralComponent<NodeT> is the shared
// base of the analysis and transform stages: it owns the channel group and
// provides play()/stop() and the control metadata hook. Spectral stages have
// no mul/add; those live on the resynthesis stages, which are
// AudioComponents.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/primitives/graph_node.h"
#include "weft/dsp/primitives/spectral_input.h"
#include "weft/dsp/primitives/spectral_node.h"
#include "weft/dsp/systems/channel_group.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

class SpectralSource {
public:
    virtual ~SpectralSource() = default;

    [[nodiscard]] virtual size_t spectralChannelCount() const noexcept = 0;

    /// @brief Spectral channel i (wraps around spectralChannelCount()).
    [[nodiscard]] virtual SpectralNodePtr spectralChannel(size_t i) const = 0;
};

/// @brief Check that a stage of `count` members can attach to `source`.
///
/// Each spectral stream has a single consumer, so the source needs at least
/// `count` channels. With expectedSize != 0 every channel must also deliver
/// frames of that size.
/// @throws ConfigurationError
inline void validateSpectralAttach(const SpectralSource& source, size_t count,
                                   size_t expectedSize = 0) {
    const size_t available = source.spectralChannelCount();
    if (count > available) {
        throw ConfigurationError("stage needs " + std::to_string(count) +
                                 " spectral streams but its input has " +
                                 std::to_string(available) +
                                 "; insert an explicit copy stage");
    }
    if (expectedSize == 0) return;
    for (size_t i = 0; i < count; ++i) {
        const size_t size = source.spectralChannel(i)->fftSize();
        if (size != expectedSize) {
            throw ConfigurationError("FFT size mismatch: stage expects " +
                                     std::to_string(expectedSize) + ", input delivers " +
                                     std::to_string(size));
        }
    }
}

/// @brief Check that `count` attached consumers can move to `source`: same
/// frame size per channel and no channel held by another stage. Nothing is
/// changed, so a failed check leaves every consumer on its old input.
/// @param inputOf Callable returning the SpectralInput of consumer i
/// @throws ConfigurationError
template <typename InputOf>
void validateSpectralReattach(const SpectralSource& source, size_t count, InputOf&& inputOf) {
    validateSpectralAttach(source, count);
    for (size_t i = 0; i < count; ++i) {
        const SpectralInput& current = inputOf(i);
        const SpectralNodePtr channel = source.spectralChannel(i);
        if (channel->fftSize() != current.node().fftSize()) {
            throw ConfigurationError("FFT size mismatch on spectral channel " + std::to_string(i) +
                                     ": stage expects " +
                                     std::to_string(current.node().fftSize()) +
                                     ", input delivers " + std::to_string(channel->fftSize()));
        }
        if (!channel->isAvailableTo(current.owner())) {
            throw ConfigurationError(
                "spectral stream already has a consumer; insert an explicit copy stage");
        }
    }
}

template <typename NodeT>
class SpectralComponent : public SpectralSource {
public:
    explicit SpectralComponent(const StreamFormat& format) : format_(format) {}

    ~SpectralComponent() override { releaseNodes(); }

    SpectralComponent(const SpectralComponent&) = delete;
    SpectralComponent& operator=(const SpectralComponent&) = delete;

    [[nodiscard]] size_t spectralChannelCount() const noexcept override { return nodes_.size(); }

    [[nodiscard]] SpectralNodePtr spectralChannel(size_t i) const override {
        if (nodes_.empty()) {
            throw ConfigurationError("spectral component has no channels");
        }
        return nodes_.node(i % nodes_.size());
    }

    SpectralComponent& play(float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        for (GraphNode* node : transportNodes_) node->play(durationSeconds, delaySeconds);
        return *this;
    }

    SpectralComponent& stop() {
        for (GraphNode* node : transportNodes_) node->stop();
        return *this;
    }

    [[nodiscard]] virtual std::vector<ControlSpec> controlSpecs() const = 0;

    [[nodiscard]] const StreamFormat& format() const noexcept { return format_; }

protected:
    void setNodes(ChannelGroup<NodeT> nodes) {
        nodes_ = std::move(nodes);
        for (const auto& node : nodes_) transportNodes_.push_back(node.get());
    }

    [[nodiscard]] const ChannelGroup<NodeT>& nodes() const noexcept { return nodes_; }

    void addTransportNode(GraphNode& node) { transportNodes_.push_back(&node); }

    /// @brief Release the spectral channels. Idempotent.
    void releaseNodes() noexcept {
        transportNodes_.clear();
        nodes_.release();
    }

private:
    StreamFormat format_;
    ChannelGroup<NodeT> nodes_;
    std::vector<GraphNode*> transportNodes_;
};

} // namespace DSP
} // namespace Weft
