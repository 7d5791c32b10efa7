// ==============================================================================
// Layer 1: DSP Primitive - ChannelTap
// ==============================================================================
// Exposes one output of a multi-output node as a standalone single-output
// node with its own mul/add. Panning components present each of their
// per-voice, per-channel signals to the outside world through a tap.
// ==============================================================================

#pragma once

#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/output_node.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace Weft {
namespace DSP {

class ChannelTap : public OutputNode {
public:
    /// @throws ConfigurationError for a null source or an out-of-range output
    ChannelTap(const StreamFormat& format, NodePtr source, size_t outputIndex)
        : OutputNode(format)
        , source_(std::move(source))
        , outputIndex_(outputIndex) {
        if (!source_) {
            throw ConfigurationError("channel tap needs a source node");
        }
        if (outputIndex_ >= source_->numOutputs()) {
            throw ConfigurationError("channel tap output index out of range");
        }
    }

    [[nodiscard]] size_t outputIndex() const noexcept { return outputIndex_; }

protected:
    void renderSignal(const BlockContext& ctx, AudioStream& out) override {
        const AudioStream& in = source_->pull(ctx, outputIndex_);
        std::copy_n(in.data(), ctx.blockSize, out.data());
    }

private:
    NodePtr source_;
    size_t outputIndex_;
};

} // namespace DSP
} // namespace Weft
