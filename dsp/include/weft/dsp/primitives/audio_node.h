// ==============================================================================
// Layer 1: DSP Primitive - AudioNode
// ==============================================================================
// A graph node producing one or more time-domain streams per block.
//
// pull() is transitive and memoized: the first pull of a block computes the
// node (pulling its own inputs from inside processBlock()), later pulls of the
// same block return the cached streams. Outside the node's transport window
// the streams are zero.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (stream buffers allocated at construction)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/primitives/audio_stream.h"
#include "weft/dsp/primitives/graph_node.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace Weft {
namespace DSP {

class AudioNode : public GraphNode {
public:
    /// @throws ConfigurationError if numOutputs is zero or the format is invalid
    explicit AudioNode(const StreamFormat& format, size_t numOutputs = 1,
                       bool startActive = true)
        : GraphNode(format, startActive) {
        if (numOutputs == 0) {
            throw ConfigurationError("audio node needs at least one output");
        }
        if (!format.isValid()) {
            throw ConfigurationError("invalid stream format");
        }
        outputs_.reserve(numOutputs);
        for (size_t i = 0; i < numOutputs; ++i) {
            outputs_.emplace_back(format.blockSize);
        }
    }

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    /// @brief Produce (or return the cached) block for `ctx`.
    /// @param output Output index; wraps around numOutputs()
    /// @throws RealtimeViolation if the stream was released
    const AudioStream& pull(const BlockContext& ctx, size_t output = 0) {
        if (released_) {
            throw RealtimeViolation("audio node pulled after its stream was released");
        }

        if (beginBlock(ctx)) {
            const TransportWindow window = advanceTransport(ctx);
            if (window.empty()) {
                for (auto& stream : outputs_) stream.clear();
            } else {
                processBlock(ctx);
                if (window.begin > 0 || window.end < ctx.blockSize) {
                    for (auto& stream : outputs_) {
                        stream.clearRange(0, window.begin);
                        stream.clearRange(window.end, ctx.blockSize);
                    }
                }
            }
        }

        return outputs_[output % outputs_.size()];
    }

    // -------------------------------------------------------------------------
    // Node interface
    // -------------------------------------------------------------------------

    void releaseStream() noexcept override {
        for (auto& stream : outputs_) stream.release();
        released_ = true;
    }

    [[nodiscard]] bool isReleased() const noexcept { return released_; }
    [[nodiscard]] size_t numOutputs() const noexcept { return outputs_.size(); }

protected:
    /// @brief Fill every output stream for the full block.
    virtual void processBlock(const BlockContext& ctx) = 0;

    [[nodiscard]] AudioStream& output(size_t index) noexcept { return outputs_[index]; }

private:
    std::vector<AudioStream> outputs_;
    bool released_ = false;
};

using NodePtr = std::shared_ptr<AudioNode>;

} // namespace DSP
} // namespace Weft
