// ==============================================================================
// Layer 1: DSP Primitive - OutputNode
// ==============================================================================
// Single-output audio node with the `mul`/`add` post-processing stage shared
// by every audio-producing component member:
//
//   out = signal * mul + add
//
// Both modifiers are Parameters, so either may be a scalar or a stream.
// ==============================================================================

#pragma once

#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/parameter.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace Weft {
namespace DSP {

class OutputNode : public AudioNode {
public:
    explicit OutputNode(const StreamFormat& format)
        : AudioNode(format, 1)
        , scratch_(format.blockSize, 0.0f) {}

    void setMul(Parameter value) { mul_.publish(std::move(value)); }
    void setAdd(Parameter value) { add_.publish(std::move(value)); }

    bool setParameter(std::string_view name, const Parameter& value) override {
        if (name == "mul") {
            setMul(value);
            return true;
        }
        if (name == "add") {
            setAdd(value);
            return true;
        }
        return false;
    }

protected:
    /// @brief Produce the unscaled signal for the full block.
    virtual void renderSignal(const BlockContext& ctx, AudioStream& out) = 0;

    void processBlock(const BlockContext& ctx) final {
        AudioStream& out = output(0);
        renderSignal(ctx, out);

        mul_.update();
        add_.update();

        if (mul_.isModulated()) {
            mul_.fill(ctx, scratch_.data());
            for (size_t i = 0; i < ctx.blockSize; ++i) out[i] *= scratch_[i];
        } else if (const float mul = mul_.current().scalar(); mul != 1.0f) {
            for (size_t i = 0; i < ctx.blockSize; ++i) out[i] *= mul;
        }

        if (add_.isModulated()) {
            add_.fill(ctx, scratch_.data());
            for (size_t i = 0; i < ctx.blockSize; ++i) out[i] += scratch_[i];
        } else if (const float add = add_.current().scalar(); add != 0.0f) {
            for (size_t i = 0; i < ctx.blockSize; ++i) out[i] += add;
        }
    }

private:
    ParameterSlot mul_{1.0f};
    ParameterSlot add_{0.0f};
    std::vector<float> scratch_;
};

} // namespace DSP
} // namespace Weft
