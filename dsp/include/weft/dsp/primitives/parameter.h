// ==============================================================================
// Layer 1: DSP Primitive - Parameter
// ==============================================================================
// A control value that is either a scalar or another node's stream:
//
//   Parameter = Scalar(float) | Modulated(NodePtr)
//
// ParameterSlot is the render-side holder: setters publish a new Parameter
// from the control thread, the render thread swaps it in at the next block
// boundary and reads it either once per block or per sample.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/primitives/audio_node.h"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace Weft {
namespace DSP {

class Parameter {
public:
    Parameter(float value = 0.0f) noexcept  // NOLINT(google-explicit-constructor)
        : value_(value) {}

    Parameter(double value) noexcept  // NOLINT(google-explicit-constructor)
        : value_(static_cast<float>(value)) {}

    Parameter(int value) noexcept  // NOLINT(google-explicit-constructor)
        : value_(static_cast<float>(value)) {}

    /// @throws ConfigurationError for a null node
    template <typename Node>
        requires std::derived_from<Node, AudioNode>
    Parameter(std::shared_ptr<Node> source)  // NOLINT(google-explicit-constructor)
        : value_(NodePtr(std::move(source))) {
        if (!std::get<NodePtr>(value_)) {
            throw ConfigurationError("modulated parameter needs a source node");
        }
    }

    [[nodiscard]] bool isModulated() const noexcept {
        return std::holds_alternative<NodePtr>(value_);
    }

    /// @brief Scalar value; 0 for a modulated parameter.
    [[nodiscard]] float scalar() const noexcept {
        const float* value = std::get_if<float>(&value_);
        return value != nullptr ? *value : 0.0f;
    }

    /// @brief Source node; null for a scalar parameter.
    [[nodiscard]] NodePtr source() const noexcept {
        const NodePtr* node = std::get_if<NodePtr>(&value_);
        return node != nullptr ? *node : NodePtr{};
    }

    /// @brief Value for the whole block: the scalar, or the first sample of
    /// the source's current block.
    [[nodiscard]] float blockValue(const BlockContext& ctx) const {
        if (const NodePtr* node = std::get_if<NodePtr>(&value_)) {
            return (*node)->pull(ctx)[0];
        }
        return std::get<float>(value_);
    }

    /// @brief Value at sample `offset` of the current block.
    [[nodiscard]] float valueAt(const BlockContext& ctx, size_t offset) const {
        if (const NodePtr* node = std::get_if<NodePtr>(&value_)) {
            return (*node)->pull(ctx)[offset];
        }
        return std::get<float>(value_);
    }

    /// @brief Per-sample values for the block into dst (ctx.blockSize floats).
    void fill(const BlockContext& ctx, float* dst) const {
        if (const NodePtr* node = std::get_if<NodePtr>(&value_)) {
            const AudioStream& stream = (*node)->pull(ctx);
            std::copy_n(stream.data(), ctx.blockSize, dst);
            return;
        }
        std::fill_n(dst, ctx.blockSize, std::get<float>(value_));
    }

    friend void swap(Parameter& a, Parameter& b) noexcept {
        a.value_.swap(b.value_);
    }

private:
    std::variant<float, NodePtr> value_;
};

/// Per-voice operand list, expanded with Multichannel::wrap
using ParameterList = std::vector<Parameter>;

/// @brief Clamp a control value into its documented range.
///
/// Out-of-range values are not errors: processing continues with the nearest
/// valid value, and the clamp is traced when WEFT_DSP_DEBUG is enabled.
[[nodiscard]] inline float clampParameter(float value, float lo, float hi,
                                          const char* name) noexcept {
    if (value < lo || value > hi) {
        WEFT_DSP_LOG("param", "%s = %f outside [%f, %f], clamped", name,
                     static_cast<double>(value), static_cast<double>(lo),
                     static_cast<double>(hi));
        return value < lo ? lo : hi;
    }
    return value;
}

// =============================================================================
// ParameterSlot
// =============================================================================

class ParameterSlot {
public:
    explicit ParameterSlot(Parameter initial = 0.0f) : current_(std::move(initial)) {}

    /// @brief Control thread: publish for the next block boundary.
    void publish(Parameter value) { slot_.publish(std::move(value)); }

    /// @brief Render thread: pick up a published value.
    /// @return true if the value changed
    bool update() noexcept { return slot_.consume(current_); }

    [[nodiscard]] const Parameter& current() const noexcept { return current_; }
    [[nodiscard]] bool isModulated() const noexcept { return current_.isModulated(); }

    [[nodiscard]] float blockValue(const BlockContext& ctx) const {
        return current_.blockValue(ctx);
    }

    [[nodiscard]] float valueAt(const BlockContext& ctx, size_t offset) const {
        return current_.valueAt(ctx, offset);
    }

    void fill(const BlockContext& ctx, float* dst) const { current_.fill(ctx, dst); }

private:
    PublishSlot<Parameter> slot_;
    Parameter current_;
};

} // namespace DSP
} // namespace Weft
