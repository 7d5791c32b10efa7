// ==============================================================================
// Layer 1: DSP Primitive - InputFader
// ==============================================================================
// Replaces its upstream node with a squared-cosine crossfade:
//
//   out = old * cos^2(theta) + new * sin^2(theta),  theta: 0 -> pi/2
//
// theta ramps linearly in time over the fade length, starting at the first
// sample of the block in which the replacement is picked up. A zero fade time
// switches at the block boundary.
//
// A replacement that arrives while a fade is running restarts the ramp from
// the current blend: every source still audible keeps its present weight,
// frozen, and the whole group fades out against the newest input. Outgoing
// sources are pulled until their fade completes and dropped after that block.
//
// Dropped sources are retired, not released: the render thread hands them
// back and setInput() or collectRetired() destroys them on the control thread.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (fixed-capacity fade set, no allocation in
//   processBlock)
// - Principle IX: Layer 1 (depends on Layer 0 and AudioNode)
// ==============================================================================

#pragma once

#include "weft/dsp/core/crossfade_utils.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/core/retire_list.h"
#include "weft/dsp/primitives/audio_node.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <tuple>
#include <utility>

namespace Weft {
namespace DSP {

class InputFader : public AudioNode {
public:
    /// Default fade time for setInput(), in seconds
    static constexpr float kDefaultFadeTime = 0.05f;

    /// Sources that can fade out together; the quietest is dropped beyond this
    static constexpr size_t kMaxFadingSources = 8;

    /// @throws ConfigurationError for a null input
    InputFader(const StreamFormat& format, NodePtr input)
        : AudioNode(format, 1)
        , current_(std::move(input)) {
        if (!current_) {
            throw ConfigurationError("input fader needs an input node");
        }
    }

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    /// @brief Replace the input, crossfading over fadeTimeSeconds.
    /// @throws ConfigurationError for a null input
    void setInput(NodePtr input, float fadeTimeSeconds = kDefaultFadeTime) {
        if (!input) {
            throw ConfigurationError("input fader needs an input node");
        }
        retired_.collect();
        pending_.publish({std::move(input), std::max(0.0f, fadeTimeSeconds)});
    }

    /// @brief Destroy inputs the render thread has stopped pulling.
    void collectRetired() { retired_.collect(); }

    /// @brief Dropped inputs waiting for collectRetired().
    [[nodiscard]] size_t retiredCount() const noexcept { return retired_.pending(); }

    /// @brief True while at least one outgoing source is still audible.
    [[nodiscard]] bool isFading() const noexcept {
        return fading_.load(std::memory_order_acquire);
    }

protected:
    void processBlock(const BlockContext& ctx) override {
        if (pending_.consume(request_)) {
            beginFade(std::move(request_.input), request_.fadeTime, ctx.sampleRate);
        }

        AudioStream& out = output(0);
        const AudioStream& incoming = current_->pull(ctx);

        if (numOutgoing_ == 0) {
            std::copy_n(incoming.data(), ctx.blockSize, out.data());
            retired_.flush();
            return;
        }

        // Frozen blend of the outgoing group
        out.clear();
        for (size_t s = 0; s < numOutgoing_; ++s) {
            const AudioStream& src = outgoing_[s].node->pull(ctx);
            const float weight = outgoing_[s].weight;
            for (size_t i = 0; i < ctx.blockSize; ++i) {
                out[i] += src[i] * weight;
            }
        }

        for (size_t i = 0; i < ctx.blockSize; ++i) {
            if (fadePos_ >= fadeLength_) {
                out[i] = incoming[i];
                continue;
            }
            const float position = static_cast<float>(fadePos_) / static_cast<float>(fadeLength_);
            const auto [fadeOut, fadeIn] = squaredCosineGains(position);
            out[i] = out[i] * fadeOut + incoming[i] * fadeIn;
            ++fadePos_;
        }

        if (fadePos_ >= fadeLength_) {
            dropOutgoing();
        }
        retired_.flush();
    }

private:
    struct Request {
        NodePtr input;
        float fadeTime = 0.0f;
    };

    struct OutgoingSource {
        NodePtr node;
        float weight = 0.0f;
    };

    void beginFade(NodePtr input, float fadeTime, double sampleRate) noexcept {
        const size_t length = crossfadeLengthSamples(fadeTime, sampleRate);

        if (length == 0) {
            dropOutgoing();
            retired_.retire(std::move(current_));
            current_ = std::move(input);
            return;
        }

        // Freeze the current blend: outgoing weights scale by cos^2, the
        // previous incoming source joins them at sin^2.
        float fadeOut = 1.0f;
        float fadeIn = 0.0f;
        if (numOutgoing_ > 0 && fadePos_ < fadeLength_) {
            const float position = static_cast<float>(fadePos_) / static_cast<float>(fadeLength_);
            std::tie(fadeOut, fadeIn) = squaredCosineGains(position);
        } else {
            dropOutgoing();
            fadeOut = 0.0f;
            fadeIn = 1.0f;
        }

        for (size_t s = 0; s < numOutgoing_; ++s) {
            outgoing_[s].weight *= fadeOut;
        }
        addOutgoing(std::move(current_), fadeIn);

        current_ = std::move(input);
        fadeLength_ = length;
        fadePos_ = 0;
        fading_.store(true, std::memory_order_release);
    }

    void addOutgoing(NodePtr node, float weight) noexcept {
        for (size_t s = 0; s < numOutgoing_; ++s) {
            if (outgoing_[s].node == node) {
                outgoing_[s].weight += weight;
                return;
            }
        }

        if (numOutgoing_ == kMaxFadingSources) {
            // Replace the quietest source
            auto quietest = std::min_element(
                outgoing_.begin(), outgoing_.end(),
                [](const OutgoingSource& a, const OutgoingSource& b) { return a.weight < b.weight; });
            WEFT_DSP_LOG("fader", "fade set full, dropping source with weight %f",
                         static_cast<double>(quietest->weight));
            if (quietest->weight >= weight) {
                retired_.retire(std::move(node));
                return;
            }
            retired_.retire(std::move(quietest->node));
            *quietest = {std::move(node), weight};
            return;
        }

        outgoing_[numOutgoing_++] = {std::move(node), weight};
    }

    void dropOutgoing() noexcept {
        for (size_t s = 0; s < numOutgoing_; ++s) {
            retired_.retire(std::move(outgoing_[s].node));
            outgoing_[s].weight = 0.0f;
        }
        numOutgoing_ = 0;
        fadeLength_ = 0;
        fadePos_ = 0;
        fading_.store(false, std::memory_order_release);
    }

    PublishSlot<Request> pending_;
    Request request_;

    // Render-thread state
    NodePtr current_;
    std::array<OutgoingSource, kMaxFadingSources> outgoing_{};
    size_t numOutgoing_ = 0;
    size_t fadeLength_ = 0;
    size_t fadePos_ = 0;

    // One block can drop a full fade set twice plus the hard-switched input
    RetireList<NodePtr, 2 * kMaxFadingSources + 2> retired_;

    std::atomic<bool> fading_{false};
};

} // namespace DSP
} // namespace Weft
