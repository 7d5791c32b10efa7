// ==============================================================================
// Layer 1: DSP Primitive - SpectralNode
// ==============================================================================
// A graph node producing a SpectralStream per block. Pulling follows the same
// memoization and transport rules as AudioNode; a stopped spectral node emits
// no events.
//
// Each spectral stream feeds exactly one downstream stage. A consumer claims
// its input when it attaches; a second claim is a ConfigurationError, so fan-
// out has to go through an explicit copy stage.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/primitives/fft.h"
#include "weft/dsp/primitives/graph_node.h"
#include "weft/dsp/primitives/spectral_frame.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace Weft {
namespace DSP {

class SpectralNode : public GraphNode {
public:
    /// @param maxFftSize Largest frame size this node's storage supports
    SpectralNode(const StreamFormat& format, size_t maxFftSize)
        : GraphNode(format)
        , maxFftSize_(std::min(maxFftSize, kMaxFFTSize)) {
        if (!format.isValid()) {
            throw ConfigurationError("invalid stream format");
        }
        if (!isValidFFTSize(maxFftSize_)) {
            throw ConfigurationError("maximum FFT size must be a power of two in (4, " +
                                     std::to_string(kMaxFFTSize) + "]");
        }
        stream_.prepare(format.blockSize, maxFftSize_);
    }

    ~SpectralNode() override = default;

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    /// @throws RealtimeViolation if the stream was released
    const SpectralStream& pull(const BlockContext& ctx) {
        if (released_) {
            throw RealtimeViolation("spectral node pulled after its stream was released");
        }

        if (beginBlock(ctx)) {
            stream_.beginBlock();
            const TransportWindow window = advanceTransport(ctx);
            if (!window.empty()) {
                processBlock(ctx, stream_);
            } else {
                idleBlock(ctx, stream_);
            }
        }
        return stream_;
    }

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    /// @brief Geometry most recently configured for this node's chain. Frames
    /// already in flight may still use the previous geometry until the
    /// corresponding Reconfigure event.
    [[nodiscard]] virtual FrameGeometry frameGeometry() const = 0;

    [[nodiscard]] size_t fftSize() const { return frameGeometry().fftSize; }

    [[nodiscard]] size_t maxFftSize() const noexcept { return maxFftSize_; }

    /// @brief Register `consumer` as the single reader of this stream.
    /// @throws ConfigurationError if another consumer already holds it
    void claim(const void* consumer) {
        const void* expected = nullptr;
        if (!consumer_.compare_exchange_strong(expected, consumer) && expected != consumer) {
            throw ConfigurationError(
                "spectral stream already has a consumer; insert an explicit copy stage");
        }
    }

    void unclaim(const void* consumer) noexcept {
        const void* expected = consumer;
        consumer_.compare_exchange_strong(expected, nullptr);
    }

    [[nodiscard]] bool isClaimed() const noexcept { return consumer_.load() != nullptr; }

    /// @brief True if `consumer` could claim this stream.
    [[nodiscard]] bool isAvailableTo(const void* consumer) const noexcept {
        const void* holder = consumer_.load();
        return holder == nullptr || holder == consumer;
    }

    void releaseStream() noexcept override {
        stream_.release();
        released_ = true;
    }

    [[nodiscard]] bool isReleased() const noexcept { return released_; }

protected:
    /// @brief Append this block's events to `out` (already cleared).
    virtual void processBlock(const BlockContext& ctx, SpectralStream& out) = 0;

    /// @brief Called instead of processBlock() for blocks outside the
    /// transport window. Geometry changes may still be applied here.
    virtual void idleBlock(const BlockContext& ctx, SpectralStream& out) {
        (void)ctx;
        (void)out;
    }

private:
    size_t maxFftSize_;
    SpectralStream stream_;
    std::atomic<const void*> consumer_{nullptr};
    bool released_ = false;
};

using SpectralNodePtr = std::shared_ptr<SpectralNode>;

} // namespace DSP
} // namespace Weft
