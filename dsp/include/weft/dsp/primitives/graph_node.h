// ==============================================================================
// Layer 1: DSP Primitive - GraphNode
// ==============================================================================
// Common base of every node in the render graph: audio nodes, spectral nodes
// and scheduler entries.
//
// Provides:
// - per-block memoization (a node pulled twice in one block computes once)
// - sample-accurate transport: play(duration, delay) and stop() are published
//   from the control thread and resolved on the render thread into the window
//   of the current block during which the node is active
// - the named-parameter and stream-release hooks of the node interface
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (render-side methods are noexcept)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/publish_slot.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace Weft {
namespace DSP {

class Parameter;

/// @brief Range [begin, end) of the current block during which a node runs.
struct TransportWindow {
    size_t begin = 0;
    size_t end = 0;

    [[nodiscard]] constexpr bool empty() const noexcept { return end <= begin; }
    [[nodiscard]] constexpr size_t length() const noexcept { return empty() ? 0 : end - begin; }
};

class GraphNode {
public:
    explicit GraphNode(const StreamFormat& format, bool startActive = true)
        : format_(format)
        , state_(startActive ? State::Running : State::Stopped)
        , active_(startActive) {}

    virtual ~GraphNode() = default;

    GraphNode(const GraphNode&) = delete;
    GraphNode& operator=(const GraphNode&) = delete;
    GraphNode(GraphNode&&) = delete;
    GraphNode& operator=(GraphNode&&) = delete;

    // -------------------------------------------------------------------------
    // Transport (control thread)
    // -------------------------------------------------------------------------

    /// @brief Activate after `delaySeconds`, deactivate after `durationSeconds`.
    /// @param durationSeconds Active time; 0 = indefinite
    /// @param delaySeconds Time until activation
    void play(float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        transport_.publish({Command::Play,
                            format_.secondsToSamples(delaySeconds),
                            format_.secondsToSamples(durationSeconds)});
    }

    /// @brief Deactivate at the start of the next block.
    void stop() {
        transport_.publish({Command::Stop, 0, 0});
    }

    /// @brief Whether the node was running or waiting on its delay as of the
    /// last rendered block.
    [[nodiscard]] bool isActive() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // Node interface
    // -------------------------------------------------------------------------

    /// @brief Set a parameter by name.
    /// @return false if the node has no parameter of that name
    virtual bool setParameter(std::string_view name, const Parameter& value) {
        (void)name;
        (void)value;
        return false;
    }

    /// @brief Free stream buffers. Call only between blocks, after stop().
    virtual void releaseStream() noexcept {}

    [[nodiscard]] const StreamFormat& format() const noexcept { return format_; }

protected:
    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    /// @brief Claim the block for computation.
    /// @return false if this block was already computed
    bool beginBlock(const BlockContext& ctx) noexcept {
        if (ctx.blockIndex == lastBlock_) return false;
        lastBlock_ = ctx.blockIndex;
        return true;
    }

    /// @brief Apply pending transport commands and advance the transport by
    /// one block. Call once per computed block.
    [[nodiscard]] TransportWindow advanceTransport(const BlockContext& ctx) noexcept {
        if (transport_.consume(command_)) {
            applyCommand(command_);
        }

        const size_t blockSize = ctx.blockSize;
        TransportWindow window{0, blockSize};

        if (state_ == State::Stopped) {
            active_.store(false, std::memory_order_release);
            return {};
        }

        if (state_ == State::Waiting) {
            if (delayRemaining_ >= blockSize) {
                delayRemaining_ -= blockSize;
                active_.store(true, std::memory_order_release);
                return {};
            }
            window.begin = delayRemaining_;
            delayRemaining_ = 0;
            state_ = State::Running;
        }

        if (timed_) {
            const size_t available = window.length();
            if (durationRemaining_ <= available) {
                window.end = window.begin + durationRemaining_;
                durationRemaining_ = 0;
                state_ = State::Stopped;
            } else {
                durationRemaining_ -= available;
            }
        }

        active_.store(state_ != State::Stopped, std::memory_order_release);
        return window;
    }

private:
    enum class Command : uint8_t { None, Play, Stop };
    enum class State : uint8_t { Stopped, Waiting, Running };

    struct TransportCommand {
        Command command = Command::None;
        size_t delaySamples = 0;
        size_t durationSamples = 0;
    };

    void applyCommand(const TransportCommand& cmd) noexcept {
        switch (cmd.command) {
            case Command::Play:
                state_ = cmd.delaySamples > 0 ? State::Waiting : State::Running;
                delayRemaining_ = cmd.delaySamples;
                timed_ = cmd.durationSamples > 0;
                durationRemaining_ = cmd.durationSamples;
                break;
            case Command::Stop:
                state_ = State::Stopped;
                break;
            case Command::None:
                break;
        }
    }

    StreamFormat format_;
    PublishSlot<TransportCommand> transport_;

    // Render-thread state
    TransportCommand command_{};
    State state_;
    size_t delayRemaining_ = 0;
    size_t durationRemaining_ = 0;
    bool timed_ = false;
    uint64_t lastBlock_ = std::numeric_limits<uint64_t>::max();

    std::atomic<bool> active_;
};

} // namespace DSP
} // namespace Weft
