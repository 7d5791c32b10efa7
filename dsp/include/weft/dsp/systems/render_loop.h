// ==============================================================================
// Layer 3: System Component - RenderLoop
// ==============================================================================
// The host-facing block loop. Each renderBlock():
//
//   1. picks up routing and control-source changes published since the last
//      block
//   2. ticks every control source (periodic schedulers) in registration order
//   3. pulls every routed node and sums it into its output bus
//
// Graph edits (connect/disconnect, adding control sources) run on the control
// thread and are published copy-on-write; the render thread swaps the new
// list in without waiting. Retired lists, and the nodes they keep alive, are
// destroyed on the control thread.
//
// A control source that throws is handled by the configured policy:
// StopScheduler halts it and counts the failure, Abort rethrows as
// CallbackError with the original exception nested. RealtimeViolation is
// never handled here.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/core/random.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/control_source.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace Weft {
namespace DSP {

enum class CallbackErrorPolicy : uint8_t {
    StopScheduler,  ///< Halt the failing source, keep rendering
    Abort           ///< Throw CallbackError out of renderBlock()
};

class RenderLoop {
public:
    struct Config {
        StreamFormat format{};
        size_t numBuses = 2;
        uint32_t rngSeed = 1;
        CallbackErrorPolicy callbackErrorPolicy = CallbackErrorPolicy::StopScheduler;
    };

    /// @throws ConfigurationError for an invalid format or zero buses
    explicit RenderLoop(const Config& config)
        : config_(config)
        , rng_(config.rngSeed) {
        if (!config.format.isValid()) {
            throw ConfigurationError("invalid stream format");
        }
        if (config.numBuses == 0) {
            throw ConfigurationError("render loop needs at least one output bus");
        }
    }

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    /// @brief Sum `node` into `bus` (mod numBuses) from the next block on.
    void connect(NodePtr node, size_t bus) {
        if (!node) {
            throw ConfigurationError("cannot route a null node");
        }
        std::lock_guard<std::mutex> lock(controlMutex_);
        routes_.push_back({std::move(node), bus % config_.numBuses});
        WEFT_DSP_LOG("render", "route -> bus %zu (%zu routes)", bus % config_.numBuses,
                     routes_.size());
        routeSlot_.publish(routes_);
    }

    /// @brief Remove every route of `node`.
    void disconnect(const AudioNode* node) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        const auto removed = std::erase_if(routes_, [node](const Route& r) {
            return r.node.get() == node;
        });
        if (removed > 0) {
            routeSlot_.publish(routes_);
        }
    }

    void addControlSource(ControlSourcePtr source) {
        if (!source) {
            throw ConfigurationError("cannot register a null control source");
        }
        std::lock_guard<std::mutex> lock(controlMutex_);
        sources_.push_back(std::move(source));
        sourceSlot_.publish(sources_);
    }

    void removeControlSource(const ControlSource* source) {
        std::lock_guard<std::mutex> lock(controlMutex_);
        const auto removed = std::erase_if(sources_, [source](const ControlSourcePtr& s) {
            return s.get() == source;
        });
        if (removed > 0) {
            sourceSlot_.publish(sources_);
        }
    }

    /// @brief Routing PRNG; used by out() on the control thread.
    [[nodiscard]] Xorshift32& routingRng() noexcept { return rng_; }

    [[nodiscard]] size_t numRoutes() const {
        std::lock_guard<std::mutex> lock(controlMutex_);
        return routes_.size();
    }

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    /// @brief Render one block into numBuses() buffers of blockSize samples.
    /// @throws CallbackError (policy Abort), RealtimeViolation
    void renderBlock(float* const* buses) {
        routeSlot_.consume(activeRoutes_);
        sourceSlot_.consume(activeSources_);

        const BlockContext ctx = BlockContext::forBlock(config_.format, blockIndex_);

        for (const auto& source : activeSources_) {
            runControlSource(*source, ctx);
        }

        const size_t blockSize = config_.format.blockSize;
        for (size_t b = 0; b < config_.numBuses; ++b) {
            std::fill_n(buses[b], blockSize, 0.0f);
        }

        for (const auto& route : activeRoutes_) {
            const AudioStream& stream = route.node->pull(ctx);
            float* bus = buses[route.bus];
            for (size_t i = 0; i < blockSize; ++i) {
                bus[i] += stream[i];
            }
        }

        ++blockIndex_;
        blocksRendered_.store(blockIndex_, std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const StreamFormat& format() const noexcept { return config_.format; }
    [[nodiscard]] size_t numBuses() const noexcept { return config_.numBuses; }

    [[nodiscard]] uint64_t blocksRendered() const noexcept {
        return blocksRendered_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t callbackErrors() const noexcept {
        return callbackErrors_.load(std::memory_order_acquire);
    }

private:
    struct Route {
        NodePtr node;
        size_t bus = 0;
    };

    void runControlSource(ControlSource& source, const BlockContext& ctx) {
        try {
            source.tick(ctx);
        } catch (const RealtimeViolation&) {
            throw;
        } catch (const std::exception& e) {
            callbackErrors_.fetch_add(1, std::memory_order_acq_rel);
            WEFT_DSP_LOG("render", "periodic callback failed in block %llu: %s",
                         static_cast<unsigned long long>(ctx.blockIndex), e.what());
            if (config_.callbackErrorPolicy == CallbackErrorPolicy::Abort) {
                std::throw_with_nested(CallbackError(std::string("periodic callback failed: ") + e.what()));
            }
            source.halt();
        }
    }

    Config config_;
    Xorshift32 rng_;

    // Control side
    mutable std::mutex controlMutex_;
    std::vector<Route> routes_;
    std::vector<ControlSourcePtr> sources_;
    PublishSlot<std::vector<Route>> routeSlot_;
    PublishSlot<std::vector<ControlSourcePtr>> sourceSlot_;

    // Render side
    std::vector<Route> activeRoutes_;
    std::vector<ControlSourcePtr> activeSources_;
    uint64_t blockIndex_ = 0;

    std::atomic<uint64_t> blocksRendered_{0};
    std::atomic<size_t> callbackErrors_{0};
};

} // namespace DSP
} // namespace Weft
