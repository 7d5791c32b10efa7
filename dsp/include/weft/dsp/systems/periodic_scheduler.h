// ==============================================================================
// Layer 3: System Component - PeriodicScheduler
// ==============================================================================
// Calls a function every `time` seconds, block-synchronously on the render
// thread, before any audio node is pulled for the block.
//
// Each entry counts the samples of its transport window; once the count
// reaches the interval the callback fires once and the count keeps its phase
// within the interval:
//
//   elapsed += activeSamples
//   if (elapsed >= time * sampleRate) { elapsed = fmod(elapsed, time * sampleRate); fire(); }
//
// An interval shorter than a block fires once per block; the surplus is not
// carried over, so a later, longer `time` takes effect from the next firing.
//
// `time` may be modulated; it is sampled once per block. Callbacks may throw:
// the exception propagates to RenderLoop, whose error policy decides whether
// the entry is halted or the session aborted.
//
// The scheduler produces no audio: there is no mul/add, and out() only starts
// it. Entries are created stopped.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/primitives/control_source.h"
#include "weft/dsp/primitives/graph_node.h"
#include "weft/dsp/primitives/parameter.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/render_loop.h"

#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

using PeriodicCallback = std::function<void()>;

// =============================================================================
// ScheduledCallback
// =============================================================================

/// @brief One scheduler entry: a callback, its interval and its transport.
class ScheduledCallback : public GraphNode, public ControlSource {
public:
    static constexpr float kDefaultTime = 1.0f;

    /// @throws ConfigurationError for an empty callback
    ScheduledCallback(const StreamFormat& format, PeriodicCallback callback,
                      Parameter time = kDefaultTime)
        : GraphNode(format, /*startActive=*/false)
        , callback_(std::move(callback))
        , time_(std::move(time)) {
        if (!callback_) {
            throw ConfigurationError("scheduled callback must be callable");
        }
    }

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    void start(float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        halted_.store(false, std::memory_order_release);
        play(durationSeconds, delaySeconds);
    }

    void setTime(Parameter value) { time_.publish(std::move(value)); }

    /// @throws ConfigurationError for an empty callback
    void setFunction(PeriodicCallback callback) {
        if (!callback) {
            throw ConfigurationError("scheduled callback must be callable");
        }
        callbackSlot_.publish(std::move(callback));
    }

    bool setParameter(std::string_view name, const Parameter& value) override {
        if (name == "time") {
            setTime(value);
            return true;
        }
        return false;
    }

    /// @brief Running, and not halted after a failed callback.
    [[nodiscard]] bool isRunning() const noexcept {
        return isActive() && !halted_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t fireCount() const noexcept {
        return fires_.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    void tick(const BlockContext& ctx) override {
        if (!beginBlock(ctx)) return;

        const TransportWindow window = advanceTransport(ctx);
        callbackSlot_.consume(callback_);
        time_.update();
        if (window.empty() || halted_.load(std::memory_order_acquire)) {
            if (window.empty()) elapsed_ = 0.0;
            return;
        }

        const float minTime = static_cast<float>(1.0 / ctx.sampleRate);
        const float time = clampParameter(time_.blockValue(ctx), minTime,
                                          std::numeric_limits<float>::max(), "time");
        const double interval = static_cast<double>(time) * ctx.sampleRate;

        elapsed_ += static_cast<double>(window.length());
        if (elapsed_ >= interval) {
            elapsed_ = std::fmod(elapsed_, interval);
            fires_.fetch_add(1, std::memory_order_acq_rel);
            callback_();
        }
    }

    void halt() noexcept override {
        halted_.store(true, std::memory_order_release);
    }

private:
    PeriodicCallback callback_;
    PublishSlot<PeriodicCallback> callbackSlot_;
    ParameterSlot time_;
    double elapsed_ = 0.0;
    std::atomic<bool> halted_{false};
    std::atomic<uint64_t> fires_{0};
};

// =============================================================================
// PeriodicScheduler
// =============================================================================

class PeriodicScheduler {
public:
    /// @param loop Render loop whose blocks drive the entries
    /// @param callbacks One entry per callback (expanded with `time`)
    /// @throws ConfigurationError for empty lists or empty callbacks
    PeriodicScheduler(RenderLoop& loop, const std::vector<PeriodicCallback>& callbacks,
                      const ParameterList& time = {ScheduledCallback::kDefaultTime})
        : loop_(loop) {
        const size_t count = Multichannel::lmax(callbacks, time);
        entries_ = ChannelGroup<ScheduledCallback>(count, [&](size_t i) {
            return std::make_shared<ScheduledCallback>(loop.format(),
                                                       Multichannel::wrap(callbacks, i),
                                                       Multichannel::wrap(time, i));
        });
        for (const auto& entry : entries_) loop_.addControlSource(entry);
    }

    ~PeriodicScheduler() {
        for (const auto& entry : entries_) {
            try {
                loop_.removeControlSource(entry.get());
            } catch (const std::system_error& e) {
                WEFT_DSP_LOG("scheduler", "unregister failed: %s", e.what());
            }
        }
    }

    PeriodicScheduler(const PeriodicScheduler&) = delete;
    PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

    // -------------------------------------------------------------------------
    // Transport
    // -------------------------------------------------------------------------

    PeriodicScheduler& play(float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        for (const auto& entry : entries_) entry->start(durationSeconds, delaySeconds);
        return *this;
    }

    PeriodicScheduler& stop() {
        for (const auto& entry : entries_) entry->stop();
        return *this;
    }

    /// @brief Starts the scheduler; it has no output to route.
    PeriodicScheduler& out(float durationSeconds = 0.0f, float delaySeconds = 0.0f) {
        return play(durationSeconds, delaySeconds);
    }

    // -------------------------------------------------------------------------
    // Setters
    // -------------------------------------------------------------------------

    void setTime(const ParameterList& time) {
        Multichannel::requireNonEmpty(time, "time");
        for (size_t i = 0; i < entries_.size(); ++i) {
            entries_[i].setTime(Multichannel::wrap(time, i));
        }
    }

    void setFunction(const std::vector<PeriodicCallback>& callbacks) {
        Multichannel::requireNonEmpty(callbacks, "callbacks");
        for (size_t i = 0; i < entries_.size(); ++i) {
            entries_[i].setFunction(Multichannel::wrap(callbacks, i));
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] ScheduledCallback& entry(size_t i) const noexcept { return entries_[i]; }

    [[nodiscard]] bool isRunning() const noexcept {
        for (const auto& entry : entries_) {
            if (entry->isRunning()) return true;
        }
        return false;
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const {
        return {{"time", 0.125f, 4.0f, ControlScale::Linear, ScheduledCallback::kDefaultTime}};
    }

private:
    RenderLoop& loop_;
    ChannelGroup<ScheduledCallback> entries_;
};

} // namespace DSP
} // namespace Weft
