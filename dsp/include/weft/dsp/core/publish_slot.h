// ==============================================================================
// Layer 0: Core Utility - PublishSlot
// ==============================================================================
// Single-value mailbox between a control thread (writer) and the render
// thread (reader).
//
// - publish() runs on the control thread. It may allocate and may wait on the
//   slot's mutex.
// - consume() runs on the render thread at a block boundary. It only ever
//   try_locks; if the control thread holds the mutex the value is picked up
//   at the next boundary instead.
// - consume() swaps rather than copies: the render thread's displaced value
//   is parked in the slot and destroyed by the next publish() or collect(),
//   i.e. on the control thread, after the render thread stopped using it.
// ==============================================================================

#pragma once

#include <atomic>
#include <mutex>
#include <utility>

namespace Weft {
namespace DSP {

template <typename T>
class PublishSlot {
public:
    PublishSlot() = default;
    explicit PublishSlot(T initial) : pending_(std::move(initial)) {}

    PublishSlot(const PublishSlot&) = delete;
    PublishSlot& operator=(const PublishSlot&) = delete;

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    /// @brief Publish a new value for pickup at the next block boundary.
    ///
    /// Replaces any value that has not been consumed yet (last write wins).
    void publish(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::move(value);
        dirty_.store(true, std::memory_order_release);
    }

    /// @brief Destroy the value parked by the last consume().
    void collect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!dirty_.load(std::memory_order_relaxed)) {
            pending_ = T{};
        }
    }

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    /// @brief Swap a freshly published value into `current`.
    /// @return true if `current` changed
    /// @note Real-time safe: never waits
    bool consume(T& current) noexcept {
        if (!dirty_.load(std::memory_order_acquire)) return false;

        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) return false;

        using std::swap;
        swap(current, pending_);
        dirty_.store(false, std::memory_order_relaxed);
        return true;
    }

    [[nodiscard]] bool hasPending() const noexcept {
        return dirty_.load(std::memory_order_acquire);
    }

private:
    std::mutex mutex_;
    T pending_{};
    std::atomic<bool> dirty_{false};
};

} // namespace DSP
} // namespace Weft
