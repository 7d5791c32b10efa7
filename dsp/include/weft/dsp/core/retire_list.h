// ==============================================================================
// Layer 0: Core Utility - RetireList
// ==============================================================================
// Fixed-capacity hand-back of values the render thread stops using, so their
// destructors run on the control thread.
//
// - retire() runs on the render thread. It moves the value into a render-side
//   staging array and never allocates or waits.
// - flush() runs on the render thread at the end of a block. It try_locks and
//   moves staged values into the shared array; on contention they stay staged
//   until the next flush().
// - collect() runs on the control thread and destroys the shared array's
//   values.
//
// If both arrays are full the value is destroyed in place.
// ==============================================================================

#pragma once

#include "weft/dsp/core/debug_log.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <utility>

namespace Weft {
namespace DSP {

template <typename T, size_t Capacity>
class RetireList {
public:
    RetireList() = default;

    RetireList(const RetireList&) = delete;
    RetireList& operator=(const RetireList&) = delete;

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    /// @brief Stage a value for destruction on the control thread.
    /// @return false if staging was full and the value was destroyed here
    bool retire(T&& value) noexcept {
        if (numStaged_ == Capacity) {
            flush();
        }
        if (numStaged_ == Capacity) {
            WEFT_DSP_LOG("retire", "retire list full, releasing on the render thread");
            T dropped = std::move(value);
            return false;
        }
        staged_[numStaged_++] = std::move(value);
        return true;
    }

    /// @brief Hand staged values to the control thread if the lock is free.
    void flush() noexcept {
        if (numStaged_ == 0) return;

        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) return;

        size_t kept = 0;
        for (size_t s = 0; s < numStaged_; ++s) {
            if (numShared_ < Capacity) {
                shared_[numShared_++] = std::move(staged_[s]);
            } else {
                staged_[kept++] = std::move(staged_[s]);
            }
        }
        numStaged_ = kept;
        pendingCount_.store(numShared_, std::memory_order_release);
    }

    /// @brief Values retired but not handed over yet.
    [[nodiscard]] size_t staged() const noexcept { return numStaged_; }

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    /// @brief Destroy every value the render thread has handed over.
    void collect() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t s = 0; s < numShared_; ++s) {
            shared_[s] = T{};
        }
        numShared_ = 0;
        pendingCount_.store(0, std::memory_order_release);
    }

    /// @brief Values handed over and waiting for collect().
    [[nodiscard]] size_t pending() const noexcept {
        return pendingCount_.load(std::memory_order_acquire);
    }

private:
    // Render-thread state
    std::array<T, Capacity> staged_{};
    size_t numStaged_ = 0;

    std::mutex mutex_;
    std::array<T, Capacity> shared_{};
    size_t numShared_ = 0;
    std::atomic<size_t> pendingCount_{0};
};

} // namespace DSP
} // namespace Weft
