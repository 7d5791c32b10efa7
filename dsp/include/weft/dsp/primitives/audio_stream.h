// ==============================================================================
// Layer 1: DSP Primitive - AudioStream
// ==============================================================================
// Fixed-size block buffer owned by the node that produces it. Consumers only
// ever see `const AudioStream&`. The buffer is allocated once at construction
// and explicitly released at teardown; a released stream cannot be written
// again without reallocating, which the render thread never does.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace Weft {
namespace DSP {

class AudioStream {
public:
    AudioStream() = default;
    explicit AudioStream(size_t blockSize) : samples_(blockSize, 0.0f) {}

    // -------------------------------------------------------------------------
    // Access
    // -------------------------------------------------------------------------

    [[nodiscard]] float* data() noexcept { return samples_.data(); }
    [[nodiscard]] const float* data() const noexcept { return samples_.data(); }
    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }

    [[nodiscard]] float& operator[](size_t i) noexcept { return samples_[i]; }
    [[nodiscard]] float operator[](size_t i) const noexcept { return samples_[i]; }

    [[nodiscard]] std::span<float> samples() noexcept { return samples_; }
    [[nodiscard]] std::span<const float> samples() const noexcept { return samples_; }

    // -------------------------------------------------------------------------
    // Block helpers
    // -------------------------------------------------------------------------

    void clear() noexcept { std::fill(samples_.begin(), samples_.end(), 0.0f); }

    /// @brief Zero the samples in [begin, end).
    void clearRange(size_t begin, size_t end) noexcept {
        end = std::min(end, samples_.size());
        if (begin < end) std::fill(samples_.begin() + static_cast<std::ptrdiff_t>(begin),
                                   samples_.begin() + static_cast<std::ptrdiff_t>(end), 0.0f);
    }

    // -------------------------------------------------------------------------
    // Lifetime
    // -------------------------------------------------------------------------

    /// @brief Free the buffer. Call only between blocks.
    void release() noexcept {
        std::vector<float>().swap(samples_);
        released_ = true;
    }

    [[nodiscard]] bool isReleased() const noexcept { return released_; }

private:
    std::vector<float> samples_;
    bool released_ = false;
};

} // namespace DSP
} // namespace Weft
