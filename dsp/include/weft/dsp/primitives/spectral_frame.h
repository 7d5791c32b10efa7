// ==============================================================================
// Layer 1: DSP Primitive - Spectral Frames
// ==============================================================================
// FrameGeometry describes one analysis configuration (size, overlaps, window,
// sample rate). SpectralFrame holds magnitude[bin] and true-frequency[bin] for
// one hop. SpectralStream is what a spectral node produces per block: an
// ordered list of events, each either a frame emitted at a sample offset or a
// geometry change that takes effect after that offset.
//
// Frame storage is one preallocated arena sized for the worst case of the
// stream format, so geometry changes never allocate on the render thread.
// ==============================================================================

#pragma once

#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/window_functions.h"
#include "weft/dsp/primitives/fft.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace Weft {
namespace DSP {

/// Largest overlap factor a spectral chain accepts
inline constexpr size_t kMaxOverlaps = 32;

// =============================================================================
// FrameGeometry
// =============================================================================

struct FrameGeometry {
    size_t fftSize = 1024;
    size_t overlaps = 4;
    WindowType window = WindowType::Hanning;
    double sampleRate = 44100.0;

    [[nodiscard]] constexpr size_t hopSize() const noexcept {
        return overlaps > 0 ? fftSize / overlaps : fftSize;
    }

    [[nodiscard]] constexpr size_t numBins() const noexcept { return fftSize / 2 + 1; }

    [[nodiscard]] constexpr bool operator==(const FrameGeometry&) const noexcept = default;
};

/// @brief Reject sizes that are not powers of two in (4, kMaxFFTSize] and
/// overlaps that are not powers of two in [1, min(size, kMaxOverlaps)].
/// @throws ConfigurationError
inline void validateGeometry(size_t fftSize, size_t overlaps) {
    if (!isValidFFTSize(fftSize)) {
        throw ConfigurationError("FFT size must be a power of two in (4, " +
                                 std::to_string(kMaxFFTSize) + "], got " +
                                 std::to_string(fftSize));
    }
    if (overlaps == 0 || !std::has_single_bit(overlaps) || overlaps > fftSize ||
        overlaps > kMaxOverlaps) {
        throw ConfigurationError("overlaps must be a power of two in [1, " +
                                 std::to_string(std::min(fftSize, kMaxOverlaps)) +
                                 "], got " + std::to_string(overlaps));
    }
}

// =============================================================================
// SpectralFrame
// =============================================================================

struct SpectralFrame {
    std::span<float> magnitude;
    std::span<float> frequency;
    uint64_t index = 0;  ///< Hop counter of the producing analysis
    FrameGeometry geometry{};  ///< Geometry the frame was analyzed with

    [[nodiscard]] size_t numBins() const noexcept { return magnitude.size(); }
};

// =============================================================================
// SpectralStream
// =============================================================================

enum class FrameEventKind : uint8_t {
    Frame,        ///< A frame completed at `offset`
    Reconfigure   ///< `geometry` applies to samples after `offset`
};

struct FrameEvent {
    size_t offset = 0;
    FrameEventKind kind = FrameEventKind::Frame;
    size_t frame = 0;           ///< Index into the stream's frames (Frame events)
    FrameGeometry geometry{};   ///< New geometry (Reconfigure events)
};

class SpectralStream {
public:
    /// @brief Allocate for the worst case of a block.
    /// @note NOT real-time safe
    void prepare(size_t blockSize, size_t maxFftSize) {
        const size_t maxBins = maxFftSize / 2 + 1;
        // frames * bins <= block * overlaps / 2 + block + bins, plus one
        // geometry change per block
        const size_t arenaFloats = blockSize * kMaxOverlaps / 2 + blockSize + 2 * maxBins;
        magnitudes_.assign(arenaFloats, 0.0f);
        frequencies_.assign(arenaFloats, 0.0f);
        frames_.resize(blockSize + 1);
        events_.resize(2 * blockSize + 2);
        numFrames_ = 0;
        numEvents_ = 0;
        cursor_ = 0;
    }

    // -------------------------------------------------------------------------
    // Producer (render thread)
    // -------------------------------------------------------------------------

    void beginBlock() noexcept {
        numFrames_ = 0;
        numEvents_ = 0;
        cursor_ = 0;
    }

    /// @brief Reserve a frame of numBins emitted at `offset`.
    /// @return nullptr if the block's frame storage is exhausted
    [[nodiscard]] SpectralFrame* appendFrame(size_t offset, size_t numBins, uint64_t index) noexcept {
        if (numFrames_ >= frames_.size() || numEvents_ >= events_.size() ||
            cursor_ + numBins > magnitudes_.size()) {
            return nullptr;
        }
        SpectralFrame& frame = frames_[numFrames_];
        frame.magnitude = std::span<float>(magnitudes_.data() + cursor_, numBins);
        frame.frequency = std::span<float>(frequencies_.data() + cursor_, numBins);
        frame.index = index;
        cursor_ += numBins;

        events_[numEvents_++] = {offset, FrameEventKind::Frame, numFrames_, {}};
        ++numFrames_;
        return &frame;
    }

    /// @return false if the block's event storage is exhausted
    bool appendReconfigure(size_t offset, const FrameGeometry& geometry) noexcept {
        if (numEvents_ >= events_.size()) return false;
        events_[numEvents_++] = {offset, FrameEventKind::Reconfigure, 0, geometry};
        return true;
    }

    // -------------------------------------------------------------------------
    // Consumer
    // -------------------------------------------------------------------------

    [[nodiscard]] std::span<const FrameEvent> events() const noexcept {
        return {events_.data(), numEvents_};
    }

    [[nodiscard]] const SpectralFrame& frame(size_t i) const noexcept { return frames_[i]; }

    [[nodiscard]] size_t numFrames() const noexcept { return numFrames_; }

    // -------------------------------------------------------------------------
    // Lifetime
    // -------------------------------------------------------------------------

    void release() noexcept {
        std::vector<float>().swap(magnitudes_);
        std::vector<float>().swap(frequencies_);
        std::vector<SpectralFrame>().swap(frames_);
        std::vector<FrameEvent>().swap(events_);
        numFrames_ = 0;
        numEvents_ = 0;
        cursor_ = 0;
    }

private:
    std::vector<float> magnitudes_;
    std::vector<float> frequencies_;
    std::vector<SpectralFrame> frames_;
    std::vector<FrameEvent> events_;
    size_t numFrames_ = 0;
    size_t numEvents_ = 0;
    size_t cursor_ = 0;
};

} // namespace DSP
} // namespace Weft
