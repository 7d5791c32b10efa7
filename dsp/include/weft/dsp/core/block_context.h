// ==============================================================================
// Layer 0: Core Utility - StreamFormat / BlockContext
// ==============================================================================
// Host-supplied stream format and the per-block processing context shared by
// every node, the crossfader and the scheduler.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (no allocation, noexcept)
// - Principle III: Modern C++ (constexpr, value semantics)
// - Principle IX: Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Weft {
namespace DSP {

// =============================================================================
// StreamFormat
// =============================================================================

/// @brief Sample rate and block size fixed for the lifetime of a graph.
///
/// Every node receives the format at construction and sizes its stream
/// buffers from it; nothing on the render thread resizes afterwards.
struct StreamFormat {
    double sampleRate = 44100.0;  ///< Sample rate in Hz
    size_t blockSize = 256;       ///< Block size in samples

    /// @brief Duration of one block in seconds.
    [[nodiscard]] constexpr double blockSeconds() const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(blockSize) / sampleRate : 0.0;
    }

    /// @brief Convert seconds to a sample count (rounded, never negative).
    [[nodiscard]] size_t secondsToSamples(double seconds) const noexcept {
        if (seconds <= 0.0 || sampleRate <= 0.0) return 0;
        return static_cast<size_t>(std::llround(seconds * sampleRate));
    }

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return sampleRate > 0.0 && blockSize > 0;
    }

    [[nodiscard]] constexpr bool operator==(const StreamFormat&) const noexcept = default;
};

// =============================================================================
// BlockContext
// =============================================================================

/// @brief Per-block processing context.
///
/// `blockIndex` is the memoization key: a node pulled twice with the same
/// index computes once. `sampleTime` is the absolute position of the first
/// sample of the block.
struct BlockContext {
    double sampleRate = 44100.0;  ///< Sample rate in Hz
    size_t blockSize = 256;       ///< Block size in samples
    uint64_t blockIndex = 0;      ///< Monotonic block counter
    uint64_t sampleTime = 0;      ///< Absolute sample position of sample 0

    /// @brief Build the context for a given block of a stream.
    [[nodiscard]] static constexpr BlockContext forBlock(const StreamFormat& format,
                                                         uint64_t index) noexcept {
        return {format.sampleRate, format.blockSize, index,
                index * static_cast<uint64_t>(format.blockSize)};
    }

    /// @brief Time of the first sample of the block, in seconds.
    [[nodiscard]] constexpr double timeSeconds() const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(sampleTime) / sampleRate : 0.0;
    }
};

} // namespace DSP
} // namespace Weft
