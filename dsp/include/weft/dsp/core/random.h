// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// Constitution Principle II: Real-Time Audio Thread Safety
// - No allocation, no locks, no exceptions, no I/O
//
// Constitution Principle IX: Layered DSP Architecture
// - Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

namespace Weft {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// The render loop owns one instance, seeded from its configuration, and
/// passes it explicitly to every routing decision that needs randomness.
/// Two loops seeded identically produce identical bus permutations.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5
///
/// @note Real-time safe: no allocation, no exceptions
/// @note NOT cryptographically secure
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer in range [1, 2^32-1].
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate an index in [0, bound). Returns 0 when bound is 0.
    [[nodiscard]] constexpr uint32_t nextBelow(uint32_t bound) noexcept {
        return bound == 0 ? 0u : next() % bound;
    }

    /// Reseed the generator.
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    uint32_t state_;
};

// ==============================================================================
// Shuffle
// ==============================================================================

/// @brief In-place Fisher-Yates shuffle driven by an explicit generator.
/// @param data Pointer to the elements
/// @param count Number of elements
/// @param rng Generator; advanced count-1 times
template <typename T>
constexpr void shuffle(T* data, size_t count, Xorshift32& rng) noexcept {
    if (data == nullptr || count < 2) return;
    for (size_t i = count - 1; i > 0; --i) {
        const size_t j = rng.nextBelow(static_cast<uint32_t>(i + 1));
        std::swap(data[i], data[j]);
    }
}

} // namespace DSP
} // namespace Weft
