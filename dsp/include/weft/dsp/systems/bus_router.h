// ==============================================================================
// Layer 3: System Component - Bus Routing
// ==============================================================================
// Assigns the members of a channel group to physical output buses:
//
// - channel >= 0: member i goes to bus (channel + i * increment) mod numBuses
// - channel <  0: the member order is a random permutation drawn from the
//   injected generator; member i goes to bus (perm[i] * increment) mod
//   numBuses. With increment 1 and no more members than buses every member
//   lands on a distinct bus.
// ==============================================================================

#pragma once

#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/random.h"

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

namespace Weft {
namespace DSP {
namespace BusRouter {

/// @brief Non-negative modulo for signed bus arithmetic.
[[nodiscard]] inline size_t wrapBus(int64_t bus, size_t numBuses) noexcept {
    const auto n = static_cast<int64_t>(numBuses);
    return static_cast<size_t>(((bus % n) + n) % n);
}

/// @brief Bus index for each of `count` members.
/// @throws ConfigurationError if numBuses is zero
[[nodiscard]] inline std::vector<size_t> assign(size_t count, int channel, int increment,
                                                size_t numBuses, Xorshift32& rng) {
    if (numBuses == 0) {
        throw ConfigurationError("render loop has no output buses");
    }

    std::vector<size_t> buses(count);
    if (channel >= 0) {
        for (size_t i = 0; i < count; ++i) {
            buses[i] = wrapBus(static_cast<int64_t>(channel) +
                                   static_cast<int64_t>(i) * increment,
                               numBuses);
        }
        return buses;
    }

    std::vector<size_t> order(count);
    std::iota(order.begin(), order.end(), size_t{0});
    shuffle(order.data(), order.size(), rng);
    for (size_t i = 0; i < count; ++i) {
        buses[i] = wrapBus(static_cast<int64_t>(order[i]) * increment, numBuses);
    }
    return buses;
}

} // namespace BusRouter
} // namespace DSP
} // namespace Weft
