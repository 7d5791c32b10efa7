// ==============================================================================
// Layer 0: Core Utility - Multichannel Expansion
// ==============================================================================
// The single rule by which scalar, per-voice and modulated operands are
// reconciled to a uniform channel count:
//
//   lmax(l1, ..., lK)  = max(len(lk))
//   wrap(list, i)      = list[i mod len(list)]
//
// Every component constructor and setter routes its operand lists through
// these two functions. An empty operand list is a ConfigurationError; it is
// never treated as length 1.
// ==============================================================================

#pragma once

#include "weft/dsp/core/dsp_errors.h"

#include <algorithm>
#include <cstddef>
#include <ranges>

namespace Weft {
namespace DSP {
namespace Multichannel {

/// @brief Throw ConfigurationError if the operand list is empty.
/// @param list Any sized range
/// @param what Operand name for the error message
template <std::ranges::sized_range List>
void requireNonEmpty(const List& list, const char* what) {
    if (std::ranges::size(list) == 0) {
        throw ConfigurationError(std::string("empty operand list: ") + what);
    }
}

/// @brief Longest length among the operand lists.
/// @throws ConfigurationError if any list is empty
template <std::ranges::sized_range... Lists>
[[nodiscard]] size_t lmax(const Lists&... lists) {
    static_assert(sizeof...(Lists) > 0, "lmax needs at least one operand list");
    (requireNonEmpty(lists, "lmax operand"), ...);
    size_t result = 0;
    ((result = std::max(result, static_cast<size_t>(std::ranges::size(lists)))), ...);
    return result;
}

/// @brief Cyclic index into an operand list.
/// @throws ConfigurationError if the list is empty
template <std::ranges::random_access_range List>
[[nodiscard]] decltype(auto) wrap(List& list, size_t i) {
    requireNonEmpty(list, "wrap operand");
    return list[i % std::ranges::size(list)];
}

} // namespace Multichannel
} // namespace DSP
} // namespace Weft
