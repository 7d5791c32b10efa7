// Tests for Xorshift32 PRNG and shuffle()
// Layer 0: Core Utilities

#include <catch2/catch_test_macros.hpp>

#include <weft/dsp/core/random.h>

#include <algorithm>
#include <array>
#include <numeric>

using namespace Weft::DSP;

TEST_CASE("Xorshift32 same seed produces same sequence", "[random]") {
    Xorshift32 rng1(99999);
    Xorshift32 rng2(99999);

    for (int i = 0; i < 100; ++i) {
        REQUIRE(rng1.next() == rng2.next());
    }
}

TEST_CASE("Xorshift32 seed of 0 is handled safely", "[random][edge]") {
    Xorshift32 rng(0);
    REQUIRE(rng.state() != 0);
    REQUIRE(rng.next() != 0);
}

TEST_CASE("Xorshift32 nextBelow stays below its bound", "[random]") {
    Xorshift32 rng(7);
    REQUIRE(rng.nextBelow(0) == 0);
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(rng.nextBelow(5) < 5);
    }
}

TEST_CASE("shuffle produces a permutation", "[random][shuffle]") {
    Xorshift32 rng(1234);
    std::array<int, 16> values{};
    std::iota(values.begin(), values.end(), 0);

    shuffle(values.data(), values.size(), rng);

    auto sorted = values;
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < 16; ++i) {
        REQUIRE(sorted[static_cast<size_t>(i)] == i);
    }
}

TEST_CASE("shuffle is reproducible from the seed", "[random][shuffle]") {
    std::array<int, 8> a{0, 1, 2, 3, 4, 5, 6, 7};
    std::array<int, 8> b = a;
    Xorshift32 rngA(55);
    Xorshift32 rngB(55);

    shuffle(a.data(), a.size(), rngA);
    shuffle(b.data(), b.size(), rngB);

    REQUIRE(a == b);
}
