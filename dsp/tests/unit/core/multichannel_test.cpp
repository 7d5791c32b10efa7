// ==============================================================================
// Layer 0: Core Tests - Multichannel Expansion
// ==============================================================================
// lmax() and wrap(): the rule every component uses to reconcile operand
// lists of different lengths to one channel count.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <weft/dsp/core/dsp_errors.h>
#include <weft/dsp/core/multichannel.h>

#include <array>
#include <string>
#include <vector>

using namespace Weft::DSP;

TEST_CASE("lmax returns the longest operand length", "[multichannel]") {
    const std::vector<float> one{0.5f};
    const std::vector<float> three{1.0f, 2.0f, 3.0f};
    const std::vector<int> two{1, 2};

    REQUIRE(Multichannel::lmax(one) == 1);
    REQUIRE(Multichannel::lmax(one, three, two) == 3);
    REQUIRE(Multichannel::lmax(two, one) == 2);
}

TEST_CASE("wrap cycles a shorter list", "[multichannel]") {
    const std::vector<std::string> list{"a", "b", "c"};

    std::vector<std::string> expanded;
    for (size_t i = 0; i < 6; ++i) {
        expanded.push_back(Multichannel::wrap(list, i));
    }

    REQUIRE(expanded == std::vector<std::string>{"a", "b", "c", "a", "b", "c"});
}

TEST_CASE("wrap of a single element broadcasts it", "[multichannel]") {
    const std::array<float, 1> scalar{0.25f};
    for (size_t i = 0; i < 8; ++i) {
        REQUIRE(Multichannel::wrap(scalar, i) == 0.25f);
    }
}

TEST_CASE("empty operand lists are configuration errors", "[multichannel][error]") {
    const std::vector<float> empty;
    const std::vector<float> full{1.0f, 2.0f};

    SECTION("lmax") {
        REQUIRE_THROWS_AS(Multichannel::lmax(full, empty), ConfigurationError);
    }

    SECTION("wrap") {
        REQUIRE_THROWS_AS(Multichannel::wrap(empty, 0), ConfigurationError);
    }

    SECTION("requireNonEmpty names the operand") {
        try {
            Multichannel::requireNonEmpty(empty, "pan");
            FAIL("expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(std::string(e.what()).find("pan") != std::string::npos);
        }
    }
}

TEST_CASE("ConfigurationError is an invalid_argument", "[multichannel][error]") {
    const std::vector<int> empty;
    REQUIRE_THROWS_AS(Multichannel::lmax(empty), std::invalid_argument);
}
