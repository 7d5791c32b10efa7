// ==============================================================================
// Layer 0: Core Tests - ControlSpec / crossfade helpers
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <weft/dsp/core/control_spec.h>
#include <weft/dsp/core/crossfade_utils.h>

#include <cmath>

using namespace Weft::DSP;
using Catch::Approx;

TEST_CASE("Linear ControlSpec maps normalized positions", "[control_spec]") {
    const ControlSpec spec{"time", 0.125f, 4.0f, ControlScale::Linear, 1.0f};

    REQUIRE(spec.fromNormalized(0.0f) == Approx(0.125f));
    REQUIRE(spec.fromNormalized(1.0f) == Approx(4.0f));
    REQUIRE(spec.toNormalized(spec.fromNormalized(0.3f)) == Approx(0.3f));
}

TEST_CASE("Logarithmic ControlSpec maps geometrically", "[control_spec]") {
    const ControlSpec spec{"freq", 20.0f, 20000.0f, ControlScale::Logarithmic, 1000.0f};

    REQUIRE(spec.fromNormalized(0.5f) == Approx(std::sqrt(20.0f * 20000.0f)));
    REQUIRE(spec.toNormalized(20000.0f) == Approx(1.0f));
}

TEST_CASE("Crossfade gain laws", "[crossfade]") {
    SECTION("equal power keeps the summed power at one") {
        for (float p = 0.0f; p <= 1.0f; p += 0.125f) {
            const auto [out, in] = equalPowerGains(p);
            REQUIRE(out * out + in * in == Approx(1.0f));
        }
    }

    SECTION("squared cosine keeps the summed gain at one") {
        for (float p = 0.0f; p <= 1.0f; p += 0.125f) {
            const auto [out, in] = squaredCosineGains(p);
            REQUIRE(out + in == Approx(1.0f));
        }
        const auto [mid, midIn] = squaredCosineGains(0.5f);
        REQUIRE(mid == Approx(0.5f));
        REQUIRE(midIn == Approx(0.5f));
    }

    SECTION("fade lengths") {
        REQUIRE(crossfadeLengthSamples(0.1f, 1000.0) == 100);
        REQUIRE(crossfadeLengthSamples(0.0f, 1000.0) == 0);
    }
}
