// ==============================================================================
// Layer 0: Core Tests - Analysis Windows
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <weft/dsp/core/math_constants.h>
#include <weft/dsp/core/window_functions.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace Weft::DSP;
using Catch::Approx;

TEST_CASE("Hanning window is periodic", "[window]") {
    const auto w = Window::generate(WindowType::Hanning, 8);

    REQUIRE(w[0] == Approx(0.0f).margin(1e-6f));
    REQUIRE(w[4] == Approx(1.0f));
    REQUIRE(w[2] == Approx(0.5f));
    // Symmetric about N/2, not about (N-1)/2
    REQUIRE(w[1] == Approx(w[7]));
}

TEST_CASE("Every window type generates values in range", "[window]") {
    for (size_t t = 0; t < kNumWindowTypes; ++t) {
        const auto type = static_cast<WindowType>(t);
        const auto w = Window::generate(type, 256);
        INFO("window type " << t);
        REQUIRE(w.size() == 256);
        REQUIRE(*std::max_element(w.begin(), w.end()) <= 1.0f + 1e-5f);
        REQUIRE(*std::min_element(w.begin(), w.end()) >= -1e-5f);
    }
}

TEST_CASE("Rectangular and Tukey windows", "[window]") {
    const auto rect = Window::generate(WindowType::Rectangular, 16);
    for (float v : rect) REQUIRE(v == 1.0f);

    // alpha = 0.66: flat over the middle third
    const auto tukey = Window::generate(WindowType::Tukey, 300);
    REQUIRE(tukey[150] == Approx(1.0f));
    REQUIRE(tukey[0] == Approx(0.0f).margin(1e-6f));
}

TEST_CASE("Hanning satisfies COLA at 2 and 4 overlaps", "[window][cola]") {
    const auto w = Window::generate(WindowType::Hanning, 1024);
    for (size_t hop : {size_t{512}, size_t{256}}) {
        float reference = 0.0f;
        for (size_t i = 0; i < w.size(); i += hop) reference += w[i];
        for (size_t offset = 1; offset < hop; offset += 17) {
            float sum = 0.0f;
            for (size_t i = offset; i < w.size(); i += hop) sum += w[i];
            REQUIRE(sum == Approx(reference).margin(2e-4f));
        }
    }
}

TEST_CASE("fromIndex clamps integer window selectors", "[window]") {
    REQUIRE(Window::fromIndex(-3) == WindowType::Rectangular);
    REQUIRE(Window::fromIndex(2) == WindowType::Hanning);
    REQUIRE(Window::fromIndex(99) == WindowType::HalfSine);
}
