// ==============================================================================
// Layer 1: Primitive Tests - OutputNode / ChannelTap
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <weft/dsp/core/dsp_errors.h>
#include <weft/dsp/primitives/channel_tap.h>

#include "test_helpers/test_nodes.h"

#include <vector>

using namespace Weft::DSP;
using namespace TestHelpers;
using Catch::Approx;

namespace {

const StreamFormat kFormat{1000.0, 10};

/// Output k carries the constant k + 1.
class StereoNode : public AudioNode {
public:
    explicit StereoNode(const StreamFormat& format) : AudioNode(format, 2) {}

protected:
    void processBlock(const BlockContext& ctx) override {
        for (size_t k = 0; k < numOutputs(); ++k) {
            for (size_t i = 0; i < ctx.blockSize; ++i) {
                output(k)[i] = static_cast<float>(k + 1);
            }
        }
    }
};

} // namespace

TEST_CASE("ChannelTap exposes one output", "[output_node][tap]") {
    auto source = makeNode<StereoNode>(kFormat);
    ChannelTap left(kFormat, source, 0);
    ChannelTap right(kFormat, source, 1);

    REQUIRE(firstSample(left, kFormat, 0) == 1.0f);
    REQUIRE(firstSample(right, kFormat, 0) == 2.0f);
    REQUIRE(right.outputIndex() == 1);
}

TEST_CASE("ChannelTap construction errors", "[output_node][tap][error]") {
    auto source = makeNode<StereoNode>(kFormat);
    REQUIRE_THROWS_AS(ChannelTap(kFormat, source, 2), ConfigurationError);
    REQUIRE_THROWS_AS(ChannelTap(kFormat, nullptr, 0), ConfigurationError);
}

TEST_CASE("OutputNode applies scalar mul and add", "[output_node][mul]") {
    ChannelTap tap(kFormat, makeNode<StereoNode>(kFormat), 1);
    tap.setMul(0.5f);
    tap.setAdd(0.25f);

    const auto samples = render(tap, kFormat, 2);
    for (float s : samples) REQUIRE(s == Approx(2.0f * 0.5f + 0.25f));
}

TEST_CASE("OutputNode applies modulated mul per sample", "[output_node][mul]") {
    ChannelTap tap(kFormat, makeNode<StereoNode>(kFormat), 0);
    tap.setMul(makeNode<RampNode>(kFormat, 0.01f));

    const auto samples = render(tap, kFormat, 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        REQUIRE(samples[i] == Approx(0.01f * static_cast<float>(i)));
    }
}

TEST_CASE("mul and add are reachable by name", "[output_node][mul]") {
    ChannelTap tap(kFormat, makeNode<StereoNode>(kFormat), 0);
    REQUIRE(tap.setParameter("mul", 3.0f));
    REQUIRE(tap.setParameter("add", 1.0f));
    REQUIRE_FALSE(tap.setParameter("freq", 1.0f));

    REQUIRE(firstSample(tap, kFormat, 0) == Approx(4.0f));
}

TEST_CASE("Changes take effect at the next block", "[output_node][mul]") {
    ChannelTap tap(kFormat, makeNode<StereoNode>(kFormat), 0);
    REQUIRE(firstSample(tap, kFormat, 0) == 1.0f);

    tap.setMul(0.0f);
    REQUIRE(firstSample(tap, kFormat, 0) == 1.0f);
    REQUIRE(firstSample(tap, kFormat, 1) == 0.0f);
}
