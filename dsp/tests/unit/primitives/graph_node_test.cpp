// ==============================================================================
// Layer 1: Primitive Tests - GraphNode transport and AudioNode pulls
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <weft/dsp/core/dsp_errors.h>
#include <weft/dsp/primitives/audio_node.h>
#include <weft/dsp/primitives/parameter.h>

#include "test_helpers/test_nodes.h"

#include <vector>

using namespace Weft::DSP;
using namespace TestHelpers;

namespace {

const StreamFormat kFormat{1000.0, 10};

size_t countNonZero(const std::vector<float>& samples, size_t& first, size_t& last) {
    size_t count = 0;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (samples[i] != 0.0f) {
            if (count == 0) first = i;
            last = i;
            ++count;
        }
    }
    return count;
}

} // namespace

TEST_CASE("AudioNode pulls are memoized per block", "[graph_node][memo]") {
    ConstantNode node(kFormat, 1.0f);
    const auto ctx = BlockContext::forBlock(kFormat, 0);

    (void)node.pull(ctx);
    (void)node.pull(ctx);
    REQUIRE(node.blocksComputed() == 1);

    (void)node.pull(BlockContext::forBlock(kFormat, 1));
    REQUIRE(node.blocksComputed() == 2);
}

TEST_CASE("Nodes start active and render immediately", "[graph_node][transport]") {
    ConstantNode node(kFormat, 0.5f);
    REQUIRE(firstSample(node, kFormat, 0) == 0.5f);
    REQUIRE(node.isActive());
}

TEST_CASE("play(duration, delay) is sample accurate", "[graph_node][transport]") {
    ConstantNode node(kFormat, 1.0f);
    node.play(0.025f, 0.015f);

    const auto samples = render(node, kFormat, 6);
    size_t first = 0;
    size_t last = 0;
    REQUIRE(countNonZero(samples, first, last) == 25);
    REQUIRE(first == 15);
    REQUIRE(last == 39);
    REQUIRE_FALSE(node.isActive());
}

TEST_CASE("A waiting node reports active", "[graph_node][transport]") {
    ConstantNode node(kFormat, 1.0f);
    node.play(0.0f, 0.05f);

    (void)node.pull(BlockContext::forBlock(kFormat, 0));
    REQUIRE(node.isActive());
    REQUIRE(firstSample(node, kFormat, 1) == 0.0f);
}

TEST_CASE("stop() silences from the next block", "[graph_node][transport]") {
    ConstantNode node(kFormat, 1.0f);
    REQUIRE(firstSample(node, kFormat, 0) == 1.0f);

    node.stop();
    REQUIRE(firstSample(node, kFormat, 1) == 0.0f);
    REQUIRE_FALSE(node.isActive());

    node.play();
    REQUIRE(firstSample(node, kFormat, 2) == 1.0f);
}

TEST_CASE("Pulling a released node is a realtime violation", "[graph_node][error]") {
    ConstantNode node(kFormat, 1.0f);
    node.releaseStream();

    REQUIRE(node.isReleased());
    REQUIRE_THROWS_AS(node.pull(BlockContext::forBlock(kFormat, 0)), RealtimeViolation);
}

TEST_CASE("AudioNode construction errors", "[graph_node][error]") {
    REQUIRE_THROWS_AS(ConstantNode(StreamFormat{0.0, 10}, 1.0f), ConfigurationError);
}

TEST_CASE("Unknown named parameters are reported", "[graph_node]") {
    ConstantNode node(kFormat, 1.0f);
    REQUIRE_FALSE(node.setParameter("nope", 1.0f));
}
