// ==============================================================================
// Layer 1: Primitive Tests - FrameGeometry / SpectralStream / SpectralNode
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <weft/dsp/core/dsp_errors.h>
#include <weft/dsp/primitives/spectral_frame.h>
#include <weft/dsp/primitives/spectral_input.h>
#include <weft/dsp/primitives/spectral_node.h>

#include <memory>

using namespace Weft::DSP;

namespace {

const StreamFormat kFormat{1000.0, 16};

/// Emits one empty frame per block at offset 0.
class TickNode : public SpectralNode {
public:
    TickNode(const StreamFormat& format, size_t fftSize, size_t maxFftSize = 1024)
        : SpectralNode(format, maxFftSize)
        , geometry_{fftSize, 4, WindowType::Hanning, format.sampleRate} {}

    [[nodiscard]] FrameGeometry frameGeometry() const override { return geometry_; }

    int idleBlocks = 0;

protected:
    void processBlock(const BlockContext& ctx, SpectralStream& out) override {
        SpectralFrame* frame = out.appendFrame(0, geometry_.numBins(), ctx.blockIndex);
        if (frame != nullptr) frame->geometry = geometry_;
    }

    void idleBlock(const BlockContext&, SpectralStream&) override { ++idleBlocks; }

private:
    FrameGeometry geometry_;
};

} // namespace

TEST_CASE("FrameGeometry derived sizes", "[spectral_frame]") {
    const FrameGeometry geometry{1024, 4, WindowType::Hanning, 44100.0};
    REQUIRE(geometry.hopSize() == 256);
    REQUIRE(geometry.numBins() == 513);
    REQUIRE(geometry == FrameGeometry{});
    REQUIRE_FALSE(geometry == FrameGeometry{2048, 4, WindowType::Hanning, 44100.0});
}

TEST_CASE("validateGeometry", "[spectral_frame][error]") {
    REQUIRE_NOTHROW(validateGeometry(8, 1));
    REQUIRE_NOTHROW(validateGeometry(1024, 4));
    REQUIRE_NOTHROW(validateGeometry(8192, 32));
    REQUIRE_NOTHROW(validateGeometry(16384, 4));
    REQUIRE_NOTHROW(validateGeometry(kMaxFFTSize, 4));

    SECTION("sizes") {
        REQUIRE_THROWS_AS(validateGeometry(4, 1), ConfigurationError);
        REQUIRE_THROWS_AS(validateGeometry(1000, 4), ConfigurationError);
        REQUIRE_THROWS_AS(validateGeometry(kMaxFFTSize * 2, 4), ConfigurationError);
    }

    SECTION("overlaps") {
        REQUIRE_THROWS_AS(validateGeometry(1024, 0), ConfigurationError);
        REQUIRE_THROWS_AS(validateGeometry(1024, 3), ConfigurationError);
        REQUIRE_THROWS_AS(validateGeometry(1024, 64), ConfigurationError);
        REQUIRE_THROWS_AS(validateGeometry(8, 16), ConfigurationError);
    }
}

TEST_CASE("SpectralStream records events in order", "[spectral_frame][stream]") {
    SpectralStream stream;
    stream.prepare(16, 64);
    stream.beginBlock();

    SpectralFrame* first = stream.appendFrame(3, 33, 7);
    REQUIRE(first != nullptr);
    first->magnitude[0] = 1.0f;
    REQUIRE(stream.appendReconfigure(3, FrameGeometry{32, 2, WindowType::Hanning, 1000.0}));
    SpectralFrame* second = stream.appendFrame(11, 17, 8);
    REQUIRE(second != nullptr);

    const auto events = stream.events();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].kind == FrameEventKind::Frame);
    REQUIRE(events[0].offset == 3);
    REQUIRE(events[1].kind == FrameEventKind::Reconfigure);
    REQUIRE(events[1].geometry.fftSize == 32);
    REQUIRE(events[2].offset == 11);

    REQUIRE(stream.numFrames() == 2);
    REQUIRE(stream.frame(events[0].frame).index == 7);
    REQUIRE(stream.frame(events[0].frame).numBins() == 33);
    REQUIRE(stream.frame(events[0].frame).magnitude[0] == 1.0f);
    REQUIRE(stream.frame(events[2].frame).numBins() == 17);

    SECTION("frames do not overlap in the arena") {
        REQUIRE(second->magnitude.data() >= first->magnitude.data() + 33);
    }

    SECTION("beginBlock clears the events") {
        stream.beginBlock();
        REQUIRE(stream.events().empty());
        REQUIRE(stream.numFrames() == 0);
    }
}

TEST_CASE("SpectralStream refuses frames beyond its storage", "[spectral_frame][stream][edge]") {
    SpectralStream stream;
    stream.prepare(4, 8);
    stream.beginBlock();

    size_t appended = 0;
    while (stream.appendFrame(0, 5, appended) != nullptr) {
        ++appended;
        REQUIRE(appended < 1000);
    }
    REQUIRE(appended > 0);
    REQUIRE(stream.numFrames() == appended);
}

TEST_CASE("SpectralNode pulls are memoized and follow the transport", "[spectral_node]") {
    TickNode node(kFormat, 64);

    const auto& stream = node.pull(BlockContext::forBlock(kFormat, 0));
    REQUIRE(stream.numFrames() == 1);
    (void)node.pull(BlockContext::forBlock(kFormat, 0));
    REQUIRE(node.pull(BlockContext::forBlock(kFormat, 0)).numFrames() == 1);

    node.stop();
    REQUIRE(node.pull(BlockContext::forBlock(kFormat, 1)).events().empty());
    REQUIRE(node.idleBlocks == 1);
}

TEST_CASE("SpectralNode construction errors", "[spectral_node][error]") {
    REQUIRE_THROWS_AS(TickNode(kFormat, 64, 100), ConfigurationError);
    REQUIRE_THROWS_AS(TickNode(StreamFormat{0.0, 16}, 64), ConfigurationError);
}

TEST_CASE("Released spectral nodes cannot be pulled", "[spectral_node][error]") {
    TickNode node(kFormat, 64);
    node.releaseStream();
    REQUIRE(node.isReleased());
    REQUIRE_THROWS_AS(node.pull(BlockContext::forBlock(kFormat, 0)), RealtimeViolation);
}

TEST_CASE("A spectral stream has a single consumer", "[spectral_node][claim]") {
    TickNode node(kFormat, 64);
    int a = 0;
    int b = 0;

    node.claim(&a);
    REQUIRE(node.isClaimed());
    REQUIRE_NOTHROW(node.claim(&a));
    REQUIRE(node.isAvailableTo(&a));
    REQUIRE_FALSE(node.isAvailableTo(&b));
    REQUIRE_THROWS_AS(node.claim(&b), ConfigurationError);

    node.unclaim(&b);
    REQUIRE(node.isClaimed());

    node.unclaim(&a);
    REQUIRE_FALSE(node.isClaimed());
    REQUIRE_NOTHROW(node.claim(&b));
}

TEST_CASE("SpectralInput holds the claim for its owner", "[spectral_input]") {
    auto first = std::make_shared<TickNode>(kFormat, 64);
    int owner = 0;
    int other = 0;

    {
        SpectralInput input(first, &owner);
        REQUIRE_FALSE(first->isAvailableTo(&other));
        REQUIRE_THROWS_AS(SpectralInput(first, &other), ConfigurationError);
    }
    REQUIRE_FALSE(first->isClaimed());
}

TEST_CASE("SpectralInput::attach", "[spectral_input]") {
    auto first = std::make_shared<TickNode>(kFormat, 64);
    int owner = 0;
    SpectralInput input(first, &owner);

    SECTION("moves the claim to the new input") {
        auto second = std::make_shared<TickNode>(kFormat, 64);
        input.attach(second, 1024);
        REQUIRE_FALSE(first->isClaimed());
        REQUIRE(second->isClaimed());
        REQUIRE(&input.node() == second.get());

        const auto ctx = BlockContext::forBlock(kFormat, 0);
        const auto& stream = input.pull(ctx);
        REQUIRE(&stream == &second->pull(ctx));
    }

    SECTION("rejects a different frame size") {
        auto other = std::make_shared<TickNode>(kFormat, 128);
        REQUIRE_THROWS_AS(input.attach(other, 1024), ConfigurationError);
        REQUIRE(first->isClaimed());
        REQUIRE_FALSE(other->isClaimed());
    }

    SECTION("rejects an input whose frames may outgrow the stage") {
        auto big = std::make_shared<TickNode>(kFormat, 64, 4096);
        REQUIRE_THROWS_AS(input.attach(big, 1024), ConfigurationError);
    }

    SECTION("rejects a null input") {
        REQUIRE_THROWS_AS(input.attach(nullptr, 1024), ConfigurationError);
    }
}
