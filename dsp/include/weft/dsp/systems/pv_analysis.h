// ==============================================================================
// Layer 3: System Component - PVAnalysis
// ==============================================================================
// Phase vocoder analysis stage: turns each input into a stream of spectral
// frames (magnitude and true frequency per bin), one frame per hop.
//
// Geometry changes (size, overlaps, window) are validated on the calling
// thread, published, and applied by the render thread at the next hop
// boundary. Applying one discards the partially collected frame and emits a
// Reconfigure event so downstream stages reset with it.
//
// Channel layout: lmax(inputs, sizes, overlaps, windows) spectral channels.
// ==============================================================================

#pragma once

#include "weft/dsp/core/control_spec.h"
#include "weft/dsp/core/debug_log.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/core/window_functions.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/fft.h"
#include "weft/dsp/primitives/input_fader.h"
#include "weft/dsp/primitives/spectral_frame.h"
#include "weft/dsp/primitives/spectral_node.h"
#include "weft/dsp/processors/phase_vocoder.h"
#include "weft/dsp/systems/channel_group.h"
#include "weft/dsp/systems/input_group.h"
#include "weft/dsp/systems/spectral_component.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

// =============================================================================
// PVAnalysisNode
// =============================================================================

class PVAnalysisNode : public SpectralNode {
public:
    /// @throws ConfigurationError for a null input or an invalid geometry
    PVAnalysisNode(const StreamFormat& format, NodePtr input, FrameGeometry geometry,
                   size_t maxFftSize = kDefaultMaxFFTSize)
        : SpectralNode(format, maxFftSize)
        , input_(std::move(input))
        , requested_(geometry) {
        if (!input_) {
            throw ConfigurationError("phase vocoder analysis needs an input node");
        }
        requested_.sampleRate = format.sampleRate;
        checkGeometry(requested_);

        analyzer_.prepare(this->maxFftSize());
        analyzer_.configure(requested_);

        const size_t maxBins = this->maxFftSize() / 2 + 1;
        overflowMagnitude_.assign(maxBins, 0.0f);
        overflowFrequency_.assign(maxBins, 0.0f);
    }

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    [[nodiscard]] FrameGeometry frameGeometry() const override { return requested_; }

    /// @brief Apply `geometry` at the next hop boundary.
    /// @throws ConfigurationError for an invalid geometry
    void setGeometry(FrameGeometry geometry) {
        geometry.sampleRate = format().sampleRate;
        checkGeometry(geometry);
        requested_ = geometry;
        pending_.publish(geometry);
        WEFT_DSP_LOG("pva", "geometry %zu/%zu requested", geometry.fftSize, geometry.overlaps);
    }

    void setSize(size_t fftSize) {
        FrameGeometry geometry = requested_;
        geometry.fftSize = fftSize;
        setGeometry(geometry);
    }

    void setOverlaps(size_t overlaps) {
        FrameGeometry geometry = requested_;
        geometry.overlaps = overlaps;
        setGeometry(geometry);
    }

    void setWindow(WindowType window) {
        FrameGeometry geometry = requested_;
        geometry.window = window;
        setGeometry(geometry);
    }

protected:
    void processBlock(const BlockContext& ctx, SpectralStream& out) override {
        hasPending_ = pending_.consume(pendingGeometry_) || hasPending_;

        const AudioStream& in = input_->pull(ctx);
        for (size_t i = 0; i < ctx.blockSize; ++i) {
            if (!analyzer_.pushSample(in[i])) continue;
            emitFrame(i, out);
            if (hasPending_) applyPending(i, out);
        }
    }

    void idleBlock(const BlockContext& ctx, SpectralStream& out) override {
        (void)ctx;
        hasPending_ = pending_.consume(pendingGeometry_) || hasPending_;
        if (hasPending_) applyPending(0, out);
    }

private:
    void checkGeometry(const FrameGeometry& geometry) const {
        validateGeometry(geometry.fftSize, geometry.overlaps);
        if (geometry.fftSize > maxFftSize()) {
            throw ConfigurationError("FFT size " + std::to_string(geometry.fftSize) +
                                     " exceeds this stage's maximum of " +
                                     std::to_string(maxFftSize()));
        }
    }

    void emitFrame(size_t offset, SpectralStream& out) noexcept {
        const size_t bins = analyzer_.geometry().numBins();
        SpectralFrame* frame = out.appendFrame(offset, bins, analyzer_.framesAnalyzed());
        if (frame != nullptr) {
            analyzer_.analyze(*frame);
            return;
        }
        // Analyze into scratch; the phase history must stay continuous
        WEFT_DSP_LOG("pva", "frame storage exhausted at offset %zu, frame dropped", offset);
        SpectralFrame overflow{std::span<float>(overflowMagnitude_.data(), bins),
                               std::span<float>(overflowFrequency_.data(), bins), 0, {}};
        analyzer_.analyze(overflow);
    }

    void applyPending(size_t offset, SpectralStream& out) noexcept {
        analyzer_.configure(pendingGeometry_);
        hasPending_ = false;
        if (!out.appendReconfigure(offset, pendingGeometry_)) {
            WEFT_DSP_LOG("pva", "event storage exhausted, reconfigure lost");
        }
    }

    NodePtr input_;
    PhaseVocoderAnalyzer analyzer_;

    // Control side
    FrameGeometry requested_;
    PublishSlot<FrameGeometry> pending_;

    // Render side
    FrameGeometry pendingGeometry_{};
    bool hasPending_ = false;
    std::vector<float> overflowMagnitude_;
    std::vector<float> overflowFrequency_;
};

// =============================================================================
// PVAnalysis
// =============================================================================

class PVAnalysis : public SpectralComponent<PVAnalysisNode> {
public:
    static constexpr size_t kDefaultSize = 1024;
    static constexpr size_t kDefaultOverlaps = 4;
    static constexpr WindowType kDefaultWindow = WindowType::Hanning;

    /// @param maxFftSize Largest frame size setSize() may switch to later; 0
    /// sizes the channels for the largest of `sizes`, at least
    /// kDefaultMaxFFTSize
    /// @throws ConfigurationError for empty operand lists or invalid geometry
    PVAnalysis(const StreamFormat& format, const std::vector<NodePtr>& inputs,
               const std::vector<size_t>& sizes = {kDefaultSize},
               const std::vector<size_t>& overlaps = {kDefaultOverlaps},
               const std::vector<WindowType>& windows = {kDefaultWindow},
               size_t maxFftSize = 0)
        : SpectralComponent(format) {
        faders_ = InputGroup::make(format, inputs);

        const size_t count = Multichannel::lmax(inputs, sizes, overlaps, windows);
        if (maxFftSize == 0) {
            maxFftSize = kDefaultMaxFFTSize;
            for (size_t size : sizes) {
                if (isValidFFTSize(size)) maxFftSize = std::max(maxFftSize, size);
            }
        }
        setNodes(ChannelGroup<PVAnalysisNode>(count, [&](size_t i) {
            FrameGeometry geometry;
            geometry.fftSize = Multichannel::wrap(sizes, i);
            geometry.overlaps = Multichannel::wrap(overlaps, i);
            geometry.window = Multichannel::wrap(windows, i);
            geometry.sampleRate = format.sampleRate;
            return std::make_shared<PVAnalysisNode>(format, InputGroup::forVoice(faders_, i),
                                                    geometry, maxFftSize);
        }));
    }

    ~PVAnalysis() override { releaseNodes(); }

    void setInput(const std::vector<NodePtr>& inputs,
                  float fadeTimeSeconds = InputFader::kDefaultFadeTime) {
        InputGroup::retarget(faders_, inputs, fadeTimeSeconds);
    }

    /// @throws ConfigurationError; no channel changes if any size is invalid
    void setSize(const std::vector<size_t>& sizes) {
        updateGeometry([&](FrameGeometry& g, size_t i) { g.fftSize = Multichannel::wrap(sizes, i); });
    }

    void setOverlaps(const std::vector<size_t>& overlaps) {
        updateGeometry([&](FrameGeometry& g, size_t i) {
            g.overlaps = Multichannel::wrap(overlaps, i);
        });
    }

    void setWinType(const std::vector<WindowType>& windows) {
        updateGeometry([&](FrameGeometry& g, size_t i) { g.window = Multichannel::wrap(windows, i); });
    }

    [[nodiscard]] FrameGeometry geometry(size_t channel) const {
        return spectralChannel(channel)->frameGeometry();
    }

    [[nodiscard]] std::vector<ControlSpec> controlSpecs() const override { return {}; }

private:
    template <typename Edit>
    void updateGeometry(Edit&& edit) {
        std::vector<FrameGeometry> next;
        next.reserve(nodes().size());
        for (size_t i = 0; i < nodes().size(); ++i) {
            FrameGeometry geometry = nodes()[i].frameGeometry();
            edit(geometry, i);
            validateGeometry(geometry.fftSize, geometry.overlaps);
            if (geometry.fftSize > nodes()[i].maxFftSize()) {
                throw ConfigurationError("FFT size " + std::to_string(geometry.fftSize) +
                                         " exceeds the analysis maximum");
            }
            next.push_back(geometry);
        }
        for (size_t i = 0; i < nodes().size(); ++i) nodes()[i].setGeometry(next[i]);
    }

    ChannelGroup<InputFader> faders_;
};

} // namespace DSP
} // namespace Weft
