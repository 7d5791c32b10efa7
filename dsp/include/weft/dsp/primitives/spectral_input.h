// ==============================================================================
// Layer 1: DSP Primitive - SpectralInput
// ==============================================================================
// The spectral input of a consuming stage (transform or resynthesis). Holds
// the claim on the upstream SpectralNode, checks frame sizes on attach, and
// hands a replacement input to the render thread at the next block boundary.
// The displaced input is destroyed on the control thread.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"
#include "weft/dsp/core/dsp_errors.h"
#include "weft/dsp/core/publish_slot.h"
#include "weft/dsp/primitives/spectral_frame.h"
#include "weft/dsp/primitives/spectral_node.h"

#include <cstddef>
#include <string>
#include <utility>

namespace Weft {
namespace DSP {

class SpectralInput {
public:
    /// @param input Upstream node; claimed on behalf of `owner`
    /// @param owner Identity of the consuming stage
    /// @throws ConfigurationError for a null input or one that already feeds
    /// another stage
    SpectralInput(SpectralNodePtr input, const void* owner)
        : owner_(owner) {
        if (!input) {
            throw ConfigurationError("spectral stage needs an input node");
        }
        input->claim(owner_);
        control_ = input;
        render_ = std::move(input);
    }

    ~SpectralInput() {
        if (control_) control_->unclaim(owner_);
    }

    SpectralInput(const SpectralInput&) = delete;
    SpectralInput& operator=(const SpectralInput&) = delete;

    // -------------------------------------------------------------------------
    // Control thread
    // -------------------------------------------------------------------------

    /// @brief Replace the input from the next block on.
    ///
    /// The replacement must deliver the same frame size as the current input
    /// and fit this stage's frame storage.
    /// @throws ConfigurationError
    void attach(SpectralNodePtr input, size_t maxFftSize) {
        if (!input) {
            throw ConfigurationError("spectral stage needs an input node");
        }
        if (input == control_) return;
        if (input->fftSize() != control_->fftSize()) {
            throw ConfigurationError("FFT size mismatch: stage expects " +
                                     std::to_string(control_->fftSize()) +
                                     ", input delivers " + std::to_string(input->fftSize()));
        }
        if (input->maxFftSize() > maxFftSize) {
            throw ConfigurationError("input frames may exceed this stage's maximum FFT size");
        }
        input->claim(owner_);
        control_->unclaim(owner_);
        control_ = input;
        pending_.publish(std::move(input));
    }

    [[nodiscard]] const SpectralNode& node() const noexcept { return *control_; }
    [[nodiscard]] const void* owner() const noexcept { return owner_; }

    // -------------------------------------------------------------------------
    // Render thread
    // -------------------------------------------------------------------------

    const SpectralStream& pull(const BlockContext& ctx) {
        pending_.consume(render_);
        return render_->pull(ctx);
    }

private:
    const void* owner_;
    SpectralNodePtr control_;
    SpectralNodePtr render_;
    PublishSlot<SpectralNodePtr> pending_;
};

} // namespace DSP
} // namespace Weft
