// ==============================================================================
// Layer 1: DSP Primitive - ControlSource Interface
// ==============================================================================
// Interface for control-rate work the render loop runs once per block, before
// any audio node is pulled. Implementations run on the render thread and must
// not block; they may throw, in which case the render loop's error policy
// decides between halting the source and aborting the block.
// ==============================================================================

#pragma once

#include "weft/dsp/core/block_context.h"

#include <memory>

namespace Weft {
namespace DSP {

class ControlSource {
public:
    virtual ~ControlSource() = default;

    /// @brief Advance by one block.
    virtual void tick(const BlockContext& ctx) = 0;

    /// @brief Stop producing work until restarted from the control thread.
    /// Called on the render thread after tick() threw.
    virtual void halt() noexcept = 0;
};

using ControlSourcePtr = std::shared_ptr<ControlSource>;

} // namespace DSP
} // namespace Weft
