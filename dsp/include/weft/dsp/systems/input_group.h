// ==============================================================================
// Layer 3: System Component - Input Fader Groups
// ==============================================================================
// Every input-taking component wraps its inputs in one InputFader each. The
// fader group keeps the length of the original input list; setInput() maps a
// new list onto it with the wrap rule and crossfades each fader.
// ==============================================================================

#pragma once

#include "weft/dsp/core/multichannel.h"
#include "weft/dsp/primitives/audio_node.h"
#include "weft/dsp/primitives/input_fader.h"
#include "weft/dsp/systems/channel_group.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace Weft {
namespace DSP {
namespace InputGroup {

/// @throws ConfigurationError for an empty list or a null input
[[nodiscard]] inline ChannelGroup<InputFader> make(const StreamFormat& format,
                                                   const std::vector<NodePtr>& inputs) {
    Multichannel::requireNonEmpty(inputs, "inputs");
    return ChannelGroup<InputFader>(inputs.size(), [&](size_t i) {
        return std::make_shared<InputFader>(format, inputs[i]);
    });
}

/// @brief Crossfade fader i to wrap(inputs, i).
inline void retarget(ChannelGroup<InputFader>& faders, const std::vector<NodePtr>& inputs,
                     float fadeTimeSeconds) {
    Multichannel::requireNonEmpty(inputs, "inputs");
    for (size_t i = 0; i < faders.size(); ++i) {
        faders[i].setInput(Multichannel::wrap(inputs, i), fadeTimeSeconds);
    }
}

/// @brief Fader feeding voice i, as a node handle.
[[nodiscard]] inline NodePtr forVoice(const ChannelGroup<InputFader>& faders, size_t i) {
    return faders.node(i % faders.size());
}

} // namespace InputGroup
} // namespace DSP
} // namespace Weft
