// ==============================================================================
// Layer 0: Core Utility - Error Types
// ==============================================================================
// Exception taxonomy for graph construction and rendering.
//
// - ConfigurationError: raised synchronously by constructors, setters and
//   attach calls on the control thread (empty operand list, FFT size mismatch,
//   non-power-of-two size or overlap, zero outputs).
// - RealtimeViolation: a node was asked to produce a block after its stream
//   was released. Fatal to the render thread.
// - CallbackError: a periodic callback failed and the render loop's policy is
//   to abort. Carries the original exception as a nested exception.
//
// Out-of-range parameter values are never errors: they are clamped and, with
// WEFT_DSP_DEBUG enabled, traced.
// ==============================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace Weft {
namespace DSP {

class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class RealtimeViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class CallbackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace DSP
} // namespace Weft
