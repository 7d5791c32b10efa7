// ==============================================================================
// WeftDSP Lint Stub - Strict clang-tidy analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header.
//
// This file is NOT part of the WeftDSP library itself; it is compiled as a
// separate OBJECT library target (weft_dsp_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <weft/dsp/core/block_context.h>
#include <weft/dsp/core/control_spec.h>
#include <weft/dsp/core/crossfade_utils.h>
#include <weft/dsp/core/debug_log.h>
#include <weft/dsp/core/dsp_errors.h>
#include <weft/dsp/core/math_constants.h>
#include <weft/dsp/core/multichannel.h>
#include <weft/dsp/core/publish_slot.h>
#include <weft/dsp/core/random.h>
#include <weft/dsp/core/retire_list.h>
#include <weft/dsp/core/spectral_simd.h>
#include <weft/dsp/core/window_functions.h>

// Layer 1: Primitives
#include <weft/dsp/primitives/audio_node.h>
#include <weft/dsp/primitives/audio_stream.h>
#include <weft/dsp/primitives/channel_tap.h>
#include <weft/dsp/primitives/control_source.h>
#include <weft/dsp/primitives/fft.h>
#include <weft/dsp/primitives/graph_node.h>
#include <weft/dsp/primitives/input_fader.h>
#include <weft/dsp/primitives/output_node.h>
#include <weft/dsp/primitives/parameter.h>
#include <weft/dsp/primitives/spectral_frame.h>
#include <weft/dsp/primitives/spectral_input.h>
#include <weft/dsp/primitives/spectral_node.h>

// Layer 2: Processors
#include <weft/dsp/processors/oscillator_bank.h>
#include <weft/dsp/processors/pan_laws.h>
#include <weft/dsp/processors/phase_vocoder.h>
#include <weft/dsp/processors/spectral_transforms.h>

// Layer 3: Systems
#include <weft/dsp/systems/audio_component.h>
#include <weft/dsp/systems/bus_router.h>
#include <weft/dsp/systems/channel_group.h>
#include <weft/dsp/systems/channel_switch.h>
#include <weft/dsp/systems/cosine_pan.h>
#include <weft/dsp/systems/equal_power_pan.h>
#include <weft/dsp/systems/input_group.h>
#include <weft/dsp/systems/periodic_scheduler.h>
#include <weft/dsp/systems/pv_add_synth.h>
#include <weft/dsp/systems/pv_analysis.h>
#include <weft/dsp/systems/pv_synth.h>
#include <weft/dsp/systems/pv_transforms.h>
#include <weft/dsp/systems/render_loop.h>
#include <weft/dsp/systems/source_selector.h>
#include <weft/dsp/systems/spectral_component.h>

