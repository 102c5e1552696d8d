// ==============================================================================
// OscillaDSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header, so each header is checked to compile on
// its own include set.
//
// This file is NOT part of the OscillaDSP library itself; it is compiled as a
// separate OBJECT library target (dsp_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <oscilla/dsp/core/analysis_types.h>
#include <oscilla/dsp/core/cancellation.h>
#include <oscilla/dsp/core/compute_simd.h>
#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/identifiers.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/core/math_constants.h>
#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/core/random.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/core/window_functions.h>

// Layer 1: Primitives
#include <oscilla/dsp/primitives/compute_backend.h>
#include <oscilla/dsp/primitives/expression.h>
#include <oscilla/dsp/primitives/fft.h>
#include <oscilla/dsp/primitives/frame_ring_buffer.h>
#include <oscilla/dsp/primitives/law_evaluator.h>
#include <oscilla/dsp/primitives/noise_source.h>
#include <oscilla/dsp/primitives/scalar_fft.h>
#include <oscilla/dsp/primitives/signal_statistics.h>
#include <oscilla/dsp/primitives/spectral_peak.h>

// Layer 2: Processors
#include <oscilla/dsp/processors/compute_strategy.h>
#include <oscilla/dsp/processors/envelope_extractor.h>
#include <oscilla/dsp/processors/scalar_compute_backend.h>
#include <oscilla/dsp/processors/signal_generator.h>
#include <oscilla/dsp/processors/simd_compute_backend.h>
#include <oscilla/dsp/processors/spectral_analyzer.h>

// Layer 3: Systems
#include <oscilla/dsp/systems/analysis_service.h>
#include <oscilla/dsp/systems/analysis_worker_pool.h>
#include <oscilla/dsp/systems/compute_runtime.h>
#include <oscilla/dsp/systems/engine_config.h>
#include <oscilla/dsp/systems/event_hub.h>
#include <oscilla/dsp/systems/events.h>
#include <oscilla/dsp/systems/persistence.h>
#include <oscilla/dsp/systems/signal_source.h>

// Layer 4: Engine
#include <oscilla/dsp/engine/signal_engine.h>
