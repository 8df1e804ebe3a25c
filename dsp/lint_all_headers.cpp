// ==============================================================================
// PrimerDSP Lint Stub - Strict clang-tidy analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header, so header-only code is checked even when
// no test includes it directly.
//
// This file is NOT part of the PrimerDSP library itself; it is compiled as a
// separate OBJECT library target (dsp_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <primer/dsp/core/db_utils.h>
#include <primer/dsp/core/dsp_error.h>
#include <primer/dsp/core/filter_design.h>
#include <primer/dsp/core/interpolation.h>
#include <primer/dsp/core/math_constants.h>
#include <primer/dsp/core/random.h>
#include <primer/dsp/core/signal.h>
#include <primer/dsp/core/spectral_simd.h>
#include <primer/dsp/core/window_functions.h>

// Layer 1: Primitives
#include <primer/dsp/primitives/biquad.h>
#include <primer/dsp/primitives/fft.h>
#include <primer/dsp/primitives/quantizer.h>
#include <primer/dsp/primitives/signal_generator.h>

// Layer 2: Processors
#include <primer/dsp/processors/iir_filter.h>
#include <primer/dsp/processors/sampling_evaluator.h>
#include <primer/dsp/processors/signal_metrics.h>
#include <primer/dsp/processors/spectrum_analyzer.h>

// Layer 3: Systems
#include <primer/dsp/systems/adc_test_bench.h>
