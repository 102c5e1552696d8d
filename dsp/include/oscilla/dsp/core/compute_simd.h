// ==============================================================================
// Layer 0: Core Utility - SIMD Vector Kernels
// ==============================================================================
// Bulk windowing, power accumulation and sinusoid evaluation using Google
// Highway for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These are the vector kernels behind the accelerated compute backend. Each
// one processes whole vectors and finishes the remainder with a scalar tail.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Oscilla {
namespace DSP {

/// @brief output[i] = input[i] * window[i]
/// @note In-place operation (output == input) is allowed
void windowedMultiplyBulk(const float* input, const float* window, size_t count,
                          float* output) noexcept;

/// @brief power[k] += re(k)^2 + im(k)^2 for interleaved {real, imag} bins
/// @param complexData Interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param power Accumulator (numBins floats)
void accumulatePowerBulk(const float* complexData, size_t numBins, float* power) noexcept;

/// @brief output[i] = amplitude * sin(2*pi*u_i) + offset,
///        u_i = frac(frequency * times[i] + phase / (2*pi))
/// @note Computed in double precision, stored as float
void evaluateSinusoidBulk(const double* times, size_t count, double frequency,
                          double amplitude, double phase, double offset,
                          float* output) noexcept;

/// @brief Name of the SIMD target chosen by runtime dispatch
[[nodiscard]] const char* activeSimdTarget() noexcept;

}  // namespace DSP
}  // namespace Oscilla
