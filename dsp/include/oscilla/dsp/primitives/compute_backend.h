// ==============================================================================
// Layer 1: DSP Primitive - Compute Backend Interface
// ==============================================================================
// Vector-math capability shared by the signal generator and the spectral
// analyzer. Two implementations exist (SIMD-accelerated and scalar CPU); the
// compute strategy selector chooses between them and is itself a backend.
//
// All operations are const and thread-safe: a backend is shared read-only by
// concurrent analysis sessions and streaming producers.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/primitives/fft.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Oscilla {
namespace DSP {

// =============================================================================
// ComputeStrategy
// =============================================================================

/// @brief Requested or active execution path
enum class ComputeStrategy : uint8_t {
    Auto,         ///< Accelerated when the probe succeeds, CPU otherwise
    Accelerated,  ///< SIMD vector unit ("gpu" in configuration files)
    Cpu           ///< Portable scalar code
};

[[nodiscard]] constexpr std::string_view computeStrategyName(ComputeStrategy strategy) noexcept {
    switch (strategy) {
        case ComputeStrategy::Auto:        return "auto";
        case ComputeStrategy::Accelerated: return "gpu";
        case ComputeStrategy::Cpu:         return "cpu";
    }
    return "unknown";
}

/// @brief Parse "auto", "gpu" (aliases "accelerated", "simd") or "cpu"
/// @throws InvalidConfigurationError for an unknown name
[[nodiscard]] ComputeStrategy parseComputeStrategy(std::string_view text);

// =============================================================================
// ComputeBackend
// =============================================================================

class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    /// @brief Human-readable name, e.g. "simd (AVX2)" or "cpu"
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Accelerated or Cpu (never Auto)
    [[nodiscard]] virtual ComputeStrategy strategy() const noexcept = 0;

    /// @brief out[i] = law(times[i])
    /// @throws UnsupportedLawError, InvalidParameterError for an invalid law
    virtual void evaluateVectorized(const MathematicalLaw& law, const double* times,
                                    size_t count, float* out) const = 0;

    /// @brief Real-to-complex transform of size samples into size/2+1 bins
    /// @param size Power of two in [kMinFFTSize, kMaxFFTSize]
    /// @throws InvalidConfigurationError for an unsupported size
    virtual void transformForward(const float* input, size_t size, Complex* output) const = 0;

    /// @brief Complex-to-real inverse of transformForward, scaled by 1/size
    virtual void transformInverse(const Complex* input, size_t size, float* output) const = 0;

    /// @brief output[i] = input[i] * window[i]; output may alias input
    virtual void windowedMultiply(const float* input, const float* window, size_t count,
                                  float* output) const = 0;

    /// @brief power[k] += |spectrum[k]|^2
    virtual void accumulatePower(const Complex* spectrum, size_t numBins, float* power) const = 0;

protected:
    ComputeBackend() = default;
    ComputeBackend(const ComputeBackend&) = default;
    ComputeBackend& operator=(const ComputeBackend&) = default;
};

}  // namespace DSP
}  // namespace Oscilla
