// ==============================================================================
// Layer 2: DSP Processor - Batch Signal Generator
// ==============================================================================
// Drives a law over a finite duration at a fixed sample rate and packages the
// result as SignalData. Synchronous and deterministic for a given backend.
//
// Sample count is round(sampleRate * duration); sample i sits at i/sampleRate.
// Optional seeded noise is added after the law is evaluated.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/primitives/compute_backend.h>
#include <oscilla/dsp/primitives/noise_source.h>

#include <string>

namespace Oscilla {
namespace DSP {

class SignalGenerator {
public:
    /// @param backend Vector backend used for law evaluation (must outlive the generator)
    explicit SignalGenerator(const ComputeBackend& backend) noexcept : backend_(backend) {}

    /// @brief Generate a complete signal
    /// @param name Signal name; defaults to the law kind name
    /// @param noise Measurement noise added to the evaluated law (none by default)
    /// @throws SampleRateError if sampleRate <= 0 or duration < 0 (or either is not finite)
    /// @throws InvalidParameterError, UnsupportedLawError from law validation
    /// @throws InvalidParameterError("noise_level") for a negative noise level
    [[nodiscard]] SignalData generate(const MathematicalLaw& law, double sampleRate,
                                      double duration, std::string name = {},
                                      const NoiseOptions& noise = {}) const;

    /// @throws SampleRateError
    static void validateTiming(double sampleRate, double duration);

    [[nodiscard]] const ComputeBackend& backend() const noexcept { return backend_; }

private:
    const ComputeBackend& backend_;
};

}  // namespace DSP
}  // namespace Oscilla
