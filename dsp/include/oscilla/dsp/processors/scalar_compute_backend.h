// ==============================================================================
// Layer 2: DSP Processor - Scalar CPU Compute Backend
// ==============================================================================
// Portable implementation of ComputeBackend: plain loops and the radix-2
// ScalarFFT. Always available; the compute strategy selector falls back to it
// whenever the accelerated path is missing or faults.
// ==============================================================================

#pragma once

#include <oscilla/dsp/primitives/compute_backend.h>

namespace Oscilla {
namespace DSP {

class ScalarComputeBackend final : public ComputeBackend {
public:
    ScalarComputeBackend() = default;

    [[nodiscard]] std::string_view name() const noexcept override { return "cpu"; }
    [[nodiscard]] ComputeStrategy strategy() const noexcept override { return ComputeStrategy::Cpu; }

    void evaluateVectorized(const MathematicalLaw& law, const double* times,
                            size_t count, float* out) const override;
    void transformForward(const float* input, size_t size, Complex* output) const override;
    void transformInverse(const Complex* input, size_t size, float* output) const override;
    void windowedMultiply(const float* input, const float* window, size_t count,
                          float* output) const override;
    void accumulatePower(const Complex* spectrum, size_t numBins, float* power) const override;
};

}  // namespace DSP
}  // namespace Oscilla
