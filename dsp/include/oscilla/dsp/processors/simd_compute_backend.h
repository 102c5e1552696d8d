// ==============================================================================
// Layer 2: DSP Processor - SIMD-Accelerated Compute Backend
// ==============================================================================
// ComputeBackend on the host vector unit: pffft transforms and Highway
// kernels (windowing, power accumulation, sinusoid evaluation).
//
// Faults of the accelerated path (pffft refusing a setup, an unusable SIMD
// target) are raised as AcceleratorFault so that the compute strategy
// selector can retry the call on the CPU backend.
// ==============================================================================

#pragma once

#include <oscilla/dsp/primitives/compute_backend.h>

#include <string>

namespace Oscilla {
namespace DSP {

class SimdComputeBackend final : public ComputeBackend {
public:
    SimdComputeBackend();

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] ComputeStrategy strategy() const noexcept override {
        return ComputeStrategy::Accelerated;
    }

    void evaluateVectorized(const MathematicalLaw& law, const double* times,
                            size_t count, float* out) const override;
    void transformForward(const float* input, size_t size, Complex* output) const override;
    void transformInverse(const Complex* input, size_t size, float* output) const override;
    void windowedMultiply(const float* input, const float* window, size_t count,
                          float* output) const override;
    void accumulatePower(const Complex* spectrum, size_t numBins, float* power) const override;

private:
    std::string name_;
};

}  // namespace DSP
}  // namespace Oscilla
