// ==============================================================================
// SIMD-Accelerated Compute Backend Implementation
// ==============================================================================

#include "simd_compute_backend.h"

#include <oscilla/dsp/core/compute_simd.h>
#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/primitives/law_evaluator.h>

#include <map>
#include <string>

namespace Oscilla {
namespace DSP {

namespace {

// One prepared pffft transform per size and thread; setups are shared
FFT& threadTransform(size_t size) {
    if (!isSupportedFFTSize(size)) {
        throw InvalidConfigurationError("unsupported transform size " + std::to_string(size));
    }
    thread_local std::map<size_t, FFT> transforms;
    FFT& fft = transforms[size];
    if (!fft.isPrepared()) {
        fft.prepare(size);
        if (!fft.isPrepared()) {
            transforms.erase(size);
            throw AcceleratorFault("pffft could not prepare a transform of size " + std::to_string(size));
        }
    }
    return fft;
}

} // namespace

SimdComputeBackend::SimdComputeBackend()
    : name_(std::string("simd (") + activeSimdTarget() + ")") {}

void SimdComputeBackend::evaluateVectorized(const MathematicalLaw& law, const double* times,
                                            size_t count, float* out) const {
    const LawEvaluator evaluator(law);
    if (evaluator.kind() == LawKind::Sinusoidal) {
        evaluateSinusoidBulk(times, count, evaluator.frequency(), evaluator.amplitude(),
                             evaluator.phase(), evaluator.offset(), out);
        return;
    }
    evaluator.evaluate(times, count, out);
}

void SimdComputeBackend::transformForward(const float* input, size_t size, Complex* output) const {
    threadTransform(size).forward(input, output);
}

void SimdComputeBackend::transformInverse(const Complex* input, size_t size, float* output) const {
    threadTransform(size).inverse(input, output);
}

void SimdComputeBackend::windowedMultiply(const float* input, const float* window, size_t count,
                                          float* output) const {
    windowedMultiplyBulk(input, window, count, output);
}

void SimdComputeBackend::accumulatePower(const Complex* spectrum, size_t numBins,
                                         float* power) const {
    // Complex is {real, imag}: an array of it is interleaved float pairs
    accumulatePowerBulk(reinterpret_cast<const float*>(spectrum), numBins, power);
}

}  // namespace DSP
}  // namespace Oscilla
