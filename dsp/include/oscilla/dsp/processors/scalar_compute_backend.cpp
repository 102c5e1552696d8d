// ==============================================================================
// Scalar CPU Compute Backend Implementation
// ==============================================================================

#include "scalar_compute_backend.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/primitives/law_evaluator.h>
#include <oscilla/dsp/primitives/scalar_fft.h>

#include <map>
#include <string>

namespace Oscilla {
namespace DSP {

namespace {

// One prepared transform per size and thread
ScalarFFT& threadTransform(size_t size) {
    if (!isSupportedFFTSize(size)) {
        throw InvalidConfigurationError("unsupported transform size " + std::to_string(size));
    }
    thread_local std::map<size_t, ScalarFFT> transforms;
    ScalarFFT& fft = transforms[size];
    if (!fft.isPrepared()) {
        fft.prepare(size);
    }
    return fft;
}

} // namespace

void ScalarComputeBackend::evaluateVectorized(const MathematicalLaw& law, const double* times,
                                              size_t count, float* out) const {
    evaluateLaw(law, times, count, out);
}

void ScalarComputeBackend::transformForward(const float* input, size_t size, Complex* output) const {
    threadTransform(size).forward(input, output);
}

void ScalarComputeBackend::transformInverse(const Complex* input, size_t size, float* output) const {
    threadTransform(size).inverse(input, output);
}

void ScalarComputeBackend::windowedMultiply(const float* input, const float* window, size_t count,
                                            float* output) const {
    if (input == nullptr || window == nullptr || output == nullptr) return;
    for (size_t i = 0; i < count; ++i) {
        output[i] = input[i] * window[i];
    }
}

void ScalarComputeBackend::accumulatePower(const Complex* spectrum, size_t numBins,
                                           float* power) const {
    if (spectrum == nullptr || power == nullptr) return;
    for (size_t k = 0; k < numBins; ++k) {
        power[k] += spectrum[k].norm();
    }
}

}  // namespace DSP
}  // namespace Oscilla
