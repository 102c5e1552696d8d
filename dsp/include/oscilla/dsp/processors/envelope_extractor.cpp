// ==============================================================================
// Analytic-Signal Envelope Implementation
// ==============================================================================

#include "envelope_extractor.h"

#include <algorithm>
#include <bit>
#include <cmath>

namespace Oscilla {
namespace DSP {

size_t EnvelopeExtractor::blockSizeFor(size_t count) noexcept {
    const size_t wanted = std::bit_ceil(std::max<size_t>(count, 1));
    return std::clamp(wanted, kMinFFTSize, kMaxFFTSize);
}

std::vector<float> EnvelopeExtractor::extract(const float* samples, size_t count, double smoothing) const {
    std::vector<float> envelope(count, 0.0f);
    if (samples == nullptr || count == 0) return envelope;

    const size_t blockSize = blockSizeFor(count);
    for (size_t start = 0; start < count; start += blockSize) {
        const size_t length = std::min(blockSize, count - start);
        extractBlock(samples + start, length, blockSize, envelope.data() + start);
    }

    if (smoothing > 0.0) {
        const float s = static_cast<float>(std::min(smoothing, 0.999999));
        float state = envelope[0];
        for (size_t i = 0; i < count; ++i) {
            state = s * state + (1.0f - s) * envelope[i];
            envelope[i] = state;
        }
    }
    return envelope;
}

void EnvelopeExtractor::extractBlock(const float* samples, size_t count, size_t blockSize,
                                     float* out) const {
    std::vector<float> padded(blockSize, 0.0f);
    std::copy_n(samples, count, padded.begin());

    std::vector<Complex> spectrum(blockSize / 2 + 1);
    backend_.transformForward(padded.data(), blockSize, spectrum.data());

    // Multiply by -j on positive frequencies: (re + j*im) * -j = im - j*re
    spectrum[0] = {};
    spectrum[blockSize / 2] = {};
    for (size_t k = 1; k < blockSize / 2; ++k) {
        spectrum[k] = {spectrum[k].imag, -spectrum[k].real};
    }

    std::vector<float> quadrature(blockSize, 0.0f);
    backend_.transformInverse(spectrum.data(), blockSize, quadrature.data());

    for (size_t i = 0; i < count; ++i) {
        const float x = samples[i];
        const float h = quadrature[i];
        out[i] = std::sqrt(x * x + h * h);
    }
}

}  // namespace DSP
}  // namespace Oscilla
