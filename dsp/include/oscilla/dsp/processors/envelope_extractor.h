// ==============================================================================
// Layer 2: DSP Processor - Analytic-Signal Envelope
// ==============================================================================
// Amplitude envelope |x + j*H{x}| where H is the Hilbert transform computed in
// the frequency domain:
//   X = FFT(x), H(k) = -j*X(k) for 0 < k < N/2, H(0) = H(N/2) = 0
//   h = IFFT(H), envelope = sqrt(x^2 + h^2)
// The input is zero-padded to a power of two; inputs longer than the largest
// transform are processed in consecutive blocks.
//
// Optional one-pole smoothing: y[n] = s*y[n-1] + (1-s)*e[n], y[0] = e[0].
// ==============================================================================

#pragma once

#include <oscilla/dsp/primitives/compute_backend.h>

#include <cstddef>
#include <vector>

namespace Oscilla {
namespace DSP {

class EnvelopeExtractor {
public:
    explicit EnvelopeExtractor(const ComputeBackend& backend) noexcept : backend_(backend) {}

    /// @brief Envelope of count samples (same length as the input)
    /// @param smoothing One-pole coefficient in [0, 1); 0 disables smoothing
    [[nodiscard]] std::vector<float> extract(const float* samples, size_t count,
                                             double smoothing = 0.0) const;

    /// @brief Transform size used for an input of count samples
    [[nodiscard]] static size_t blockSizeFor(size_t count) noexcept;

private:
    void extractBlock(const float* samples, size_t count, size_t blockSize, float* out) const;

    const ComputeBackend& backend_;
};

}  // namespace DSP
}  // namespace Oscilla
