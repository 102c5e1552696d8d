// ==============================================================================
// Layer 1: DSP Primitive - Portable Radix-2 FFT
// ==============================================================================
// Iterative Cooley-Tukey radix-2 decimation-in-time transform in double
// precision. Same interface and bin layout as FFT; used by the CPU compute
// path, which must not depend on any SIMD library.
//
// Real input is transformed as a complex sequence with zero imaginary part.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/math_constants.h>
#include <oscilla/dsp/primitives/fft.h>

#include <bit>
#include <cmath>
#include <complex>
#include <cstddef>
#include <utility>
#include <vector>

namespace Oscilla {
namespace DSP {

class ScalarFFT {
public:
    ScalarFFT() noexcept = default;

    /// @brief Build twiddle and bit-reversal tables
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @note NOT real-time safe (allocates memory). Check isPrepared() afterwards.
    void prepare(size_t fftSize) {
        size_ = 0;
        if (!isSupportedFFTSize(fftSize)) return;

        twiddles_.resize(fftSize / 2);
        for (size_t k = 0; k < fftSize / 2; ++k) {
            const double angle = -kTwoPiD * static_cast<double>(k) / static_cast<double>(fftSize);
            twiddles_[k] = {std::cos(angle), std::sin(angle)};
        }

        const int bits = std::countr_zero(fftSize);
        bitReverse_.resize(fftSize);
        for (size_t i = 0; i < fftSize; ++i) {
            size_t reversed = 0;
            for (int b = 0; b < bits; ++b) {
                reversed |= ((i >> b) & 1U) << (bits - 1 - b);
            }
            bitReverse_[i] = reversed;
        }

        work_.assign(fftSize, {0.0, 0.0});
        size_ = fftSize;
    }

    /// @brief Forward FFT: N real samples -> N/2+1 unnormalized bins
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        for (size_t i = 0; i < size_; ++i) {
            work_[bitReverse_[i]] = {static_cast<double>(input[i]), 0.0};
        }
        butterflies(false);

        for (size_t k = 0; k <= size_ / 2; ++k) {
            output[k] = {static_cast<float>(work_[k].real()), static_cast<float>(work_[k].imag())};
        }
        output[0].imag = 0.0f;
        output[size_ / 2].imag = 0.0f;
    }

    /// @brief Inverse FFT: N/2+1 bins -> N real samples, scaled by 1/N
    /// @note The imaginary parts of the DC and Nyquist bins are ignored.
    void inverse(const Complex* input, float* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        for (size_t k = 0; k < N; ++k) {
            std::complex<double> bin;
            if (k == 0 || k == N / 2) {
                bin = {input[k].real, 0.0};
            } else if (k < N / 2) {
                bin = {input[k].real, input[k].imag};
            } else {
                // Hermitian mirror
                bin = {input[N - k].real, -input[N - k].imag};
            }
            work_[bitReverse_[k]] = bin;
        }
        butterflies(true);

        const double scale = 1.0 / static_cast<double>(N);
        for (size_t i = 0; i < N; ++i) {
            output[i] = static_cast<float>(work_[i].real() * scale);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0; }

private:
    // In-place butterfly passes over bit-reversed data
    void butterflies(bool inverse) noexcept {
        for (size_t span = 2; span <= size_; span <<= 1) {
            const size_t half = span / 2;
            const size_t stride = size_ / span;
            for (size_t start = 0; start < size_; start += span) {
                for (size_t j = 0; j < half; ++j) {
                    std::complex<double> w = twiddles_[j * stride];
                    if (inverse) w = std::conj(w);
                    const std::complex<double> t = w * work_[start + j + half];
                    work_[start + j + half] = work_[start + j] - t;
                    work_[start + j] += t;
                }
            }
        }
    }

    size_t size_ = 0;
    std::vector<std::complex<double>> twiddles_;
    std::vector<size_t> bitReverse_;
    std::vector<std::complex<double>> work_;
};

} // namespace DSP
} // namespace Oscilla
