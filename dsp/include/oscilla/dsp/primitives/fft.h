// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated FFT via pffft (Pretty Fast FFT).
// Provides forward (real-to-complex) and inverse (complex-to-real) transforms.
// Uses SSE on x86/x64, NEON on ARM, with scalar fallback.
//
// pffft setups are immutable after creation and shared process-wide through a
// small cache keyed by size, so an FFT instance per call (or per analysis
// session) only pays for its aligned work buffers.
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

#include <pffft.h>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (pffft real transforms need multiples of 32)
inline constexpr size_t kMinFFTSize = 32;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = size_t{1} << 20;

/// @brief True for a power of two in [kMinFFTSize, kMaxFFTSize]
[[nodiscard]] constexpr bool isSupportedFFTSize(size_t size) noexcept {
    return std::has_single_bit(size) && size >= kMinFFTSize && size <= kMaxFFTSize;
}

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
/// @note Layout is {real, imag}; arrays of Complex are read as interleaved floats
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    /// @brief |z|^2
    [[nodiscard]] constexpr float norm() const noexcept { return real * real + imag * imag; }

    [[nodiscard]] float magnitude() const noexcept { return std::sqrt(norm()); }

    [[nodiscard]] float phase() const noexcept { return std::atan2(imag, real); }
};

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) noexcept {
    return AlignedBuffer{static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
                         PffftAlignedDeleter{}};
}

/// @brief Shared real-transform setup for a size (nullptr if pffft refuses it)
/// @note Thread-safe. Setups live until process exit or clearSetupCache().
inline std::shared_ptr<PFFFT_Setup> sharedSetup(size_t fftSize) noexcept {
    static std::mutex mutex;
    static std::map<size_t, std::shared_ptr<PFFFT_Setup>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(fftSize);
    if (it != cache.end()) return it->second;

    std::shared_ptr<PFFFT_Setup> setup(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL),
                                       PffftSetupDeleter{});
    if (setup) cache.emplace(fftSize, setup);
    return setup;
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Core Fast Fourier Transform processor (SIMD-accelerated via pffft)
/// @note One instance per thread; the underlying setup is shared.
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (acquires setup, allocates aligned buffers)
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @note NOT real-time safe (allocates memory). Check isPrepared() afterwards.
    void prepare(size_t fftSize) noexcept {
        size_ = 0;
        setup_.reset();

        if (!isSupportedFFTSize(fftSize)) return;

        setup_ = detail::sharedSetup(fftSize);
        if (!setup_) return;

        buf1_ = detail::makeAlignedBuffer(fftSize);
        buf2_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!buf1_ || !buf2_ || !work_) {
            setup_.reset();
            return;
        }
        size_ = fftSize;
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist), unnormalized
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        std::copy_n(input, N, buf1_.get());

        pffft_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered output: [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
        const float* fftOut = buf2_.get();

        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};

        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    /// @brief Inverse FFT: complex frequency-domain -> real time-domain
    /// @param input N/2+1 complex bins (DC to Nyquist)
    /// @param output N real samples, scaled by 1/N
    void inverse(const Complex* input, float* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        float* fftIn = buf1_.get();

        fftIn[0] = input[0].real;
        fftIn[1] = input[N / 2].real;

        for (size_t k = 1; k < N / 2; ++k) {
            fftIn[2 * k] = input[k].real;
            fftIn[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), fftIn, buf2_.get(),
                                work_.get(), PFFFT_BACKWARD);

        // pffft inverse is unscaled: IFFT(FFT(x)) = N*x
        const float scale = 1.0f / static_cast<float>(N);
        const float* fftOut = buf2_.get();
        for (size_t i = 0; i < N; ++i) {
            output[i] = fftOut[i] * scale;
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::shared_ptr<PFFFT_Setup> setup_;
    detail::AlignedBuffer buf1_;  // Input staging
    detail::AlignedBuffer buf2_;  // Output staging
    detail::AlignedBuffer work_;  // pffft work buffer
};

} // namespace DSP
} // namespace Oscilla
