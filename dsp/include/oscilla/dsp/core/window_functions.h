// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Window function generators for frame-based spectral analysis.
// Includes Rectangular, Hann, Hamming and Blackman windows together with the
// gain figures needed to turn raw transform magnitudes back into amplitudes.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported window function types for spectral analysis
enum class WindowType : uint8_t {
    Rectangular,  ///< No tapering - best resolution, worst leakage
    Hann,         ///< Hann (Hanning) window - COLA at 50%/75% overlap
    Hamming,      ///< Hamming window - COLA at 50%/75% overlap
    Blackman      ///< Blackman window - lowest sidelobes of the set
};

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

// -----------------------------------------------------------------------------
// Window Generators (In-Place)
// -----------------------------------------------------------------------------

/// @brief Fill buffer with ones
inline void generateRectangular(float* output, size_t size) noexcept {
    if (output == nullptr) return;
    for (size_t n = 0; n < size; ++n) {
        output[n] = 1.0f;
    }
}

/// @brief Fill buffer with Hann window (periodic/DFT-even variant)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N) (periodic variant)
/// @note Real-time safe if buffer is pre-allocated
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        // Periodic (DFT-even) variant: divides by N, not N-1
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.5f - 0.5f * std::cos(phase);
    }
}

/// @brief Fill buffer with Hamming window
/// @note Formula: 0.54 - 0.46*cos(2*pi*n/N)
inline void generateHamming(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.54f - 0.46f * std::cos(phase);
    }
}

/// @brief Fill buffer with Blackman window
/// @note Formula: 0.42 - 0.5*cos(2*pi*n/N) + 0.08*cos(4*pi*n/N)
inline void generateBlackman(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.42f - 0.5f * std::cos(phase) + 0.08f * std::cos(2.0f * phase);
    }
}

// -----------------------------------------------------------------------------
// Gain Figures
// -----------------------------------------------------------------------------

/// @brief Sum of coefficients (coherent gain times N)
/// @note A sinusoid of amplitude A produces a transform peak of A * sum / 2
[[nodiscard]] inline double coherentSum(const float* window, size_t size) noexcept {
    if (window == nullptr) return 0.0;
    double sum = 0.0;
    for (size_t n = 0; n < size; ++n) {
        sum += window[n];
    }
    return sum;
}

/// @brief Sum of squared coefficients (incoherent power gain times N)
/// @note Used for PSD scaling and Parseval-based amplitude estimates
[[nodiscard]] inline double powerSum(const float* window, size_t size) noexcept {
    if (window == nullptr) return 0.0;
    double sum = 0.0;
    for (size_t n = 0; n < size; ++n) {
        sum += static_cast<double>(window[n]) * window[n];
    }
    return sum;
}

/// @brief Magnitude of the window's transform at a bin offset
/// @param offsetBins Distance from the tone in bins of a transform of transformSize
/// @note A sinusoid of amplitude A leaks A * result / 2 into a bin offsetBins away
[[nodiscard]] inline double transformMagnitude(const float* window, size_t size,
                                               double offsetBins, size_t transformSize) noexcept {
    if (window == nullptr || transformSize == 0) return 0.0;
    const double step = kTwoPiD * offsetBins / static_cast<double>(transformSize);
    double re = 0.0;
    double im = 0.0;
    for (size_t n = 0; n < size; ++n) {
        const double phase = step * static_cast<double>(n);
        re += window[n] * std::cos(phase);
        im -= window[n] * std::sin(phase);
    }
    return std::sqrt(re * re + im * im);
}

/// @brief Half-width of the main lobe in bins of an unpadded transform
[[nodiscard]] constexpr size_t mainLobeHalfWidth(WindowType type) noexcept {
    switch (type) {
        case WindowType::Rectangular: return 1;
        case WindowType::Hann:        return 2;
        case WindowType::Hamming:     return 2;
        case WindowType::Blackman:    return 3;
    }
    return 3;
}

// -----------------------------------------------------------------------------
// Factory Function
// -----------------------------------------------------------------------------

/// @brief Generate window coefficients (allocates vector)
/// @param type Window type
/// @param size Window size
/// @return Vector of window coefficients
/// @note NOT real-time safe (allocates memory)
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size, 0.0f);

    switch (type) {
        case WindowType::Rectangular:
            generateRectangular(window.data(), size);
            break;
        case WindowType::Hann:
            generateHann(window.data(), size);
            break;
        case WindowType::Hamming:
            generateHamming(window.data(), size);
            break;
        case WindowType::Blackman:
            generateBlackman(window.data(), size);
            break;
    }

    return window;
}

// -----------------------------------------------------------------------------
// Names
// -----------------------------------------------------------------------------

/// @brief Canonical configuration name of a window type
[[nodiscard]] constexpr std::string_view name(WindowType type) noexcept {
    switch (type) {
        case WindowType::Rectangular: return "rectangular";
        case WindowType::Hann:        return "hann";
        case WindowType::Hamming:     return "hamming";
        case WindowType::Blackman:    return "blackman";
    }
    return "unknown";
}

/// @brief Parse a window name ("hanning" and "rect" are accepted aliases)
/// @throws InvalidConfigurationError for an unknown name
[[nodiscard]] inline WindowType parse(std::string_view text) {
    if (text == "rectangular" || text == "rect" || text == "boxcar") return WindowType::Rectangular;
    if (text == "hann" || text == "hanning") return WindowType::Hann;
    if (text == "hamming") return WindowType::Hamming;
    if (text == "blackman") return WindowType::Blackman;
    throw InvalidConfigurationError("unknown window kind '" + std::string(text) + "'");
}

} // namespace Window

} // namespace DSP
} // namespace Oscilla
