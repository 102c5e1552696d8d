// ==============================================================================
// Layer 1: DSP Primitive - Spectral Peak Utilities
// ==============================================================================
// Peak picking, sub-bin interpolation and band energy over a power spectrum.
//
// Interpolation fits a parabola through the natural log of the power of the
// peak bin and its two neighbours. For a Gaussian-like main lobe the vertex of
// that parabola is the true peak:
//   delta = 0.5 * (a - c) / (a - 2b + c),  a, b, c = ln P[k-1], ln P[k], ln P[k+1]
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Oscilla {
namespace DSP {
namespace SpectralPeak {

/// Power values below this are treated as this for the logarithm
inline constexpr double kMinPower = 1e-30;

/// @brief Index of the largest value in [first, last] (inclusive)
/// @return first when the range is empty or inverted
[[nodiscard]] inline size_t findPeak(const double* values, size_t first, size_t last) noexcept {
    if (values == nullptr || last < first) return first;
    size_t best = first;
    for (size_t k = first + 1; k <= last; ++k) {
        if (values[k] > values[best]) best = k;
    }
    return best;
}

/// @brief Sub-bin offset of the true peak, in [-0.5, 0.5]
/// @param left Power at k-1
/// @param center Power at k
/// @param right Power at k+1
[[nodiscard]] inline double interpolateOffset(double left, double center, double right) noexcept {
    const double a = std::log(std::max(left, kMinPower));
    const double b = std::log(std::max(center, kMinPower));
    const double c = std::log(std::max(right, kMinPower));

    const double denom = a - 2.0 * b + c;
    if (!(denom < 0.0)) {
        return 0.0;  // Not a local maximum
    }
    return std::clamp(0.5 * (a - c) / denom, -0.5, 0.5);
}

/// @brief Sub-bin offset at bin k of a power spectrum with numBins bins
[[nodiscard]] inline double interpolateOffsetAt(const double* power, size_t numBins, size_t k) noexcept {
    if (power == nullptr || k == 0 || k + 1 >= numBins) return 0.0;
    return interpolateOffset(power[k - 1], power[k], power[k + 1]);
}

/// @brief Sum of power over [center - halfWidth, center + halfWidth] clipped to the spectrum
[[nodiscard]] inline double bandEnergy(const double* power, size_t numBins,
                                       size_t center, size_t halfWidth) noexcept {
    if (power == nullptr || numBins == 0) return 0.0;
    const size_t first = center > halfWidth ? center - halfWidth : 0;
    const size_t last = std::min(numBins - 1, center + halfWidth);
    double sum = 0.0;
    for (size_t k = first; k <= last; ++k) {
        sum += power[k];
    }
    return sum;
}

/// @brief Median of a sequence (allocates a copy)
[[nodiscard]] inline double median(const double* values, size_t count) {
    if (values == nullptr || count == 0) return 0.0;
    std::vector<double> sorted(values, values + count);
    const size_t mid = count / 2;
    std::nth_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(mid), sorted.end());
    const double upper = sorted[mid];
    if (count % 2 == 1) return upper;
    const double lower = *std::max_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

} // namespace SpectralPeak
} // namespace DSP
} // namespace Oscilla
