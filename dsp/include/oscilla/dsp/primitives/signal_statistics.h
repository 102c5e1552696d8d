// ==============================================================================
// Layer 1: DSP Primitive - Time-Domain Statistics
// ==============================================================================
// Mean, spread and shape figures of a sample block, accumulated in double.
// Moments are population moments; kurtosis is reported without the -3 excess
// correction (a sinusoid gives 1.5, Gaussian noise about 3).
//
// findPeaks() locates strict local maxima above a threshold.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/analysis_types.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Oscilla {
namespace DSP {

[[nodiscard]] inline SignalStatistics computeStatistics(const float* samples, size_t count) noexcept {
    SignalStatistics stats;
    if (samples == nullptr || count == 0) return stats;

    const double n = static_cast<double>(count);

    double sum = 0.0;
    double sumSquares = 0.0;
    double lo = samples[0];
    double hi = samples[0];
    double peak = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double x = samples[i];
        sum += x;
        sumSquares += x * x;
        lo = std::min(lo, x);
        hi = std::max(hi, x);
        peak = std::max(peak, std::abs(x));
    }

    stats.mean = sum / n;
    stats.rms = std::sqrt(sumSquares / n);
    stats.min = lo;
    stats.max = hi;
    stats.peakToPeak = hi - lo;
    stats.crestFactor = (stats.rms > 1e-12) ? peak / stats.rms : 0.0;

    double m2 = 0.0;
    double m3 = 0.0;
    double m4 = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double d = samples[i] - stats.mean;
        const double d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    m2 /= n;
    m3 /= n;
    m4 /= n;

    stats.standardDeviation = std::sqrt(m2);
    if (m2 > 1e-24) {
        stats.skewness = m3 / (m2 * stats.standardDeviation);
        stats.kurtosis = m4 / (m2 * m2);
    }
    return stats;
}

/// @brief Indices of strict local maxima whose value exceeds threshold
/// @note The first and last samples are never reported
[[nodiscard]] inline std::vector<size_t> findPeaks(const float* samples, size_t count, double threshold = 0.1) {
    std::vector<size_t> peaks;
    if (samples == nullptr || count < 3) return peaks;

    for (size_t i = 1; i + 1 < count; ++i) {
        const float x = samples[i];
        if (x > samples[i - 1] && x > samples[i + 1] && static_cast<double>(x) > threshold) {
            peaks.push_back(i);
        }
    }
    return peaks;
}

}  // namespace DSP
}  // namespace Oscilla
