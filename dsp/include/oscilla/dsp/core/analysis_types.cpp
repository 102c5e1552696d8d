// ==============================================================================
// Analysis Types Implementation
// ==============================================================================

#include "analysis_types.h"

#include "engine_errors.h"

#include <algorithm>
#include <bit>
#include <cmath>

namespace Oscilla {
namespace DSP {

size_t AnalysisConfig::hopSize() const noexcept {
    const double stride = std::floor(static_cast<double>(windowSize) * (1.0 - overlap));
    return std::max<size_t>(1, static_cast<size_t>(std::max(0.0, stride)));
}

size_t AnalysisConfig::frameCount(size_t segmentLength) const noexcept {
    if (windowSize == 0 || segmentLength < windowSize) return 0;
    return 1 + (segmentLength - windowSize) / hopSize();
}

void AnalysisConfig::validate() const {
    if (windowSize < 2) {
        throw InvalidConfigurationError("window_size must be at least 2");
    }
    if (!std::has_single_bit(transformSize) || transformSize < kMinTransformSize ||
        transformSize > kMaxTransformSize) {
        throw InvalidConfigurationError("transform_size must be a power of two in [32, 65536], got " +
                                        std::to_string(transformSize));
    }
    if (transformSize < windowSize) {
        throw InvalidConfigurationError("transform_size (" + std::to_string(transformSize) +
                                        ") is smaller than window_size (" +
                                        std::to_string(windowSize) + ")");
    }
    if (!(overlap >= 0.0 && overlap < 1.0)) {
        throw InvalidConfigurationError("overlap must lie in [0, 1)");
    }
    if (!(detectionThreshold > 0.0 && detectionThreshold <= 1.0)) {
        throw InvalidConfigurationError("detection_threshold must lie in (0, 1]");
    }
    if (maxHarmonics < 1) {
        throw InvalidConfigurationError("max_harmonics must be at least 1");
    }
    if (!(minFundamentalHz >= 0.0) || !(maxFundamentalHz >= 0.0) || !std::isfinite(minFundamentalHz) ||
        !std::isfinite(maxFundamentalHz)) {
        throw InvalidConfigurationError("fundamental search bounds must be finite and >= 0");
    }
    if (maxFundamentalHz > 0.0 && maxFundamentalHz <= minFundamentalHz) {
        throw InvalidConfigurationError("fundamental_max_hz must exceed fundamental_min_hz");
    }
    if (!(noiseFloorRatio > 0.0) || !std::isfinite(noiseFloorRatio)) {
        throw InvalidConfigurationError("noise_floor_ratio must be positive");
    }
    if (!(envelopeSmoothing >= 0.0 && envelopeSmoothing < 1.0)) {
        throw InvalidConfigurationError("envelope_smoothing must lie in [0, 1)");
    }
}

std::string_view analysisStatusName(AnalysisStatus status) noexcept {
    switch (status) {
        case AnalysisStatus::Created:   return "created";
        case AnalysisStatus::Running:   return "running";
        case AnalysisStatus::Completed: return "completed";
        case AnalysisStatus::Cancelled: return "cancelled";
        case AnalysisStatus::Failed:    return "failed";
    }
    return "unknown";
}

}  // namespace DSP
}  // namespace Oscilla
