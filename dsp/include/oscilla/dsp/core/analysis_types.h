// ==============================================================================
// Layer 0: Core Type - Analysis Configuration, Results and Sessions
// ==============================================================================
// Value types exchanged between the spectral analyzer, the analysis service
// and its consumers (event subscribers, persistence).
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/window_functions.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Smallest supported transform size
inline constexpr size_t kMinTransformSize = 32;

/// Largest transform size accepted by an analysis configuration
inline constexpr size_t kMaxTransformSize = 65536;

// =============================================================================
// AnalysisConfig
// =============================================================================

/// @brief Spectral analysis parameters
struct AnalysisConfig {
    WindowType window = WindowType::Hann;
    size_t windowSize = 1024;           ///< W, samples per frame
    double overlap = 0.5;               ///< o in [0, 1)
    size_t transformSize = 1024;        ///< F >= W, power of two
    double detectionThreshold = 0.01;   ///< Harmonic threshold, fraction of fundamental
    size_t maxHarmonics = 10;           ///< Including the fundamental
    double minFundamentalHz = 0.0;      ///< 0 = no lower bound beyond the DC lobe
    double maxFundamentalHz = 0.0;      ///< 0 = up to Nyquist
    double noiseFloorRatio = 4.0;       ///< Peak must exceed ratio * median magnitude
    bool computeEnvelope = true;
    double envelopeSmoothing = 0.0;     ///< One-pole coefficient in [0, 1)

    /// @brief Frame stride max(1, floor(W * (1 - o)))
    [[nodiscard]] size_t hopSize() const noexcept;

    /// @brief Number of whole frames that fit into a segment of given length
    [[nodiscard]] size_t frameCount(size_t segmentLength) const noexcept;

    /// @brief Check every field
    /// @throws InvalidConfigurationError naming the first offending field
    void validate() const;
};

// =============================================================================
// SpectralAnalysisResult
// =============================================================================

/// @brief One detected harmonic (order 1 is the fundamental)
struct HarmonicPeak {
    size_t order = 0;
    double frequency = 0.0;   ///< Hz, interpolated
    double amplitude = 0.0;   ///< Linear amplitude estimate
};

/// @brief Time-domain summary of the analyzed segment
struct SignalStatistics {
    double mean = 0.0;
    double standardDeviation = 0.0;   ///< Population standard deviation
    double rms = 0.0;
    double min = 0.0;
    double max = 0.0;
    double peakToPeak = 0.0;
    double crestFactor = 0.0;         ///< max|x| / rms, 0 for silence
    double skewness = 0.0;            ///< 0 for constant input
    double kurtosis = 0.0;            ///< Non-excess, 0 for constant input
};

struct SpectralAnalysisResult {
    std::string signalId;
    double sampleRate = 0.0;
    size_t transformSize = 0;
    double binWidth = 0.0;            ///< sampleRate / transformSize
    size_t frameCount = 0;

    std::vector<double> frequencies;  ///< F/2 + 1 bins, k * binWidth
    std::vector<double> magnitudes;   ///< Amplitude-normalized, F/2 + 1 bins
    std::vector<double> phases;       ///< Radians, first frame
    std::vector<double> psd;          ///< One-sided Welch PSD, units^2 / Hz

    double fundamentalFrequency = 0.0;  ///< 0 when no peak clears the noise floor
    double fundamentalAmplitude = 0.0;
    std::vector<HarmonicPeak> harmonics; ///< Ascending frequency
    double thdPercent = 0.0;

    std::vector<float> envelope;      ///< Same length as the input when enabled
    SignalStatistics statistics;

    [[nodiscard]] size_t numBins() const noexcept { return magnitudes.size(); }
    [[nodiscard]] bool hasFundamental() const noexcept { return fundamentalFrequency > 0.0; }
};

// =============================================================================
// AnalysisSession
// =============================================================================

enum class AnalysisStatus : uint8_t {
    Created,
    Running,
    Completed,
    Cancelled,
    Failed
};

[[nodiscard]] std::string_view analysisStatusName(AnalysisStatus status) noexcept;

/// @brief True for Completed, Cancelled and Failed
[[nodiscard]] constexpr bool isTerminal(AnalysisStatus status) noexcept {
    return status == AnalysisStatus::Completed || status == AnalysisStatus::Cancelled ||
           status == AnalysisStatus::Failed;
}

/// @brief One analysis request over one or more signals
/// @note Mutated only by the analysis runner; published as shared_ptr<const>.
struct AnalysisSession {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string name;
    std::vector<std::string> signalIds;
    AnalysisConfig config;
    AnalysisStatus status = AnalysisStatus::Created;
    double progress = 0.0;            ///< [0, 1]
    std::string errorMessage;
    Clock::time_point createdAt{};
    Clock::time_point startedAt{};
    Clock::time_point finishedAt{};
    std::vector<SpectralAnalysisResult> results;  ///< One per signal when completed
};

}  // namespace DSP
}  // namespace Oscilla
