// ==============================================================================
// Layer 2: DSP Processor - Spectral Analyzer
// ==============================================================================
// Welch-style spectral analysis of a signal segment with fundamental,
// harmonic, THD and envelope extraction.
//
// Pipeline:
//   1. Frames of W samples, stride max(1, floor(W * (1 - overlap)))
//   2. Window each frame, zero-pad to F, forward transform (F/2 + 1 bins)
//   3. Average |X|^2 over frames (Welch)
//   4. Magnitude = 2*sqrt(mean power) / sum(w)   (amplitude-normalized)
//      PSD       = mean power / (fs * sum(w^2)), doubled except DC/Nyquist
//   5. Fundamental: largest magnitude above the noise floor in the search
//      range, refined by log-parabolic interpolation
//   6. Harmonics: the largest local maximum within max(1, F/(2W)) bins of
//      n*f0 that lies outside the main lobes of the tones already found.
//      Recorded when it exceeds detectionThreshold * fundamental peak
//      magnitude and twice the leakage those tones put into its bin
//   7. Amplitudes from main-lobe energy (Parseval): A = sqrt(4E / (F*sum(w^2)))
//   8. THD = sqrt(sum_{n>=2} A_n^2) / A_1 * 100
//   9. Envelope from the analytic signal, optional one-pole smoothing
//
// Cancellation is checked at every frame boundary; a cancelled run returns
// std::nullopt rather than a partial result.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/analysis_types.h>
#include <oscilla/dsp/core/cancellation.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/primitives/compute_backend.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace Oscilla {
namespace DSP {

class SpectralAnalyzer {
public:
    /// Called after each processed frame with the completed fraction in (0, 1]
    using ProgressCallback = std::function<void(double fraction)>;

    /// @throws InvalidConfigurationError if config.validate() fails
    SpectralAnalyzer(AnalysisConfig config, const ComputeBackend& backend);

    /// @brief Check that a segment can be analyzed with this configuration
    /// @throws AnalysisEmptyInputError for a zero-length segment (checked first)
    /// @throws SampleRateError for a non-positive sample rate
    /// @throws InvalidConfigurationError if the window is longer than the segment
    void validateInput(size_t count, double sampleRate) const;

    /// @brief Analyze a whole signal
    [[nodiscard]] std::optional<SpectralAnalysisResult> analyze(
        const SignalData& signal, const CancellationToken& token = {},
        const ProgressCallback& progress = {}) const;

    /// @brief Analyze a raw segment
    [[nodiscard]] std::optional<SpectralAnalysisResult> analyze(
        const float* samples, size_t count, double sampleRate,
        const CancellationToken& token = {}, const ProgressCallback& progress = {}) const;

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }

private:
    void detectHarmonics(const std::vector<double>& meanPower, SpectralAnalysisResult& result) const;

    /// Main-lobe energy half-width in bins for a tone at bin position
    [[nodiscard]] size_t energyHalfWidth(double peakBin) const noexcept;

    /// Amplitude of the tone whose peak sits at bin k
    [[nodiscard]] double toneAmplitude(const std::vector<double>& meanPower, size_t k,
                                       size_t halfWidth) const noexcept;

    AnalysisConfig config_;
    const ComputeBackend& backend_;
    std::vector<float> window_;
    double windowSum_ = 0.0;
    double windowPowerSum_ = 0.0;
};

}  // namespace DSP
}  // namespace Oscilla
