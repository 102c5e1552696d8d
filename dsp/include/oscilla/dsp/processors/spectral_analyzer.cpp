// ==============================================================================
// Spectral Analyzer Implementation
// ==============================================================================

#include "spectral_analyzer.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/primitives/signal_statistics.h>
#include <oscilla/dsp/primitives/spectral_peak.h>
#include <oscilla/dsp/processors/envelope_extractor.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace Oscilla {
namespace DSP {

namespace {

/// Extra bins either side of the main lobe included in the energy sum
constexpr size_t kEnergyGuardBins = 3;

/// Smallest noise floor magnitude
constexpr double kMinNoiseFloor = 1e-9;

/// A harmonic must exceed the leakage of the stronger tones by this factor
constexpr double kLeakageMargin = 2.0;

size_t ceilDiv(size_t numerator, size_t denominator) noexcept {
    return (numerator + denominator - 1) / denominator;
}

} // namespace

SpectralAnalyzer::SpectralAnalyzer(AnalysisConfig config, const ComputeBackend& backend)
    : config_(std::move(config)), backend_(backend) {
    config_.validate();
    window_ = Window::generate(config_.window, config_.windowSize);
    windowSum_ = Window::coherentSum(window_.data(), window_.size());
    windowPowerSum_ = Window::powerSum(window_.data(), window_.size());
}

void SpectralAnalyzer::validateInput(size_t count, double sampleRate) const {
    if (count == 0) {
        throw AnalysisEmptyInputError("cannot analyze an empty signal");
    }
    if (!std::isfinite(sampleRate) || sampleRate <= 0.0) {
        throw SampleRateError("sample rate must be positive, got " + std::to_string(sampleRate));
    }
    if (config_.windowSize > count) {
        throw InvalidConfigurationError("window_size (" + std::to_string(config_.windowSize) +
                                        ") exceeds the segment length (" + std::to_string(count) + ")");
    }
}

std::optional<SpectralAnalysisResult> SpectralAnalyzer::analyze(const SignalData& signal,
                                                                const CancellationToken& token,
                                                                const ProgressCallback& progress) const {
    auto result = analyze(signal.amplitudes().data(), signal.size(), signal.sampleRate(), token, progress);
    if (result) {
        result->signalId = signal.id();
    }
    return result;
}

std::optional<SpectralAnalysisResult> SpectralAnalyzer::analyze(const float* samples, size_t count,
                                                                double sampleRate,
                                                                const CancellationToken& token,
                                                                const ProgressCallback& progress) const {
    validateInput(count, sampleRate);

    const size_t W = config_.windowSize;
    const size_t F = config_.transformSize;
    const size_t numBins = F / 2 + 1;
    const size_t hop = config_.hopSize();
    const size_t frames = config_.frameCount(count);

    SpectralAnalysisResult result;
    result.sampleRate = sampleRate;
    result.transformSize = F;
    result.binWidth = sampleRate / static_cast<double>(F);
    result.frameCount = frames;
    result.phases.assign(numBins, 0.0);

    // -------------------------------------------------------------------------
    // Welch averaging
    // -------------------------------------------------------------------------

    std::vector<float> frame(F, 0.0f);  // Samples [W, F) stay zero
    std::vector<Complex> spectrum(numBins);
    std::vector<float> power(numBins, 0.0f);

    for (size_t f = 0; f < frames; ++f) {
        if (token.isCancellationRequested()) {
            Log::get()->debug("analysis cancelled after {} of {} frames", f, frames);
            return std::nullopt;
        }

        backend_.windowedMultiply(samples + f * hop, window_.data(), W, frame.data());
        backend_.transformForward(frame.data(), F, spectrum.data());
        if (f == 0) {
            for (size_t k = 0; k < numBins; ++k) {
                result.phases[k] = spectrum[k].phase();
            }
        }
        backend_.accumulatePower(spectrum.data(), numBins, power.data());

        if (progress) {
            progress(static_cast<double>(f + 1) / static_cast<double>(frames));
        }
    }
    if (token.isCancellationRequested()) {
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Spectra
    // -------------------------------------------------------------------------

    std::vector<double> meanPower(numBins);
    for (size_t k = 0; k < numBins; ++k) {
        meanPower[k] = static_cast<double>(power[k]) / static_cast<double>(frames);
    }

    result.frequencies.resize(numBins);
    result.magnitudes.resize(numBins);
    result.psd.resize(numBins);
    const double psdScale = 1.0 / (sampleRate * windowPowerSum_);
    for (size_t k = 0; k < numBins; ++k) {
        const bool edge = (k == 0 || k == numBins - 1);
        result.frequencies[k] = static_cast<double>(k) * result.binWidth;
        result.magnitudes[k] = (edge ? 1.0 : 2.0) * std::sqrt(meanPower[k]) / windowSum_;
        result.psd[k] = (edge ? 1.0 : 2.0) * meanPower[k] * psdScale;
    }

    detectHarmonics(meanPower, result);

    // -------------------------------------------------------------------------
    // Time domain
    // -------------------------------------------------------------------------

    if (config_.computeEnvelope) {
        if (token.isCancellationRequested()) {
            return std::nullopt;
        }
        result.envelope = EnvelopeExtractor(backend_).extract(samples, count, config_.envelopeSmoothing);
    }
    result.statistics = computeStatistics(samples, count);

    Log::get()->info("analysis: {} frames of {} (F={}), fundamental {:.3f} Hz, {} harmonics, THD {:.3f}%",
                     frames, W, F, result.fundamentalFrequency, result.harmonics.size(),
                     result.thdPercent);
    return result;
}

size_t SpectralAnalyzer::energyHalfWidth(double peakBin) const noexcept {
    const size_t F = config_.transformSize;
    const size_t W = config_.windowSize;
    const size_t lobe = ceilDiv((Window::mainLobeHalfWidth(config_.window) + kEnergyGuardBins) * F, W);
    // Keep the sum clear of the neighbouring harmonics
    const auto spacingCap = static_cast<size_t>(std::max(1.0, std::floor(peakBin / 2.0)));
    return std::max<size_t>(1, std::min(lobe, spacingCap));
}

double SpectralAnalyzer::toneAmplitude(const std::vector<double>& meanPower, size_t k,
                                       size_t halfWidth) const noexcept {
    const double energy = SpectralPeak::bandEnergy(meanPower.data(), meanPower.size(), k, halfWidth);
    const double F = static_cast<double>(config_.transformSize);
    return std::sqrt(4.0 * energy / (F * windowPowerSum_));
}

void SpectralAnalyzer::detectHarmonics(const std::vector<double>& meanPower,
                                       SpectralAnalysisResult& result) const {
    const size_t numBins = meanPower.size();
    const size_t F = config_.transformSize;
    const size_t W = config_.windowSize;
    const double binWidth = result.binWidth;
    const double nyquist = result.sampleRate / 2.0;
    const auto& magnitudes = result.magnitudes;

    // Search range: past the DC main lobe, within the configured bounds
    size_t lo = std::max<size_t>(1, ceilDiv(Window::mainLobeHalfWidth(config_.window) * F, W));
    size_t hi = numBins - 2;
    if (config_.minFundamentalHz > 0.0) {
        lo = std::max(lo, static_cast<size_t>(std::ceil(config_.minFundamentalHz / binWidth)));
    }
    if (config_.maxFundamentalHz > 0.0) {
        hi = std::min(hi, static_cast<size_t>(std::floor(config_.maxFundamentalHz / binWidth)));
    }
    if (lo > hi) {
        return;
    }

    const double noiseFloor = std::max(kMinNoiseFloor,
        config_.noiseFloorRatio * SpectralPeak::median(magnitudes.data(), numBins));

    const size_t peak = SpectralPeak::findPeak(magnitudes.data(), lo, hi);
    if (!(magnitudes[peak] > noiseFloor)) {
        Log::get()->debug("no spectral peak above noise floor {:.3g}", noiseFloor);
        return;
    }

    const double peakBin = static_cast<double>(peak) +
                           SpectralPeak::interpolateOffsetAt(meanPower.data(), numBins, peak);
    const size_t halfWidth = energyHalfWidth(peakBin);

    HarmonicPeak fundamental;
    fundamental.order = 1;
    fundamental.frequency = peakBin * binWidth;
    fundamental.amplitude = toneAmplitude(meanPower, peak, halfWidth);

    result.fundamentalFrequency = fundamental.frequency;
    result.fundamentalAmplitude = fundamental.amplitude;
    result.harmonics.push_back(fundamental);

    // Harmonic search around n * f0. A candidate must be a local maximum that
    // sits outside the main lobe of every tone already recorded and stands
    // clear of the leakage those tones put into its bin.
    struct Tone {
        double bin;
        double amplitude;
    };
    std::vector<Tone> tones{{peakBin, fundamental.amplitude}};

    const double lobeBins = static_cast<double>(Window::mainLobeHalfWidth(config_.window) * F) /
                            static_cast<double>(W);
    const size_t searchHalfWidth = std::max<size_t>(1, F / (2 * W));
    const double threshold = config_.detectionThreshold * magnitudes[peak];
    double distortionPower = 0.0;

    const auto outsideLobes = [&](size_t k) {
        const auto bin = static_cast<double>(k);
        return std::all_of(tones.begin(), tones.end(),
                           [&](const Tone& tone) { return std::abs(bin - tone.bin) >= lobeBins; });
    };
    const auto leakageAt = [&](size_t k) {
        const auto bin = static_cast<double>(k);
        double leakage = 0.0;
        for (const auto& tone : tones) {
            // Positive-frequency lobe plus its negative-frequency image
            const double spread =
                Window::transformMagnitude(window_.data(), W, bin - tone.bin, F) +
                Window::transformMagnitude(window_.data(), W, bin + tone.bin, F);
            leakage += tone.amplitude * spread / windowSum_;
        }
        return leakage;
    };

    for (size_t order = 2; result.harmonics.size() < config_.maxHarmonics; ++order) {
        const double expected = static_cast<double>(order) * fundamental.frequency;
        if (expected >= nyquist) break;

        const auto center = static_cast<size_t>(std::llround(expected / binWidth));
        if (center + 1 >= numBins) break;

        const size_t first = center > searchHalfWidth ? center - searchHalfWidth : 1;
        const size_t last = std::min(numBins - 2, center + searchHalfWidth);

        std::optional<size_t> candidate;
        for (size_t k = std::max<size_t>(1, first); k <= last; ++k) {
            const bool localMax = magnitudes[k] > magnitudes[k - 1] && magnitudes[k] >= magnitudes[k + 1];
            if (!localMax || !outsideLobes(k)) continue;
            if (!candidate || magnitudes[k] > magnitudes[*candidate]) candidate = k;
        }
        if (!candidate) continue;

        const size_t k = *candidate;
        if (!(magnitudes[k] > threshold) || !(magnitudes[k] > noiseFloor)) continue;
        if (!(magnitudes[k] > kLeakageMargin * leakageAt(k))) {
            Log::get()->debug("harmonic {} at bin {} is within the leakage of stronger tones", order, k);
            continue;
        }

        const double bin = static_cast<double>(k) +
                           SpectralPeak::interpolateOffsetAt(meanPower.data(), numBins, k);

        // Keep the energy sum clear of the neighbouring main lobes
        double nearest = std::numeric_limits<double>::max();
        for (const auto& tone : tones) {
            nearest = std::min(nearest, std::abs(bin - tone.bin));
        }
        size_t harmonicHalfWidth = 1;
        if (nearest > lobeBins) {
            harmonicHalfWidth = std::max<size_t>(
                1, std::min(halfWidth, static_cast<size_t>(std::floor(nearest - lobeBins))));
        }

        HarmonicPeak harmonic;
        harmonic.order = order;
        harmonic.frequency = bin * binWidth;
        harmonic.amplitude = toneAmplitude(meanPower, k, harmonicHalfWidth);
        distortionPower += harmonic.amplitude * harmonic.amplitude;
        result.harmonics.push_back(harmonic);
        tones.push_back({bin, harmonic.amplitude});
    }

    std::sort(result.harmonics.begin(), result.harmonics.end(),
              [](const HarmonicPeak& a, const HarmonicPeak& b) { return a.frequency < b.frequency; });

    if (fundamental.amplitude > 0.0) {
        result.thdPercent = std::sqrt(distortionPower) / fundamental.amplitude * 100.0;
    }
}

}  // namespace DSP
}  // namespace Oscilla
