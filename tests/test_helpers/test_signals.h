#pragma once
// ==============================================================================
// Test Signal Generators
// ==============================================================================
// Standard test signals for spectral analysis verification. Everything here is
// computed in double precision and stored as float, the way SignalData holds
// its amplitudes.
// ==============================================================================

#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/core/signal_data.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <numbers>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace TestHelpers {

// ==============================================================================
// Constants
// ==============================================================================

constexpr double kTwoPiD = 2.0 * std::numbers::pi;

// ==============================================================================
// Sine Wave
// ==============================================================================
// amplitude * sin(2*pi*frequency*n/sampleRate + phase)

inline std::vector<float> generateSine(size_t count, double frequency, double sampleRate,
                                       double amplitude = 1.0, double phase = 0.0) {
    std::vector<float> out(count);
    for (size_t n = 0; n < count; ++n) {
        const double t = static_cast<double>(n) / sampleRate;
        out[n] = static_cast<float>(amplitude * std::sin(kTwoPiD * frequency * t + phase));
    }
    return out;
}

// ==============================================================================
// Harmonic Tone
// ==============================================================================
// Sum of sines at integer multiples of a fundamental. amplitudes[0] is the
// fundamental, amplitudes[1] the second harmonic, and so on.

inline std::vector<float> generateHarmonicTone(size_t count, double fundamental, double sampleRate,
                                               const std::vector<double>& amplitudes) {
    std::vector<float> out(count, 0.0f);
    for (size_t n = 0; n < count; ++n) {
        const double t = static_cast<double>(n) / sampleRate;
        double value = 0.0;
        for (size_t h = 0; h < amplitudes.size(); ++h) {
            value += amplitudes[h] * std::sin(kTwoPiD * fundamental * static_cast<double>(h + 1) * t);
        }
        out[n] = static_cast<float>(value);
    }
    return out;
}

// ==============================================================================
// White Noise
// ==============================================================================
// Uniform in [-amplitude, amplitude], reproducible from the seed.

inline std::vector<float> generateWhiteNoise(size_t count, float amplitude = 1.0f, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-amplitude, amplitude);
    std::vector<float> out(count);
    for (auto& sample : out) {
        sample = dist(rng);
    }
    return out;
}

// ==============================================================================
// SignalData Wrapper
// ==============================================================================
// Wraps raw samples into a SignalData with an evenly spaced time axis. The law
// is recorded as metadata only; the samples are taken as given.

inline std::shared_ptr<const Oscilla::DSP::SignalData> makeSignal(
    std::vector<float> samples, double sampleRate, std::string name = "test-signal") {
    using Oscilla::DSP::SignalData;
    const double duration = static_cast<double>(samples.size()) / sampleRate;
    std::vector<double> times(samples.size());
    SignalData::fillTimes(sampleRate, 0, times.data(), times.size());
    return std::make_shared<const SignalData>(std::move(name),
                                              Oscilla::DSP::MathematicalLaw::custom("0"),
                                              sampleRate, duration, std::move(times),
                                              std::move(samples));
}

} // namespace TestHelpers
