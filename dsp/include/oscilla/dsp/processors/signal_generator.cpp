// ==============================================================================
// Batch Signal Generator Implementation
// ==============================================================================

#include "signal_generator.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/primitives/law_evaluator.h>

#include <cmath>
#include <utility>
#include <vector>

namespace Oscilla {
namespace DSP {

void SignalGenerator::validateTiming(double sampleRate, double duration) {
    if (!std::isfinite(sampleRate) || sampleRate <= 0.0) {
        throw SampleRateError("sample_rate must be a positive number of Hz, got " +
                              std::to_string(sampleRate));
    }
    if (!std::isfinite(duration) || duration < 0.0) {
        throw SampleRateError("duration must be >= 0 seconds, got " + std::to_string(duration));
    }
}

SignalData SignalGenerator::generate(const MathematicalLaw& law, double sampleRate, double duration,
                                     std::string name, const NoiseOptions& noise) const {
    validateTiming(sampleRate, duration);
    validateLaw(law);
    noise.validate();

    const size_t count = SignalData::expectedSampleCount(sampleRate, duration);
    std::vector<double> times(count);
    std::vector<float> amplitudes(count, 0.0f);

    SignalData::fillTimes(sampleRate, 0, times.data(), count);
    backend_.evaluateVectorized(law, times.data(), count, amplitudes.data());
    if (noise.enabled()) {
        addNoise(amplitudes.data(), count, noise);
        Log::get()->debug("added {} noise (level {}, seed {})", noiseTypeName(noise.type), noise.level,
                          noise.seed);
    }

    if (name.empty()) {
        name = std::string(lawKindName(law.kind()));
    }

    SignalData signal(std::move(name), law, sampleRate, duration, std::move(times), std::move(amplitudes));
    Log::get()->info("generated signal '{}' ({} samples at {} Hz, {} backend)", signal.name(),
                     signal.size(), sampleRate, backend_.name());
    return signal;
}

}  // namespace DSP
}  // namespace Oscilla
