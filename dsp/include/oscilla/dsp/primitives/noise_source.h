// ==============================================================================
// Layer 1: DSP Primitive - Additive Noise
// ==============================================================================
// Seeded measurement noise added on top of a generated signal.
//
//   gaussian  level * N(0, 1)
//   uniform   level * U(-1, 1)
//   colored   level * (5-tap centred moving average of N(0, 1)), low-pass
//
// The same options and seed always produce the same noise sequence.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/random.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Oscilla {
namespace DSP {

enum class NoiseType : uint8_t {
    None,
    Gaussian,
    Uniform,
    Colored
};

struct NoiseOptions {
    NoiseType type = NoiseType::None;
    double level = 0.0;     ///< Scale of the noise, >= 0
    uint32_t seed = 1;

    [[nodiscard]] bool enabled() const noexcept { return type != NoiseType::None && level > 0.0; }

    /// @throws InvalidParameterError("noise_level") for a negative or non-finite level
    void validate() const {
        if (!std::isfinite(level) || level < 0.0) {
            throw InvalidParameterError("noise_level",
                                        "noise_level must be a finite value >= 0, got " + std::to_string(level));
        }
    }
};

[[nodiscard]] constexpr std::string_view noiseTypeName(NoiseType type) noexcept {
    switch (type) {
        case NoiseType::None:     return "none";
        case NoiseType::Gaussian: return "gaussian";
        case NoiseType::Uniform:  return "uniform";
        case NoiseType::Colored:  return "colored";
    }
    return "unknown";
}

/// @brief Parse a noise type name ("white" is an alias of gaussian)
/// @throws InvalidConfigurationError for an unknown name
[[nodiscard]] inline NoiseType parseNoiseType(std::string_view text) {
    if (text == "none") return NoiseType::None;
    if (text == "gaussian" || text == "white") return NoiseType::Gaussian;
    if (text == "uniform") return NoiseType::Uniform;
    if (text == "colored" || text == "coloured") return NoiseType::Colored;
    throw InvalidConfigurationError("unknown noise type '" + std::string(text) + "'");
}

/// @brief Add noise to a block in place
/// @throws InvalidParameterError from NoiseOptions::validate()
inline void addNoise(float* samples, size_t count, const NoiseOptions& options) {
    options.validate();
    if (samples == nullptr || count == 0 || !options.enabled()) return;

    Xorshift32 rng(options.seed);
    switch (options.type) {
        case NoiseType::None:
            return;
        case NoiseType::Gaussian:
            for (size_t n = 0; n < count; ++n) {
                samples[n] += static_cast<float>(options.level * rng.nextGaussian());
            }
            return;
        case NoiseType::Uniform:
            for (size_t n = 0; n < count; ++n) {
                samples[n] += static_cast<float>(options.level * rng.nextBipolar());
            }
            return;
        case NoiseType::Colored: {
            constexpr size_t kTaps = 5;
            constexpr size_t kHalf = kTaps / 2;
            std::vector<double> white(count);
            for (auto& value : white) {
                value = rng.nextGaussian();
            }
            // Samples outside the block count as zero
            for (size_t n = 0; n < count; ++n) {
                const size_t first = n > kHalf ? n - kHalf : 0;
                const size_t last = std::min(count - 1, n + kHalf);
                double sum = 0.0;
                for (size_t k = first; k <= last; ++k) {
                    sum += white[k];
                }
                samples[n] += static_cast<float>(options.level * sum / static_cast<double>(kTaps));
            }
            return;
        }
    }
}

} // namespace DSP
} // namespace Oscilla
