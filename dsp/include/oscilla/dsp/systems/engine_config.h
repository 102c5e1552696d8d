// ==============================================================================
// Layer 3: System Component - Engine Configuration
// ==============================================================================
// Immutable value describing one engine instance, loaded from YAML.
//
// Keys (all optional, defaults below):
//
//   law_kind: sinusoidal            # square, triangular, sawtooth, custom
//   law_parameters: {frequency: 440, amplitude: 1}
//   law_expression: ""              # custom laws only
//   sample_rate: 44100
//   duration: 1.0
//   noise: {type: none, level: 0, seed: 1}   # gaussian, uniform, colored
//   window_kind: hann               # rectangular, hamming, blackman
//   window_size: 1024
//   overlap: 0.5
//   transform_size: 1024
//   detection_threshold: 0.01
//   max_harmonics: 10
//   fundamental_min_hz: 0
//   fundamental_max_hz: 0
//   noise_floor_ratio: 4
//   compute_envelope: true
//   envelope_smoothing: 0
//   ring_buffer_capacity: 64
//   frame_length: 1024
//   compute_strategy: auto          # gpu, cpu
//   analysis_workers: 2
//   logging: {level: info, file: "", pattern: ""}
//
// OSCILLA_LOG_LEVEL and OSCILLA_LOG_FILE override the logging section when set.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/analysis_types.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/primitives/compute_backend.h>
#include <oscilla/dsp/primitives/noise_source.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace Oscilla {
namespace DSP {

struct EngineConfig {
    LawKind lawKind = LawKind::Sinusoidal;
    ParameterMap lawParameters{{LawParam::kFrequency, 440.0}, {LawParam::kAmplitude, 1.0}};
    std::string lawExpression;

    double sampleRate = 44100.0;
    double duration = 1.0;

    NoiseOptions noise;

    AnalysisConfig analysis;

    size_t ringBufferCapacity = 64;
    size_t frameLength = 1024;

    ComputeStrategy computeStrategy = ComputeStrategy::Auto;
    size_t analysisWorkers = 2;

    LoggingConfig logging;

    /// @brief Build the configured law (default constraints of its kind)
    [[nodiscard]] MathematicalLaw makeLaw() const;

    /// @brief Check every value that can be checked without running anything
    /// @throws SampleRateError, InvalidConfigurationError, InvalidParameterError
    void validate() const;
};

/// Environment overrides for the logging section
inline constexpr const char* kLogLevelEnv = "OSCILLA_LOG_LEVEL";
inline constexpr const char* kLogFileEnv = "OSCILLA_LOG_FILE";

/// @brief Parse a YAML document
/// @throws InvalidConfigurationError for malformed YAML, wrong value types or unknown enum names
/// @throws UnsupportedLawError for an unknown law_kind
[[nodiscard]] EngineConfig parseEngineConfig(std::string_view yaml);

/// @brief Load and parse a YAML file
/// @throws InvalidConfigurationError if the file cannot be read, plus parseEngineConfig() errors
[[nodiscard]] EngineConfig loadEngineConfig(const std::string& path);

/// @brief Apply OSCILLA_LOG_LEVEL / OSCILLA_LOG_FILE to a config
[[nodiscard]] EngineConfig applyEnvironmentOverrides(EngineConfig config);

}  // namespace DSP
}  // namespace Oscilla
