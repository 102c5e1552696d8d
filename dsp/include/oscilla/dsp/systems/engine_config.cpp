// ==============================================================================
// Engine Configuration Implementation
// ==============================================================================

#include "engine_config.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/primitives/law_evaluator.h>
#include <oscilla/dsp/processors/compute_strategy.h>
#include <oscilla/dsp/processors/signal_generator.h>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <utility>

namespace Oscilla {
namespace DSP {

namespace {

template <typename T>
void readScalar(const YAML::Node& root, const char* key, T& target) {
    const YAML::Node node = root[key];
    if (!node) return;
    try {
        target = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidConfigurationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

void readSize(const YAML::Node& root, const char* key, size_t& target) {
    long long value = static_cast<long long>(target);
    readScalar(root, key, value);
    if (value < 0) {
        throw InvalidConfigurationError(std::string("'") + key + "' must not be negative");
    }
    target = static_cast<size_t>(value);
}

std::string readName(const YAML::Node& root, const char* key) {
    std::string text;
    readScalar(root, key, text);
    return text;
}

EngineConfig fromYaml(const YAML::Node& root) {
    EngineConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) {
        throw InvalidConfigurationError("engine configuration must be a YAML mapping");
    }

    // Law
    if (const std::string kind = readName(root, "law_kind"); !kind.empty()) {
        config.lawKind = parseLawKind(kind);
    }
    if (const YAML::Node params = root["law_parameters"]) {
        if (!params.IsMap()) {
            throw InvalidConfigurationError("'law_parameters' must be a mapping of name to number");
        }
        config.lawParameters.clear();
        for (const auto& entry : params) {
            const auto name = entry.first.as<std::string>();
            try {
                config.lawParameters[name] = entry.second.as<double>();
            } catch (const YAML::Exception& e) {
                throw InvalidConfigurationError("law parameter '" + name + "' is not a number: " + e.what());
            }
        }
    }
    readScalar(root, "law_expression", config.lawExpression);

    // Timing
    readScalar(root, "sample_rate", config.sampleRate);
    readScalar(root, "duration", config.duration);

    if (const YAML::Node noise = root["noise"]) {
        if (!noise.IsMap()) {
            throw InvalidConfigurationError("'noise' must be a mapping");
        }
        if (const std::string type = readName(noise, "type"); !type.empty()) {
            config.noise.type = parseNoiseType(type);
        }
        readScalar(noise, "level", config.noise.level);
        long long seed = config.noise.seed;
        readScalar(noise, "seed", seed);
        if (seed < 0 || seed > static_cast<long long>(UINT32_MAX)) {
            throw InvalidConfigurationError("'noise.seed' must fit in 32 bits");
        }
        config.noise.seed = static_cast<uint32_t>(seed);
    }

    // Analysis
    AnalysisConfig& analysis = config.analysis;
    if (const std::string window = readName(root, "window_kind"); !window.empty()) {
        analysis.window = Window::parse(window);
    }
    readSize(root, "window_size", analysis.windowSize);
    readScalar(root, "overlap", analysis.overlap);
    readSize(root, "transform_size", analysis.transformSize);
    readScalar(root, "detection_threshold", analysis.detectionThreshold);
    readSize(root, "max_harmonics", analysis.maxHarmonics);
    readScalar(root, "fundamental_min_hz", analysis.minFundamentalHz);
    readScalar(root, "fundamental_max_hz", analysis.maxFundamentalHz);
    readScalar(root, "noise_floor_ratio", analysis.noiseFloorRatio);
    readScalar(root, "compute_envelope", analysis.computeEnvelope);
    readScalar(root, "envelope_smoothing", analysis.envelopeSmoothing);

    // Streaming and runtime
    readSize(root, "ring_buffer_capacity", config.ringBufferCapacity);
    readSize(root, "frame_length", config.frameLength);
    if (const std::string strategy = readName(root, "compute_strategy"); !strategy.empty()) {
        config.computeStrategy = parseComputeStrategy(strategy);
    }
    readSize(root, "analysis_workers", config.analysisWorkers);

    if (const YAML::Node logging = root["logging"]) {
        if (!logging.IsMap()) {
            throw InvalidConfigurationError("'logging' must be a mapping");
        }
        readScalar(logging, "level", config.logging.level);
        readScalar(logging, "file", config.logging.file);
        readScalar(logging, "pattern", config.logging.pattern);
    }

    return config;
}

} // namespace

MathematicalLaw EngineConfig::makeLaw() const {
    return MathematicalLaw(lawKind, lawParameters, lawExpression);
}

void EngineConfig::validate() const {
    SignalGenerator::validateTiming(sampleRate, duration);
    validateLaw(makeLaw());
    noise.validate();
    analysis.validate();
    if (ringBufferCapacity == 0) {
        throw InvalidConfigurationError("ring_buffer_capacity must be at least 1");
    }
    if (frameLength == 0) {
        throw InvalidConfigurationError("frame_length must be at least 1");
    }
    if (analysisWorkers == 0) {
        throw InvalidConfigurationError("analysis_workers must be at least 1");
    }
}

EngineConfig parseEngineConfig(std::string_view yaml) {
    try {
        return fromYaml(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        throw InvalidConfigurationError(std::string("malformed engine configuration: ") + e.what());
    }
}

EngineConfig loadEngineConfig(const std::string& path) {
    try {
        return fromYaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw InvalidConfigurationError("cannot load engine configuration '" + path + "': " + e.what());
    }
}

EngineConfig applyEnvironmentOverrides(EngineConfig config) {
    if (const char* level = std::getenv(kLogLevelEnv); level != nullptr && *level != '\0') {
        config.logging.level = level;
    }
    if (const char* file = std::getenv(kLogFileEnv); file != nullptr && *file != '\0') {
        config.logging.file = file;
    }
    return config;
}

}  // namespace DSP
}  // namespace Oscilla
