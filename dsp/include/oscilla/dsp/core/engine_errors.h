// ==============================================================================
// Layer 0: Core Utility - Engine Error Taxonomy
// ==============================================================================
// Exception types raised by the non-real-time entry points of the engine
// (law validation, signal generation, analysis configuration, persistence).
//
// Real-time paths (ring buffer writes, FFT calls, window generation) never
// throw; they report failure through state queries such as isPrepared().
// ==============================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace Oscilla {
namespace DSP {

/// @brief Base class of every error raised by the engine.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief A law parameter violates its declared constraint.
class InvalidParameterError : public EngineError {
public:
    InvalidParameterError(std::string parameter, const std::string& message)
        : EngineError(message), parameter_(std::move(parameter)) {}

    /// @brief Name of the offending parameter ("expression" for custom laws)
    [[nodiscard]] const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

/// @brief An analysis or engine configuration value is out of range.
class InvalidConfigurationError : public EngineError {
public:
    using EngineError::EngineError;
};

/// @brief The law kind is not one of the supported kinds.
class UnsupportedLawError : public EngineError {
public:
    using EngineError::EngineError;
};

/// @brief Sample rate <= 0 or duration < 0.
class SampleRateError : public EngineError {
public:
    using EngineError::EngineError;
};

/// @brief Analysis requested on a zero-length signal.
class AnalysisEmptyInputError : public EngineError {
public:
    using EngineError::EngineError;
};

/// @brief The persistence backend cannot be reached.
class StorageUnavailableError : public EngineError {
public:
    using EngineError::EngineError;
};

/// @brief The persistence backend has no record with the requested id.
class RecordNotFoundError : public EngineError {
public:
    using EngineError::EngineError;
};

/// @brief The accelerated compute path failed.
/// @note Internal: the compute strategy selector recovers from it by falling
///       back to the CPU path. Callers never observe this type.
class AcceleratorFault : public EngineError {
public:
    using EngineError::EngineError;
};

}  // namespace DSP
}  // namespace Oscilla
