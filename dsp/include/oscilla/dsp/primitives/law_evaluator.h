// ==============================================================================
// Layer 1: DSP Primitive - Law Evaluator
// ==============================================================================
// Evaluates a MathematicalLaw at a sequence of time points.
//
// Pure and deterministic: evaluation runs in double precision with a fixed
// operation order, so identical inputs give bit-identical outputs.
//
// Cycle position for periodic laws: c = f*t + phase/(2*pi), u = c - floor(c)
//   Sinusoidal : A*sin(2*pi*f*t + phase) + offset
//   Square     : (u < duty ? A : -A) + offset
//   Sawtooth   : A*(2u - 1) + offset
//   Triangular : (u < 0.5 ? A*(4u - 1) : A*(3 - 4u)) + offset
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/primitives/expression.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace Oscilla {
namespace DSP {

/// @brief Check a law against its kind and parameter constraints
/// @throws UnsupportedLawError for an unrecognized kind
/// @throws InvalidParameterError naming the offending parameter
void validateLaw(const MathematicalLaw& law);

/// @brief Validated, ready-to-run form of a law
/// @note Immutable after construction; safe to share between threads.
class LawEvaluator {
public:
    /// @throws UnsupportedLawError, InvalidParameterError
    explicit LawEvaluator(const MathematicalLaw& law);

    /// @brief Value at one time point
    [[nodiscard]] double valueAt(double t) const noexcept;

    /// @brief out[i] = value(times[i]) for i < count
    void evaluate(const double* times, size_t count, float* out) const noexcept;

    [[nodiscard]] LawKind kind() const noexcept { return kind_; }
    [[nodiscard]] double frequency() const noexcept { return frequency_; }
    [[nodiscard]] double amplitude() const noexcept { return amplitude_; }
    [[nodiscard]] double phase() const noexcept { return phase_; }
    [[nodiscard]] double offset() const noexcept { return offset_; }

private:
    LawKind kind_;
    double frequency_ = 0.0;
    double amplitude_ = 0.0;
    double phase_ = 0.0;
    double offset_ = 0.0;
    double dutyCycle_ = 0.5;
    std::optional<CompiledExpression> expression_;
};

/// @brief Evaluate a law at count time points
/// @throws UnsupportedLawError, InvalidParameterError
void evaluateLaw(const MathematicalLaw& law, const double* times, size_t count, float* out);

/// @brief Evaluate a law at every time point (allocates)
[[nodiscard]] std::vector<float> evaluateLaw(const MathematicalLaw& law,
                                             const std::vector<double>& times);

}  // namespace DSP
}  // namespace Oscilla
