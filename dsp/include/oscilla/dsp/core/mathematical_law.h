// ==============================================================================
// Layer 0: Core Type - Mathematical Law
// ==============================================================================
// A named parametric function of time: kind, numeric parameters, optional
// per-parameter constraints and (for custom laws) an expression source.
//
// Laws are immutable values. withParameter() returns a new instance with a new
// identifier. Construction never validates; validation belongs to the law
// evaluator so that constraint violations surface as InvalidParameterError at
// evaluation time.
// ==============================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Law Kind
// =============================================================================

/// @brief Closed set of supported law kinds
enum class LawKind : uint8_t {
    Sinusoidal = 0,    ///< A*sin(2*pi*f*t + phase) + offset
    Square,            ///< +A for the duty fraction of each period, -A otherwise
    Triangular,        ///< Linear ramps -A -> +A -> -A
    Sawtooth,          ///< Linear ramp -A -> +A, instant reset
    CustomExpression   ///< User expression over t and the law parameters
};

/// @brief Canonical configuration name ("sinusoidal", "square", ...)
[[nodiscard]] std::string_view lawKindName(LawKind kind) noexcept;

/// @brief Parse a law kind name, accepting common aliases
/// @throws UnsupportedLawError for an unknown name
[[nodiscard]] LawKind parseLawKind(std::string_view text);

// =============================================================================
// Well-known Parameter Names
// =============================================================================

namespace LawParam {
inline constexpr const char* kFrequency = "frequency";
inline constexpr const char* kAmplitude = "amplitude";
inline constexpr const char* kPhase = "phase";
inline constexpr const char* kOffset = "offset";
inline constexpr const char* kDutyCycle = "duty_cycle";
} // namespace LawParam

// =============================================================================
// Parameter Constraint
// =============================================================================

/// @brief Validity constraint for one law parameter
struct ParameterConstraint {
    std::optional<double> min;   ///< Lower bound (none = unbounded)
    std::optional<double> max;   ///< Upper bound (none = unbounded)
    bool minExclusive = false;   ///< Lower bound is strict
    bool maxExclusive = false;   ///< Upper bound is strict
    bool required = false;       ///< Parameter must be present

    /// @brief True if value lies within the bounds (NaN never does)
    [[nodiscard]] bool admits(double value) const noexcept;

    /// @brief Human-readable bound description, e.g. "(0, +inf)"
    [[nodiscard]] std::string describe() const;

    /// @brief Required, strictly positive
    [[nodiscard]] static ParameterConstraint positive() noexcept;

    /// @brief Optional, closed range [lo, hi]
    [[nodiscard]] static ParameterConstraint closedRange(double lo, double hi) noexcept;
};

using ParameterMap = std::map<std::string, double, std::less<>>;
using ConstraintMap = std::map<std::string, ParameterConstraint, std::less<>>;

/// @brief Default constraints for a law kind (frequency/amplitude > 0, ...)
[[nodiscard]] ConstraintMap defaultConstraints(LawKind kind);

// =============================================================================
// MathematicalLaw
// =============================================================================

class MathematicalLaw {
public:
    /// @brief Construct a law with the default constraints of its kind
    MathematicalLaw(LawKind kind, ParameterMap parameters, std::string expression = {});

    /// @brief Construct a law with explicit constraints
    MathematicalLaw(LawKind kind, ParameterMap parameters, std::string expression,
                    ConstraintMap constraints);

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    [[nodiscard]] static MathematicalLaw sinusoid(double frequency, double amplitude,
                                                  double phase = 0.0, double offset = 0.0);
    [[nodiscard]] static MathematicalLaw square(double frequency, double amplitude,
                                                double dutyCycle = 0.5, double phase = 0.0);
    [[nodiscard]] static MathematicalLaw triangular(double frequency, double amplitude,
                                                    double phase = 0.0);
    [[nodiscard]] static MathematicalLaw sawtooth(double frequency, double amplitude,
                                                  double phase = 0.0);
    [[nodiscard]] static MathematicalLaw custom(std::string expression,
                                                ParameterMap parameters = {});

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] LawKind kind() const noexcept { return kind_; }
    [[nodiscard]] const ParameterMap& parameters() const noexcept { return parameters_; }
    [[nodiscard]] const ConstraintMap& constraints() const noexcept { return constraints_; }
    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

    [[nodiscard]] bool hasParameter(std::string_view name) const noexcept;

    /// @brief Parameter value, or fallback when absent
    [[nodiscard]] double parameter(std::string_view name, double fallback = 0.0) const noexcept;

    /// @brief Copy of this law with one parameter replaced (new identifier)
    [[nodiscard]] MathematicalLaw withParameter(std::string_view name, double value) const;

private:
    std::string id_;
    LawKind kind_;
    ParameterMap parameters_;
    std::string expression_;
    ConstraintMap constraints_;
};

}  // namespace DSP
}  // namespace Oscilla
