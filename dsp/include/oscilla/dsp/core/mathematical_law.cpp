// ==============================================================================
// Mathematical Law Implementation
// ==============================================================================

#include "mathematical_law.h"

#include "engine_errors.h"
#include "identifiers.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Law Kind Names
// =============================================================================

std::string_view lawKindName(LawKind kind) noexcept {
    switch (kind) {
        case LawKind::Sinusoidal:       return "sinusoidal";
        case LawKind::Square:           return "square";
        case LawKind::Triangular:       return "triangular";
        case LawKind::Sawtooth:         return "sawtooth";
        case LawKind::CustomExpression: return "custom-expression";
    }
    return "unknown";
}

LawKind parseLawKind(std::string_view text) {
    if (text == "sinusoidal" || text == "sine" || text == "sinusoid") return LawKind::Sinusoidal;
    if (text == "square") return LawKind::Square;
    if (text == "triangular" || text == "triangle") return LawKind::Triangular;
    if (text == "sawtooth" || text == "saw") return LawKind::Sawtooth;
    if (text == "custom-expression" || text == "custom" || text == "expression") {
        return LawKind::CustomExpression;
    }
    throw UnsupportedLawError("unsupported law kind '" + std::string(text) + "'");
}

// =============================================================================
// ParameterConstraint
// =============================================================================

bool ParameterConstraint::admits(double value) const noexcept {
    if (std::isnan(value)) return false;
    if (min) {
        if (minExclusive ? !(value > *min) : !(value >= *min)) return false;
    }
    if (max) {
        if (maxExclusive ? !(value < *max) : !(value <= *max)) return false;
    }
    return true;
}

std::string ParameterConstraint::describe() const {
    std::ostringstream out;
    out << (min && !minExclusive ? '[' : '(');
    if (min) out << *min; else out << "-inf";
    out << ", ";
    if (max) out << *max; else out << "+inf";
    out << (max && !maxExclusive ? ']' : ')');
    return out.str();
}

ParameterConstraint ParameterConstraint::positive() noexcept {
    ParameterConstraint c;
    c.min = 0.0;
    c.minExclusive = true;
    c.required = true;
    return c;
}

ParameterConstraint ParameterConstraint::closedRange(double lo, double hi) noexcept {
    ParameterConstraint c;
    c.min = lo;
    c.max = hi;
    return c;
}

ConstraintMap defaultConstraints(LawKind kind) {
    ConstraintMap constraints;
    if (kind == LawKind::CustomExpression) {
        return constraints;
    }

    constraints.emplace(LawParam::kFrequency, ParameterConstraint::positive());
    constraints.emplace(LawParam::kAmplitude, ParameterConstraint::positive());
    if (kind == LawKind::Square) {
        constraints.emplace(LawParam::kDutyCycle, ParameterConstraint::closedRange(0.0, 1.0));
    }
    return constraints;
}

// =============================================================================
// MathematicalLaw
// =============================================================================

MathematicalLaw::MathematicalLaw(LawKind kind, ParameterMap parameters, std::string expression)
    : MathematicalLaw(kind, std::move(parameters), std::move(expression), defaultConstraints(kind)) {}

MathematicalLaw::MathematicalLaw(LawKind kind, ParameterMap parameters, std::string expression,
                                 ConstraintMap constraints)
    : id_(generateIdentifier())
    , kind_(kind)
    , parameters_(std::move(parameters))
    , expression_(std::move(expression))
    , constraints_(std::move(constraints)) {}

MathematicalLaw MathematicalLaw::sinusoid(double frequency, double amplitude,
                                          double phase, double offset) {
    return MathematicalLaw(LawKind::Sinusoidal, {{LawParam::kFrequency, frequency},
                                                 {LawParam::kAmplitude, amplitude},
                                                 {LawParam::kPhase, phase},
                                                 {LawParam::kOffset, offset}});
}

MathematicalLaw MathematicalLaw::square(double frequency, double amplitude,
                                        double dutyCycle, double phase) {
    return MathematicalLaw(LawKind::Square, {{LawParam::kFrequency, frequency},
                                             {LawParam::kAmplitude, amplitude},
                                             {LawParam::kDutyCycle, dutyCycle},
                                             {LawParam::kPhase, phase}});
}

MathematicalLaw MathematicalLaw::triangular(double frequency, double amplitude, double phase) {
    return MathematicalLaw(LawKind::Triangular, {{LawParam::kFrequency, frequency},
                                                 {LawParam::kAmplitude, amplitude},
                                                 {LawParam::kPhase, phase}});
}

MathematicalLaw MathematicalLaw::sawtooth(double frequency, double amplitude, double phase) {
    return MathematicalLaw(LawKind::Sawtooth, {{LawParam::kFrequency, frequency},
                                               {LawParam::kAmplitude, amplitude},
                                               {LawParam::kPhase, phase}});
}

MathematicalLaw MathematicalLaw::custom(std::string expression, ParameterMap parameters) {
    return MathematicalLaw(LawKind::CustomExpression, std::move(parameters), std::move(expression));
}

bool MathematicalLaw::hasParameter(std::string_view name) const noexcept {
    return parameters_.find(name) != parameters_.end();
}

double MathematicalLaw::parameter(std::string_view name, double fallback) const noexcept {
    const auto it = parameters_.find(name);
    return it != parameters_.end() ? it->second : fallback;
}

MathematicalLaw MathematicalLaw::withParameter(std::string_view name, double value) const {
    ParameterMap updated = parameters_;
    updated.insert_or_assign(std::string(name), value);
    return MathematicalLaw(kind_, std::move(updated), expression_, constraints_);
}

}  // namespace DSP
}  // namespace Oscilla
