// ==============================================================================
// Law Evaluator Implementation
// ==============================================================================

#include "law_evaluator.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/math_constants.h>

#include <cmath>
#include <sstream>
#include <string>

namespace Oscilla {
namespace DSP {

namespace {

bool isKnownKind(LawKind kind) noexcept {
    switch (kind) {
        case LawKind::Sinusoidal:
        case LawKind::Square:
        case LawKind::Triangular:
        case LawKind::Sawtooth:
        case LawKind::CustomExpression:
            return true;
    }
    return false;
}

std::string formatValue(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

void validateLaw(const MathematicalLaw& law) {
    if (!isKnownKind(law.kind())) {
        throw UnsupportedLawError("unsupported law kind " +
                                  std::to_string(static_cast<int>(law.kind())));
    }

    for (const auto& [name, value] : law.parameters()) {
        if (!std::isfinite(value)) {
            throw InvalidParameterError(name, "parameter '" + name + "' is not finite");
        }
    }

    for (const auto& [name, constraint] : law.constraints()) {
        const auto it = law.parameters().find(name);
        if (it == law.parameters().end()) {
            if (constraint.required) {
                throw InvalidParameterError(name, "missing required parameter '" + name + "' for " +
                                            std::string(lawKindName(law.kind())) + " law");
            }
            continue;
        }
        if (!constraint.admits(it->second)) {
            throw InvalidParameterError(name, "parameter '" + name + "' = " + formatValue(it->second) +
                                        " outside " + constraint.describe());
        }
    }

    if (law.kind() == LawKind::CustomExpression) {
        if (law.expression().empty()) {
            throw InvalidParameterError("expression", "custom-expression law has no expression");
        }
        // Compiling reports unknown names and syntax errors
        (void)CompiledExpression::compile(law.expression(), law.parameters());
    }
}

// =============================================================================
// LawEvaluator
// =============================================================================

LawEvaluator::LawEvaluator(const MathematicalLaw& law) : kind_(law.kind()) {
    validateLaw(law);

    frequency_ = law.parameter(LawParam::kFrequency);
    amplitude_ = law.parameter(LawParam::kAmplitude);
    phase_ = law.parameter(LawParam::kPhase);
    offset_ = law.parameter(LawParam::kOffset);
    dutyCycle_ = law.parameter(LawParam::kDutyCycle, 0.5);

    if (kind_ == LawKind::CustomExpression) {
        expression_ = CompiledExpression::compile(law.expression(), law.parameters());
    }
}

double LawEvaluator::valueAt(double t) const noexcept {
    if (kind_ == LawKind::CustomExpression) {
        return expression_ ? expression_->evaluate(t) : 0.0;
    }
    if (kind_ == LawKind::Sinusoidal) {
        return amplitude_ * std::sin(kTwoPiD * frequency_ * t + phase_) + offset_;
    }

    const double cycles = frequency_ * t + phase_ / kTwoPiD;
    const double u = cycles - std::floor(cycles);

    switch (kind_) {
        case LawKind::Square:
            return (u < dutyCycle_ ? amplitude_ : -amplitude_) + offset_;
        case LawKind::Sawtooth:
            return amplitude_ * (2.0 * u - 1.0) + offset_;
        case LawKind::Triangular:
            return (u < 0.5 ? amplitude_ * (4.0 * u - 1.0) : amplitude_ * (3.0 - 4.0 * u)) + offset_;
        default:
            return 0.0;
    }
}

void LawEvaluator::evaluate(const double* times, size_t count, float* out) const noexcept {
    if (times == nullptr || out == nullptr) return;
    for (size_t i = 0; i < count; ++i) {
        out[i] = static_cast<float>(valueAt(times[i]));
    }
}

// =============================================================================
// Free Functions
// =============================================================================

void evaluateLaw(const MathematicalLaw& law, const double* times, size_t count, float* out) {
    LawEvaluator(law).evaluate(times, count, out);
}

std::vector<float> evaluateLaw(const MathematicalLaw& law, const std::vector<double>& times) {
    std::vector<float> out(times.size(), 0.0f);
    evaluateLaw(law, times.data(), times.size(), out.data());
    return out;
}

}  // namespace DSP
}  // namespace Oscilla
