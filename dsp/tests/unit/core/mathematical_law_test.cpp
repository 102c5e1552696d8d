// ==============================================================================
// Mathematical Law - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/oscilla/dsp/core/mathematical_law.h
// Purpose: Verify law construction, identity, constraints and kind names
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/mathematical_law.h>

#include <cmath>
#include <limits>

using namespace Oscilla::DSP;

// ==============================================================================
// Factories
// ==============================================================================

TEST_CASE("Law factories record kind and parameters", "[dsp][core][law]") {

    SECTION("sinusoid") {
        const auto law = MathematicalLaw::sinusoid(440.0, 0.5, 0.25, 0.1);
        REQUIRE(law.kind() == LawKind::Sinusoidal);
        REQUIRE(law.parameter(LawParam::kFrequency) == 440.0);
        REQUIRE(law.parameter(LawParam::kAmplitude) == 0.5);
        REQUIRE(law.parameter(LawParam::kPhase) == 0.25);
        REQUIRE(law.parameter(LawParam::kOffset) == 0.1);
    }

    SECTION("square carries a duty cycle") {
        const auto law = MathematicalLaw::square(100.0, 1.0, 0.25);
        REQUIRE(law.kind() == LawKind::Square);
        REQUIRE(law.parameter(LawParam::kDutyCycle) == 0.25);
    }

    SECTION("custom keeps the expression") {
        const auto law = MathematicalLaw::custom("a * t", {{"a", 2.0}});
        REQUIRE(law.kind() == LawKind::CustomExpression);
        REQUIRE(law.expression() == "a * t");
        REQUIRE(law.parameter("a") == 2.0);
        REQUIRE(law.constraints().empty());
    }

    SECTION("Missing parameters fall back") {
        const auto law = MathematicalLaw::triangular(50.0, 1.0);
        REQUIRE_FALSE(law.hasParameter(LawParam::kOffset));
        REQUIRE(law.parameter(LawParam::kOffset, -3.0) == -3.0);
    }
}

// ==============================================================================
// Identity
// ==============================================================================

TEST_CASE("Every law has its own identifier", "[dsp][core][law]") {
    const auto a = MathematicalLaw::sinusoid(440.0, 1.0);
    const auto b = MathematicalLaw::sinusoid(440.0, 1.0);

    REQUIRE_FALSE(a.id().empty());
    REQUIRE(a.id() != b.id());

    SECTION("withParameter produces a new law and leaves the original untouched") {
        const auto changed = a.withParameter(LawParam::kFrequency, 880.0);
        REQUIRE(changed.id() != a.id());
        REQUIRE(changed.parameter(LawParam::kFrequency) == 880.0);
        REQUIRE(a.parameter(LawParam::kFrequency) == 440.0);
        REQUIRE(changed.kind() == a.kind());
    }
}

// ==============================================================================
// Constraints
// ==============================================================================

TEST_CASE("Default constraints per law kind", "[dsp][core][law]") {

    SECTION("Periodic laws require positive frequency and amplitude") {
        const auto constraints = defaultConstraints(LawKind::Sawtooth);
        REQUIRE(constraints.count(LawParam::kFrequency) == 1);
        REQUIRE(constraints.count(LawParam::kAmplitude) == 1);
        REQUIRE(constraints.at(LawParam::kFrequency).required);
        REQUIRE_FALSE(constraints.at(LawParam::kFrequency).admits(0.0));
        REQUIRE(constraints.at(LawParam::kFrequency).admits(1e-6));
    }

    SECTION("Square adds a closed duty-cycle range") {
        const auto constraints = defaultConstraints(LawKind::Square);
        const auto& duty = constraints.at(LawParam::kDutyCycle);
        REQUIRE_FALSE(duty.required);
        REQUIRE(duty.admits(0.0));
        REQUIRE(duty.admits(1.0));
        REQUIRE_FALSE(duty.admits(1.01));
    }

    SECTION("Custom expressions have no default constraints") {
        REQUIRE(defaultConstraints(LawKind::CustomExpression).empty());
    }
}

TEST_CASE("ParameterConstraint admits and describes its range", "[dsp][core][law]") {
    const auto positive = ParameterConstraint::positive();
    REQUIRE_FALSE(positive.admits(-1.0));
    REQUIRE_FALSE(positive.admits(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE(positive.describe() == "(0, +inf)");

    const auto unit = ParameterConstraint::closedRange(0.0, 1.0);
    REQUIRE(unit.describe() == "[0, 1]");

    const ParameterConstraint unbounded;
    REQUIRE(unbounded.admits(-1e300));
    REQUIRE(unbounded.describe() == "(-inf, +inf)");
}

// ==============================================================================
// Kind Names
// ==============================================================================

TEST_CASE("Law kind names parse back to their kind", "[dsp][core][law]") {

    SECTION("Canonical names round trip") {
        for (LawKind kind : {LawKind::Sinusoidal, LawKind::Square, LawKind::Triangular,
                             LawKind::Sawtooth, LawKind::CustomExpression}) {
            REQUIRE(parseLawKind(lawKindName(kind)) == kind);
        }
    }

    SECTION("Aliases") {
        REQUIRE(parseLawKind("sine") == LawKind::Sinusoidal);
        REQUIRE(parseLawKind("triangle") == LawKind::Triangular);
        REQUIRE(parseLawKind("saw") == LawKind::Sawtooth);
        REQUIRE(parseLawKind("custom") == LawKind::CustomExpression);
    }

    SECTION("Unknown kinds are unsupported") {
        REQUIRE_THROWS_AS(parseLawKind("chirp"), UnsupportedLawError);
    }
}
