// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for signal synthesis and analysis.
// All components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Oscilla {
namespace DSP {

// =============================================================================
// Mathematical Constants (single precision, spectral path)
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr float kHalfPi = kPi / 2.0f;

// =============================================================================
// Mathematical Constants (double precision, law evaluation)
// =============================================================================

/// Pi in double precision. Law evaluation runs in double so that sample
/// values are reproducible regardless of signal length.
inline constexpr double kPiD = 3.14159265358979323846;

/// Two times Pi in double precision
inline constexpr double kTwoPiD = 2.0 * kPiD;

/// Euler's number
inline constexpr double kEulerD = 2.71828182845904523536;

}  // namespace DSP
}  // namespace Oscilla
