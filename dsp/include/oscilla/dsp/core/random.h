// ==============================================================================
// Layer 0: Core Utility - Pseudo-Random Numbers
// ==============================================================================
// Seeded generator for reproducible noise. Identical seeds give identical
// sequences on every platform, so noisy test signals stay deterministic.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Oscilla {
namespace DSP {

// ==============================================================================
// Xorshift32
// ==============================================================================

/// Marsaglia xorshift generator (shifts 13, 17, 5), period 2^32 - 1.
///
/// @note Not cryptographically secure
class Xorshift32 {
public:
    /// @param seedValue Initial seed (0 is replaced with a fixed default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Next value in [1, 2^32 - 1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Uniform value in [0, 1]
    [[nodiscard]] constexpr double nextUnipolar() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

    /// @return Uniform value in [-1, 1]
    [[nodiscard]] constexpr double nextBipolar() noexcept {
        return nextUnipolar() * 2.0 - 1.0;
    }

    /// @brief Standard normal value (Box-Muller, one value per call)
    [[nodiscard]] double nextGaussian() noexcept {
        // next() never returns 0, so u1 > 0 and the logarithm is finite
        const double u1 = nextUnipolar();
        const double u2 = nextUnipolar();
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPiD * u2);
    }

    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept { return state_; }

private:
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1 / (2^32 - 1)
    static constexpr double kToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
};

} // namespace DSP
} // namespace Oscilla
