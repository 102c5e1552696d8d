// ==============================================================================
// Layer 0: Core Utility - SIMD Vector Kernels
// ==============================================================================
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "oscilla/dsp/core/compute_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <cmath>
#include <cstddef>
#include <numbers>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Oscilla {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// WindowedMultiplyImpl: output = input * window
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void WindowedMultiplyImpl(const float* input, const float* HWY_RESTRICT window,
                          size_t count, float* output) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t i = 0;
    for (; i + N <= count; i += N) {
        const auto x = hn::LoadU(d, input + i);
        const auto w = hn::LoadU(d, window + i);
        hn::StoreU(hn::Mul(x, w), d, output + i);
    }

    // Scalar tail
    for (; i < count; ++i) {
        output[i] = input[i] * window[i];
    }
}

// -----------------------------------------------------------------------------
// AccumulatePowerImpl: power[k] += |X(k)|^2 over interleaved Complex bins
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void AccumulatePowerImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                         float* HWY_RESTRICT power) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        const auto binPower = hn::MulAdd(im, im, hn::Mul(re, re));
        hn::StoreU(hn::Add(hn::LoadU(d, power + k), binPower), d, power + k);
    }

    // Scalar tail
    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        power[k] += re * re + im * im;
    }
}

// -----------------------------------------------------------------------------
// EvaluateSinusoidImpl: A*sin(2*pi*frac(f*t + phase/(2*pi))) + offset
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void EvaluateSinusoidImpl(const double* HWY_RESTRICT times, size_t count,
                          double frequency, double amplitude, double phase,
                          double offset, float* HWY_RESTRICT output) {
    constexpr double kTwoPi = 2.0 * std::numbers::pi;
    const double phaseCycles = phase / kTwoPi;

    size_t i = 0;

#if HWY_HAVE_FLOAT64
    const hn::ScalableTag<double> d;
    const hn::Rebind<float, decltype(d)> df;
    const size_t N = hn::Lanes(d);

    const auto vFreq = hn::Set(d, frequency);
    const auto vPhase = hn::Set(d, phaseCycles);
    const auto vAmp = hn::Set(d, amplitude);
    const auto vOffset = hn::Set(d, offset);
    const auto vTwoPi = hn::Set(d, kTwoPi);

    for (; i + N <= count; i += N) {
        // Reduce to [0, 1) cycles before the sine so its argument stays small
        const auto cycles = hn::MulAdd(vFreq, hn::LoadU(d, times + i), vPhase);
        const auto u = hn::Sub(cycles, hn::Floor(cycles));
        const auto value = hn::MulAdd(vAmp, hn::Sin(d, hn::Mul(vTwoPi, u)), vOffset);
        hn::StoreU(hn::DemoteTo(df, value), df, output + i);
    }
#endif

    // Scalar tail
    for (; i < count; ++i) {
        const double cycles = frequency * times[i] + phaseCycles;
        const double u = cycles - std::floor(cycles);
        output[i] = static_cast<float>(amplitude * std::sin(kTwoPi * u) + offset);
    }
}

// -----------------------------------------------------------------------------
// TargetNameImpl: name of the target this copy was compiled for
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
const char* TargetNameImpl() {
    return hwy::TargetName(HWY_TARGET);
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Oscilla

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "oscilla/dsp/core/compute_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Oscilla {
namespace DSP {

HWY_EXPORT(WindowedMultiplyImpl);
HWY_EXPORT(AccumulatePowerImpl);
HWY_EXPORT(EvaluateSinusoidImpl);
HWY_EXPORT(TargetNameImpl);

void windowedMultiplyBulk(const float* input, const float* window, size_t count,
                          float* output) noexcept {
    if (input == nullptr || window == nullptr || output == nullptr) return;
    HWY_DYNAMIC_DISPATCH(WindowedMultiplyImpl)(input, window, count, output);
}

void accumulatePowerBulk(const float* complexData, size_t numBins, float* power) noexcept {
    if (complexData == nullptr || power == nullptr) return;
    HWY_DYNAMIC_DISPATCH(AccumulatePowerImpl)(complexData, numBins, power);
}

void evaluateSinusoidBulk(const double* times, size_t count, double frequency,
                          double amplitude, double phase, double offset,
                          float* output) noexcept {
    if (times == nullptr || output == nullptr) return;
    HWY_DYNAMIC_DISPATCH(EvaluateSinusoidImpl)(times, count, frequency, amplitude,
                                               phase, offset, output);
}

const char* activeSimdTarget() noexcept {
    return HWY_DYNAMIC_DISPATCH(TargetNameImpl)();
}

}  // namespace DSP
}  // namespace Oscilla

#endif  // HWY_ONCE
