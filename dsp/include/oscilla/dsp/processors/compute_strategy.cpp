// ==============================================================================
// Compute Strategy Selector Implementation
// ==============================================================================

#include "compute_strategy.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/processors/scalar_compute_backend.h>
#include <oscilla/dsp/processors/simd_compute_backend.h>

#include <hwy/targets.h>

#include <cstdlib>
#include <string_view>
#include <utility>

namespace Oscilla {
namespace DSP {

ComputeStrategy parseComputeStrategy(std::string_view text) {
    if (text == "auto") return ComputeStrategy::Auto;
    if (text == "gpu" || text == "accelerated" || text == "simd") return ComputeStrategy::Accelerated;
    if (text == "cpu") return ComputeStrategy::Cpu;
    throw InvalidConfigurationError("unknown compute_strategy '" + std::string(text) + "'");
}

// =============================================================================
// Probe and Decision
// =============================================================================

AcceleratorProbe probeAccelerator() {
    AcceleratorProbe probe;

    if (const char* disabled = std::getenv(kDisableAcceleratorEnv);
        disabled != nullptr && std::string_view(disabled) == "1") {
        probe.description = std::string(kDisableAcceleratorEnv) + "=1";
        return probe;
    }

    const int64_t vectorTargets = hwy::SupportedTargets() & ~static_cast<int64_t>(HWY_SCALAR | HWY_EMU128);
    if (vectorTargets == 0) {
        probe.description = "no SIMD target beyond scalar emulation";
        return probe;
    }

    // Lower bit values are better targets
    const int64_t best = vectorTargets & -vectorTargets;
    probe.available = true;
    probe.description = hwy::TargetName(best);
    return probe;
}

StrategyDecision resolveComputeStrategy(ComputeStrategy requested, const AcceleratorProbe& probe) {
    StrategyDecision decision;
    if (requested == ComputeStrategy::Cpu) {
        decision.active = ComputeStrategy::Cpu;
        return decision;
    }
    if (probe.available) {
        decision.active = ComputeStrategy::Accelerated;
        return decision;
    }
    decision.active = ComputeStrategy::Cpu;
    decision.degraded = true;
    decision.reason = "accelerator unavailable: " +
                      (probe.description.empty() ? std::string("probe failed") : probe.description);
    return decision;
}

// =============================================================================
// ComputeStrategySelector
// =============================================================================

ComputeStrategySelector::ComputeStrategySelector(ComputeStrategy requested,
                                                 const AcceleratorProbe& probe,
                                                 std::unique_ptr<ComputeBackend> accelerated,
                                                 std::unique_ptr<ComputeBackend> fallback,
                                                 DegradationHandler onDegraded)
    : requested_(requested)
    , accelerated_(std::move(accelerated))
    , fallback_(std::move(fallback))
    , onDegraded_(std::move(onDegraded)) {
    if (!fallback_) {
        throw InvalidConfigurationError("compute strategy selector needs a CPU backend");
    }

    StrategyDecision decision = resolveComputeStrategy(requested, probe);
    if (decision.active == ComputeStrategy::Accelerated && !accelerated_) {
        decision.active = ComputeStrategy::Cpu;
        decision.degraded = true;
        decision.reason = "accelerator unavailable: no accelerated backend";
    }

    active_.store(decision.active == ComputeStrategy::Accelerated ? accelerated_.get() : fallback_.get(),
                  std::memory_order_release);

    Log::get()->info("compute strategy: requested {}, active {}", computeStrategyName(requested),
                     activeBackend().name());

    if (decision.degraded) {
        degrade(decision.reason);
    }
}

std::unique_ptr<ComputeStrategySelector> ComputeStrategySelector::create(ComputeStrategy requested,
                                                                         DegradationHandler onDegraded) {
    const AcceleratorProbe probe = (requested == ComputeStrategy::Cpu) ? AcceleratorProbe{}
                                                                       : probeAccelerator();
    std::unique_ptr<ComputeBackend> accelerated;
    if (probe.available) {
        accelerated = std::make_unique<SimdComputeBackend>();
    }
    return std::make_unique<ComputeStrategySelector>(requested, probe, std::move(accelerated),
                                                     std::make_unique<ScalarComputeBackend>(),
                                                     std::move(onDegraded));
}

std::string ComputeStrategySelector::degradationReason() const {
    std::lock_guard<std::mutex> lock(reasonMutex_);
    return reason_;
}

void ComputeStrategySelector::degrade(const std::string& reason) const {
    active_.store(fallback_.get(), std::memory_order_release);
    if (degraded_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already reported
    }

    {
        std::lock_guard<std::mutex> lock(reasonMutex_);
        reason_ = reason;
    }
    Log::get()->warn("compute degraded to cpu: {}", reason);

    if (onDegraded_) {
        try {
            onDegraded_(reason);
        } catch (const std::exception& e) {
            Log::get()->warn("degradation handler failed: {}", e.what());
        }
    }
}

template <typename Operation>
void ComputeStrategySelector::dispatch(Operation&& operation) const {
    const ComputeBackend* backend = active_.load(std::memory_order_acquire);
    if (backend != fallback_.get()) {
        try {
            operation(*backend);
            return;
        } catch (const AcceleratorFault& fault) {
            degrade(fault.what());
        }
    }
    operation(*fallback_);
}

void ComputeStrategySelector::evaluateVectorized(const MathematicalLaw& law, const double* times,
                                                 size_t count, float* out) const {
    dispatch([&](const ComputeBackend& backend) { backend.evaluateVectorized(law, times, count, out); });
}

void ComputeStrategySelector::transformForward(const float* input, size_t size, Complex* output) const {
    dispatch([&](const ComputeBackend& backend) { backend.transformForward(input, size, output); });
}

void ComputeStrategySelector::transformInverse(const Complex* input, size_t size, float* output) const {
    dispatch([&](const ComputeBackend& backend) { backend.transformInverse(input, size, output); });
}

void ComputeStrategySelector::windowedMultiply(const float* input, const float* window, size_t count,
                                               float* output) const {
    dispatch([&](const ComputeBackend& backend) { backend.windowedMultiply(input, window, count, output); });
}

void ComputeStrategySelector::accumulatePower(const Complex* spectrum, size_t numBins,
                                              float* power) const {
    dispatch([&](const ComputeBackend& backend) { backend.accumulatePower(spectrum, numBins, power); });
}

}  // namespace DSP
}  // namespace Oscilla
