// ==============================================================================
// Layer 2: DSP Processor - Compute Strategy Selector
// ==============================================================================
// Chooses between the accelerated (SIMD) and CPU compute backends and exposes
// the choice as a single ComputeBackend.
//
// - resolveComputeStrategy() is a pure function of the request and the
//   accelerator probe result.
// - The selector forwards every call to the active backend. When the
//   accelerated backend raises AcceleratorFault, the selector switches to the
//   CPU backend for good, retries the call there and reports the degradation
//   exactly once through its degradation handler. Callers never see the fault.
// ==============================================================================

#pragma once

#include <oscilla/dsp/primitives/compute_backend.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Probe and Decision
// =============================================================================

/// @brief Result of probing the host for a usable vector unit
struct AcceleratorProbe {
    bool available = false;
    std::string description;  ///< Best target name, or why none is usable
};

/// Environment variable that forces the probe to report no accelerator
inline constexpr const char* kDisableAcceleratorEnv = "OSCILLA_DISABLE_ACCELERATOR";

/// @brief Probe Highway's supported targets for one better than scalar/emulated
[[nodiscard]] AcceleratorProbe probeAccelerator();

struct StrategyDecision {
    ComputeStrategy active = ComputeStrategy::Cpu;  ///< Accelerated or Cpu
    bool degraded = false;                          ///< Acceleration wanted but unavailable
    std::string reason;
};

/// @brief Pure selection rule
/// - Cpu                        -> Cpu
/// - Auto/Accelerated + probe   -> Accelerated
/// - Auto/Accelerated, no probe -> Cpu, degraded
[[nodiscard]] StrategyDecision resolveComputeStrategy(ComputeStrategy requested,
                                                      const AcceleratorProbe& probe);

// =============================================================================
// ComputeStrategySelector
// =============================================================================

class ComputeStrategySelector final : public ComputeBackend {
public:
    using DegradationHandler = std::function<void(const std::string& reason)>;

    /// @param accelerated Accelerated backend; may be null when the probe failed
    /// @param fallback CPU backend (required)
    /// @param onDegraded Called once, on the thread that observed the degradation
    ComputeStrategySelector(ComputeStrategy requested, const AcceleratorProbe& probe,
                            std::unique_ptr<ComputeBackend> accelerated,
                            std::unique_ptr<ComputeBackend> fallback,
                            DegradationHandler onDegraded = {});

    /// @brief Probe the host and build the SIMD and CPU backends
    [[nodiscard]] static std::unique_ptr<ComputeStrategySelector> create(
        ComputeStrategy requested, DegradationHandler onDegraded = {});

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] ComputeStrategy requestedStrategy() const noexcept { return requested_; }
    [[nodiscard]] bool isDegraded() const noexcept { return degraded_.load(std::memory_order_acquire); }
    [[nodiscard]] std::string degradationReason() const;
    [[nodiscard]] const ComputeBackend& activeBackend() const noexcept {
        return *active_.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // ComputeBackend
    // -------------------------------------------------------------------------

    [[nodiscard]] std::string_view name() const noexcept override { return activeBackend().name(); }
    [[nodiscard]] ComputeStrategy strategy() const noexcept override {
        return activeBackend().strategy();
    }

    void evaluateVectorized(const MathematicalLaw& law, const double* times,
                            size_t count, float* out) const override;
    void transformForward(const float* input, size_t size, Complex* output) const override;
    void transformInverse(const Complex* input, size_t size, float* output) const override;
    void windowedMultiply(const float* input, const float* window, size_t count,
                          float* output) const override;
    void accumulatePower(const Complex* spectrum, size_t numBins, float* power) const override;

private:
    template <typename Operation>
    void dispatch(Operation&& operation) const;

    void degrade(const std::string& reason) const;

    ComputeStrategy requested_;
    std::unique_ptr<ComputeBackend> accelerated_;
    std::unique_ptr<ComputeBackend> fallback_;
    DegradationHandler onDegraded_;

    mutable std::atomic<const ComputeBackend*> active_{nullptr};
    mutable std::atomic<bool> degraded_{false};
    mutable std::mutex reasonMutex_;
    mutable std::string reason_;
};

}  // namespace DSP
}  // namespace Oscilla
