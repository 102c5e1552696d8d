// ==============================================================================
// Layer 3: System Component - Compute Runtime
// ==============================================================================
// Process-scoped cache of the compute strategy selector. The host probe and
// backend construction happen once per initialize(); every generator and
// analyzer built afterwards shares the cached selector.
//
// Degradation (probe failure or an accelerator fault at run time) is
// published as DegradedToCpu on the hub given to initialize(). The hub is
// held weakly: once it is destroyed, degradations are only logged.
//
// reset() drops the cache; tests use it to re-run the probe.
// ==============================================================================

#pragma once

#include <oscilla/dsp/processors/compute_strategy.h>
#include <oscilla/dsp/systems/event_hub.h>

#include <memory>

namespace Oscilla {
namespace DSP {

class ComputeRuntime {
public:
    ComputeRuntime() = delete;

    /// @brief Probe the host and replace the cached selector
    /// @param hub Receives DegradedToCpu; may be null
    static std::shared_ptr<ComputeStrategySelector> initialize(ComputeStrategy requested,
                                                               const std::shared_ptr<EventHub>& hub = {});

    /// @brief The cached selector, initialized with ComputeStrategy::Auto on first use
    [[nodiscard]] static std::shared_ptr<ComputeStrategySelector> selector();

    /// @brief True once initialize() or selector() has built a selector
    [[nodiscard]] static bool isInitialized();

    /// @brief Drop the cached selector. Holders of the old one keep it alive.
    static void reset();
};

}  // namespace DSP
}  // namespace Oscilla
