// ==============================================================================
// Compute Runtime Implementation
// ==============================================================================

#include "compute_runtime.h"

#include <mutex>
#include <string>
#include <utility>

namespace Oscilla {
namespace DSP {

namespace {

std::mutex& runtimeMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<ComputeStrategySelector>& cachedSelector() {
    static std::shared_ptr<ComputeStrategySelector> selector;
    return selector;
}

std::shared_ptr<ComputeStrategySelector> buildSelector(ComputeStrategy requested,
                                                       const std::shared_ptr<EventHub>& hub) {
    ComputeStrategySelector::DegradationHandler handler;
    if (hub) {
        std::weak_ptr<EventHub> weakHub = hub;
        handler = [weakHub](const std::string& reason) {
            if (auto target = weakHub.lock()) {
                target->publish(DegradedToCpu{reason});
            }
        };
    }
    return ComputeStrategySelector::create(requested, std::move(handler));
}

} // namespace

std::shared_ptr<ComputeStrategySelector> ComputeRuntime::initialize(ComputeStrategy requested,
                                                                    const std::shared_ptr<EventHub>& hub) {
    // Built outside the lock: a degradation during construction publishes to
    // the hub, whose subscribers may query the runtime.
    auto selector = buildSelector(requested, hub);

    std::lock_guard<std::mutex> lock(runtimeMutex());
    cachedSelector() = selector;
    return selector;
}

std::shared_ptr<ComputeStrategySelector> ComputeRuntime::selector() {
    {
        std::lock_guard<std::mutex> lock(runtimeMutex());
        if (cachedSelector()) return cachedSelector();
    }
    auto selector = buildSelector(ComputeStrategy::Auto, {});

    std::lock_guard<std::mutex> lock(runtimeMutex());
    if (!cachedSelector()) {
        cachedSelector() = std::move(selector);
    }
    return cachedSelector();
}

bool ComputeRuntime::isInitialized() {
    std::lock_guard<std::mutex> lock(runtimeMutex());
    return cachedSelector() != nullptr;
}

void ComputeRuntime::reset() {
    std::lock_guard<std::mutex> lock(runtimeMutex());
    cachedSelector().reset();
}

}  // namespace DSP
}  // namespace Oscilla
