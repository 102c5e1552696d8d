// ==============================================================================
// Compute Runtime - Unit Tests
// ==============================================================================
// Layer 3: System Components
//
// Tests for: dsp/include/oscilla/dsp/systems/compute_runtime.h
// Purpose: Verify the cached selector's lifetime and DegradedToCpu publication
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <oscilla/dsp/systems/compute_runtime.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace Oscilla::DSP;

namespace {

/// Forces the accelerator probe to fail for the lifetime of the guard
struct AcceleratorDisabled {
    AcceleratorDisabled() { ::setenv(kDisableAcceleratorEnv, "1", 1); }
    ~AcceleratorDisabled() { ::unsetenv(kDisableAcceleratorEnv); }
};

/// Leaves the process-wide cache empty for the next test
struct RuntimeReset {
    ~RuntimeReset() { ComputeRuntime::reset(); }
};

} // namespace

TEST_CASE("initialize caches the selector", "[dsp][systems][compute_runtime]") {
    RuntimeReset cleanup;
    ComputeRuntime::reset();
    REQUIRE_FALSE(ComputeRuntime::isInitialized());

    const auto selector = ComputeRuntime::initialize(ComputeStrategy::Cpu);

    REQUIRE(ComputeRuntime::isInitialized());
    REQUIRE(ComputeRuntime::selector() == selector);
    REQUIRE(selector->strategy() == ComputeStrategy::Cpu);
    REQUIRE_FALSE(selector->isDegraded());

    SECTION("initialize replaces the cache") {
        const auto replacement = ComputeRuntime::initialize(ComputeStrategy::Cpu);
        REQUIRE(replacement != selector);
        REQUIRE(ComputeRuntime::selector() == replacement);
    }

    SECTION("reset drops the cache but not existing holders") {
        ComputeRuntime::reset();
        REQUIRE_FALSE(ComputeRuntime::isInitialized());
        REQUIRE(selector->name() == std::string("cpu"));
    }
}

TEST_CASE("selector() initializes lazily with Auto", "[dsp][systems][compute_runtime]") {
    RuntimeReset cleanup;
    ComputeRuntime::reset();

    const auto selector = ComputeRuntime::selector();

    REQUIRE(selector != nullptr);
    REQUIRE(selector->requestedStrategy() == ComputeStrategy::Auto);
    REQUIRE(ComputeRuntime::selector() == selector);
}

TEST_CASE("Start-up degradation is published on the hub", "[dsp][systems][compute_runtime]") {
    RuntimeReset cleanup;
    AcceleratorDisabled disabled;
    auto hub = std::make_shared<EventHub>();
    std::vector<std::string> reasons;
    hub->subscribe<DegradedToCpu>("watcher", [&](const DegradedToCpu& event) { reasons.push_back(event.reason); });

    const auto selector = ComputeRuntime::initialize(ComputeStrategy::Auto, hub);

    REQUIRE(selector->strategy() == ComputeStrategy::Cpu);
    REQUIRE(selector->isDegraded());
    REQUIRE(reasons.size() == 1);
    REQUIRE(reasons.front().find(kDisableAcceleratorEnv) != std::string::npos);

    SECTION("An explicit CPU request publishes nothing") {
        reasons.clear();
        ComputeRuntime::initialize(ComputeStrategy::Cpu, hub);
        REQUIRE(reasons.empty());
    }
}

TEST_CASE("The cached selector outlives its hub", "[dsp][systems][compute_runtime]") {
    RuntimeReset cleanup;
    std::weak_ptr<EventHub> observer;
    {
        auto hub = std::make_shared<EventHub>();
        observer = hub;
        ComputeRuntime::initialize(ComputeStrategy::Cpu, hub);
    }
    REQUIRE(observer.expired());

    const float input[4] = {1.0f, 2.0f, 3.0f, 4.0f};
    const float window[4] = {0.5f, 0.5f, 0.5f, 0.5f};
    float output[4] = {};
    ComputeRuntime::selector()->windowedMultiply(input, window, 4, output);
    REQUIRE(output[3] == 2.0f);
}
