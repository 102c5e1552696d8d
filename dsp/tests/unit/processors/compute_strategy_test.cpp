// ==============================================================================
// Compute Strategy Selector - Unit Tests
// ==============================================================================
// Layer 2: DSP Processors
//
// Tests for: dsp/include/oscilla/dsp/processors/compute_strategy.h
// Purpose: Verify strategy resolution, start-up degradation and the one-way
//          switch to the CPU backend after an accelerator fault
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/processors/compute_strategy.h>
#include <oscilla/dsp/processors/scalar_compute_backend.h>

#include <test_backends.h>

#include <atomic>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Oscilla::DSP;
using Catch::Approx;
using TestHelpers::FaultyBackend;

namespace {

AcceleratorProbe available() {
    return AcceleratorProbe{true, "TEST"};
}

AcceleratorProbe unavailable() {
    return AcceleratorProbe{false, "no device"};
}

} // namespace

// ==============================================================================
// Resolution
// ==============================================================================

TEST_CASE("resolveComputeStrategy", "[dsp][processors][compute_strategy]") {

    SECTION("Cpu is never degraded") {
        const auto decision = resolveComputeStrategy(ComputeStrategy::Cpu, unavailable());
        REQUIRE(decision.active == ComputeStrategy::Cpu);
        REQUIRE_FALSE(decision.degraded);
    }

    SECTION("Auto and Accelerated use the accelerator when present") {
        REQUIRE(resolveComputeStrategy(ComputeStrategy::Auto, available()).active == ComputeStrategy::Accelerated);
        REQUIRE(resolveComputeStrategy(ComputeStrategy::Accelerated, available()).active ==
                ComputeStrategy::Accelerated);
    }

    SECTION("Without an accelerator both degrade with the probe's reason") {
        for (ComputeStrategy requested : {ComputeStrategy::Auto, ComputeStrategy::Accelerated}) {
            const auto decision = resolveComputeStrategy(requested, unavailable());
            REQUIRE(decision.active == ComputeStrategy::Cpu);
            REQUIRE(decision.degraded);
            REQUIRE(decision.reason.find("no device") != std::string::npos);
        }
    }
}

// ==============================================================================
// Construction
// ==============================================================================

TEST_CASE("Selector construction picks the active backend", "[dsp][processors][compute_strategy]") {
    std::vector<std::string> reports;
    auto handler = [&](const std::string& reason) { reports.push_back(reason); };

    SECTION("Accelerated backend when the probe succeeds") {
        const ComputeStrategySelector selector(ComputeStrategy::Auto, available(),
                                               std::make_unique<FaultyBackend>(false),
                                               std::make_unique<ScalarComputeBackend>(), handler);
        REQUIRE(selector.strategy() == ComputeStrategy::Accelerated);
        REQUIRE(selector.name() == "faulty-accelerator");
        REQUIRE_FALSE(selector.isDegraded());
        REQUIRE(reports.empty());
    }

    SECTION("Degraded at start-up when the probe fails") {
        const ComputeStrategySelector selector(ComputeStrategy::Accelerated, unavailable(), nullptr,
                                               std::make_unique<ScalarComputeBackend>(), handler);
        REQUIRE(selector.strategy() == ComputeStrategy::Cpu);
        REQUIRE(selector.isDegraded());
        REQUIRE(reports.size() == 1);
        REQUIRE(selector.degradationReason() == reports.front());
    }

    SECTION("Degraded when the probe succeeds but no backend was supplied") {
        const ComputeStrategySelector selector(ComputeStrategy::Auto, available(), nullptr,
                                               std::make_unique<ScalarComputeBackend>(), handler);
        REQUIRE(selector.isDegraded());
        REQUIRE(reports.size() == 1);
    }

    SECTION("Cpu requested is not a degradation") {
        const ComputeStrategySelector selector(ComputeStrategy::Cpu, unavailable(), nullptr,
                                               std::make_unique<ScalarComputeBackend>(), handler);
        REQUIRE(selector.name() == "cpu");
        REQUIRE_FALSE(selector.isDegraded());
        REQUIRE(reports.empty());
    }

    SECTION("A CPU backend is required") {
        REQUIRE_THROWS_AS(ComputeStrategySelector(ComputeStrategy::Cpu, unavailable(), nullptr, nullptr),
                          InvalidConfigurationError);
    }
}

// ==============================================================================
// Runtime Fallback
// ==============================================================================

TEST_CASE("An accelerator fault switches to the CPU backend once", "[dsp][processors][compute_strategy]") {
    std::vector<std::string> reports;
    auto faulty = std::make_unique<FaultyBackend>(true);
    const FaultyBackend* device = faulty.get();
    const ComputeStrategySelector selector(ComputeStrategy::Auto, available(), std::move(faulty),
                                           std::make_unique<ScalarComputeBackend>(),
                                           [&](const std::string& reason) { reports.push_back(reason); });

    constexpr size_t kCount = 256;
    std::vector<double> times(kCount);
    SignalData::fillTimes(8000.0, 0, times.data(), kCount);
    std::vector<float> out(kCount, 0.0f);
    const auto law = MathematicalLaw::sinusoid(500.0, 1.0);

    selector.evaluateVectorized(law, times.data(), kCount, out.data());

    SECTION("The failed call is retried on the CPU and completes") {
        REQUIRE(out[4] == Approx(std::sin(TestHelpers::kTwoPiD * 500.0 * times[4])).margin(1e-6));
        REQUIRE(selector.isDegraded());
        REQUIRE(selector.strategy() == ComputeStrategy::Cpu);
        REQUIRE(selector.degradationReason().find("simulated device fault") != std::string::npos);
    }

    SECTION("Later calls never touch the accelerator again") {
        const size_t callsAfterFault = device->calls();
        std::vector<Complex> spectrum(kCount / 2 + 1);
        std::vector<float> input(kCount, 1.0f);
        selector.transformForward(input.data(), kCount, spectrum.data());
        selector.evaluateVectorized(law, times.data(), kCount, out.data());
        REQUIRE(device->calls() == callsAfterFault);
        REQUIRE(spectrum[0].real == Approx(static_cast<double>(kCount)));
    }

    SECTION("The degradation is reported exactly once") {
        selector.evaluateVectorized(law, times.data(), kCount, out.data());
        selector.evaluateVectorized(law, times.data(), kCount, out.data());
        REQUIRE(reports.size() == 1);
    }
}

TEST_CASE("Concurrent faults report one degradation", "[dsp][processors][compute_strategy][concurrency]") {
    std::atomic<int> reports{0};
    const ComputeStrategySelector selector(ComputeStrategy::Accelerated, available(),
                                           std::make_unique<FaultyBackend>(true),
                                           std::make_unique<ScalarComputeBackend>(),
                                           [&](const std::string&) { reports.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&selector] {
            std::vector<float> input(1024, 0.25f);
            std::vector<float> window(1024, 2.0f);
            std::vector<float> output(1024);
            for (int n = 0; n < 50; ++n) {
                selector.windowedMultiply(input.data(), window.data(), input.size(), output.data());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(reports.load() == 1);
    REQUIRE(selector.isDegraded());
}

TEST_CASE("A throwing degradation handler does not break the fallback", "[dsp][processors][compute_strategy]") {
    const ComputeStrategySelector selector(ComputeStrategy::Auto, available(),
                                           std::make_unique<FaultyBackend>(true),
                                           std::make_unique<ScalarComputeBackend>(),
                                           [](const std::string&) { throw std::runtime_error("listener down"); });

    std::vector<float> input(8, 1.0f);
    std::vector<float> window(8, 0.5f);
    std::vector<float> output(8, 0.0f);
    REQUIRE_NOTHROW(selector.windowedMultiply(input.data(), window.data(), 8, output.data()));
    REQUIRE(output[7] == 0.5f);
    REQUIRE(selector.isDegraded());
}

TEST_CASE("create honours an explicit CPU request", "[dsp][processors][compute_strategy]") {
    const auto selector = ComputeStrategySelector::create(ComputeStrategy::Cpu);
    REQUIRE(selector != nullptr);
    REQUIRE(selector->requestedStrategy() == ComputeStrategy::Cpu);
    REQUIRE(selector->strategy() == ComputeStrategy::Cpu);
    REQUIRE_FALSE(selector->isDegraded());
}

TEST_CASE("create with Auto always yields a usable backend", "[dsp][processors][compute_strategy]") {
    const auto selector = ComputeStrategySelector::create(ComputeStrategy::Auto);
    REQUIRE(selector != nullptr);
    // Either accelerated, or CPU with a recorded reason
    if (selector->strategy() == ComputeStrategy::Cpu) {
        REQUIRE(selector->isDegraded());
        REQUIRE_FALSE(selector->degradationReason().empty());
    } else {
        REQUIRE_FALSE(selector->isDegraded());
    }
}
