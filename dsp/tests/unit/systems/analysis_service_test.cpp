// ==============================================================================
// Analysis Service - Unit Tests
// ==============================================================================
// Layer 3: System Components
//
// Tests for: dsp/include/oscilla/dsp/systems/analysis_service.h
//            dsp/include/oscilla/dsp/systems/analysis_worker_pool.h
// Purpose: Verify session lifecycle, synchronous validation, worker-pool
//          execution, cancellation and failure reporting
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/processors/scalar_compute_backend.h>
#include <oscilla/dsp/systems/analysis_service.h>

#include <test_backends.h>
#include <test_signals.h>

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Oscilla::DSP;
using Catch::Approx;

namespace {

AnalysisConfig smallConfig() {
    AnalysisConfig config;
    config.windowSize = 256;
    config.transformSize = 512;
    return config;
}

SignalList twoTones() {
    return {TestHelpers::makeSignal(TestHelpers::generateSine(4096, 250.0, 8000.0, 1.0), 8000.0, "a"),
            TestHelpers::makeSignal(TestHelpers::generateSine(4096, 500.0, 8000.0, 0.5), 8000.0, "b")};
}

} // namespace

// ==============================================================================
// Worker Pool
// ==============================================================================

TEST_CASE("Worker pool runs tasks and carries their results", "[dsp][systems][analysis_service]") {
    AnalysisWorkerPool pool(2);
    REQUIRE(pool.workerCount() == 2);

    auto value = pool.submit([] { return 42; });
    auto failure = pool.submit([]() -> int { throw std::runtime_error("task failed"); });

    REQUIRE(value.get() == 42);
    REQUIRE_THROWS_AS(failure.get(), std::runtime_error);

    SECTION("shutdown drains and refuses new work") {
        std::atomic<int> ran{0};
        for (int i = 0; i < 8; ++i) {
            pool.submit([&ran] { ran.fetch_add(1); });
        }
        pool.shutdown();
        REQUIRE(ran.load() == 8);
        REQUIRE(pool.pendingTasks() == 0);
        REQUIRE_THROWS_AS(pool.submit([] { return 0; }), EngineError);
        REQUIRE_NOTHROW(pool.shutdown());
    }
}

TEST_CASE("Worker pool needs at least one worker", "[dsp][systems][analysis_service]") {
    REQUIRE_THROWS_AS(AnalysisWorkerPool(0), InvalidConfigurationError);
}

// ==============================================================================
// Validation
// ==============================================================================

TEST_CASE("Invalid requests throw before a session exists", "[dsp][systems][analysis_service]") {
    const ScalarComputeBackend backend;
    EventHub hub;
    int published = 0;
    hub.subscribe<AnalysisComplete>("count", [&](const AnalysisComplete&) { ++published; });
    const AnalysisService service(backend, &hub);

    SECTION("No signals") {
        REQUIRE_THROWS_AS(service.run("empty", {}, smallConfig()), InvalidConfigurationError);
    }
    SECTION("A zero-length signal") {
        const SignalList signals{TestHelpers::makeSignal({}, 8000.0)};
        REQUIRE_THROWS_AS(service.run("zero", signals, smallConfig()), AnalysisEmptyInputError);
    }
    SECTION("A bad configuration") {
        auto config = smallConfig();
        config.overlap = 1.5;
        REQUIRE_THROWS_AS(service.run("bad", twoTones(), config), InvalidConfigurationError);
    }
    SECTION("A window longer than a signal") {
        const SignalList signals{TestHelpers::makeSignal(std::vector<float>(100, 0.0f), 8000.0)};
        REQUIRE_THROWS_AS(service.run("short", signals, smallConfig()), InvalidConfigurationError);
    }

    REQUIRE(published == 0);
}

TEST_CASE("submit without a pool is an error", "[dsp][systems][analysis_service]") {
    const ScalarComputeBackend backend;
    const AnalysisService service(backend);
    REQUIRE_THROWS_AS(service.submit("x", twoTones(), smallConfig()), EngineError);
}

// ==============================================================================
// Synchronous Runs
// ==============================================================================

TEST_CASE("run completes a session with one result per signal", "[dsp][systems][analysis_service]") {
    const ScalarComputeBackend backend;
    EventHub hub;
    std::shared_ptr<const AnalysisSession> published;
    hub.subscribe<AnalysisComplete>("capture", [&](const AnalysisComplete& event) { published = event.session; });
    const AnalysisService service(backend, &hub);
    const auto signals = twoTones();

    const auto session = service.run("pair", signals, smallConfig());

    REQUIRE(session->status == AnalysisStatus::Completed);
    REQUIRE(session->name == "pair");
    REQUIRE_FALSE(session->id.empty());
    REQUIRE(session->progress == 1.0);
    REQUIRE(session->errorMessage.empty());
    REQUIRE(session->signalIds == std::vector<std::string>{signals[0]->id(), signals[1]->id()});
    REQUIRE(session->results.size() == 2);
    REQUIRE(session->results[0].signalId == signals[0]->id());
    REQUIRE(session->results[0].fundamentalFrequency == Approx(250.0).margin(2.0));
    REQUIRE(session->results[1].fundamentalFrequency == Approx(500.0).margin(2.0));
    REQUIRE(session->finishedAt >= session->startedAt);
    REQUIRE(published == session);
}

TEST_CASE("Unnamed sessions get a default name", "[dsp][systems][analysis_service]") {
    const ScalarComputeBackend backend;
    const AnalysisService service(backend);
    REQUIRE(service.run("", twoTones(), smallConfig())->name == "analysis");
}

TEST_CASE("A cancelled run has no results", "[dsp][systems][analysis_service]") {
    const ScalarComputeBackend backend;
    const AnalysisService service(backend);
    CancellationSource source;
    source.requestCancellation();

    const auto session = service.run("cancelled", twoTones(), smallConfig(), source.token());

    REQUIRE(session->status == AnalysisStatus::Cancelled);
    REQUIRE(session->results.empty());
    REQUIRE(isTerminal(session->status));
}

TEST_CASE("A backend fault fails the session", "[dsp][systems][analysis_service]") {
    const TestHelpers::FaultyBackend backend(true);
    EventHub hub;
    std::shared_ptr<const AnalysisSession> published;
    hub.subscribe<AnalysisComplete>("capture", [&](const AnalysisComplete& event) { published = event.session; });
    const AnalysisService service(backend, &hub);

    const auto session = service.run("doomed", twoTones(), smallConfig());

    REQUIRE(session->status == AnalysisStatus::Failed);
    REQUIRE(session->errorMessage.find("simulated device fault") != std::string::npos);
    REQUIRE(session->results.empty());
    REQUIRE(published == session);
}

// ==============================================================================
// Worker Pool Sessions
// ==============================================================================

TEST_CASE("submit runs the session on the pool", "[dsp][systems][analysis_service][concurrency]") {
    const ScalarComputeBackend backend;
    AnalysisWorkerPool pool(2);
    const AnalysisService service(backend, nullptr, &pool);

    auto first = service.submit("first", twoTones(), smallConfig());
    auto second = service.submit("second", twoTones(), smallConfig());
    REQUIRE(first.sessionId() != second.sessionId());

    const auto a = first.wait();
    const auto b = second.wait();
    REQUIRE(a->id == first.sessionId());
    REQUIRE(a->status == AnalysisStatus::Completed);
    REQUIRE(b->status == AnalysisStatus::Completed);
    REQUIRE(first.progress() == 1.0);
}

TEST_CASE("submit validates synchronously", "[dsp][systems][analysis_service]") {
    const ScalarComputeBackend backend;
    AnalysisWorkerPool pool(1);
    const AnalysisService service(backend, nullptr, &pool);

    REQUIRE_THROWS_AS(service.submit("empty", {}, smallConfig()), InvalidConfigurationError);
    REQUIRE(pool.pendingTasks() == 0);
}

TEST_CASE("A queued session can be cancelled", "[dsp][systems][analysis_service][concurrency]") {
    const ScalarComputeBackend backend;
    AnalysisWorkerPool pool(1);
    const AnalysisService service(backend, nullptr, &pool);

    // Hold the only worker so the session stays queued
    std::promise<void> release;
    auto gate = pool.submit([opened = release.get_future().share()] { opened.wait(); });

    auto handle = service.submit("queued", twoTones(), smallConfig());
    handle.cancel();
    release.set_value();
    gate.get();

    const auto session = handle.wait();
    REQUIRE(session->status == AnalysisStatus::Cancelled);
    REQUIRE(session->results.empty());
}
