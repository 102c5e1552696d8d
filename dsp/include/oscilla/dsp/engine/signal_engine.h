// ==============================================================================
// Layer 4: User Feature - Signal Engine
// ==============================================================================
// One engine instance built from an immutable EngineConfig.
//
// Composes:
// - EventHub (Layer 3): typed events between all components
// - ComputeRuntime (Layer 3): cached accelerated/CPU compute selector
// - SignalGenerator (Layer 2) + generateAndPublish (Layer 3): batch signals
// - StreamingProducer (Layer 3) + FrameRingBuffer (Layer 1): display stream
// - AnalysisService + AnalysisWorkerPool (Layer 3): spectral analysis
// - InMemorySignalRepository + PersistenceAdapter (Layer 3): storage
//
// Data flow:
//   config -> generator -> ring buffer / SignalData -> analyzer -> hub
//          -> subscribers (display, persistence)
// ==============================================================================

#pragma once

#include <oscilla/dsp/primitives/frame_ring_buffer.h>
#include <oscilla/dsp/processors/compute_strategy.h>
#include <oscilla/dsp/processors/signal_generator.h>
#include <oscilla/dsp/systems/analysis_service.h>
#include <oscilla/dsp/systems/analysis_worker_pool.h>
#include <oscilla/dsp/systems/engine_config.h>
#include <oscilla/dsp/systems/event_hub.h>
#include <oscilla/dsp/systems/persistence.h>
#include <oscilla/dsp/systems/signal_source.h>

#include <cstdint>
#include <memory>
#include <string>

namespace Oscilla {
namespace DSP {

class SignalEngine {
public:
    /// @brief Validate the configuration and build every component
    /// @throws Everything EngineConfig::validate() and Log::configure() throw
    explicit SignalEngine(EngineConfig config);
    ~SignalEngine();

    SignalEngine(const SignalEngine&) = delete;
    SignalEngine& operator=(const SignalEngine&) = delete;

    // -------------------------------------------------------------------------
    // Generation
    // -------------------------------------------------------------------------

    /// @brief Generate the configured law over the configured duration
    std::shared_ptr<const SignalData> generate(std::string name = {});

    /// @brief Generate any law at the configured sample rate and duration
    std::shared_ptr<const SignalData> generate(const MathematicalLaw& law, std::string name = {});

    /// @brief Streaming producer feeding this engine's ring buffer and hub
    /// @param maxFrames 0 = until cancelled
    [[nodiscard]] std::unique_ptr<StreamingProducer> createStreamingProducer(
        bool realtimePacing = true, uint64_t maxFrames = 0, CancellationToken token = {});

    // -------------------------------------------------------------------------
    // Analysis
    // -------------------------------------------------------------------------

    /// @brief Analyze synchronously with the configured analysis settings
    std::shared_ptr<const AnalysisSession> analyze(const SignalList& signals, std::string name = {},
                                                   const CancellationToken& token = {});

    /// @brief Analyze on the worker pool
    [[nodiscard]] AnalysisHandle submitAnalysis(SignalList signals, std::string name = {});

    // -------------------------------------------------------------------------
    // Components
    // -------------------------------------------------------------------------

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] EventHub& hub() noexcept { return *hub_; }
    [[nodiscard]] const ComputeStrategySelector& compute() const noexcept { return *compute_; }
    [[nodiscard]] FrameRingBuffer& ringBuffer() noexcept { return ring_; }
    [[nodiscard]] InMemorySignalRepository& repository() noexcept { return repository_; }
    [[nodiscard]] PersistenceAdapter& persistence() noexcept { return *persistence_; }

private:
    // Destroyed in reverse order: the pool drains before anything it uses goes away
    EngineConfig config_;
    std::shared_ptr<EventHub> hub_;
    InMemorySignalRepository repository_;
    std::shared_ptr<ComputeStrategySelector> compute_;
    FrameRingBuffer ring_;
    SignalGenerator generator_;
    std::unique_ptr<PersistenceAdapter> persistence_;
    std::unique_ptr<AnalysisService> service_;
    std::unique_ptr<AnalysisWorkerPool> pool_;
};

}  // namespace DSP
}  // namespace Oscilla
