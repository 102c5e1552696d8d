// ==============================================================================
// Signal Engine Implementation
// ==============================================================================

#include "signal_engine.h"

#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/systems/compute_runtime.h>

#include <utility>

namespace Oscilla {
namespace DSP {

namespace {

EngineConfig validated(EngineConfig config) {
    config.validate();
    Log::configure(config.logging);
    return config;
}

} // namespace

SignalEngine::SignalEngine(EngineConfig config)
    : config_(validated(std::move(config)))
    , hub_(std::make_shared<EventHub>())
    , compute_(ComputeRuntime::initialize(config_.computeStrategy, hub_))
    , ring_(config_.ringBufferCapacity, config_.frameLength)
    , generator_(*compute_) {
    persistence_ = std::make_unique<PersistenceAdapter>(*hub_, repository_);
    pool_ = std::make_unique<AnalysisWorkerPool>(config_.analysisWorkers);
    service_ = std::make_unique<AnalysisService>(*compute_, hub_.get(), pool_.get());

    Log::get()->info("signal engine ready: {} law, {} Hz, {} backend, {} analysis workers",
                     lawKindName(config_.lawKind), config_.sampleRate, compute_->name(),
                     config_.analysisWorkers);
}

SignalEngine::~SignalEngine() {
    pool_->shutdown();
}

std::shared_ptr<const SignalData> SignalEngine::generate(std::string name) {
    return generate(config_.makeLaw(), std::move(name));
}

std::shared_ptr<const SignalData> SignalEngine::generate(const MathematicalLaw& law, std::string name) {
    return generateAndPublish(generator_, hub_.get(), law, config_.sampleRate, config_.duration,
                              std::move(name), config_.noise);
}

std::unique_ptr<StreamingProducer> SignalEngine::createStreamingProducer(bool realtimePacing, uint64_t maxFrames,
                                                                         CancellationToken token) {
    StreamingConfig streaming;
    streaming.sampleRate = config_.sampleRate;
    streaming.frameLength = config_.frameLength;
    streaming.realtimePacing = realtimePacing;
    streaming.maxFrames = maxFrames;
    return std::make_unique<StreamingProducer>(config_.makeLaw(), streaming, ring_, *compute_, hub_.get(),
                                               std::move(token));
}

std::shared_ptr<const AnalysisSession> SignalEngine::analyze(const SignalList& signals, std::string name,
                                                             const CancellationToken& token) {
    return service_->run(std::move(name), signals, config_.analysis, token);
}

AnalysisHandle SignalEngine::submitAnalysis(SignalList signals, std::string name) {
    return service_->submit(std::move(name), std::move(signals), config_.analysis);
}

}  // namespace DSP
}  // namespace Oscilla
