// ==============================================================================
// Analysis Service Implementation
// ==============================================================================

#include "analysis_service.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/identifiers.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/processors/spectral_analyzer.h>

#include <chrono>
#include <exception>
#include <utility>

namespace Oscilla {
namespace DSP {

void AnalysisService::validate(const SignalList& signals, const AnalysisConfig& config) const {
    const SpectralAnalyzer analyzer(config, backend_);
    if (signals.empty()) {
        throw InvalidConfigurationError("analysis session references no signals");
    }
    for (const auto& signal : signals) {
        if (!signal) {
            throw InvalidConfigurationError("analysis session references a null signal");
        }
        analyzer.validateInput(signal->size(), signal->sampleRate());
    }
}

std::shared_ptr<AnalysisSession> AnalysisService::createSession(std::string name, const SignalList& signals,
                                                                const AnalysisConfig& config) {
    auto session = std::make_shared<AnalysisSession>();
    session->id = generateIdentifier();
    session->name = name.empty() ? std::string("analysis") : std::move(name);
    session->config = config;
    session->createdAt = AnalysisSession::Clock::now();
    session->signalIds.reserve(signals.size());
    for (const auto& signal : signals) {
        session->signalIds.push_back(signal->id());
    }
    return session;
}

std::shared_ptr<const AnalysisSession> AnalysisService::run(std::string name, const SignalList& signals,
                                                            const AnalysisConfig& config,
                                                            const CancellationToken& token) const {
    validate(signals, config);
    return execute(createSession(std::move(name), signals, config), signals, token, nullptr);
}

AnalysisHandle AnalysisService::submit(std::string name, SignalList signals, AnalysisConfig config) const {
    if (pool_ == nullptr) {
        throw EngineError("analysis service has no worker pool");
    }
    validate(signals, config);

    auto session = createSession(std::move(name), signals, config);
    CancellationSource cancellation;
    auto progress = std::make_shared<std::atomic<double>>(0.0);

    const std::string sessionId = session->id;
    auto future = pool_->submit(
        [this, session, signals = std::move(signals), token = cancellation.token(), progress]() {
            return execute(session, signals, token, progress.get());
        });

    return AnalysisHandle(sessionId, std::move(cancellation), std::move(progress), std::move(future));
}

std::shared_ptr<const AnalysisSession> AnalysisService::execute(std::shared_ptr<AnalysisSession> session,
                                                                const SignalList& signals,
                                                                const CancellationToken& token,
                                                                std::atomic<double>* progress) const {
    session->status = AnalysisStatus::Running;
    session->startedAt = AnalysisSession::Clock::now();
    Log::get()->debug("analysis session '{}' ({}) started over {} signals", session->name, session->id,
                      signals.size());

    const double share = 1.0 / static_cast<double>(signals.size());
    try {
        const SpectralAnalyzer analyzer(session->config, backend_);
        std::vector<SpectralAnalysisResult> results;
        results.reserve(signals.size());

        for (size_t i = 0; i < signals.size(); ++i) {
            const double base = static_cast<double>(i) * share;
            auto result = analyzer.analyze(*signals[i], token, [&](double fraction) {
                session->progress = base + fraction * share;
                if (progress != nullptr) progress->store(session->progress, std::memory_order_relaxed);
            });
            if (!result) {
                session->status = AnalysisStatus::Cancelled;
                break;
            }
            results.push_back(std::move(*result));
        }

        if (session->status == AnalysisStatus::Running) {
            session->results = std::move(results);
            session->status = AnalysisStatus::Completed;
            session->progress = 1.0;
        }
    } catch (const std::exception& e) {
        session->status = AnalysisStatus::Failed;
        session->errorMessage = e.what();
        session->results.clear();
        Log::get()->error("analysis session '{}' failed: {}", session->name, e.what());
    }

    session->finishedAt = AnalysisSession::Clock::now();
    if (progress != nullptr) progress->store(session->progress, std::memory_order_relaxed);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(session->finishedAt -
                                                                               session->startedAt);
    Log::get()->info("analysis session '{}' {} in {} ms", session->name,
                     analysisStatusName(session->status), elapsed.count());

    std::shared_ptr<const AnalysisSession> frozen = std::move(session);
    if (hub_ != nullptr) {
        hub_->publish(AnalysisComplete{frozen});
    }
    return frozen;
}

}  // namespace DSP
}  // namespace Oscilla
