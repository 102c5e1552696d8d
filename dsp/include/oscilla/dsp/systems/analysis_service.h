// ==============================================================================
// Layer 3: System Component - Analysis Service
// ==============================================================================
// Runs AnalysisSessions: one SpectralAnalysisResult per referenced signal,
// either on the caller's thread (run) or on an AnalysisWorkerPool (submit).
//
// - Configuration and input validation happen synchronously in both modes and
//   throw to the caller; no session is created for an invalid request.
// - A session ends Completed, Cancelled (no results) or Failed (error message
//   set) and is published as AnalysisComplete, then frozen.
// - Concurrent sessions share only the read-only compute backend.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/analysis_types.h>
#include <oscilla/dsp/core/cancellation.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/primitives/compute_backend.h>
#include <oscilla/dsp/systems/analysis_worker_pool.h>
#include <oscilla/dsp/systems/event_hub.h>

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace Oscilla {
namespace DSP {

using SignalList = std::vector<std::shared_ptr<const SignalData>>;

/// @brief Handle on a session running in the worker pool
class AnalysisHandle {
public:
    AnalysisHandle(std::string sessionId, CancellationSource cancellation,
                   std::shared_ptr<const std::atomic<double>> progress,
                   std::future<std::shared_ptr<const AnalysisSession>> result)
        : sessionId_(std::move(sessionId))
        , cancellation_(std::move(cancellation))
        , progress_(std::move(progress))
        , result_(std::move(result)) {}

    [[nodiscard]] const std::string& sessionId() const noexcept { return sessionId_; }

    /// @brief Request cancellation; the session ends Cancelled at the next frame boundary
    void cancel() noexcept { cancellation_.requestCancellation(); }

    /// @brief Fraction of frames processed across all signals, in [0, 1]
    [[nodiscard]] double progress() const noexcept { return progress_->load(std::memory_order_relaxed); }

    /// @brief Block until the session is terminal
    [[nodiscard]] std::shared_ptr<const AnalysisSession> wait() { return result_.get(); }

    [[nodiscard]] bool valid() const noexcept { return result_.valid(); }

private:
    std::string sessionId_;
    CancellationSource cancellation_;
    std::shared_ptr<const std::atomic<double>> progress_;
    std::future<std::shared_ptr<const AnalysisSession>> result_;
};

class AnalysisService {
public:
    /// @param backend Compute backend shared by every session (must outlive the service)
    /// @param hub Receives AnalysisComplete; may be null
    /// @param pool Worker pool for submit(); may be null (submit() then throws)
    explicit AnalysisService(const ComputeBackend& backend, EventHub* hub = nullptr,
                             AnalysisWorkerPool* pool = nullptr) noexcept
        : backend_(backend), hub_(hub), pool_(pool) {}

    /// @brief Validate a request without running it
    /// @throws InvalidConfigurationError for a bad config or an empty signal list
    /// @throws AnalysisEmptyInputError for a zero-length signal
    void validate(const SignalList& signals, const AnalysisConfig& config) const;

    /// @brief Analyze synchronously
    std::shared_ptr<const AnalysisSession> run(std::string name, const SignalList& signals,
                                               const AnalysisConfig& config,
                                               const CancellationToken& token = {}) const;

    /// @brief Analyze on the worker pool
    /// @throws EngineError if the service has no pool
    [[nodiscard]] AnalysisHandle submit(std::string name, SignalList signals, AnalysisConfig config) const;

private:
    [[nodiscard]] static std::shared_ptr<AnalysisSession> createSession(std::string name,
                                                                        const SignalList& signals,
                                                                        const AnalysisConfig& config);

    std::shared_ptr<const AnalysisSession> execute(std::shared_ptr<AnalysisSession> session,
                                                   const SignalList& signals,
                                                   const CancellationToken& token,
                                                   std::atomic<double>* progress) const;

    const ComputeBackend& backend_;
    EventHub* hub_;
    AnalysisWorkerPool* pool_;
};

}  // namespace DSP
}  // namespace Oscilla
