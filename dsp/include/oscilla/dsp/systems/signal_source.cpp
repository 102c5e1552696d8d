// ==============================================================================
// Signal Sources Implementation
// ==============================================================================

#include "signal_source.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/primitives/law_evaluator.h>

#include <cmath>
#include <exception>
#include <utility>

namespace Oscilla {
namespace DSP {

std::shared_ptr<const SignalData> generateAndPublish(const SignalGenerator& generator, EventHub* hub,
                                                     const MathematicalLaw& law, double sampleRate,
                                                     double duration, std::string name,
                                                     const NoiseOptions& noise) {
    auto signal = std::make_shared<const SignalData>(
        generator.generate(law, sampleRate, duration, std::move(name), noise));
    if (hub != nullptr) {
        hub->publish(SignalReady{signal});
    }
    return signal;
}

std::string_view streamingStatusName(StreamingStatus status) noexcept {
    switch (status) {
        case StreamingStatus::Idle:      return "idle";
        case StreamingStatus::Running:   return "running";
        case StreamingStatus::Cancelled: return "cancelled";
        case StreamingStatus::Completed: return "completed";
        case StreamingStatus::Failed:    return "failed";
    }
    return "unknown";
}

// =============================================================================
// StreamingProducer
// =============================================================================

StreamingProducer::StreamingProducer(MathematicalLaw law, StreamingConfig config, FrameRingBuffer& ring,
                                     const ComputeBackend& backend, EventHub* hub,
                                     CancellationToken token)
    : law_(std::move(law))
    , config_(config)
    , ring_(ring)
    , backend_(backend)
    , hub_(hub)
    , externalToken_(std::move(token)) {
    if (!std::isfinite(config_.sampleRate) || config_.sampleRate <= 0.0) {
        throw SampleRateError("streaming sample_rate must be positive, got " +
                              std::to_string(config_.sampleRate));
    }
    if (config_.frameLength == 0) {
        throw InvalidConfigurationError("frame_length must be at least 1");
    }
    if (config_.frameLength != ring_.frameLength()) {
        throw InvalidConfigurationError("frame_length (" + std::to_string(config_.frameLength) +
                                        ") does not match the ring buffer (" +
                                        std::to_string(ring_.frameLength()) + ")");
    }
    validateLaw(law_);

    times_.resize(config_.frameLength);
    samples_.resize(config_.frameLength);
}

StreamingProducer::~StreamingProducer() {
    cancel();
    join();
}

double StreamingProducer::tickPeriod() const noexcept {
    return static_cast<double>(config_.frameLength) / config_.sampleRate;
}

bool StreamingProducer::stopRequested() const noexcept {
    return stopSource_.isCancellationRequested() || externalToken_.isCancellationRequested();
}

void StreamingProducer::finish(StreamingStatus status) noexcept {
    StreamingStatus running = StreamingStatus::Running;
    if (!status_.compare_exchange_strong(running, status, std::memory_order_acq_rel)) {
        StreamingStatus idle = StreamingStatus::Idle;
        status_.compare_exchange_strong(idle, status, std::memory_order_acq_rel);
    }
}

void StreamingProducer::start() {
    StreamingStatus idle = StreamingStatus::Idle;
    if (!status_.compare_exchange_strong(idle, StreamingStatus::Running, std::memory_order_acq_rel)) {
        throw EngineError("streaming producer already started (status " +
                          std::string(streamingStatusName(status())) + ")");
    }
    Log::get()->info("streaming {} at {} Hz, {} samples per frame ({} backend)", lawKindName(law_.kind()),
                     config_.sampleRate, config_.frameLength, backend_.name());
    threadStarted_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(threadMutex_);
    thread_ = std::thread(&StreamingProducer::run, this);
}

void StreamingProducer::cancel() noexcept {
    stopSource_.requestCancellation();
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wake_.notify_all();
    // A running thread reports its own terminal status
    if (!threadStarted_.load(std::memory_order_acquire)) {
        finish(StreamingStatus::Cancelled);
    }
}

void StreamingProducer::join() {
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool StreamingProducer::tick() {
    StreamingStatus idle = StreamingStatus::Idle;
    status_.compare_exchange_strong(idle, StreamingStatus::Running, std::memory_order_acq_rel);
    if (status() != StreamingStatus::Running) {
        return false;
    }

    if (stopRequested()) {
        finish(StreamingStatus::Cancelled);
        return false;
    }

    const uint64_t index = framesProduced_.load(std::memory_order_relaxed);
    if (config_.maxFrames > 0 && index >= config_.maxFrames) {
        finish(StreamingStatus::Completed);
        return false;
    }

    const size_t length = config_.frameLength;
    const double timestamp = static_cast<double>(index * length) / config_.sampleRate;
    SignalData::fillTimes(config_.sampleRate, static_cast<size_t>(index * length), times_.data(), length);
    try {
        backend_.evaluateVectorized(law_, times_.data(), length, samples_.data());
    } catch (const std::exception&) {
        finish(StreamingStatus::Failed);
        throw;
    }

    ring_.write(timestamp, samples_.data(), length);
    framesProduced_.store(index + 1, std::memory_order_release);

    if (hub_ != nullptr) {
        FrameReady event;
        event.lawId = law_.id();
        event.frame.index = index;
        event.frame.timestamp = timestamp;
        event.frame.samples = samples_;
        hub_->publish(event);
    }

    if (config_.maxFrames > 0 && index + 1 >= config_.maxFrames) {
        finish(StreamingStatus::Completed);
        return false;
    }
    return true;
}

void StreamingProducer::run() {
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(tickPeriod()));
    auto next = std::chrono::steady_clock::now();

    try {
        while (tick()) {
            if (!config_.realtimePacing) continue;
            next += period;
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wake_.wait_until(lock, next, [this] { return stopSource_.isCancellationRequested(); });
        }
    } catch (const std::exception& e) {
        finish(StreamingStatus::Failed);
        Log::get()->error("streaming producer failed after {} frames: {}", framesProduced(), e.what());
        return;
    }

    Log::get()->info("streaming {} after {} frames", streamingStatusName(status()), framesProduced());
}

}  // namespace DSP
}  // namespace Oscilla
