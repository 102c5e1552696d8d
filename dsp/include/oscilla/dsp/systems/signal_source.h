// ==============================================================================
// Layer 3: System Component - Signal Sources
// ==============================================================================
// Connects the signal generator to the rest of the engine.
//
// generateAndPublish(): batch generation, result handed to the hub as
// SignalReady.
//
// StreamingProducer: tick-driven generation of fixed-length frames into a
// FrameRingBuffer. Each tick evaluates frame n over sample indices
// [n*L, (n+1)*L), writes it whole to the ring buffer and publishes FrameReady.
// Ticks are paced at L / sampleRate seconds on a dedicated producer thread
// (or run back to back when realtimePacing is false). Cancellation is checked
// at every tick boundary, so a cancelled producer never leaves a partial frame.
//
// States:
//   Idle -> Running -> Completed  (maxFrames reached)
//                   -> Cancelled  (cancel() or the external token)
//                   -> Failed     (evaluation error on the producer thread)
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/cancellation.h>
#include <oscilla/dsp/core/mathematical_law.h>
#include <oscilla/dsp/primitives/compute_backend.h>
#include <oscilla/dsp/primitives/frame_ring_buffer.h>
#include <oscilla/dsp/processors/signal_generator.h>
#include <oscilla/dsp/systems/event_hub.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace Oscilla {
namespace DSP {

// =============================================================================
// Batch
// =============================================================================

/// @brief Generate a signal and publish it as SignalReady
/// @param hub May be null (generation only)
/// @throws Everything SignalGenerator::generate() throws; nothing is published then
std::shared_ptr<const SignalData> generateAndPublish(const SignalGenerator& generator, EventHub* hub,
                                                     const MathematicalLaw& law, double sampleRate,
                                                     double duration, std::string name = {},
                                                     const NoiseOptions& noise = {});

// =============================================================================
// Streaming
// =============================================================================

enum class StreamingStatus : uint8_t {
    Idle,
    Running,
    Cancelled,
    Completed,
    Failed
};

[[nodiscard]] std::string_view streamingStatusName(StreamingStatus status) noexcept;

struct StreamingConfig {
    double sampleRate = 48000.0;
    size_t frameLength = 1024;   ///< Samples per tick; must match the ring buffer
    bool realtimePacing = true;  ///< false: produce frames back to back
    uint64_t maxFrames = 0;      ///< 0 = until cancelled
};

class StreamingProducer {
public:
    /// @param ring Destination buffer (must outlive the producer)
    /// @param backend Evaluation backend (must outlive the producer)
    /// @param hub Receives FrameReady; may be null
    /// @param token External cancellation, observed with cancel()
    /// @throws SampleRateError for a non-positive sample rate
    /// @throws InvalidConfigurationError if frameLength is zero or differs from the ring's
    /// @throws InvalidParameterError, UnsupportedLawError from law validation
    StreamingProducer(MathematicalLaw law, StreamingConfig config, FrameRingBuffer& ring,
                      const ComputeBackend& backend, EventHub* hub = nullptr,
                      CancellationToken token = {});

    /// Cancels and joins the producer thread
    ~StreamingProducer();

    StreamingProducer(const StreamingProducer&) = delete;
    StreamingProducer& operator=(const StreamingProducer&) = delete;

    // -------------------------------------------------------------------------
    // Control
    // -------------------------------------------------------------------------

    /// @brief Launch the producer thread
    /// @throws EngineError if the producer was already started or has finished
    void start();

    /// @brief Request cancellation and wake the producer. Thread-safe, idempotent.
    void cancel() noexcept;

    /// @brief Wait for the producer thread to finish. Thread-safe.
    void join();

    /// @brief Produce one frame synchronously
    /// @return false once the producer reached a terminal status
    /// @note Use either tick() or start(), not both.
    bool tick();

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] StreamingStatus status() const noexcept { return status_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t framesProduced() const noexcept {
        return framesProduced_.load(std::memory_order_acquire);
    }

    /// @brief Seconds between ticks: frameLength / sampleRate
    [[nodiscard]] double tickPeriod() const noexcept;

    [[nodiscard]] const StreamingConfig& config() const noexcept { return config_; }
    [[nodiscard]] const MathematicalLaw& law() const noexcept { return law_; }

private:
    void run();
    [[nodiscard]] bool stopRequested() const noexcept;
    void finish(StreamingStatus status) noexcept;

    MathematicalLaw law_;
    StreamingConfig config_;
    FrameRingBuffer& ring_;
    const ComputeBackend& backend_;
    EventHub* hub_;
    CancellationToken externalToken_;
    CancellationSource stopSource_;

    std::vector<double> times_;
    std::vector<float> samples_;

    std::atomic<StreamingStatus> status_{StreamingStatus::Idle};
    std::atomic<uint64_t> framesProduced_{0};

    std::mutex wakeMutex_;
    std::condition_variable wake_;

    std::atomic<bool> threadStarted_{false};
    std::mutex threadMutex_;  ///< Guards thread_
    std::thread thread_;
};

}  // namespace DSP
}  // namespace Oscilla
