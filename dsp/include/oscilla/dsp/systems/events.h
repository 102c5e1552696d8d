// ==============================================================================
// Layer 3: System Component - Engine Events
// ==============================================================================
// Event payloads carried by the EventHub. Each type names its EventKind in a
// static kKind member, which is how the hub routes it to subscribers.
// Payloads share immutable data through shared_ptr<const T>.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/analysis_types.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/primitives/frame_ring_buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace Oscilla {
namespace DSP {

enum class EventKind : uint8_t {
    SignalReady = 0,
    FrameReady,
    AnalysisComplete,
    DegradedToCpu
};

inline constexpr size_t kNumEventKinds = 4;

[[nodiscard]] constexpr std::string_view eventKindName(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::SignalReady:      return "signal_ready";
        case EventKind::FrameReady:       return "frame_ready";
        case EventKind::AnalysisComplete: return "analysis_complete";
        case EventKind::DegradedToCpu:    return "degraded_to_cpu";
    }
    return "unknown";
}

/// @brief A batch signal finished generating
struct SignalReady {
    static constexpr EventKind kKind = EventKind::SignalReady;
    std::shared_ptr<const SignalData> signal;
};

/// @brief A streaming producer wrote one frame to its ring buffer
struct FrameReady {
    static constexpr EventKind kKind = EventKind::FrameReady;
    std::string lawId;        ///< Law driving the producer
    RingBufferFrame frame;    ///< index = producer frame number
};

/// @brief An analysis session reached a terminal status
struct AnalysisComplete {
    static constexpr EventKind kKind = EventKind::AnalysisComplete;
    std::shared_ptr<const AnalysisSession> session;
};

/// @brief The compute selector fell back to the CPU backend
struct DegradedToCpu {
    static constexpr EventKind kKind = EventKind::DegradedToCpu;
    std::string reason;
};

}  // namespace DSP
}  // namespace Oscilla
