// ==============================================================================
// Layer 1: DSP Primitive - Real-Time Frame Ring Buffer
// ==============================================================================
// Fixed-capacity, overwrite-on-full buffer of sample frames decoupling a
// producer thread from display readers.
//
// - Single writer, any number of readers.
// - write() never blocks and never fails; when full it overwrites the oldest
//   frame.
// - readLatest() returns a snapshot of the most recent frames in write order.
//   Each slot carries a sequence counter (seqlock): a reader that races with
//   the writer drops the overwritten frame instead of returning a torn one.
//   No lock is ever taken.
//
// All slot storage is allocated in the constructor.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/engine_errors.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Oscilla {
namespace DSP {

/// @brief Snapshot of one ring buffer slot
struct RingBufferFrame {
    uint64_t index = 0;          ///< Position in the buffer's write sequence
    double timestamp = 0.0;      ///< Seconds, as supplied by the writer
    std::vector<float> samples;  ///< frameLength() samples
};

class FrameRingBuffer {
public:
    /// @throws InvalidConfigurationError if capacity or frameLength is zero
    FrameRingBuffer(size_t capacity, size_t frameLength)
        : capacity_(capacity), frameLength_(frameLength) {
        if (capacity == 0) {
            throw InvalidConfigurationError("ring_buffer_capacity must be at least 1");
        }
        if (frameLength == 0) {
            throw InvalidConfigurationError("frame_length must be at least 1");
        }
        slots_ = std::make_unique<Slot[]>(capacity);
        for (size_t i = 0; i < capacity; ++i) {
            slots_[i].samples = std::make_unique<std::atomic<float>[]>(frameLength);
            for (size_t n = 0; n < frameLength; ++n) {
                slots_[i].samples[n].store(0.0f, std::memory_order_relaxed);
            }
        }
    }

    FrameRingBuffer(const FrameRingBuffer&) = delete;
    FrameRingBuffer& operator=(const FrameRingBuffer&) = delete;

    // -------------------------------------------------------------------------
    // Writer (single thread)
    // -------------------------------------------------------------------------

    /// @brief Store one frame, overwriting the oldest when full
    /// @param samples Up to frameLength() samples; a shorter frame is zero-padded
    /// @note Real-time safe: no allocation, no locks
    void write(double timestamp, const float* samples, size_t count) noexcept {
        const uint64_t index = written_.load(std::memory_order_relaxed);
        Slot& slot = slots_[index % capacity_];

        const uint64_t seq = slot.sequence.load(std::memory_order_relaxed);
        slot.sequence.store(seq + 1, std::memory_order_relaxed);  // odd: write in progress
        std::atomic_thread_fence(std::memory_order_release);

        slot.frameIndex.store(index, std::memory_order_relaxed);
        slot.timestamp.store(timestamp, std::memory_order_relaxed);
        const size_t n = (samples != nullptr) ? std::min(count, frameLength_) : 0;
        for (size_t i = 0; i < n; ++i) {
            slot.samples[i].store(samples[i], std::memory_order_relaxed);
        }
        for (size_t i = n; i < frameLength_; ++i) {
            slot.samples[i].store(0.0f, std::memory_order_relaxed);
        }

        slot.sequence.store(seq + 2, std::memory_order_release);
        written_.store(index + 1, std::memory_order_release);
    }

    /// @brief Forget every stored frame (writer thread only)
    void clear() noexcept {
        floor_.store(written_.load(std::memory_order_relaxed), std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // Readers (any thread)
    // -------------------------------------------------------------------------

    /// @brief Up to min(k, capacity, stored) most recent frames, oldest first
    /// @note Allocates the returned frames. Frames overwritten while the read
    ///       is in progress are dropped from the front of the snapshot.
    [[nodiscard]] std::vector<RingBufferFrame> readLatest(size_t k) const {
        const uint64_t total = written_.load(std::memory_order_acquire);
        const uint64_t stored = total - std::min(total, floor_.load(std::memory_order_acquire));
        const size_t wanted = static_cast<size_t>(
            std::min<uint64_t>({static_cast<uint64_t>(k), static_cast<uint64_t>(capacity_), stored}));

        std::vector<RingBufferFrame> frames;
        frames.reserve(wanted);

        // Newest to oldest; stop at the first frame the writer has reclaimed
        for (size_t j = 0; j < wanted; ++j) {
            const uint64_t expected = total - 1 - j;
            RingBufferFrame frame;
            if (!readSlot(expected, frame)) break;
            frames.push_back(std::move(frame));
        }

        std::reverse(frames.begin(), frames.end());
        return frames;
    }

    /// @brief Most recent frame, if any
    [[nodiscard]] bool readNewest(RingBufferFrame& out) const {
        auto frames = readLatest(1);
        if (frames.empty()) return false;
        out = std::move(frames.front());
        return true;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Frames written since construction or the last clear()
    [[nodiscard]] uint64_t totalWritten() const noexcept {
        const uint64_t total = written_.load(std::memory_order_acquire);
        return total - std::min(total, floor_.load(std::memory_order_acquire));
    }

    /// @brief Frames currently held: min(totalWritten(), capacity())
    [[nodiscard]] size_t size() const noexcept {
        return static_cast<size_t>(std::min<uint64_t>(totalWritten(), capacity_));
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t frameLength() const noexcept { return frameLength_; }

private:
    struct Slot {
        std::atomic<uint64_t> sequence{0};    // even = stable, odd = being written
        std::atomic<uint64_t> frameIndex{0};
        std::atomic<double> timestamp{0.0};
        std::unique_ptr<std::atomic<float>[]> samples;
    };

    bool readSlot(uint64_t expected, RingBufferFrame& out) const {
        const Slot& slot = slots_[expected % capacity_];

        const uint64_t before = slot.sequence.load(std::memory_order_acquire);
        if ((before & 1U) != 0) return false;

        out.index = slot.frameIndex.load(std::memory_order_relaxed);
        out.timestamp = slot.timestamp.load(std::memory_order_relaxed);
        out.samples.resize(frameLength_);
        for (size_t i = 0; i < frameLength_; ++i) {
            out.samples[i] = slot.samples[i].load(std::memory_order_relaxed);
        }

        std::atomic_thread_fence(std::memory_order_acquire);
        const uint64_t after = slot.sequence.load(std::memory_order_relaxed);
        return before == after && out.index == expected;
    }

    size_t capacity_;
    size_t frameLength_;
    std::unique_ptr<Slot[]> slots_;
    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> floor_{0};
};

}  // namespace DSP
}  // namespace Oscilla
