// ==============================================================================
// Layer 3: System Component - Persistence
// ==============================================================================
// SignalRepository is the storage contract for signals and analysis
// sessions. InMemorySignalRepository implements it with a switchable outage
// for tests and offline use.
//
// PersistenceAdapter subscribes to SignalReady and AnalysisComplete and
// stores every record it sees. While the repository is unavailable it logs a
// warning and keeps records pending, in arrival order; flushPending() (or the
// next event) retries them. The pending queue is bounded: when it is full the
// oldest record is dropped with a warning.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/analysis_types.h>
#include <oscilla/dsp/core/signal_data.h>
#include <oscilla/dsp/systems/event_hub.h>

#include <atomic>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace Oscilla {
namespace DSP {

// =============================================================================
// SignalRepository
// =============================================================================

class SignalRepository {
public:
    virtual ~SignalRepository() = default;

    /// @return Identifier the record was stored under
    /// @throws StorageUnavailableError
    virtual std::string save(const SignalData& signal) = 0;

    /// @return Identifier the record was stored under
    /// @throws StorageUnavailableError
    virtual std::string save(const AnalysisSession& session) = 0;

    /// @throws StorageUnavailableError, RecordNotFoundError
    [[nodiscard]] virtual std::shared_ptr<const SignalData> loadSignal(const std::string& id) const = 0;

    /// @throws StorageUnavailableError, RecordNotFoundError
    [[nodiscard]] virtual std::shared_ptr<const AnalysisSession> loadSession(const std::string& id) const = 0;
};

// =============================================================================
// InMemorySignalRepository
// =============================================================================

class InMemorySignalRepository final : public SignalRepository {
public:
    std::string save(const SignalData& signal) override;
    std::string save(const AnalysisSession& session) override;
    [[nodiscard]] std::shared_ptr<const SignalData> loadSignal(const std::string& id) const override;
    [[nodiscard]] std::shared_ptr<const AnalysisSession> loadSession(const std::string& id) const override;

    /// @brief Simulate an outage (false) or recovery (true)
    void setAvailable(bool available) noexcept { available_.store(available, std::memory_order_release); }
    [[nodiscard]] bool isAvailable() const noexcept { return available_.load(std::memory_order_acquire); }

    [[nodiscard]] size_t signalCount() const;
    [[nodiscard]] size_t sessionCount() const;

private:
    void requireAvailable() const;

    std::atomic<bool> available_{true};
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const SignalData>> signals_;
    std::map<std::string, std::shared_ptr<const AnalysisSession>> sessions_;
};

// =============================================================================
// PersistenceAdapter
// =============================================================================

class PersistenceAdapter {
public:
    /// Default bound on records kept during an outage
    static constexpr size_t kDefaultMaxPending = 1024;

    /// @brief Subscribe to the hub; both must outlive the adapter
    /// @throws InvalidConfigurationError if maxPending is 0
    PersistenceAdapter(EventHub& hub, SignalRepository& repository,
                       size_t maxPending = kDefaultMaxPending);

    /// Unsubscribes from the hub
    ~PersistenceAdapter();

    PersistenceAdapter(const PersistenceAdapter&) = delete;
    PersistenceAdapter& operator=(const PersistenceAdapter&) = delete;

    /// @brief Retry pending records in arrival order, stopping at the first outage
    /// @return Number of records stored by this call
    size_t flushPending();

    [[nodiscard]] size_t pendingCount() const;
    [[nodiscard]] size_t storedCount() const noexcept { return stored_.load(std::memory_order_relaxed); }

    /// Records discarded because the pending queue was full
    [[nodiscard]] size_t droppedCount() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t maxPending() const noexcept { return maxPending_; }

private:
    using Record = std::variant<std::shared_ptr<const SignalData>, std::shared_ptr<const AnalysisSession>>;

    void accept(Record record);
    size_t flushLocked();

    EventHub& hub_;
    SignalRepository& repository_;
    SubscriptionId signalSubscription_ = 0;
    SubscriptionId sessionSubscription_ = 0;
    size_t maxPending_;

    mutable std::mutex mutex_;
    std::deque<Record> pending_;
    std::atomic<size_t> stored_{0};
    std::atomic<size_t> dropped_{0};
};

}  // namespace DSP
}  // namespace Oscilla
