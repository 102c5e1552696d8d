// ==============================================================================
// Persistence Implementation
// ==============================================================================

#include "persistence.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>

#include <string>
#include <utility>

namespace Oscilla {
namespace DSP {

// =============================================================================
// InMemorySignalRepository
// =============================================================================

void InMemorySignalRepository::requireAvailable() const {
    if (!isAvailable()) {
        throw StorageUnavailableError("in-memory repository is offline");
    }
}

std::string InMemorySignalRepository::save(const SignalData& signal) {
    requireAvailable();
    auto copy = std::make_shared<const SignalData>(signal);
    std::lock_guard<std::mutex> lock(mutex_);
    signals_[signal.id()] = std::move(copy);
    return signal.id();
}

std::string InMemorySignalRepository::save(const AnalysisSession& session) {
    requireAvailable();
    auto copy = std::make_shared<const AnalysisSession>(session);
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session.id] = std::move(copy);
    return session.id;
}

std::shared_ptr<const SignalData> InMemorySignalRepository::loadSignal(const std::string& id) const {
    requireAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = signals_.find(id);
    if (it == signals_.end()) {
        throw RecordNotFoundError("no signal with id " + id);
    }
    return it->second;
}

std::shared_ptr<const AnalysisSession> InMemorySignalRepository::loadSession(const std::string& id) const {
    requireAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw RecordNotFoundError("no analysis session with id " + id);
    }
    return it->second;
}

size_t InMemorySignalRepository::signalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_.size();
}

size_t InMemorySignalRepository::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// =============================================================================
// PersistenceAdapter
// =============================================================================

PersistenceAdapter::PersistenceAdapter(EventHub& hub, SignalRepository& repository, size_t maxPending)
    : hub_(hub), repository_(repository), maxPending_(maxPending) {
    if (maxPending_ == 0) {
        throw InvalidConfigurationError("persistence adapter needs room for at least one pending record");
    }
    signalSubscription_ = hub_.subscribe<SignalReady>("persistence", [this](const SignalReady& event) {
        if (event.signal) accept(event.signal);
    });
    sessionSubscription_ = hub_.subscribe<AnalysisComplete>("persistence", [this](const AnalysisComplete& event) {
        if (event.session) accept(event.session);
    });
}

PersistenceAdapter::~PersistenceAdapter() {
    hub_.unsubscribe(signalSubscription_);
    hub_.unsubscribe(sessionSubscription_);
    const size_t pending = pendingCount();
    if (pending > 0) {
        Log::get()->warn("persistence adapter destroyed with {} unsaved records", pending);
    }
}

void PersistenceAdapter::accept(Record record) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(record));
    flushLocked();
    while (pending_.size() > maxPending_) {
        pending_.pop_front();
        const size_t dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        Log::get()->warn("pending queue full ({} records), dropped the oldest ({} dropped so far)",
                         maxPending_, dropped);
    }
}

size_t PersistenceAdapter::flushPending() {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushLocked();
}

size_t PersistenceAdapter::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t PersistenceAdapter::flushLocked() {
    size_t stored = 0;
    while (!pending_.empty()) {
        try {
            const std::string id =
                std::visit([this](const auto& item) { return repository_.save(*item); }, pending_.front());
            Log::get()->debug("stored record {}", id);
        } catch (const StorageUnavailableError& e) {
            Log::get()->warn("storage unavailable, {} records pending: {}", pending_.size(), e.what());
            break;
        }
        pending_.pop_front();
        ++stored;
    }
    stored_.fetch_add(stored, std::memory_order_relaxed);
    return stored;
}

}  // namespace DSP
}  // namespace Oscilla
