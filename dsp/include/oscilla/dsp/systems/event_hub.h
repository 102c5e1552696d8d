// ==============================================================================
// Layer 3: System Component - Event Hub
// ==============================================================================
// Typed publish/subscribe broker connecting producers (generator, analysis
// service, compute selector) to consumers (display, persistence).
//
// Delivery rules:
// - Synchronous, on the publishing thread, in registration order.
// - A subscriber registered after a publish receives nothing retroactively.
// - A throwing subscriber is recorded as a DeliveryFailure; delivery to the
//   remaining subscribers continues.
// - The subscriber list is copied under the lock and invoked outside it, so
//   handlers may subscribe, unsubscribe or publish re-entrantly.
//
// There is no global hub; every component receives the hub it publishes to.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/systems/events.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Oscilla {
namespace DSP {

using SubscriptionId = uint64_t;

/// @brief One subscriber that threw during delivery
struct DeliveryFailure {
    SubscriptionId subscription = 0;
    std::string subscriber;
    std::string message;
};

/// @brief Raised by DeliveryReport::throwIfFailed()
class DeliveryError : public EngineError {
public:
    explicit DeliveryError(std::vector<DeliveryFailure> failures);

    [[nodiscard]] const std::vector<DeliveryFailure>& failures() const noexcept { return failures_; }

private:
    std::vector<DeliveryFailure> failures_;
};

/// @brief Outcome of one publish()
struct DeliveryReport {
    EventKind kind = EventKind::SignalReady;
    size_t delivered = 0;                  ///< Handlers that returned normally
    std::vector<DeliveryFailure> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }

    /// @throws DeliveryError listing every failure, if any
    void throwIfFailed() const;
};

class EventHub {
public:
    EventHub() = default;
    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    /// @brief Register a handler for one event type
    /// @param name Subscriber name used in failure reports and logs
    template <typename Event>
    SubscriptionId subscribe(std::string name, std::function<void(const Event&)> handler) {
        return addSubscriber(Event::kKind, std::move(name),
                             [h = std::move(handler)](const void* event) {
                                 h(*static_cast<const Event*>(event));
                             });
    }

    /// @brief Remove a subscription
    /// @return false if the id is unknown (already removed)
    bool unsubscribe(SubscriptionId id);

    /// @brief Deliver an event to every current subscriber of its kind
    template <typename Event>
    DeliveryReport publish(const Event& event) {
        return deliver(Event::kKind, &event);
    }

    [[nodiscard]] size_t subscriberCount(EventKind kind) const;
    [[nodiscard]] size_t subscriberCount() const;

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscriber {
        SubscriptionId id = 0;
        EventKind kind = EventKind::SignalReady;
        std::string name;
        ErasedHandler handler;
    };

    SubscriptionId addSubscriber(EventKind kind, std::string name, ErasedHandler handler);
    DeliveryReport deliver(EventKind kind, const void* event);

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const Subscriber>> subscribers_;
    SubscriptionId nextId_ = 1;
};

}  // namespace DSP
}  // namespace Oscilla
