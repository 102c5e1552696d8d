// ==============================================================================
// Event Hub Implementation
// ==============================================================================

#include "event_hub.h"

#include <oscilla/dsp/core/logging.h>

#include <algorithm>
#include <exception>

namespace Oscilla {
namespace DSP {

namespace {

std::string describeFailures(const std::vector<DeliveryFailure>& failures) {
    std::string text = "event delivery failed for " + std::to_string(failures.size()) + " subscriber(s)";
    for (const auto& failure : failures) {
        text += "; " + failure.subscriber + " (#" + std::to_string(failure.subscription) +
                "): " + failure.message;
    }
    return text;
}

} // namespace

DeliveryError::DeliveryError(std::vector<DeliveryFailure> failures)
    : EngineError(describeFailures(failures)), failures_(std::move(failures)) {}

void DeliveryReport::throwIfFailed() const {
    if (!failures.empty()) {
        throw DeliveryError(failures);
    }
}

SubscriptionId EventHub::addSubscriber(EventKind kind, std::string name, ErasedHandler handler) {
    auto subscriber = std::make_shared<Subscriber>();
    subscriber->kind = kind;
    subscriber->name = std::move(name);
    subscriber->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);
    subscriber->id = nextId_++;
    subscribers_.push_back(subscriber);
    Log::get()->debug("subscriber '{}' (#{}) registered for {}", subscriber->name, subscriber->id,
                      eventKindName(kind));
    return subscriber->id;
}

bool EventHub::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                                 [id](const auto& s) { return s->id == id; });
    if (it == subscribers_.end()) return false;
    subscribers_.erase(it);
    return true;
}

size_t EventHub::subscriberCount(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                             [kind](const auto& s) { return s->kind == kind; }));
}

size_t EventHub::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

DeliveryReport EventHub::deliver(EventKind kind, const void* event) {
    std::vector<std::shared_ptr<const Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& subscriber : subscribers_) {
            if (subscriber->kind == kind) targets.push_back(subscriber);
        }
    }

    DeliveryReport report;
    report.kind = kind;
    for (const auto& subscriber : targets) {
        try {
            subscriber->handler(event);
            ++report.delivered;
        } catch (const std::exception& e) {
            Log::get()->warn("subscriber '{}' failed on {}: {}", subscriber->name, eventKindName(kind),
                             e.what());
            report.failures.push_back({subscriber->id, subscriber->name, e.what()});
        } catch (...) {
            Log::get()->warn("subscriber '{}' failed on {} with a non-standard exception",
                             subscriber->name, eventKindName(kind));
            report.failures.push_back({subscriber->id, subscriber->name, "unknown exception"});
        }
    }
    return report;
}

}  // namespace DSP
}  // namespace Oscilla
