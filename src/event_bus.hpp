#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace ollie {

using EventHandler = std::function<void(const Event&)>;

// Notification sink for the models:pull-* events. Each PullManager thread
// publishes on its own stack, so handlers run on that pull's thread and
// must lock whatever state they share.
// Handlers may call PullManager::cancel_pull; the flag is seen before the
// pull reads its next chunk.
class EventBus {
public:
    // Subscribe to one pull event tag (event_tags::PullProgress, ...).
    // Returns an ID for unsubscribe().
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Deliver event to every handler of its tag, in registration order.
    // Runs on the caller's thread with the lock released, so a handler may
    // unsubscribe itself or cancel a pull. A handler that throws is
    // logged and skipped: publish() never throws into the pull loop.
    void publish(const Event& event);

    // Drop every subscription (all tags).
    void clear();

    // Handlers currently registered for tag.
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// subscribe<PullProgressEvent>(bus, [](const PullProgressEvent& ev) {...}):
// the tag comes from E::TAG, so the downcast is always to the right type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace ollie
