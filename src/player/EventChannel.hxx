#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace player {

struct LoadResult;

extern const char *const kLoaded;          // player initialized
extern const char *const kModelLoaded;     // asset inserted into the scene
extern const char *const kModelLoadFailed; // asset load failed

struct Event {
    std::string name;
    const LoadResult *result = nullptr; // set for the model events
};

typedef std::uint64_t SubscriptionId;

// Synchronous publish/subscribe keyed by event name.
class EventChannel {
 public:
    typedef std::function<void(const Event &)> Callback;

    SubscriptionId subscribe(const std::string &name, Callback callback);

    // Returns false when `id` is not registered.
    bool unsubscribe(SubscriptionId id);

    // Calls the subscribers of `event.name` in registration order. Changes to the
    // registry made by a callback take effect from the next emit.
    void emit(const Event &event);
    void emit(const std::string &name) { emit(Event{name, nullptr}); }

    std::size_t subscriberCount(const std::string &name) const;

 private:
    std::map<std::string, std::vector<std::pair<SubscriptionId, Callback>>> subscribers_;
    SubscriptionId nextId_ = 1;
};

// Read-only view over an EventChannel: subscribing is allowed, emitting is not.
class EventSubscriber {
 public:
    explicit EventSubscriber(EventChannel &channel) : channel_(&channel) {}

    SubscriptionId subscribe(const std::string &name, EventChannel::Callback callback) {
        return channel_->subscribe(name, std::move(callback));
    }

    bool unsubscribe(SubscriptionId id) { return channel_->unsubscribe(id); }

 private:
    EventChannel *channel_;
};

} // namespace player
