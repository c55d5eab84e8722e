#include "player/EventChannel.hxx"

#include <algorithm>

namespace player {

const char *const kLoaded = "loaded";
const char *const kModelLoaded = "model-loaded";
const char *const kModelLoadFailed = "model-load-failed";

SubscriptionId EventChannel::subscribe(const std::string &name, Callback callback) {
    SubscriptionId id = nextId_++;
    subscribers_[name].emplace_back(id, std::move(callback));
    return id;
}

bool EventChannel::unsubscribe(SubscriptionId id) {
    for (auto &entry : subscribers_) {
        auto &list = entry.second;
        auto it = std::find_if(list.begin(), list.end(),
                               [id](const std::pair<SubscriptionId, Callback> &s) { return s.first == id; });
        if (it != list.end()) {
            list.erase(it);
            return true;
        }
    }
    return false;
}

void EventChannel::emit(const Event &event) {
    auto it = subscribers_.find(event.name);
    if (it == subscribers_.end()) return;

    // Snapshot so callbacks may (un)subscribe safely.
    std::vector<std::pair<SubscriptionId, Callback>> snapshot = it->second;
    for (const auto &s : snapshot) {
        s.second(event);
    }
}

std::size_t EventChannel::subscriberCount(const std::string &name) const {
    auto it = subscribers_.find(name);
    return it == subscribers_.end() ? 0 : it->second.size();
}

} // namespace player
