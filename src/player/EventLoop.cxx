#include "player/EventLoop.hxx"

#include <algorithm>
#include <chrono>
#include <vector>

namespace player {

static double steadyClockMs() {
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

EventLoop::EventLoop() : clock_(steadyClockMs) {}

EventLoop::EventLoop(Clock clock) : clock_(clock ? std::move(clock) : Clock(steadyClockMs)) {}

TaskId EventLoop::post(Task task) {
    TaskId id = nextId_++;
    tasks_.emplace_back(id, std::move(task));
    return id;
}

TaskId EventLoop::postDelayed(Task task, double delayMs) {
    TaskId id = nextId_++;
    timers_.emplace(std::make_pair(now() + std::max(0.0, delayMs), id), std::move(task));
    return id;
}

TaskId EventLoop::requestFrame(Task task) {
    TaskId id = nextId_++;
    frames_.emplace_back(id, std::move(task));
    return id;
}

bool EventLoop::cancel(TaskId id) {
    auto byId = [id](const std::pair<TaskId, Task> &t) { return t.first == id; };

    auto t = std::find_if(tasks_.begin(), tasks_.end(), byId);
    if (t != tasks_.end()) {
        tasks_.erase(t);
        return true;
    }
    auto f = std::find_if(frames_.begin(), frames_.end(), byId);
    if (f != frames_.end()) {
        frames_.erase(f);
        return true;
    }
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->first.second == id) {
            timers_.erase(it);
            return true;
        }
    }
    return false;
}

std::size_t EventLoop::runPending() {
    std::size_t ran = 0;

    // Tasks posted while draining run on the next call.
    std::size_t n = tasks_.size();
    while (n-- > 0 && !tasks_.empty()) {
        Task task = std::move(tasks_.front().second);
        tasks_.pop_front();
        task();
        ++ran;
    }

    // Timers due now; collected first so new zero-delay timers wait a turn.
    const double t = now();
    std::vector<TaskId> due;
    for (const auto &entry : timers_) {
        if (entry.first.first > t) break;
        due.push_back(entry.first.second);
    }
    for (TaskId id : due) {
        auto it = std::find_if(timers_.begin(), timers_.end(),
                               [id](const std::pair<const std::pair<double, TaskId>, Task> &e) {
                                   return e.first.second == id;
                               });
        if (it == timers_.end()) continue; // cancelled by an earlier timer
        Task task = std::move(it->second);
        timers_.erase(it);
        task();
        ++ran;
    }
    return ran;
}

std::size_t EventLoop::runFrame() {
    std::deque<std::pair<TaskId, Task>> frame;
    frame.swap(frames_);

    std::size_t ran = 0;
    while (!frame.empty()) {
        Task task = std::move(frame.front().second);
        frame.pop_front();
        task();
        ++ran;
    }
    return ran;
}

double EventLoop::timeUntilNextTimer() const {
    if (timers_.empty()) return -1.0;
    return std::max(0.0, timers_.begin()->first.first - now());
}

} // namespace player
