#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <utility>

namespace player {

typedef std::uint64_t TaskId;

// Single-threaded callback queue: immediate tasks, timers and per-frame
// callbacks. Nothing runs until the owner drives runPending()/runFrame().
class EventLoop {
 public:
    typedef std::function<void()> Task;
    typedef std::function<double()> Clock; // milliseconds, monotonic

    EventLoop();
    explicit EventLoop(Clock clock);

    double now() const { return clock_(); }

    TaskId post(Task task);
    TaskId postDelayed(Task task, double delayMs);
    TaskId requestFrame(Task task);

    // Drops a queued task. Returns false if it already ran or was never queued.
    bool cancel(TaskId id);

    // Runs posted tasks and expired timers. Work queued by those tasks waits
    // for the next call. Returns the number of tasks run.
    std::size_t runPending();

    // Runs the frame callbacks requested before this call.
    std::size_t runFrame();

    bool hasPending() const { return !tasks_.empty() || !timers_.empty() || !frames_.empty(); }
    bool hasImmediate() const { return !tasks_.empty(); }
    std::size_t timerCount() const { return timers_.size(); }
    std::size_t frameRequestCount() const { return frames_.size(); }

    // Milliseconds until the earliest timer fires (0 if overdue); negative when no timer is queued.
    double timeUntilNextTimer() const;

 private:
    Clock clock_;
    TaskId nextId_ = 1;
    std::deque<std::pair<TaskId, Task>> tasks_;
    std::deque<std::pair<TaskId, Task>> frames_;
    // (deadline, id) keeps timers with equal deadlines in scheduling order
    std::map<std::pair<double, TaskId>, Task> timers_;
};

} // namespace player
