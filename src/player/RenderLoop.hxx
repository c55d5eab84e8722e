#pragma once

#include <cstdint>
#include <functional>

#include "player/EventLoop.hxx"

namespace player {

// Fixed-rate frame driver. Each tick asks the event loop for the next frame
// and, inside that frame callback, waits 1000 / fps ms before ticking again;
// then it runs the frame body. The result follows display sync at roughly
// the target rate.
class RenderLoop {
 public:
    enum class State { Idle, Running, Stopped };

    typedef std::function<void()> Frame;

    RenderLoop(EventLoop &loop, Frame frame, double targetFrameRate);
    ~RenderLoop();

    RenderLoop(const RenderLoop &) = delete;
    RenderLoop &operator=(const RenderLoop &) = delete;

    // Idle/Stopped -> Running and render the first frame now. No-op while running.
    void start();

    // Running -> Stopped; pending frame requests and timers are dropped.
    void stop();

    State state() const { return state_; }
    bool running() const { return state_ == State::Running; }

    double targetFrameRate() const { return fps_; }
    void setTargetFrameRate(double fps);

    double frameInterval() const { return 1000.0 / fps_; }

    std::uint64_t frameCount() const { return frames_; }

 private:
    EventLoop &loop_;
    Frame frame_;
    double fps_;
    State state_ = State::Idle;
    std::uint64_t frames_ = 0;

    // Bumped by stop(); callbacks from an older run see a stale generation and bail out.
    std::uint64_t generation_ = 0;
    TaskId pendingFrame_ = 0;
    TaskId pendingTimer_ = 0;

    void tick(std::uint64_t generation);
};

} // namespace player
