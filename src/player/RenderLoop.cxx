#include "player/RenderLoop.hxx"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace player {

RenderLoop::RenderLoop(EventLoop &loop, Frame frame, double targetFrameRate)
    : loop_(loop), frame_(std::move(frame)), fps_(targetFrameRate) {
    if (!(fps_ > 0.0) || !std::isfinite(fps_)) {
        throw std::invalid_argument("RenderLoop: frame rate must be positive");
    }
}

RenderLoop::~RenderLoop() {
    stop();
}

void RenderLoop::setTargetFrameRate(double fps) {
    if (!(fps > 0.0) || !std::isfinite(fps)) {
        throw std::invalid_argument("RenderLoop: frame rate must be positive");
    }
    fps_ = fps;
}

void RenderLoop::start() {
    if (state_ == State::Running) return;
    state_ = State::Running;
    tick(generation_);
}

void RenderLoop::stop() {
    if (state_ != State::Running) return;
    state_ = State::Stopped;
    ++generation_;

    if (pendingFrame_) loop_.cancel(pendingFrame_);
    if (pendingTimer_) loop_.cancel(pendingTimer_);
    pendingFrame_ = 0;
    pendingTimer_ = 0;
}

void RenderLoop::tick(std::uint64_t generation) {
    if (state_ != State::Running || generation != generation_) return;

    // Set next frame execution
    pendingFrame_ = loop_.requestFrame([this, generation]() {
        pendingFrame_ = 0;
        if (state_ != State::Running || generation != generation_) return;
        pendingTimer_ = loop_.postDelayed([this, generation]() {
            pendingTimer_ = 0;
            tick(generation);
        }, frameInterval());
    });

    ++frames_;
    if (frame_) frame_();
}

} // namespace player
