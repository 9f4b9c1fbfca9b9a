#include "ProgressLoop.hpp"

ProgressLoop::ProgressLoop(FrameScheduler& scheduler, std::function<bool()> on_frame)
    : scheduler_(scheduler), on_frame_(std::move(on_frame)), self_(std::make_shared<ProgressLoop*>(this)) {}

ProgressLoop::~ProgressLoop() {
    self_.reset();
}

void ProgressLoop::start() {
    if (pending_) {
        return;
    }
    pending_ = true;
    std::weak_ptr<ProgressLoop*> weak = self_;
    scheduler_.request_frame([weak]() {
        if (auto self = weak.lock()) {
            (*self)->tick();
        }
    });
}

void ProgressLoop::tick() {
    pending_ = false;
    if (on_frame_ && on_frame_()) {
        start();
    }
}
