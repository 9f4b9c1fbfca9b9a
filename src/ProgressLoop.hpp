#pragma once

#include <functional>
#include <memory>

// Schedules a callback for the next display refresh on the single UI thread
// (requestAnimationFrame in the browser, the terminal event loop natively).
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;
    virtual void request_frame(std::function<void()> callback) = 0;
};

// Per-frame polling task. Each tick runs `on_frame`, which pushes the current
// position to the UI and returns whether playback continues; the loop
// reschedules itself only while it does. start() is idempotent, so calling
// it from every play() never stacks a second pending tick.
class ProgressLoop {
public:
    ProgressLoop(FrameScheduler& scheduler, std::function<bool()> on_frame);
    ~ProgressLoop();

    ProgressLoop(const ProgressLoop&) = delete;
    ProgressLoop& operator=(const ProgressLoop&) = delete;

    void start();
    bool pending() const { return pending_; }

private:
    void tick();

    FrameScheduler& scheduler_;
    std::function<bool()> on_frame_;
    bool pending_{false};
    // Scheduled callbacks hold a weak reference so a frame delivered after
    // destruction does nothing.
    std::shared_ptr<ProgressLoop*> self_;
};
