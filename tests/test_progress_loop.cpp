#include <functional>
#include <iostream>
#include <memory>
#include <vector>
#include "FakeRenderSubsystem.hpp"
#include "ProgressLoop.hpp"

namespace {

// Queues frame callbacks until the test delivers them.
class ManualScheduler final : public FrameScheduler {
public:
    void request_frame(std::function<void()> callback) override { queued.push_back(std::move(callback)); }

    // Runs the callbacks queued before this call.
    void run_frame() {
        std::vector<std::function<void()>> due;
        due.swap(queued);
        for (auto& callback : due) {
            callback();
        }
    }

    std::vector<std::function<void()>> queued;
};

} // namespace

int main() {
    bool ok = true;
    ManualScheduler scheduler;
    int ticks = 0;
    int frames_left = 3;

    {
        ProgressLoop loop(scheduler, [&]() {
            ++ticks;
            return --frames_left > 0;
        });

        loop.start();
        loop.start();
        loop.start();
        ok &= expect(scheduler.queued.size() == 1, "Repeated start() must leave a single pending tick.");
        ok &= expect(loop.pending(), "start() marks a tick as pending.");

        scheduler.run_frame();
        ok &= expect(ticks == 1 && scheduler.queued.size() == 1, "A continuing tick reschedules itself once.");
        loop.start();
        ok &= expect(scheduler.queued.size() == 1, "start() during playback does not stack ticks.");

        scheduler.run_frame();
        scheduler.run_frame();
        ok &= expect(ticks == 3, "Each frame runs exactly one tick.");
        ok &= expect(scheduler.queued.empty() && !loop.pending(), "The loop stops once the frame reports no playback.");

        frames_left = 1;
        loop.start();
        ok &= expect(scheduler.queued.size() == 1, "The loop can be restarted after it terminated.");
    }

    // The loop above is gone; its queued frame must do nothing.
    scheduler.run_frame();
    ok &= expect(ticks == 3, "A frame delivered after destruction must not tick.");

    if (!ok) {
        return 1;
    }
    std::cout << "[Test] Progress loop checks passed." << std::endl;
    return 0;
}
