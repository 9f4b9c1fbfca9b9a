#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ProgressLoop.hpp"

// Single-threaded cooperative loop for the terminal player. Lines typed on
// stdin and animation frames are both dispatched on the thread that calls
// run(). A helper thread only blocks on std::getline and queues what it reads.
class NativeEventLoop final : public FrameScheduler {
public:
    using LineHandler = std::function<void(const std::string& line)>;

    explicit NativeEventLoop(std::chrono::milliseconds frame_interval = std::chrono::milliseconds(16));

    NativeEventLoop(const NativeEventLoop&) = delete;
    NativeEventLoop& operator=(const NativeEventLoop&) = delete;

    void request_frame(std::function<void()> callback) override;

    // Dispatches input and frames until quit() or end of input.
    void run(LineHandler on_line);
    void quit();

private:
    // Shared with the reader thread, which may outlive the loop while it is
    // still blocked in std::getline.
    struct Inbox {
        std::mutex mutex;
        std::condition_variable wake;
        std::deque<std::string> lines;
        bool input_closed{false};
        bool quit{false};
    };

    static void read_input(std::shared_ptr<Inbox> inbox);

    const std::chrono::milliseconds frame_interval_;
    std::shared_ptr<Inbox> inbox_;
    bool reader_started_{false};

    // Owned by the loop thread only.
    std::vector<std::function<void()>> frames_;
};
