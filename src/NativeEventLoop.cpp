#include <iostream>
#include <thread>
#include "NativeEventLoop.hpp"

NativeEventLoop::NativeEventLoop(std::chrono::milliseconds frame_interval)
    : frame_interval_(frame_interval), inbox_(std::make_shared<Inbox>()) {}

void NativeEventLoop::request_frame(std::function<void()> callback) {
    frames_.push_back(std::move(callback));
}

void NativeEventLoop::quit() {
    std::lock_guard<std::mutex> lock(inbox_->mutex);
    inbox_->quit = true;
    inbox_->wake.notify_all();
}

void NativeEventLoop::run(LineHandler on_line) {
    if (!reader_started_) {
        reader_started_ = true;
        // Detached: std::getline cannot be interrupted, and the process exits
        // with the loop anyway.
        std::thread(&NativeEventLoop::read_input, inbox_).detach();
    }

    auto next_frame = std::chrono::steady_clock::now() + frame_interval_;
    for (;;) {
        std::deque<std::string> lines;
        {
            std::unique_lock<std::mutex> lock(inbox_->mutex);
            // Once input is closed, keep running only while frames are pending
            // so a piped "play" still plays to the end.
            auto ready = [this]() {
                return inbox_->quit || !inbox_->lines.empty() || (inbox_->input_closed && frames_.empty());
            };
            if (frames_.empty()) {
                inbox_->wake.wait(lock, ready);
            } else {
                inbox_->wake.wait_until(lock, next_frame, ready);
            }
            if (inbox_->quit) {
                return;
            }
            lines.swap(inbox_->lines);
            if (lines.empty() && inbox_->input_closed && frames_.empty()) {
                std::cout << std::endl;
                return;
            }
        }

        for (const std::string& line : lines) {
            on_line(line);
        }

        const auto now = std::chrono::steady_clock::now();
        if (!frames_.empty() && now >= next_frame) {
            // Callbacks may request the next frame; those run next time round.
            std::vector<std::function<void()>> due;
            due.swap(frames_);
            for (auto& frame : due) {
                frame();
            }
            next_frame = now + frame_interval_;
        } else if (frames_.empty()) {
            next_frame = now + frame_interval_;
        }
    }
}

void NativeEventLoop::read_input(std::shared_ptr<Inbox> inbox) {
    std::string line;
    while (std::getline(std::cin, line)) {
        std::lock_guard<std::mutex> lock(inbox->mutex);
        inbox->lines.push_back(line);
        inbox->wake.notify_all();
    }
    std::lock_guard<std::mutex> lock(inbox->mutex);
    inbox->input_closed = true;
    inbox->wake.notify_all();
}
