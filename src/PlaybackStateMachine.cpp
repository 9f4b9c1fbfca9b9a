#include <algorithm>
#include <iostream>
#include "PlaybackStateMachine.hpp"

PlaybackStateMachine::PlaybackStateMachine(RenderSubsystem& renderer, EffectsGraphController& effects)
    : renderer_(renderer), effects_(effects) {}

PlaybackStateMachine::~PlaybackStateMachine() {
    teardown_chain();
}

void PlaybackStateMachine::load(std::shared_ptr<const SampleBuffer> buffer) {
    teardown_chain();
    buffer_ = std::move(buffer);
    duration_ = buffer_ ? buffer_->duration() : 0.0;
    held_position_ = 0.0;
    anchor_ = Anchor{};
    state_ = TransportState::Stopped;
}

Status PlaybackStateMachine::play() {
    if (state_ == TransportState::Playing) {
        return Status::Ok;
    }
    if (!buffer_) {
        return Status::NotReady;
    }
    if (!renderer_.rendering_permitted()) {
        std::cerr << "Player: audio output is not unlocked yet." << std::endl;
        return Status::NotReady;
    }
    if (!start_chain(held_position_)) {
        return Status::NotReady;
    }
    state_ = TransportState::Playing;
    return Status::Ok;
}

void PlaybackStateMachine::pause() {
    if (state_ != TransportState::Playing) {
        return;
    }
    // The only place a paused position is derived from the clock.
    const double paused_at = clamp_to_duration(position(anchor_, renderer_.now()));
    teardown_chain();
    held_position_ = paused_at;
    state_ = TransportState::Paused;
}

void PlaybackStateMachine::stop() {
    teardown_chain();
    held_position_ = 0.0;
    state_ = TransportState::Stopped;
}

Status PlaybackStateMachine::seek(double target) {
    if (!buffer_) {
        return Status::NotReady;
    }
    const double clamped = clamp_to_duration(target);
    if (state_ != TransportState::Playing) {
        held_position_ = clamped;
        return Status::Ok;
    }

    teardown_chain();
    if (!start_chain(clamped)) {
        // Keep the requested position so a later play() resumes there.
        held_position_ = clamped;
        state_ = TransportState::Paused;
        return Status::NotReady;
    }
    return Status::Ok;
}

void PlaybackStateMachine::set_rate(double new_rate) {
    const double clamped = std::clamp(new_rate, kMinRate, kMaxRate);
    if (state_ == TransportState::Playing) {
        // Position observed under the old rate at the switch becomes the new
        // anchor, so the playhead does not jump when only its velocity changes.
        const double switched = renderer_.set_rate(chain_, clamped);
        const double current = clamp_to_duration(position(anchor_, switched));
        anchor_ = Anchor{switched, current, clamped};
    }
    rate_ = clamped;
}

Status PlaybackStateMachine::toggle_play_pause() {
    if (state_ == TransportState::Playing) {
        pause();
        return Status::Ok;
    }
    return play();
}

double PlaybackStateMachine::current_position() {
    if (state_ != TransportState::Playing) {
        return held_position_;
    }
    const double computed = position(anchor_, renderer_.now());
    if (computed >= duration_) {
        stop();
        return duration_;
    }
    return std::max(computed, 0.0);
}

bool PlaybackStateMachine::start_chain(double offset) {
    const BuiltChain built = renderer_.build_chain(buffer_, offset, rate_);
    if (built.handle == kNoChain) {
        std::cerr << "Player: could not build a render chain at " << offset << " s." << std::endl;
        return false;
    }
    chain_ = built.handle;
    anchor_ = Anchor{built.device_time, offset, rate_};
    effects_.attach(chain_);
    return true;
}

void PlaybackStateMachine::teardown_chain() {
    if (chain_ == kNoChain) {
        return;
    }
    renderer_.teardown(chain_);
    effects_.detach();
    chain_ = kNoChain;
}

double PlaybackStateMachine::clamp_to_duration(double seconds) const {
    return std::clamp(seconds, 0.0, duration_);
}
