#pragma once

#include <memory>

#include "ClockModel.hpp"
#include "EffectsGraphController.hpp"
#include "PlayerTypes.hpp"
#include "RenderSubsystem.hpp"
#include "SampleBuffer.hpp"

// Transport for one loaded buffer: Stopped / Playing / Paused.
//
// While Playing no position is stored. The anchor plus the render
// subsystem's device clock is the only source of truth, and every transition
// that changes velocity (play, seek, rate change) re-derives the anchor from
// the position observed at that instant. This class is the only writer of
// the anchor and the transport state.
class PlaybackStateMachine {
public:
    static constexpr double kMinRate = 0.5;
    static constexpr double kMaxRate = 1.5;

    PlaybackStateMachine(RenderSubsystem& renderer, EffectsGraphController& effects);
    ~PlaybackStateMachine();

    PlaybackStateMachine(const PlaybackStateMachine&) = delete;
    PlaybackStateMachine& operator=(const PlaybackStateMachine&) = delete;

    // Valid in any state. Drops any live chain and resets to Stopped at 0.
    // A null buffer unloads.
    void load(std::shared_ptr<const SampleBuffer> buffer);

    // From Stopped or Paused. NotReady without a buffer or while the device
    // may not render. A no-op while already Playing.
    Status play();

    // From Playing only; anything else is a no-op.
    void pause();

    // Valid in any state; held position returns to 0.
    void stop();

    // Clamped to [0, duration]. Restarts the chain when Playing.
    Status seek(double target);

    // Clamped to [kMinRate, kMaxRate]. Position stays continuous across the
    // change; only its velocity differs afterwards.
    void set_rate(double new_rate);

    // Plays when not playing, pauses otherwise.
    Status toggle_play_pause();

    // Computed from the anchor while Playing. Reaching the end of the buffer
    // stops the transport and returns exactly duration().
    double current_position();

    TransportState state() const { return state_; }
    bool is_playing() const { return state_ == TransportState::Playing; }
    bool has_buffer() const { return buffer_ != nullptr; }
    double duration() const { return duration_; }
    double rate() const { return rate_; }
    const Anchor& anchor() const { return anchor_; }
    const std::shared_ptr<const SampleBuffer>& buffer() const { return buffer_; }

private:
    // Builds a chain at `offset` and re-anchors there. Leaves the transport
    // untouched and returns false if the chain could not be built.
    bool start_chain(double offset);
    void teardown_chain();
    double clamp_to_duration(double seconds) const;

    RenderSubsystem& renderer_;
    EffectsGraphController& effects_;

    std::shared_ptr<const SampleBuffer> buffer_;
    double duration_{0.0};

    TransportState state_{TransportState::Stopped};
    Anchor anchor_;
    double held_position_{0.0};
    double rate_{1.0};
    ChainHandle chain_{kNoChain};
};
