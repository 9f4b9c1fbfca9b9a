#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Decoder.hpp"
#include "EffectsGraphController.hpp"
#include "PlaybackStateMachine.hpp"
#include "PlayerConfig.hpp"
#include "PlayerTypes.hpp"
#include "ProgressLoop.hpp"
#include "SourceFetcher.hpp"
#include "WaveformRenderer.hpp"

// Everything the UI shows, captured at one instant.
struct PlayerSnapshot {
    TransportState transport{TransportState::Stopped};
    double position{0.0};
    double duration{0.0};
    double rate{1.0};
    double mix{0.0};
    LoadState load_state{LoadState::Idle};
    std::string source_name;
    std::string message;  // Last load error, empty when none.
    bool controls_enabled{false};
};

// Receives UI updates: once per frame while playing and after every input.
class PlayerView {
public:
    virtual ~PlayerView() = default;
    virtual void update(const PlayerSnapshot& snapshot, const WaveformRenderer& waveform) = 0;
};

// Identifies one load request. Completions carrying an older token are ignored.
using LoadToken = std::uint64_t;

// One player instance: owns the loaded buffer, the transport, the effect mix,
// the waveform and the progress loop. All calls happen on the UI thread.
class PlayerSession {
public:
    PlayerSession(RenderSubsystem& renderer, FrameScheduler& scheduler, PlayerView& view,
                  const PlayerConfig& config = {});
    ~PlayerSession();

    PlayerSession(const PlayerSession&) = delete;
    PlayerSession& operator=(const PlayerSession&) = delete;

    // Loading. begin_load() supersedes any load still in flight, stops
    // playback and disables the controls until completion or failure.
    LoadToken begin_load(const std::string& source_name);
    bool complete_load(LoadToken token, std::shared_ptr<const SampleBuffer> buffer);
    bool complete_load(LoadToken token, const DecodeResult& result);
    bool fail_load(LoadToken token, Status status, const std::string& message);

    // Fetches and decodes `source`; completion may be asynchronous.
    LoadToken load_source(const std::string& source, SourceFetcher& fetcher, Decoder& decoder);
    // Decodes bytes already in memory (e.g. a dropped file).
    Status load_bytes(const std::string& source_name, const std::vector<std::uint8_t>& bytes, Decoder& decoder);

    // Input contract.
    Status play();
    void pause();
    Status toggle_play_pause();
    void stop();
    Status seek(double seconds);
    Status scrub(double x, double width);
    void set_rate(double rate);
    void set_mix(double amount);

    // Canvas size for the waveform; recomputes the envelope when the width changes.
    void resize(int width, int height);

    double current_position();
    PlayerSnapshot snapshot();
    // Pushes a snapshot to the view.
    void publish();

    TransportState transport_state() const { return transport_.state(); }
    LoadState load_state() const { return load_state_; }
    bool controls_enabled() const;
    const WaveformRenderer& waveform() const { return waveform_; }
    const PlaybackStateMachine& transport() const { return transport_; }
    const EffectsGraphController& effects() const { return effects_; }
    LoadToken current_load() const { return load_generation_; }

private:
    bool is_current(LoadToken token) const;
    bool on_frame();

    PlayerConfig config_;
    EffectsGraphController effects_;
    PlaybackStateMachine transport_;
    WaveformRenderer waveform_;
    PlayerView& view_;
    ProgressLoop progress_;

    LoadToken load_generation_{0};
    LoadState load_state_{LoadState::Idle};
    std::string source_name_;
    std::string pending_name_;
    std::string message_;

    // Asynchronous fetch completions check this before touching the session.
    std::shared_ptr<PlayerSession*> self_;
};
