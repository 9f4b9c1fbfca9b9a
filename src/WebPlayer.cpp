#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <emscripten.h>
#include <emscripten/html5.h>
#include "EmscriptenFetcher.hpp"
#include "InputAdapters.hpp"
#include "MixerRenderSubsystem.hpp"
#include "PlayerSession.hpp"
#include "WebPlayer.hpp"

namespace {

// requestAnimationFrame-backed scheduler. Callbacks requested during a frame
// run on the next one.
class WebFrameScheduler final : public FrameScheduler {
public:
    void request_frame(std::function<void()> callback) override {
        callbacks_.push_back(std::move(callback));
        if (!scheduled_) {
            scheduled_ = true;
            emscripten_request_animation_frame(&WebFrameScheduler::on_animation_frame, this);
        }
    }

private:
    static EM_BOOL on_animation_frame(double time, void* user_data) {
        (void)time;
        auto* self = static_cast<WebFrameScheduler*>(user_data);
        self->scheduled_ = false;
        std::vector<std::function<void()>> due;
        due.swap(self->callbacks_);
        for (auto& callback : due) {
            callback();
        }
        return EM_FALSE;
    }

    std::vector<std::function<void()>> callbacks_;
    bool scheduled_{false};
};

// Draws onto the page's waveform <canvas> (Module.waveformCanvas).
class HtmlCanvas final : public Canvas {
public:
    HtmlCanvas(int width, int height) : width_(width), height_(height) {}

    int width() const override { return width_; }
    int height() const override { return height_; }

    void clear() override {
        EM_ASM({
            const canvas = Module.waveformCanvas;
            if (!canvas) return;
            const ctx = canvas.getContext('2d');
            ctx.clearRect(0, 0, canvas.width, canvas.height);
            ctx.fillStyle = '#8b5cf6';
        });
    }

    void draw_vertical_line(int x, double y_from, double y_to) override {
        EM_ASM({
            const canvas = Module.waveformCanvas;
            if (!canvas) return;
            canvas.getContext('2d').fillRect($0, $1, 1, Math.max($2 - $1, 1));
        }, x, y_from, y_to);
    }

    void fill_rect(double x, double y, double w, double h) override {
        EM_ASM({
            const canvas = Module.waveformCanvas;
            if (!canvas) return;
            const ctx = canvas.getContext('2d');
            ctx.fillStyle = '#fff';
            ctx.fillRect($0, $1, $2, $3);
            ctx.fillStyle = '#8b5cf6';
        }, x, y, w, h);
    }

private:
    int width_;
    int height_;
};

// Pushes each snapshot to Module.onPlayerUpdate and redraws the waveform.
class WebView final : public PlayerView {
public:
    void update(const PlayerSnapshot& snapshot, const WaveformRenderer& waveform) override {
        HtmlCanvas canvas(waveform.width(), waveform.height());
        waveform.draw(canvas, snapshot.position, snapshot.duration);

        EM_ASM({
            if (!Module.onPlayerUpdate) return;
            Module.onPlayerUpdate({
                transport: ['stopped', 'playing', 'paused'][$0],
                position: $1,
                duration: $2,
                rate: $3,
                mix: $4,
                rateSlider: $9,
                mixSlider: $10,
                loadState: ['idle', 'loading', 'ready', 'error'][$5],
                source: UTF8ToString($6),
                message: UTF8ToString($7),
                controlsEnabled: !!$8,
            });
        }, static_cast<int>(snapshot.transport), snapshot.position, snapshot.duration, snapshot.rate, snapshot.mix,
           static_cast<int>(snapshot.load_state), snapshot.source_name.c_str(), snapshot.message.c_str(),
           snapshot.controls_enabled ? 1 : 0, kRateControl.to_fraction(snapshot.rate),
           kMixControl.to_fraction(snapshot.mix));
    }
};

struct WebPlayer {
    WebPlayer(AudioEngine& engine, const PlayerConfig& config)
        : renderer(engine, config.sample_rate, config.reverb_seconds),
          fetcher(config.fetch_endpoint),
          session(renderer, scheduler, view, config) {}

    MixerRenderSubsystem renderer;
    WebFrameScheduler scheduler;
    WebView view;
    EmscriptenFetcher fetcher;
    PlayerSession session;
};

std::unique_ptr<WebPlayer> g_player;

} // namespace

bool start_web_player(AudioEngine& engine, const PlayerConfig& config) {
    if (g_player) {
        // A pending animation frame still points at the current scheduler.
        std::cout << "C++: player already running." << std::endl;
        return true;
    }
    g_player = std::make_unique<WebPlayer>(engine, config);
    if (!g_player->renderer.start()) {
        std::cerr << "C++: could not attach the mixer to the audio engine." << std::endl;
        g_player.reset();
        return false;
    }
    g_player->session.publish();
    std::cout << "C++: player ready at " << config.sample_rate << " Hz." << std::endl;
    return true;
}

// Entry points for the page. Statuses are returned as the integer value of Status.
extern "C" {

EMSCRIPTEN_KEEPALIVE int player_play() {
    return g_player ? static_cast<int>(g_player->session.play()) : static_cast<int>(Status::NotReady);
}

EMSCRIPTEN_KEEPALIVE void player_pause() {
    if (g_player) g_player->session.pause();
}

EMSCRIPTEN_KEEPALIVE int player_toggle() {
    return g_player ? static_cast<int>(g_player->session.toggle_play_pause()) : static_cast<int>(Status::NotReady);
}

EMSCRIPTEN_KEEPALIVE void player_stop() {
    if (g_player) g_player->session.stop();
}

EMSCRIPTEN_KEEPALIVE int player_seek(double seconds) {
    return g_player ? static_cast<int>(g_player->session.seek(seconds)) : static_cast<int>(Status::NotReady);
}

EMSCRIPTEN_KEEPALIVE int player_scrub(double x, double width) {
    return g_player ? static_cast<int>(g_player->session.scrub(x, width)) : static_cast<int>(Status::NotReady);
}

// Slider positions in [0, 1].
EMSCRIPTEN_KEEPALIVE void player_set_rate(double slider) {
    if (g_player) g_player->session.set_rate(kRateControl.from_fraction(slider));
}

EMSCRIPTEN_KEEPALIVE void player_set_mix(double slider) {
    if (g_player) g_player->session.set_mix(kMixControl.from_fraction(slider));
}

EMSCRIPTEN_KEEPALIVE void player_resize(int width, int height) {
    if (g_player) g_player->session.resize(width, height);
}

// Load tokens travel as doubles so JavaScript numbers hold them exactly.
EMSCRIPTEN_KEEPALIVE double player_begin_load(const char* name) {
    return g_player ? static_cast<double>(g_player->session.begin_load(name ? name : "")) : 0.0;
}

// `samples` is interleaved and owned by the caller.
EMSCRIPTEN_KEEPALIVE int player_complete_load(double token, const float* samples, int num_frames, int num_channels,
                                              double sample_rate) {
    if (!g_player) {
        return 0;
    }
    auto buffer = SampleBuffer::from_interleaved(samples, static_cast<std::size_t>(num_frames > 0 ? num_frames : 0),
                                                 num_channels, sample_rate);
    return g_player->session.complete_load(static_cast<LoadToken>(token), buffer) ? 1 : 0;
}

EMSCRIPTEN_KEEPALIVE int player_fail_load(double token, const char* message) {
    if (!g_player) {
        return 0;
    }
    return g_player->session.fail_load(static_cast<LoadToken>(token), Status::DecodeFailure,
                                       message ? message : "could not decode audio") ? 1 : 0;
}

// Fetches `url` (remote URLs through the transcoding endpoint) and hands the
// encoded bytes to Module.decodeAudioBytes(token, pointer, length), which
// decodes them with the page's AudioContext and answers through
// player_complete_load / player_fail_load.
EMSCRIPTEN_KEEPALIVE double player_load_url(const char* url) {
    if (!g_player) {
        return 0.0;
    }
    const std::string source = url ? url : "";
    const LoadToken token = g_player->session.begin_load(source);
    g_player->fetcher.fetch(source, [token](FetchResult fetched) {
        if (!g_player) {
            return;
        }
        if (!fetched.ok()) {
            g_player->session.fail_load(token, Status::FetchFailure, fetched.message);
            return;
        }
        EM_ASM({
            if (!Module.decodeAudioBytes) {
                Module._player_fail_load($0, 0);
                return;
            }
            Module.decodeAudioBytes($0, HEAPU8.slice($1, $1 + $2));
        }, static_cast<double>(token), fetched.bytes.data(), static_cast<int>(fetched.bytes.size()));
    });
    return static_cast<double>(token);
}

} // extern "C"
