#include <algorithm>
#include "WebAudioEngine.hpp"

// Global pointer to the single engine instance.
WebAudioEngine* g_web_audio_engine = nullptr;

// This is the C-style entry point that our JavaScript will call.
extern "C" void generate_audio_data(float* buffer_ptr, int num_frames) {
    if (g_web_audio_engine) {
        g_web_audio_engine->process_audio_from_js(buffer_ptr, num_frames);
    }
}

// The page calls this after AudioContext.resume() succeeds inside a user gesture.
extern "C" void notify_audio_unlocked() {
    if (g_web_audio_engine) {
        g_web_audio_engine->set_unlocked(true);
    }
}

WebAudioEngine::~WebAudioEngine() {
    stop();
}

bool WebAudioEngine::start(int sample_rate, AudioCallback callback) {
    // We only need to store the callback function. All web API setup
    // is handled in JavaScript.
    (void)sample_rate;
    audio_callback_ = std::move(callback);
    g_web_audio_engine = this;
    return true;
}

void WebAudioEngine::stop() {
    audio_callback_ = nullptr;
    if (g_web_audio_engine == this) {
        g_web_audio_engine = nullptr;
    }
}

bool WebAudioEngine::is_running() const {
    return unlocked_ && static_cast<bool>(audio_callback_);
}

void WebAudioEngine::process_audio_from_js(float* output_ptr, int num_frames) {
    const int num_channels = 2; // Stereo
    if (audio_callback_) {
        audio_callback_(output_ptr, num_frames, num_channels);
    } else {
        std::fill(output_ptr, output_ptr + num_frames * num_channels, 0.0f);
    }
}
