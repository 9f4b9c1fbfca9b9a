#pragma once
#include "AudioEngine.hpp"

class WebAudioEngine final : public AudioEngine {
public:
    WebAudioEngine() = default;
    ~WebAudioEngine() override;

    // The 'start' method just saves the callback function. It doesn't touch any web APIs.
    bool start(int sample_rate, AudioCallback callback) override;

    // The page owns the AudioContext, so this only detaches the callback.
    void stop() override;

    // False until the page reports that its AudioContext has been resumed by
    // a user gesture.
    bool is_running() const override;

    // Called from JavaScript once the context is resumed.
    void set_unlocked(bool unlocked) { unlocked_ = unlocked; }

    // This public method is the link between the C-style function and the callback.
    void process_audio_from_js(float* output_ptr, int num_frames);

private:
    AudioCallback audio_callback_;
    bool unlocked_{false};
};
