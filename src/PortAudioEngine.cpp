#include <algorithm>
#include <iostream>
#include "PortAudioEngine.hpp"

PortAudioEngine::PortAudioEngine() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
        return;
    }
    initialized_ = true;
}

PortAudioEngine::~PortAudioEngine() {
    stop();
    if (!initialized_) {
        return;
    }
    PaError err = Pa_Terminate();
    if (err != paNoError) {
        std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    }
}

bool PortAudioEngine::start(int sample_rate, AudioCallback callback) {
    if (!initialized_) {
        std::cerr << "PortAudio error: library not initialized." << std::endl;
        return false;
    }
    stop();
    audio_callback_ = std::move(callback);

    PaStreamParameters output_parameters;
    output_parameters.device = Pa_GetDefaultOutputDevice();
    if (output_parameters.device == paNoDevice) {
        std::cerr << "Error: No default output device." << std::endl;
        return false;
    }

    const PaDeviceInfo* device_info = Pa_GetDeviceInfo(output_parameters.device);
    if (device_info == nullptr) {
        std::cerr << "Error: No info for the default output device." << std::endl;
        return false;
    }

    output_parameters.channelCount = kNumChannels;
    output_parameters.sampleFormat = paFloat32; // We will work with 32-bit floats
    output_parameters.suggestedLatency = device_info->defaultLowOutputLatency;
    output_parameters.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(
        &stream_,
        nullptr, // No input
        &output_parameters,
        sample_rate,
        paFramesPerBufferUnspecified, // Let PortAudio choose buffer size
        paNoFlag,
        &PortAudioEngine::pa_callback,
        this // Pass a pointer to this instance as user data
    );

    if (err != paNoError) {
        std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        return false;
    }

    std::cout << "PortAudio stream started on " << device_info->name << " at " << sample_rate << " Hz." << std::endl;
    return true;
}

void PortAudioEngine::stop() {
    if (stream_ != nullptr) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
        }
        err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
        }
        stream_ = nullptr;
        std::cout << "PortAudio stream stopped." << std::endl;
    }
}

bool PortAudioEngine::is_running() const {
    return stream_ != nullptr && Pa_IsStreamActive(stream_) == 1;
}

int PortAudioEngine::pa_callback(
    const void* input_buffer,
    void* output_buffer,
    unsigned long frames_per_buffer,
    const PaStreamCallbackTimeInfo* time_info,
    PaStreamCallbackFlags status_flags,
    void* user_data)
{
    (void)input_buffer;
    (void)time_info;
    (void)status_flags;
    // Cast user_data back to a pointer to our PortAudioEngine instance
    PortAudioEngine* engine = static_cast<PortAudioEngine*>(user_data);
    return engine->process_audio(static_cast<float*>(output_buffer), frames_per_buffer);
}

int PortAudioEngine::process_audio(float* output_buffer, unsigned long frames_per_buffer) {
    if (audio_callback_) {
        audio_callback_(output_buffer, static_cast<int>(frames_per_buffer), kNumChannels);
    } else {
        std::fill(output_buffer, output_buffer + frames_per_buffer * kNumChannels, 0.0f);
    }
    return paContinue;
}
