#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "AudioEngine.hpp"
#include "ConvolutionReverb.hpp"
#include "RenderSubsystem.hpp"

// Renders chains in software into an AudioEngine's output callback.
//
// Each chain is a variable-rate buffer source (linear interpolation,
// resampled to the device rate) split into a dry path and a wet path through
// a shared convolution reverb. Control calls come from the UI thread; the
// device callback only try-locks the chain table and outputs silence when
// the UI thread holds it. Device time advances only over mixed frames, under
// the same lock, so it always equals the time the chains consumed.
class MixerRenderSubsystem final : public RenderSubsystem {
public:
    MixerRenderSubsystem(AudioEngine& engine, double device_sample_rate, double reverb_seconds = 2.0);
    ~MixerRenderSubsystem() override;

    MixerRenderSubsystem(const MixerRenderSubsystem&) = delete;
    MixerRenderSubsystem& operator=(const MixerRenderSubsystem&) = delete;

    // Opens the device stream with this mixer as its callback.
    bool start();
    void stop();

    bool rendering_permitted() const override;
    bool configure_effects(double sample_rate) override;
    BuiltChain build_chain(std::shared_ptr<const SampleBuffer> buffer, double offset, double rate) override;
    double set_rate(ChainHandle chain, double rate) override;
    void set_gains(ChainHandle chain, double dry_gain, double wet_gain) override;
    void teardown(ChainHandle chain) override;
    double now() const override;

    double device_sample_rate() const { return device_sample_rate_; }
    std::size_t active_chains() const;

    // Device callback body. Public so the mixer can be driven without a device.
    void render(float* output, int num_frames, int num_channels);

    // Chunks output as silence because the chain table was busy.
    std::uint64_t skipped_chunks() const { return skipped_chunks_.load(std::memory_order_relaxed); }

private:
    struct Chain {
        std::shared_ptr<const SampleBuffer> buffer;
        double read_position{0.0};  // In source frames.
        double rate{1.0};
        float dry_gain{1.0f};
        float wet_gain{0.0f};
        bool finished{false};
    };

    // Renders up to kChunkFrames stereo frames into dry_ and wet_.
    void mix_chunk(std::size_t frames);

    static constexpr std::size_t kChunkFrames = 1024;

    AudioEngine& engine_;
    const double device_sample_rate_;
    const double reverb_seconds_;

    mutable std::mutex mutex_;
    std::map<ChainHandle, Chain> chains_;
    std::unique_ptr<ConvolutionReverb> reverb_;
    ChainHandle next_handle_{1};

    // Written only under mutex_; read lock-free by now().
    std::atomic<std::uint64_t> frames_rendered_{0};
    std::atomic<std::uint64_t> skipped_chunks_{0};

    // Interleaved stereo scratch, touched only by the device callback.
    std::vector<float> dry_;
    std::vector<float> wet_;
};
