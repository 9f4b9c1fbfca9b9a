#pragma once

#include <cstddef>
#include <memory>
#include <vector>

// Decoded audio, one float array per channel (normalized to roughly [-1, 1]).
// Never mutated after construction; shared read-only between the session,
// the waveform renderer and live render chains.
class SampleBuffer {
public:
    SampleBuffer(std::vector<std::vector<float>> channels, double sample_rate);

    // Splits an interleaved block (frame-major) into per-channel arrays.
    static std::shared_ptr<const SampleBuffer> from_interleaved(const float* samples,
                                                                std::size_t num_frames,
                                                                int num_channels,
                                                                double sample_rate);

    int channel_count() const { return static_cast<int>(channels_.size()); }
    std::size_t frame_count() const { return frames_; }
    double sample_rate() const { return sample_rate_; }

    // Length in seconds.
    double duration() const;

    // Returns an empty vector for an out-of-range channel index.
    const std::vector<float>& channel(int index) const;

private:
    std::vector<std::vector<float>> channels_;
    std::size_t frames_{0};
    double sample_rate_{0.0};
};
