#include "SampleBuffer.hpp"

#include <algorithm>

SampleBuffer::SampleBuffer(std::vector<std::vector<float>> channels, double sample_rate)
    : channels_(std::move(channels)), sample_rate_(sample_rate) {
    // Ragged input is truncated to the shortest channel so every frame is complete.
    if (!channels_.empty()) {
        frames_ = channels_.front().size();
        for (const auto& channel : channels_) {
            frames_ = std::min(frames_, channel.size());
        }
        for (auto& channel : channels_) {
            channel.resize(frames_);
        }
    }
}

std::shared_ptr<const SampleBuffer> SampleBuffer::from_interleaved(const float* samples,
                                                                   std::size_t num_frames,
                                                                   int num_channels,
                                                                   double sample_rate) {
    if (num_channels <= 0) {
        return std::make_shared<const SampleBuffer>(std::vector<std::vector<float>>{}, sample_rate);
    }

    std::vector<std::vector<float>> channels(static_cast<std::size_t>(num_channels),
                                             std::vector<float>(num_frames));
    for (std::size_t frame = 0; frame < num_frames; ++frame) {
        for (int channel = 0; channel < num_channels; ++channel) {
            channels[static_cast<std::size_t>(channel)][frame] =
                samples[frame * static_cast<std::size_t>(num_channels) + static_cast<std::size_t>(channel)];
        }
    }
    return std::make_shared<const SampleBuffer>(std::move(channels), sample_rate);
}

double SampleBuffer::duration() const {
    if (sample_rate_ <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(frames_) / sample_rate_;
}

const std::vector<float>& SampleBuffer::channel(int index) const {
    static const std::vector<float> empty;
    if (index < 0 || index >= channel_count()) {
        return empty;
    }
    return channels_[static_cast<std::size_t>(index)];
}
