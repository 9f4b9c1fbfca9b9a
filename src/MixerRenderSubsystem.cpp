#include <algorithm>
#include <cmath>
#include <iostream>
#include "MixerRenderSubsystem.hpp"

MixerRenderSubsystem::MixerRenderSubsystem(AudioEngine& engine, double device_sample_rate, double reverb_seconds)
    : engine_(engine),
      device_sample_rate_(device_sample_rate > 0.0 ? device_sample_rate : 44100.0),
      reverb_seconds_(reverb_seconds),
      dry_(kChunkFrames * 2),
      wet_(kChunkFrames * 2) {}

MixerRenderSubsystem::~MixerRenderSubsystem() {
    stop();
}

bool MixerRenderSubsystem::start() {
    return engine_.start(static_cast<int>(device_sample_rate_),
                         [this](float* buffer, int num_frames, int num_channels) {
                             render(buffer, num_frames, num_channels);
                         });
}

void MixerRenderSubsystem::stop() {
    engine_.stop();
}

bool MixerRenderSubsystem::rendering_permitted() const {
    return engine_.is_running();
}

bool MixerRenderSubsystem::configure_effects(double sample_rate) {
    if (!(sample_rate > 0.0)) {
        return false;
    }

    // The reverb runs after resampling, so its impulse is built at the device rate.
    auto reverb = std::make_unique<ConvolutionReverb>(
        generate_impulse_response(device_sample_rate_, reverb_seconds_));
    const std::size_t partitions = reverb->partition_count();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reverb_.swap(reverb);
    }
    std::cout << "Mixer: reverb ready, " << reverb_seconds_ << " s impulse in " << partitions << " partitions."
              << std::endl;
    return true;
}

BuiltChain MixerRenderSubsystem::build_chain(std::shared_ptr<const SampleBuffer> buffer, double offset, double rate) {
    if (!buffer || buffer->frame_count() == 0 || !(buffer->sample_rate() > 0.0)) {
        return {};
    }

    Chain chain;
    chain.read_position = std::clamp(offset, 0.0, buffer->duration()) * buffer->sample_rate();
    chain.rate = rate;
    chain.buffer = std::move(buffer);

    std::lock_guard<std::mutex> lock(mutex_);
    const ChainHandle handle = next_handle_++;
    chains_.emplace(handle, std::move(chain));
    // The next mixed frame is the chain's first.
    return BuiltChain{handle, now()};
}

double MixerRenderSubsystem::set_rate(ChainHandle chain, double rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(chain);
    if (it != chains_.end()) {
        it->second.rate = rate;
    }
    return now();
}

void MixerRenderSubsystem::set_gains(ChainHandle chain, double dry_gain, double wet_gain) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(chain);
    if (it != chains_.end()) {
        it->second.dry_gain = static_cast<float>(dry_gain);
        it->second.wet_gain = static_cast<float>(wet_gain);
    }
}

void MixerRenderSubsystem::teardown(ChainHandle chain) {
    std::shared_ptr<const SampleBuffer> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chains_.find(chain);
        if (it == chains_.end()) {
            return;
        }
        // Drop the buffer reference outside the lock.
        released = std::move(it->second.buffer);
        chains_.erase(it);
    }
}

double MixerRenderSubsystem::now() const {
    return static_cast<double>(frames_rendered_.load(std::memory_order_acquire)) / device_sample_rate_;
}

std::size_t MixerRenderSubsystem::active_chains() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(chains_.begin(), chains_.end(),
                                                  [](const auto& entry) { return !entry.second.finished; }));
}

void MixerRenderSubsystem::render(float* output, int num_frames, int num_channels) {
    if (num_frames <= 0 || num_channels <= 0) {
        return;
    }

    std::size_t done = 0;
    const std::size_t total = static_cast<std::size_t>(num_frames);
    const std::size_t channels = static_cast<std::size_t>(num_channels);
    while (done < total) {
        const std::size_t frames = std::min(kChunkFrames, total - done);
        float* out = output + done * channels;

        // Never block the device thread; a busy table means one silent chunk
        // that no chain and no clock reading moves through.
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) {
            std::fill(out, out + frames * channels, 0.0f);
            skipped_chunks_.fetch_add(1, std::memory_order_relaxed);
        } else {
            mix_chunk(frames);
            frames_rendered_.fetch_add(frames, std::memory_order_release);
            lock.unlock();

            for (std::size_t f = 0; f < frames; ++f) {
                const float left = dry_[f * 2] + wet_[f * 2];
                const float right = dry_[f * 2 + 1] + wet_[f * 2 + 1];
                float* frame = out + f * channels;
                if (channels == 1) {
                    frame[0] = 0.5f * (left + right);
                    continue;
                }
                frame[0] = left;
                frame[1] = right;
                std::fill(frame + 2, frame + channels, 0.0f);
            }
        }

        done += frames;
    }
}

void MixerRenderSubsystem::mix_chunk(std::size_t frames) {
    std::fill(dry_.begin(), dry_.begin() + static_cast<std::ptrdiff_t>(frames * 2), 0.0f);
    std::fill(wet_.begin(), wet_.begin() + static_cast<std::ptrdiff_t>(frames * 2), 0.0f);

    for (auto& entry : chains_) {
        Chain& chain = entry.second;
        if (chain.finished) {
            continue;
        }
        const SampleBuffer& buffer = *chain.buffer;
        const std::size_t length = buffer.frame_count();
        const std::vector<float>& left = buffer.channel(0);
        const std::vector<float>& right = buffer.channel(buffer.channel_count() > 1 ? 1 : 0);
        const double step = chain.rate * buffer.sample_rate() / device_sample_rate_;

        for (std::size_t f = 0; f < frames; ++f) {
            if (chain.read_position >= static_cast<double>(length)) {
                chain.finished = true;
                break;
            }
            const std::size_t index = static_cast<std::size_t>(chain.read_position);
            const std::size_t next = std::min(index + 1, length - 1);
            const float frac = static_cast<float>(chain.read_position - static_cast<double>(index));
            const float l = left[index] + (left[next] - left[index]) * frac;
            const float r = right[index] + (right[next] - right[index]) * frac;

            dry_[f * 2] += l * chain.dry_gain;
            dry_[f * 2 + 1] += r * chain.dry_gain;
            // Scaling before the reverb equals scaling its output.
            wet_[f * 2] += l * chain.wet_gain;
            wet_[f * 2 + 1] += r * chain.wet_gain;

            chain.read_position += step;
        }
    }

    if (reverb_) {
        reverb_->process(wet_.data(), wet_.data(), frames);
    } else {
        std::fill(wet_.begin(), wet_.begin() + static_cast<std::ptrdiff_t>(frames * 2), 0.0f);
    }
}
