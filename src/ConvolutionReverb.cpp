#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include "ConvolutionReverb.hpp"

std::vector<std::vector<float>> generate_impulse_response(double sample_rate,
                                                          double seconds,
                                                          int num_channels,
                                                          std::uint32_t seed) {
    const std::size_t length = sample_rate > 0.0 && seconds > 0.0
                                   ? static_cast<std::size_t>(sample_rate * seconds)
                                   : 0;
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);

    std::vector<std::vector<float>> impulse(static_cast<std::size_t>(std::max(num_channels, 0)),
                                            std::vector<float>(length));
    for (std::size_t i = 0; i < length; ++i) {
        const double remaining = 1.0 - static_cast<double>(i) / static_cast<double>(length);
        const float decay = static_cast<float>(remaining * remaining);
        for (auto& channel : impulse) {
            channel[i] = noise(rng) * decay;
        }
    }
    return impulse;
}

Fft::Fft(std::size_t size) : size_(size), bit_reverse_(size), twiddles_(size / 2) {
    std::size_t bits = 0;
    while ((std::size_t{1} << bits) < size_) {
        ++bits;
    }
    for (std::size_t i = 0; i < size_; ++i) {
        std::size_t reversed = 0;
        for (std::size_t b = 0; b < bits; ++b) {
            if (i & (std::size_t{1} << b)) {
                reversed |= std::size_t{1} << (bits - 1 - b);
            }
        }
        bit_reverse_[i] = reversed;
    }
    for (std::size_t k = 0; k < twiddles_.size(); ++k) {
        const double angle = -2.0 * std::numbers::pi * static_cast<double>(k) / static_cast<double>(size_);
        twiddles_[k] = std::complex<float>(static_cast<float>(std::cos(angle)), static_cast<float>(std::sin(angle)));
    }
}

void Fft::forward(std::vector<std::complex<float>>& data) const {
    transform(data, false);
}

void Fft::inverse(std::vector<std::complex<float>>& data) const {
    transform(data, true);
    const float scale = 1.0f / static_cast<float>(size_);
    for (auto& value : data) {
        value *= scale;
    }
}

void Fft::transform(std::vector<std::complex<float>>& data, bool inverse) const {
    for (std::size_t i = 0; i < size_; ++i) {
        if (i < bit_reverse_[i]) {
            std::swap(data[i], data[bit_reverse_[i]]);
        }
    }
    for (std::size_t length = 2; length <= size_; length <<= 1) {
        const std::size_t half = length / 2;
        const std::size_t stride = size_ / length;
        for (std::size_t start = 0; start < size_; start += length) {
            for (std::size_t j = 0; j < half; ++j) {
                std::complex<float> w = twiddles_[j * stride];
                if (inverse) {
                    w = std::conj(w);
                }
                const std::complex<float> even = data[start + j];
                const std::complex<float> odd = data[start + j + half] * w;
                data[start + j] = even + odd;
                data[start + j + half] = even - odd;
            }
        }
    }
}

ConvolutionReverb::ConvolutionReverb(const std::vector<std::vector<float>>& impulse)
    : fft_(kBlockSize * 2),
      impulse_spectra_(kChannels),
      input_spectra_(kChannels),
      input_window_(kChannels, std::vector<float>(kBlockSize * 2)),
      output_block_(kChannels, std::vector<float>(kBlockSize)),
      scratch_(kBlockSize * 2),
      accumulator_(kBlockSize * 2) {
    std::size_t longest = 0;
    for (const auto& channel : impulse) {
        longest = std::max(longest, channel.size());
    }
    partitions_ = (longest + kBlockSize - 1) / kBlockSize;
    if (partitions_ == 0) {
        return;
    }

    const std::size_t fft_size = fft_.size();
    for (int c = 0; c < kChannels; ++c) {
        const auto& source = impulse[std::min<std::size_t>(static_cast<std::size_t>(c), impulse.size() - 1)];
        auto& spectra = impulse_spectra_[static_cast<std::size_t>(c)];
        spectra.assign(partitions_, Spectrum(fft_size));
        for (std::size_t p = 0; p < partitions_; ++p) {
            Spectrum& spectrum = spectra[p];
            const std::size_t begin = p * kBlockSize;
            for (std::size_t i = 0; i < kBlockSize && begin + i < source.size(); ++i) {
                spectrum[i] = source[begin + i];
            }
            fft_.forward(spectrum);
        }
        input_spectra_[static_cast<std::size_t>(c)].assign(partitions_, Spectrum(fft_size));
    }
}

void ConvolutionReverb::reset() {
    for (auto& channel : input_spectra_) {
        for (auto& spectrum : channel) {
            std::fill(spectrum.begin(), spectrum.end(), std::complex<float>{});
        }
    }
    for (auto& window : input_window_) {
        std::fill(window.begin(), window.end(), 0.0f);
    }
    for (auto& block : output_block_) {
        std::fill(block.begin(), block.end(), 0.0f);
    }
    ring_head_ = 0;
    block_pos_ = 0;
}

void ConvolutionReverb::process(const float* input, float* output, std::size_t num_frames) {
    for (std::size_t frame = 0; frame < num_frames; ++frame) {
        for (std::size_t c = 0; c < static_cast<std::size_t>(kChannels); ++c) {
            const std::size_t index = frame * kChannels + c;
            const float in = input[index];
            input_window_[c][kBlockSize + block_pos_] = in;
            output[index] = output_block_[c][block_pos_];
        }
        if (++block_pos_ == kBlockSize) {
            process_block();
            block_pos_ = 0;
        }
    }
}

void ConvolutionReverb::process_block() {
    const std::size_t fft_size = fft_.size();

    if (partitions_ > 0) {
        ring_head_ = (ring_head_ + partitions_ - 1) % partitions_;
    }

    for (std::size_t c = 0; c < static_cast<std::size_t>(kChannels); ++c) {
        std::vector<float>& window = input_window_[c];
        if (partitions_ == 0) {
            std::fill(output_block_[c].begin(), output_block_[c].end(), 0.0f);
        } else {
            for (std::size_t i = 0; i < fft_size; ++i) {
                scratch_[i] = window[i];
            }
            fft_.forward(scratch_);
            std::copy(scratch_.begin(), scratch_.end(), input_spectra_[c][ring_head_].begin());

            // Real signals: accumulate the lower half and mirror the rest.
            std::fill(accumulator_.begin(), accumulator_.end(), std::complex<float>{});
            const std::size_t bins = fft_size / 2 + 1;
            for (std::size_t p = 0; p < partitions_; ++p) {
                const Spectrum& x = input_spectra_[c][(ring_head_ + p) % partitions_];
                const Spectrum& h = impulse_spectra_[c][p];
                for (std::size_t k = 0; k < bins; ++k) {
                    accumulator_[k] += x[k] * h[k];
                }
            }
            for (std::size_t k = bins; k < fft_size; ++k) {
                accumulator_[k] = std::conj(accumulator_[fft_size - k]);
            }
            fft_.inverse(accumulator_);

            // Overlap-save: only the second half is free of wrap-around.
            for (std::size_t i = 0; i < kBlockSize; ++i) {
                output_block_[c][i] = accumulator_[kBlockSize + i].real();
            }
        }

        std::copy(window.begin() + kBlockSize, window.end(), window.begin());
    }
}
