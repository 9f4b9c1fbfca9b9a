#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

// Synthetic room response: white noise per channel under a (1 - t)^2 decay.
std::vector<std::vector<float>> generate_impulse_response(double sample_rate,
                                                          double seconds,
                                                          int num_channels = 2,
                                                          std::uint32_t seed = 0x5EED);

// In-place radix-2 FFT of a fixed power-of-two size.
class Fft {
public:
    explicit Fft(std::size_t size);

    std::size_t size() const { return size_; }
    void forward(std::vector<std::complex<float>>& data) const;
    // Includes the 1/N scaling.
    void inverse(std::vector<std::complex<float>>& data) const;

private:
    void transform(std::vector<std::complex<float>>& data, bool inverse) const;

    std::size_t size_;
    std::vector<std::size_t> bit_reverse_;
    std::vector<std::complex<float>> twiddles_;
};

// Stereo convolution reverb using uniformly partitioned overlap-save FFT
// convolution. Channel c of the input is convolved with channel c of the
// impulse (a mono impulse feeds both). Output lags input by one block.
class ConvolutionReverb {
public:
    static constexpr std::size_t kBlockSize = 512;
    static constexpr int kChannels = 2;

    explicit ConvolutionReverb(const std::vector<std::vector<float>>& impulse);

    // Clears all signal history; the impulse is kept.
    void reset();

    // Interleaved stereo in, interleaved stereo out. `input` and `output` may alias.
    void process(const float* input, float* output, std::size_t num_frames);

    std::size_t partition_count() const { return partitions_; }

private:
    using Spectrum = std::vector<std::complex<float>>;

    void process_block();

    Fft fft_;
    std::size_t partitions_{0};
    // [channel][partition] spectra of the impulse.
    std::vector<std::vector<Spectrum>> impulse_spectra_;
    // [channel][slot] ring of recent input spectra.
    std::vector<std::vector<Spectrum>> input_spectra_;
    std::size_t ring_head_{0};

    // [channel] previous + current input block, and the pending output block.
    std::vector<std::vector<float>> input_window_;
    std::vector<std::vector<float>> output_block_;
    std::size_t block_pos_{0};

    Spectrum scratch_;
    Spectrum accumulator_;
};
