#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include "Decoder.hpp"
#include "FakeRenderSubsystem.hpp"

namespace {

void put_le16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
}

void put_le32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void put_tag(std::vector<std::uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Builds a WAV file around already-encoded sample bytes.
std::vector<std::uint8_t> make_wav(std::uint16_t format, std::uint16_t channels, std::uint32_t sample_rate,
                                   std::uint16_t bits, const std::vector<std::uint8_t>& samples,
                                   bool with_list_chunk = false) {
    std::vector<std::uint8_t> body;
    put_tag(body, "WAVE");
    if (with_list_chunk) {
        // Odd-sized chunk before fmt, padded to a word boundary.
        put_tag(body, "LIST");
        put_le32(body, 3);
        body.insert(body.end(), {'a', 'b', 'c', 0});
    }
    put_tag(body, "fmt ");
    put_le32(body, 16);
    put_le16(body, format);
    put_le16(body, channels);
    put_le32(body, sample_rate);
    put_le32(body, sample_rate * channels * (bits / 8));
    put_le16(body, static_cast<std::uint16_t>(channels * (bits / 8)));
    put_le16(body, bits);
    put_tag(body, "data");
    put_le32(body, static_cast<std::uint32_t>(samples.size()));
    body.insert(body.end(), samples.begin(), samples.end());

    std::vector<std::uint8_t> file;
    put_tag(file, "RIFF");
    put_le32(file, static_cast<std::uint32_t>(body.size()));
    file.insert(file.end(), body.begin(), body.end());
    return file;
}

bool test_pcm16_stereo() {
    std::vector<std::uint8_t> samples;
    // Frame 0: L = 16384 (0.5), R = -32768 (-1.0). Frame 1: L = 0, R = 8192 (0.25).
    put_le16(samples, 16384);
    put_le16(samples, 0x8000);
    put_le16(samples, 0);
    put_le16(samples, 8192);

    WavDecoder decoder;
    const DecodeResult result = decoder.decode(make_wav(1, 2, 22050, 16, samples));
    bool ok = expect(result.ok(), "16-bit stereo PCM should decode.");
    if (!ok) {
        return false;
    }
    const SampleBuffer& buffer = *result.buffer;
    ok &= expect(buffer.channel_count() == 2 && buffer.frame_count() == 2, "Two channels of two frames.");
    ok &= expect(buffer.sample_rate() == 22050.0, "Sample rate is taken from the fmt chunk.");
    ok &= expect(buffer.channel(0)[0] == 0.5f && buffer.channel(1)[0] == -1.0f, "Frame 0 is de-interleaved.");
    ok &= expect(buffer.channel(0)[1] == 0.0f && buffer.channel(1)[1] == 0.25f, "Frame 1 is de-interleaved.");
    return ok;
}

bool test_other_sample_formats() {
    WavDecoder decoder;
    bool ok = true;

    const DecodeResult eight = decoder.decode(make_wav(1, 1, 8000, 8, {0, 128, 192}));
    ok &= expect(eight.ok() && eight.buffer->channel(0) == std::vector<float>({-1.0f, 0.0f, 0.5f}),
                 "8-bit PCM is unsigned around 128.");

    // -4194304 and 4194304 as 24-bit little endian.
    const DecodeResult twenty_four = decoder.decode(make_wav(1, 1, 8000, 24, {0x00, 0x00, 0xC0, 0x00, 0x00, 0x40}));
    ok &= expect(twenty_four.ok() && twenty_four.buffer->channel(0) == std::vector<float>({-0.5f, 0.5f}),
                 "24-bit PCM is sign extended.");

    std::vector<std::uint8_t> floats(8);
    const float values[2] = {0.75f, 3.0f};
    std::memcpy(floats.data(), values, sizeof(values));
    const DecodeResult float32 = decoder.decode(make_wav(3, 1, 48000, 32, floats, true));
    ok &= expect(float32.ok() && float32.buffer->channel(0) == std::vector<float>({0.75f, 1.0f}),
                 "Float samples decode and are clamped, after skipping an odd-sized chunk.");
    return ok;
}

bool test_duration_and_truncated_data() {
    WavDecoder decoder;
    std::vector<std::uint8_t> file = make_wav(1, 1, 1000, 16, std::vector<std::uint8_t>(2000, 0));
    // Declared data size larger than what follows.
    file[40] = 0xFF;
    file[41] = 0xFF;
    const DecodeResult result = decoder.decode(file);
    bool ok = expect(result.ok() && result.buffer->frame_count() == 1000, "Oversized data chunks use what is present.");
    ok &= expect(result.ok() && result.buffer->duration() == 1.0, "Duration is frames / sample rate.");
    return ok;
}

bool test_rejections() {
    WavDecoder decoder;
    bool ok = true;

    const DecodeResult garbage = decoder.decode({'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 0, 0, 0});
    ok &= expect(!garbage.ok() && garbage.error == "not a RIFF/WAVE file", "Non-RIFF bytes are rejected.");

    ok &= expect(!decoder.decode({}).ok(), "Empty input is rejected.");

    const DecodeResult adpcm = decoder.decode(make_wav(2, 1, 8000, 4, {0, 0}));
    ok &= expect(!adpcm.ok() && adpcm.error.find("unsupported sample format") == 0, "Compressed formats are rejected.");

    const DecodeResult no_channels = decoder.decode(make_wav(1, 0, 8000, 16, {0, 0}));
    ok &= expect(!no_channels.ok() && no_channels.error == "invalid channel count or sample rate",
                 "Zero channels are rejected.");

    std::vector<std::uint8_t> no_data = make_wav(1, 1, 8000, 16, {});
    no_data.resize(no_data.size() - 8);
    const DecodeResult missing = decoder.decode(no_data);
    ok &= expect(!missing.ok() && missing.error == "missing data chunk", "Files without samples are rejected.");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_pcm16_stereo();
    ok &= test_other_sample_formats();
    ok &= test_duration_and_truncated_data();
    ok &= test_rejections();
    if (!ok) {
        return 1;
    }
    std::cout << "[Test] WAV decoder checks passed." << std::endl;
    return 0;
}
