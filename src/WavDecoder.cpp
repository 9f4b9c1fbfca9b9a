#include <algorithm>
#include <cstring>
#include "Decoder.hpp"

namespace {

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

std::uint16_t read_le16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

std::uint32_t read_le32(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0]) |
           (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

DecodeResult failure(std::string message) {
    return DecodeResult{nullptr, std::move(message)};
}

// Converts one sample starting at `data` to a float in [-1, 1].
float convert_sample(const std::uint8_t* data, std::uint16_t format, std::uint16_t bits) {
    if (format == kFormatFloat) {
        if (bits == 32) {
            float value;
            std::memcpy(&value, data, sizeof(value));
            return std::clamp(value, -1.0f, 1.0f);
        }
        double value;
        std::memcpy(&value, data, sizeof(value));
        return static_cast<float>(std::clamp(value, -1.0, 1.0));
    }

    switch (bits) {
    case 8:
        // 8-bit PCM is unsigned with a 128 midpoint.
        return (static_cast<float>(data[0]) - 128.0f) / 128.0f;
    case 16:
        return static_cast<float>(static_cast<std::int16_t>(read_le16(data))) / 32768.0f;
    case 24: {
        std::int32_t value = static_cast<std::int32_t>(data[0]) |
                             (static_cast<std::int32_t>(data[1]) << 8) |
                             (static_cast<std::int32_t>(data[2]) << 16);
        if (value & 0x800000) {
            value |= ~0xFFFFFF;
        }
        return static_cast<float>(value) / 8388608.0f;
    }
    default:
        return static_cast<float>(static_cast<double>(static_cast<std::int32_t>(read_le32(data))) / 2147483648.0);
    }
}

} // namespace

DecodeResult WavDecoder::decode(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return failure("not a RIFF/WAVE file");
    }

    bool fmt_found = false;
    std::uint16_t format = 0;
    std::uint16_t channels = 0;
    std::uint32_t sample_rate = 0;
    std::uint16_t bits = 0;
    const std::uint8_t* sample_data = nullptr;
    std::size_t sample_bytes = 0;

    std::size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const std::uint8_t* chunk = bytes.data() + offset;
        const std::uint32_t chunk_size = read_le32(chunk + 4);
        const std::size_t body = offset + 8;
        const std::size_t remaining = bytes.size() - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || chunk_size > remaining) {
                return failure("truncated fmt chunk");
            }
            const std::uint8_t* fmt = bytes.data() + body;
            format = read_le16(fmt);
            channels = read_le16(fmt + 2);
            sample_rate = read_le32(fmt + 4);
            bits = read_le16(fmt + 14);
            if (format == kFormatExtensible) {
                // The sub-format GUID starts with the real format tag.
                if (chunk_size < 40) {
                    return failure("truncated extensible fmt chunk");
                }
                format = read_le16(fmt + 24);
            }
            fmt_found = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            // Streams written before their length was known leave the size
            // oversized; take what is actually present.
            sample_data = bytes.data() + body;
            sample_bytes = std::min<std::size_t>(chunk_size, remaining);
            if (fmt_found) {
                break;
            }
        }

        // Chunks are word aligned.
        const std::size_t advance = 8 + static_cast<std::size_t>(chunk_size) + (chunk_size % 2);
        if (advance > bytes.size() - offset) {
            break;
        }
        offset += advance;
    }

    if (!fmt_found) {
        return failure("missing fmt chunk");
    }
    if (sample_data == nullptr) {
        return failure("missing data chunk");
    }
    if (channels == 0 || sample_rate == 0) {
        return failure("invalid channel count or sample rate");
    }

    const bool pcm_ok = format == kFormatPcm && (bits == 8 || bits == 16 || bits == 24 || bits == 32);
    const bool float_ok = format == kFormatFloat && (bits == 32 || bits == 64);
    if (!pcm_ok && !float_ok) {
        return failure("unsupported sample format " + std::to_string(format) + " / " +
                       std::to_string(bits) + "-bit");
    }

    const std::size_t bytes_per_sample = bits / 8;
    const std::size_t frame_bytes = bytes_per_sample * channels;
    const std::size_t frames = sample_bytes / frame_bytes;

    std::vector<std::vector<float>> decoded(channels, std::vector<float>(frames));
    for (std::size_t frame = 0; frame < frames; ++frame) {
        const std::uint8_t* frame_data = sample_data + frame * frame_bytes;
        for (std::uint16_t channel = 0; channel < channels; ++channel) {
            decoded[channel][frame] = convert_sample(frame_data + channel * bytes_per_sample, format, bits);
        }
    }

    return DecodeResult{std::make_shared<const SampleBuffer>(std::move(decoded), static_cast<double>(sample_rate)), {}};
}
