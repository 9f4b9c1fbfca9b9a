#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "SampleBuffer.hpp"

struct DecodeResult {
    std::shared_ptr<const SampleBuffer> buffer;  // Null on failure.
    std::string error;

    bool ok() const { return buffer != nullptr; }
};

// Turns encoded bytes into a SampleBuffer.
class Decoder {
public:
    virtual ~Decoder() = default;
    virtual DecodeResult decode(const std::vector<std::uint8_t>& bytes) = 0;
};

// RIFF/WAVE: integer PCM (8/16/24/32-bit) and IEEE float (32/64-bit).
class WavDecoder final : public Decoder {
public:
    DecodeResult decode(const std::vector<std::uint8_t>& bytes) override;
};
