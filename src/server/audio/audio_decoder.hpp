#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

struct DecodedAudio {
    std::vector<float> samples; // interleaved, channels per frame
    uint32_t sample_rate = 0;
    uint32_t channels = 0;

    size_t frames() const { return channels ? samples.size() / channels : 0; }
};

// Turns a container-encoded blob (WAV, FLAC, OGG, MP3, ...) into raw samples.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;
    virtual std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t> bytes) = 0;
};
