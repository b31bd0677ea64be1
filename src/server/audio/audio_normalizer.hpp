#pragma once

#include "audio/audio_buffer.hpp"
#include "audio/audio_decoder.hpp"
#include "http/api_error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

constexpr uint32_t kEngineSampleRate = 16000;

// Decodes uploads into the mono 16 kHz float buffer the engine expects.
class AudioNormalizer {
public:
    explicit AudioNormalizer(AudioDecoder& decoder);

    std::expected<AudioBuffer, ApiError> normalize(std::span<const uint8_t> bytes);

    // Arithmetic mean of all channels per frame.
    static std::vector<float> downmix(std::span<const float> interleaved, uint32_t channels);

    // Linear interpolation onto round(duration * target_rate) evenly spaced
    // positions spanning [0, len]. Not anti-aliased.
    static std::vector<float> resample_linear(std::span<const float> mono,
                                              uint32_t from_rate, uint32_t to_rate);

private:
    AudioDecoder& decoder_;
};
