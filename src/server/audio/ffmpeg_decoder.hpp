#pragma once

#include "audio/audio_decoder.hpp"

// Decodes any container/codec libavformat can probe, straight from memory.
// Samples are converted to interleaved float at the native rate and layout;
// rate and channel conversion are left to AudioNormalizer.
class FfmpegDecoder : public AudioDecoder {
public:
    FfmpegDecoder();
    ~FfmpegDecoder() override;

    std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t> bytes) override;
};
