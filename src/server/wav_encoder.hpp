#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// In-memory 16-bit PCM WAV encoding.
namespace wav {

// Float samples in [-1, 1] are scaled and clamped to int16.
inline std::vector<int16_t> to_pcm16(std::span<const float> samples) {
    std::vector<int16_t> pcm(samples.size());
    std::ranges::transform(samples, pcm.begin(), [](float s) {
        float scaled = std::clamp(s, -1.0f, 1.0f) * 32767.0f;
        return static_cast<int16_t>(std::lrint(scaled));
    });
    return pcm;
}

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(1);                 // PCM
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

inline std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate) {
    return encode(to_pcm16(samples), sample_rate);
}

} // namespace wav
