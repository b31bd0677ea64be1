#include "audio/audio_normalizer.hpp"

#include <cmath>

AudioNormalizer::AudioNormalizer(AudioDecoder& decoder) : decoder_(decoder) {}

std::expected<AudioBuffer, ApiError> AudioNormalizer::normalize(std::span<const uint8_t> bytes) {
    auto decoded = decoder_.decode(bytes);
    if (!decoded) {
        return std::unexpected(ApiError::internal("Transcription failed: " + decoded.error()));
    }
    if (decoded->sample_rate == 0 || decoded->channels == 0) {
        return std::unexpected(ApiError::internal("Transcription failed: invalid stream parameters"));
    }

    std::vector<float> mono = decoded->channels > 1
        ? downmix(decoded->samples, decoded->channels)
        : std::move(decoded->samples);

    if (decoded->sample_rate != kEngineSampleRate) {
        mono = resample_linear(mono, decoded->sample_rate, kEngineSampleRate);
    }

    if (mono.empty()) {
        return std::unexpected(ApiError::internal("Transcription failed: audio contains no samples"));
    }

    return AudioBuffer{.samples = std::move(mono), .sample_rate = kEngineSampleRate};
}

std::vector<float> AudioNormalizer::downmix(std::span<const float> interleaved, uint32_t channels) {
    if (channels <= 1) return {interleaved.begin(), interleaved.end()};

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        double sum = 0.0;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono[f] = static_cast<float>(sum / channels);
    }
    return mono;
}

std::vector<float> AudioNormalizer::resample_linear(std::span<const float> mono,
                                                    uint32_t from_rate, uint32_t to_rate) {
    if (mono.empty() || from_rate == 0) return {};
    if (from_rate == to_rate) return {mono.begin(), mono.end()};

    const size_t n = mono.size();
    double duration = static_cast<double>(n) / from_rate;
    auto target = static_cast<size_t>(std::llround(duration * to_rate));
    if (target == 0) return {};

    std::vector<float> out(target);
    // Positions run from 0 to n inclusive; anything at or past the last index clamps.
    double step = target > 1 ? static_cast<double>(n) / static_cast<double>(target - 1) : 0.0;
    for (size_t i = 0; i < target; ++i) {
        double pos = static_cast<double>(i) * step;
        if (pos >= static_cast<double>(n - 1)) {
            out[i] = mono[n - 1];
            continue;
        }
        auto lo = static_cast<size_t>(pos);
        double frac = pos - static_cast<double>(lo);
        out[i] = static_cast<float>(mono[lo] + (mono[lo + 1] - mono[lo]) * frac);
    }
    return out;
}
