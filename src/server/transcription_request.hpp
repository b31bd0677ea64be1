#pragma once

#include "audio/audio_buffer.hpp"
#include "audio/audio_normalizer.hpp"
#include "config.hpp"
#include "http/api_error.hpp"
#include "http/multipart.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct TranscriptionRequest {
    AudioBuffer audio; // mono, kEngineSampleRate
    std::optional<std::string> language;
    std::optional<std::string> prompt;
    std::optional<float> temperature;
    bool condition_on_previous_text = true;
    bool vad_filter = false;
};

// Best-effort float parse: anything that is not entirely a number (optional
// leading '+', "inf" and "nan" allowed) yields nullopt rather than an error.
std::optional<float> parse_temperature(std::string_view s);

// Validates the form and normalizes the uploaded file. Only `file` is required.
std::expected<TranscriptionRequest, ApiError>
build_transcription_request(const FormFields& fields, const ModelOptions& options,
                            AudioNormalizer& normalizer);
