#include "transcription_request.hpp"

#include "http/text_util.hpp"

#include <charconv>
#include <span>

std::optional<float> parse_temperature(std::string_view s) {
    s = text::trim(s);
    if (s.starts_with('+')) s.remove_prefix(1);
    if (s.empty()) return std::nullopt;

    float value = 0.0f;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::expected<TranscriptionRequest, ApiError>
build_transcription_request(const FormFields& fields, const ModelOptions& options,
                            AudioNormalizer& normalizer) {
    auto file = fields.find("file");
    if (file == fields.end()) {
        return std::unexpected(ApiError::invalid_request("Missing required field: file"));
    }

    const auto& bytes = file->second.value;
    auto audio = normalizer.normalize(
        std::span(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
    if (!audio) return std::unexpected(audio.error());

    TranscriptionRequest req;
    req.audio = std::move(*audio);
    req.condition_on_previous_text = options.condition_on_previous_text;
    req.vad_filter = options.vad_filter;

    if (auto it = fields.find("language"); it != fields.end()) req.language = it->second.value;
    if (auto it = fields.find("prompt"); it != fields.end()) req.prompt = it->second.value;
    if (auto it = fields.find("temperature"); it != fields.end()) {
        req.temperature = parse_temperature(it->second.value);
    }

    return req;
}
