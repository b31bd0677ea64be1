#include "whisper/engine_gateway.hpp"

#include "http/text_util.hpp"

#include <chrono>
#include <exception>

EngineGateway::EngineGateway(std::shared_ptr<TranscriptionEngine> engine)
    : engine_(std::move(engine)) {}

std::expected<TranscriptionResult, ApiError>
EngineGateway::invoke(const TranscriptionRequest& request) {
    if (!engine_) {
        return std::unexpected(ApiError::service_unavailable("Local model not available"));
    }

    EngineParams params{
        .audio = request.audio.samples,
        .language = request.language,
        .initial_prompt = request.prompt,
        .temperature = request.temperature,
        .condition_on_previous_text = request.condition_on_previous_text,
        .vad_filter = request.vad_filter,
    };

    auto start = std::chrono::steady_clock::now();
    std::expected<EngineOutput, std::string> output;
    try {
        std::lock_guard lock(engine_mutex_);
        output = engine_->transcribe(params);
    } catch (const std::exception& e) {
        return std::unexpected(ApiError::internal(std::string("Transcription failed: ") + e.what()));
    }
    auto end = std::chrono::steady_clock::now();

    if (!output) {
        return std::unexpected(ApiError::internal("Transcription failed: " + output.error()));
    }

    std::string joined;
    for (const auto& segment : output->segments) {
        joined += segment.text;
    }

    return TranscriptionResult{
        .text = std::string(text::trim_unicode(joined)),
        .language = output->info.language,
        .audio_duration_s = request.audio.duration_s(),
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}
