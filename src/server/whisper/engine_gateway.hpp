#pragma once

#include "http/api_error.hpp"
#include "transcription_request.hpp"
#include "whisper/engine.hpp"

#include <expected>
#include <memory>
#include <mutex>
#include <string>

struct TranscriptionResult {
    std::string text; // segments joined in emission order, trimmed
    std::string language;
    double audio_duration_s = 0.0;
    double processing_s = 0.0;
};

// Sole owner of the shared engine. invoke() holds the engine lock for the
// duration of the engine call and nothing else, so at most one transcription
// runs at a time while other connections keep reading and decoding.
class EngineGateway {
public:
    explicit EngineGateway(std::shared_ptr<TranscriptionEngine> engine);

    EngineGateway(const EngineGateway&) = delete;
    EngineGateway& operator=(const EngineGateway&) = delete;

    bool available() const { return engine_ != nullptr; }

    std::expected<TranscriptionResult, ApiError> invoke(const TranscriptionRequest& request);

private:
    std::shared_ptr<TranscriptionEngine> engine_;
    std::mutex engine_mutex_;
};
