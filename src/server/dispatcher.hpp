#pragma once

#include "audio/audio_decoder.hpp"
#include "audio/audio_normalizer.hpp"
#include "config.hpp"
#include "http/api_error.hpp"
#include "http/raw_request.hpp"
#include "http/response_codec.hpp"
#include "whisper/engine_gateway.hpp"

#include <expected>
#include <functional>
#include <string>

// Routes one request to its handler and turns every outcome, including
// unexpected exceptions, into a complete response.
class Dispatcher {
public:
    using BodyReader = std::function<std::expected<void, ApiError>(RawRequest&)>;
    using LogSink = std::function<void(const std::string&)>;

    Dispatcher(ModelOptions options, EngineGateway& gateway, AudioDecoder& decoder,
               LogSink log = {});

    // read_body is called at most once, and only once the request has passed
    // the checks that do not need the body.
    HttpResponse handle(RawRequest& request, const BodyReader& read_body);

private:
    HttpResponse handle_models();
    HttpResponse handle_transcription(RawRequest& request, const BodyReader& read_body);
    std::expected<TranscriptionResult, ApiError> transcribe(const RawRequest& request);

    void log(const std::string& msg);

    ModelOptions options_;
    EngineGateway& gateway_;
    AudioNormalizer normalizer_;
    LogSink log_;
};
