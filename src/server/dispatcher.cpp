#include "dispatcher.hpp"

#include "http/multipart.hpp"
#include "transcription_request.hpp"

#include <exception>
#include <format>

namespace {

bool route_matches(const std::string& path, std::string_view route) {
    if (path == route) return true;
    return path.size() == route.size() + 1 && path.starts_with(route) && path.back() == '/';
}

} // namespace

Dispatcher::Dispatcher(ModelOptions options, EngineGateway& gateway, AudioDecoder& decoder,
                       LogSink log)
    : options_(std::move(options)), gateway_(gateway), normalizer_(decoder),
      log_(std::move(log)) {}

HttpResponse Dispatcher::handle(RawRequest& request, const BodyReader& read_body) {
    if (request.method == "GET" && route_matches(request.path, "/v1/models")) {
        return handle_models();
    }
    if (request.method == "POST" && route_matches(request.path, "/v1/audio/transcriptions")) {
        return handle_transcription(request, read_body);
    }
    return response_codec::error(ApiError::not_found());
}

HttpResponse Dispatcher::handle_models() {
    return response_codec::models_list(options_.model_name);
}

HttpResponse Dispatcher::handle_transcription(RawRequest& request, const BodyReader& read_body) {
    if (!gateway_.available()) {
        return response_codec::error(ApiError::service_unavailable("Local model not available"));
    }

    if (request.header("Content-Type").find("multipart/form-data") == std::string::npos) {
        return response_codec::error(
            ApiError::invalid_request("Content-Type must be multipart/form-data"));
    }

    std::expected<TranscriptionResult, ApiError> result;
    try {
        if (auto body = read_body(request); !body) {
            return response_codec::error(body.error());
        }
        result = transcribe(request);
    } catch (const std::exception& e) {
        result = std::unexpected(ApiError::internal(std::string("Transcription failed: ") + e.what()));
    }

    if (!result) {
        log("API transcription error: " + result.error().message);
        return response_codec::error(result.error());
    }

    return response_codec::transcription(result->text);
}

std::expected<TranscriptionResult, ApiError> Dispatcher::transcribe(const RawRequest& request) {
    auto fields = multipart::decode(request.body, request.header("Content-Type"));
    if (!fields) return std::unexpected(fields.error());

    auto req = build_transcription_request(*fields, options_, normalizer_);
    if (!req) return std::unexpected(req.error());

    log(std::format("API: Received audio. Duration: {:.2f} seconds", req->audio.duration_s()));
    log("Transcribing...");

    auto result = gateway_.invoke(*req);
    if (result) {
        log(std::format("Transcription completed in {:.2f} seconds. Result: {}",
                        result->processing_s, result->text));
    }
    return result;
}

void Dispatcher::log(const std::string& msg) {
    if (log_) log_(msg);
}
