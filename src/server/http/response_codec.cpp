#include "http/response_codec.hpp"

#include <format>
#include <nlohmann/json.hpp>

using ordered_json = nlohmann::ordered_json;

namespace response_codec {

namespace {

std::string dump(const ordered_json& j) {
    // Text from clients or the engine is never allowed to fail serialization.
    return j.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

HttpResponse json_response(int status, const ordered_json& j) {
    return HttpResponse{.status = status, .content_type = "application/json", .body = dump(j), .headers = {}};
}

} // namespace

HttpResponse models_list(const std::string& model_name) {
    ordered_json model = {
        {"id", model_name},
        {"object", "model"},
        {"owned_by", "local"},
    };
    ordered_json body = {
        {"object", "list"},
        {"data", ordered_json::array({model})},
    };
    return json_response(200, body);
}

HttpResponse transcription(const std::string& text) {
    return json_response(200, ordered_json{{"text", text}});
}

HttpResponse error(const ApiError& err) {
    ordered_json body = {
        {"error", {
            {"message", err.message},
            {"type", "invalid_request_error"},
            {"code", nullptr},
        }},
    };
    return json_response(err.http_status, body);
}

std::string_view reason_phrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string serialize(const HttpResponse& response) {
    std::string out = std::format("HTTP/1.1 {} {}\r\n", response.status, reason_phrase(response.status));
    out += std::format("Content-Type: {}\r\n", response.content_type);
    out += std::format("Content-Length: {}\r\n", response.body.size());
    for (const auto& [name, value] : response.headers) {
        out += std::format("{}: {}\r\n", name, value);
    }
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

} // namespace response_codec
