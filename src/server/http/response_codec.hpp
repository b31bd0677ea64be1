#pragma once

#include "http/api_error.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

// OpenAI-compatible JSON bodies and their HTTP framing.
namespace response_codec {

HttpResponse models_list(const std::string& model_name);
HttpResponse transcription(const std::string& text);
HttpResponse error(const ApiError& err);

std::string_view reason_phrase(int status);

// Status line, Content-Type, exact Content-Length, Connection: close, body.
std::string serialize(const HttpResponse& response);

} // namespace response_codec
