#include "whisper/lan_engine.hpp"

#include "audio/audio_normalizer.hpp"
#include "wav_encoder.hpp"

#include <curl/curl.h>
#include <format>
#include <memory>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlCleanup {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct MimeFree {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};

void add_text_part(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::string error_message(const json& j) {
    const auto& err = j["error"];
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object() && err.contains("message")) return err["message"].get<std::string>();
    return err.dump();
}

} // namespace

LanEngine::LanEngine(std::string url, std::string api_format, std::string model)
    : url_(std::move(url)), api_format_(std::move(api_format)), model_(std::move(model)) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanEngine::~LanEngine() {
    curl_global_cleanup();
}

std::expected<EngineOutput, std::string> LanEngine::transcribe(const EngineParams& params) {
    if (params.audio.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode(params.audio, kEngineSampleRate);
    double duration_s = static_cast<double>(params.audio.size()) / kEngineSampleRate;

    std::unique_ptr<CURL, CurlCleanup> curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::unique_ptr<curl_mime, MimeFree> mime(curl_mime_init(curl.get()));

    curl_mimepart* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (params.language) add_text_part(mime.get(), "language", *params.language);
    if (params.initial_prompt) add_text_part(mime.get(), "prompt", *params.initial_prompt);
    if (params.temperature) add_text_part(mime.get(), "temperature", std::format("{}", *params.temperature));

    bool openai = api_format_ == "openai";
    std::string endpoint;
    if (openai) {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_text_part(mime.get(), "model", model_);
        add_text_part(mime.get(), "response_format", "json");
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";
        add_text_part(mime.get(), "response_format", "verbose_json");
        add_text_part(mime.get(), "no_context", params.condition_on_previous_text ? "false" : "true");
        if (params.vad_filter) add_text_part(mime.get(), "vad", "true");
    }

    std::string response_body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    try {
        auto j = json::parse(response_body);

        if (j.contains("error")) {
            return std::unexpected(std::format("server error ({}): {}", status, error_message(j)));
        }
        if (status != 200) {
            return std::unexpected(std::format("server returned HTTP {}", status));
        }

        EngineOutput out;
        out.info.duration_s = duration_s;
        out.info.language = j.value("language", params.language.value_or(""));

        if (j.contains("segments") && j["segments"].is_array()) {
            for (const auto& s : j["segments"]) {
                out.segments.push_back(Segment{
                    .text = s.value("text", ""),
                    .start_s = s.value("start", 0.0),
                    .end_s = s.value("end", 0.0),
                });
            }
        } else if (j.contains("text")) {
            out.segments.push_back(Segment{
                .text = j["text"].get<std::string>(),
                .start_s = 0.0,
                .end_s = duration_s,
            });
        } else {
            return std::unexpected("unexpected response: " + response_body);
        }

        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
