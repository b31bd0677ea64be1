#pragma once

#include "audio/audio_decoder.hpp"
#include "whisper/engine.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace test_support {

struct Part {
    std::string name;
    std::string value;
    std::optional<std::string> filename;
};

inline std::string multipart_body(const std::string& boundary, const std::vector<Part>& parts) {
    std::string body;
    for (const auto& p : parts) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + p.name + "\"";
        if (p.filename) body += "; filename=\"" + *p.filename + "\"";
        body += "\r\n";
        if (p.filename) body += "Content-Type: application/octet-stream\r\n";
        body += "\r\n";
        body += p.value;
        body += "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

inline std::string post_request(const std::string& path, const std::string& content_type,
                                const std::string& body) {
    std::string req = "POST " + path + " HTTP/1.1\r\n";
    req += "Host: 127.0.0.1\r\n";
    req += "Content-Type: " + content_type + "\r\n";
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    req += body;
    return req;
}

inline std::string transcription_request(const std::vector<Part>& parts) {
    const std::string boundary = "test-boundary-1234";
    return post_request("/v1/audio/transcriptions",
                        "multipart/form-data; boundary=" + boundary,
                        multipart_body(boundary, parts));
}

// Decoder returning canned samples, optionally after a delay. Tracks how
// many decodes overlap.
class StubDecoder : public AudioDecoder {
public:
    DecodedAudio audio{.samples = std::vector<float>(1600, 0.1f), .sample_rate = 16000, .channels = 1};
    std::optional<std::string> error;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t>) override {
        ++calls;
        int now = ++in_flight;
        int prev = max_in_flight.load();
        while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        --in_flight;

        if (error) return std::unexpected(*error);
        return audio;
    }
};

// Engine that records how many calls overlap and what it was given.
class RecordingEngine : public TranscriptionEngine {
public:
    std::vector<Segment> segments{{" Hello", 0.0, 0.5}, {" world. ", 0.5, 1.0}};
    std::optional<std::string> error;
    bool throw_error = false;
    std::chrono::milliseconds delay{0};

    std::atomic<int> calls{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    std::string name() const override { return "recording"; }

    std::expected<EngineOutput, std::string> transcribe(const EngineParams& params) override {
        int now = ++in_flight;
        int prev = max_in_flight.load();
        while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {
        }
        ++calls;
        {
            std::lock_guard lock(mutex_);
            last_language_ = params.language;
            last_prompt_ = params.initial_prompt;
            last_temperature_ = params.temperature;
            last_condition_ = params.condition_on_previous_text;
            last_vad_ = params.vad_filter;
            last_samples_ = params.audio.size();
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        --in_flight;

        if (throw_error) throw std::runtime_error("engine exploded");
        if (error) return std::unexpected(*error);
        return EngineOutput{.segments = segments, .info = {.language = "en", .duration_s = 0.1}};
    }

    std::optional<std::string> last_language() { std::lock_guard l(mutex_); return last_language_; }
    std::optional<std::string> last_prompt() { std::lock_guard l(mutex_); return last_prompt_; }
    std::optional<float> last_temperature() { std::lock_guard l(mutex_); return last_temperature_; }
    bool last_condition() { std::lock_guard l(mutex_); return last_condition_; }
    bool last_vad() { std::lock_guard l(mutex_); return last_vad_; }
    size_t last_samples() { std::lock_guard l(mutex_); return last_samples_; }

private:
    std::mutex mutex_;
    std::optional<std::string> last_language_;
    std::optional<std::string> last_prompt_;
    std::optional<float> last_temperature_;
    bool last_condition_ = false;
    bool last_vad_ = false;
    size_t last_samples_ = 0;
};

struct HttpReply {
    int status = 0;
    std::string head;
    std::string body;

    nlohmann::json json() const { return nlohmann::json::parse(body); }
};

inline int connect_loopback(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    timeval tv{.tv_sec = 10, .tv_usec = 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

inline bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Reads until the server closes the connection.
inline std::optional<HttpReply> read_reply(int fd) {
    std::string raw;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        raw.append(buf, static_cast<size_t>(n));
    }

    // Skip interim 100 Continue responses.
    while (raw.starts_with("HTTP/1.1 100")) {
        auto end = raw.find("\r\n\r\n");
        if (end == std::string::npos) return std::nullopt;
        raw.erase(0, end + 4);
    }

    auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos || raw.size() < 12) return std::nullopt;

    HttpReply reply;
    reply.head = raw.substr(0, end);
    reply.body = raw.substr(end + 4);
    reply.status = std::stoi(raw.substr(9, 3));
    return reply;
}

inline std::optional<HttpReply> http_exchange(uint16_t port, const std::string& request) {
    int fd = connect_loopback(port);
    if (fd < 0) return std::nullopt;
    std::optional<HttpReply> reply;
    if (send_all(fd, request)) reply = read_reply(fd);
    ::close(fd);
    return reply;
}

} // namespace test_support
