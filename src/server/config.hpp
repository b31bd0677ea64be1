#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct ModelOptions {
    std::string model_name = "whisper-local";
    bool condition_on_previous_text = true;
    bool vad_filter = false;
};

struct Config {
    struct Server {
        std::string host = "127.0.0.1";
        uint16_t port = 5000;
        size_t max_body_bytes = 100 * 1024 * 1024;
        uint32_t read_timeout_s = 60;
    } server;

    // "model_options": { "local": { ... } } in the config file.
    ModelOptions model;

    struct Engine {
        std::string type = "lan"; // "lan" or "none"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    } engine;

    static Config load(const std::string& path);
    static Config load_default();
};
