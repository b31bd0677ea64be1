#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    // Parse into a copy so a type error halfway through leaves pure defaults.
    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host")) parsed.server.host = s["host"].get<std::string>();
            if (s.contains("port")) parsed.server.port = s["port"].get<uint16_t>();
            if (s.contains("max_body_bytes")) parsed.server.max_body_bytes = s["max_body_bytes"].get<size_t>();
            if (s.contains("read_timeout_s")) parsed.server.read_timeout_s = s["read_timeout_s"].get<uint32_t>();
        }

        if (j.contains("model_options") && j["model_options"].contains("local")) {
            auto& m = j["model_options"]["local"];
            if (m.contains("model")) parsed.model.model_name = m["model"].get<std::string>();
            if (m.contains("condition_on_previous_text")) {
                parsed.model.condition_on_previous_text = m["condition_on_previous_text"].get<bool>();
            }
            if (m.contains("vad_filter")) parsed.model.vad_filter = m["vad_filter"].get<bool>();
        }

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("type")) parsed.engine.type = e["type"].get<std::string>();
            if (e.contains("url")) parsed.engine.url = e["url"].get<std::string>();
            if (e.contains("api_format")) parsed.engine.api_format = e["api_format"].get<std::string>();
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
