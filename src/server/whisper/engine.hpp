#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Everything the engine needs for one call; optional fields are left to the
// engine's own defaults when absent.
struct EngineParams {
    std::span<const float> audio; // mono, 16 kHz
    std::optional<std::string> language;
    std::optional<std::string> initial_prompt;
    std::optional<float> temperature;
    bool condition_on_previous_text = true;
    bool vad_filter = false;
};

struct Segment {
    std::string text;
    double start_s = 0.0;
    double end_s = 0.0;
};

struct EngineInfo {
    std::string language;
    double duration_s = 0.0;
};

struct EngineOutput {
    std::vector<Segment> segments; // in emission order
    EngineInfo info;
};

// Speech-to-text model runtime. Implementations are not assumed reentrant;
// EngineGateway serializes every call.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    virtual std::string name() const = 0;
    virtual std::expected<EngineOutput, std::string> transcribe(const EngineParams& params) = 0;
};
