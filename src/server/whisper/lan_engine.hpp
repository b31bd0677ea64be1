#pragma once

#include "whisper/engine.hpp"

#include <string>

// Forwards audio to a whisper.cpp server or another OpenAI-compatible server
// on the network, uploading it as a 16 kHz mono WAV.
class LanEngine : public TranscriptionEngine {
public:
    // api_format: "whisper.cpp" or "openai"
    LanEngine(std::string url, std::string api_format = "whisper.cpp",
              std::string model = "whisper-1");
    ~LanEngine() override;

    LanEngine(const LanEngine&) = delete;
    LanEngine& operator=(const LanEngine&) = delete;

    std::string name() const override { return "lan"; }

    std::expected<EngineOutput, std::string> transcribe(const EngineParams& params) override;

private:
    std::string url_;
    std::string api_format_;
    std::string model_;
};
