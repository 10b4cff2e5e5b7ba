#pragma once

#include "backend.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Posts WAV audio to a whisper.cpp server (/inference) or an OpenAI-compatible
// one (/v1/audio/transcriptions).
class LanBackend : public InferenceBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string model = "whisper-1", long timeout_s = 600);

    std::expected<Transcript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const TranscribeOptions& options) override;

    // Maps a JSON or verbose_json reply to a transcript.
    static std::expected<Transcript, std::string>
        parse_response(const nlohmann::json& j, bool want_segments);

private:
    std::string url_;
    std::string api_format_;
    std::string model_;
    long timeout_s_;
};
