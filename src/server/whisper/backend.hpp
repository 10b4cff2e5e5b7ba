#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

struct Segment {
    int64_t start_time_ms = 0;
    int64_t end_time_ms = 0;
    std::string text;
};

struct TranscribeOptions {
    std::string language;
    double temperature = 0.0;
    std::string prompt;
    bool return_timestamps = false;
};

struct Transcript {
    std::string text;
    std::optional<std::vector<Segment>> segments; // set when timestamps were requested
};

class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;
    virtual std::expected<Transcript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const TranscribeOptions& options) = 0;
};
