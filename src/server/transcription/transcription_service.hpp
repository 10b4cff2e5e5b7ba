#pragma once

#include "../audio/audio_pipeline.hpp"
#include "../config.hpp"
#include "../error.hpp"
#include "../source/audio_source.hpp"
#include "../whisper/backend.hpp"

#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

class FileValidator;
class HistoryDb;
class ResourceManager;

// Per-request overrides. Unset fields fall back to the configured defaults.
struct RequestParams {
    std::optional<std::string> language;
    std::optional<double> temperature;
    std::string prompt;
    std::optional<bool> return_timestamps;
};

struct TranscriptionResponse {
    Transcript transcript;
    double processing_time = 0.0;   // seconds spent in inference
    size_t response_size_bytes = 0;
    double duration_seconds = 0.0;  // of the staged input, before processing
    std::string model;
    std::string source_name;

    nlohmann::json to_json() const;
};

// "true", "t", "yes", "y", "1" (any case) are true; anything else is false.
bool parse_flag(std::string_view value);

// Source -> validate -> stage -> probe -> pipeline -> inference -> response.
class TranscriptionService {
public:
    TranscriptionService(const Config& config, ResourceManager& resources,
                         InferenceBackend& backend, HistoryDb* history = nullptr);

    std::expected<TranscriptionResponse, Error>
        run(AudioSource& source, const RequestParams& params,
            const FileValidator* validator = nullptr);

    // File name part of the configured model path.
    std::string model_name() const;

    ResourceManager& resources() { return resources_; }

private:
    Config::Backend backend_cfg_;
    Config::Audio audio_cfg_;
    Config::Tools tools_;
    ResourceManager& resources_;
    InferenceBackend& backend_;
    HistoryDb* history_;
    AudioPipeline pipeline_;
};
