#pragma once

#include "../config.hpp"
#include "../error.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

class ResourceManager;

struct StageResult {
    std::string path;
    bool produced = false; // false: the input was passed through untouched
};

// Owns the artifacts of one pipeline run and releases them on destruction.
class ProcessedAudio {
public:
    ProcessedAudio(ResourceManager& rm, std::string path, std::vector<std::string> artifacts)
        : rm_(&rm), path_(std::move(path)), artifacts_(std::move(artifacts)) {}
    ~ProcessedAudio();

    ProcessedAudio(ProcessedAudio&& o) noexcept
        : rm_(o.rm_), path_(std::move(o.path_)), artifacts_(std::move(o.artifacts_)) {
        o.artifacts_.clear();
    }
    ProcessedAudio& operator=(ProcessedAudio&&) = delete;
    ProcessedAudio(const ProcessedAudio&) = delete;
    ProcessedAudio& operator=(const ProcessedAudio&) = delete;

    const std::string& path() const { return path_; }
    const std::vector<std::string>& artifacts() const { return artifacts_; }

private:
    ResourceManager* rm_;
    std::string path_;
    std::vector<std::string> artifacts_;
};

// convert (ffmpeg) -> normalize (sox norm + compand) -> speed up (ffmpeg
// atempo) -> pad (sox pad). Each stage writes a fresh scratch file; on any
// failure every artifact produced so far is released before returning.
class AudioPipeline {
public:
    AudioPipeline(Config::Audio audio, Config::Tools tools, ResourceManager& resources);

    std::expected<StageResult, Error> convert(const std::string& input);
    std::expected<StageResult, Error> normalize(const std::string& input);
    std::expected<StageResult, Error> speed_up(const std::string& input);
    std::expected<StageResult, Error> pad(const std::string& input);

    std::expected<ProcessedAudio, Error> process(const std::string& input);

    std::chrono::milliseconds process_timeout() const;
    std::chrono::milliseconds probe_timeout() const;

private:
    // argv + input + (output + tail | tail + output)
    std::expected<StageResult, Error> run_stage(std::string_view stage, const std::string& suffix,
                                                std::vector<std::string> argv,
                                                const std::string& input,
                                                std::vector<std::string> tail,
                                                bool output_before_tail);

    Config::Audio audio_;
    Config::Tools tools_;
    ResourceManager& resources_;
};

// "2.0" for whole numbers, shortest round-trip form otherwise.
std::string format_number(double v);
