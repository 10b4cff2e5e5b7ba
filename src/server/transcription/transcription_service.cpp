#include "transcription_service.hpp"

#include "../audio/audio_probe.hpp"
#include "../log.hpp"
#include "../storage/history_db.hpp"
#include "../storage/temp_files.hpp"
#include "../validation/file_validator.hpp"
#include "../wav.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Runs cleanup(source) once, on release() or destruction.
class SourceGuard {
public:
    explicit SourceGuard(AudioSource& source) : source_(source) {}
    ~SourceGuard() { release(); }

    SourceGuard(const SourceGuard&) = delete;
    SourceGuard& operator=(const SourceGuard&) = delete;

    void release() {
        if (!released_) {
            released_ = true;
            cleanup(source_);
        }
    }

private:
    AudioSource& source_;
    bool released_ = false;
};

std::string staging_suffix(const std::string& name) {
    auto ext = fs::path(name).extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext.empty() ? ".wav" : ext;
}

json segments_json(const std::vector<Segment>& segments) {
    json arr = json::array();
    for (const auto& s : segments) {
        arr.push_back({
            {"start_time_ms", s.start_time_ms},
            {"end_time_ms", s.end_time_ms},
            {"text", s.text},
        });
    }
    return arr;
}

} // namespace

bool parse_flag(std::string_view value) {
    std::string v(value);
    std::ranges::transform(v, v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "true" || v == "t" || v == "yes" || v == "y" || v == "1";
}

json TranscriptionResponse::to_json() const {
    json j = {
        {"text", transcript.text},
        {"processing_time", processing_time},
        {"response_size_bytes", response_size_bytes},
        {"duration_seconds", duration_seconds},
        {"model", model},
    };
    if (transcript.segments) j["segments"] = segments_json(*transcript.segments);
    return j;
}

TranscriptionService::TranscriptionService(const Config& config, ResourceManager& resources,
                                           InferenceBackend& backend, HistoryDb* history)
    : backend_cfg_(config.backend), audio_cfg_(config.audio), tools_(config.tools),
      resources_(resources), backend_(backend), history_(history),
      pipeline_(config.audio, config.tools, resources) {}

std::string TranscriptionService::model_name() const {
    return fs::path(backend_cfg_.model).filename().string();
}

std::expected<TranscriptionResponse, Error>
TranscriptionService::run(AudioSource& source, const RequestParams& params,
                          const FileValidator* validator) {
    SourceGuard guard(source);

    auto fetched = fetch(source);
    if (!fetched) {
        logging::warn("transcribe", "fetch failed: {}", fetched.error().message);
        return std::unexpected(fetched.error());
    }

    if (validator) {
        if (auto ok = validator->validate(*fetched->stream, fetched->name); !ok) {
            return std::unexpected(ok.error());
        }
    }

    if (auto size = check_size(*fetched->stream, UINT64_MAX); size && *size == 0) {
        return std::unexpected(Error{ErrorKind::BadRequest, "Uploaded file is empty"});
    }

    auto staged = ScopedTempFile::create(resources_, staging_suffix(fetched->name));
    if (!staged) {
        logging::error("transcribe", "could not stage {}: {}", fetched->name, staged.error());
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error staging audio"});
    }
    {
        std::ofstream out(staged->path(), std::ios::binary);
        out << fetched->stream->rdbuf();
        if (!out) {
            logging::error("transcribe", "could not write {}", staged->path());
            return std::unexpected(Error{ErrorKind::ExternalTool, "Error staging audio"});
        }
    }
    fetched->stream.reset();

    auto duration = probe_duration(tools_.ffprobe, staged->path(), pipeline_.probe_timeout());
    if (!duration) return std::unexpected(duration.error());

    guard.release();

    auto processed = pipeline_.process(staged->path());
    if (!processed) return std::unexpected(processed.error());

    auto wave = wav::load(processed->path(), audio_cfg_.sample_rate);
    if (!wave) {
        logging::error("transcribe", "could not load processed audio: {}", wave.error());
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error loading processed audio"});
    }

    TranscribeOptions options{
        .language = params.language.value_or(backend_cfg_.language),
        .temperature = params.temperature.value_or(backend_cfg_.temperature),
        .prompt = params.prompt,
        .return_timestamps = params.return_timestamps.value_or(backend_cfg_.return_timestamps),
    };

    auto start = std::chrono::steady_clock::now();
    auto transcript = backend_.transcribe(wave->samples, wave->sample_rate, options);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!transcript) {
        logging::error("transcribe", "inference failed for {}: {}", fetched->name, transcript.error());
        return std::unexpected(Error{ErrorKind::Inference, "Error during transcription: " + transcript.error()});
    }

    TranscriptionResponse resp{
        .transcript = std::move(*transcript),
        .processing_time = elapsed,
        .duration_seconds = *duration,
        .model = model_name(),
        .source_name = fetched->name,
    };
    if (options.return_timestamps) {
        if (!resp.transcript.segments) resp.transcript.segments.emplace();
        json body = {{"segments", segments_json(*resp.transcript.segments)},
                     {"text", resp.transcript.text}};
        resp.response_size_bytes = body.dump().size();
    } else {
        resp.transcript.segments.reset();
        resp.response_size_bytes = resp.transcript.text.size();
    }

    logging::info("transcribe", "{}: {:.2f}s audio, inference {:.2f}s", resp.source_name,
                  resp.duration_seconds, resp.processing_time);

    if (history_ && history_->is_open()) {
        if (auto id = history_->save(resp.to_json(), resp.source_name)) {
            logging::debug("transcribe", "saved history entry {}", *id);
        }
    }
    return resp;
}
