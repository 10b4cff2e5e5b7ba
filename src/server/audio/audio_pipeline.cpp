#include "audio_pipeline.hpp"

#include "audio_probe.hpp"
#include "../log.hpp"
#include "../process/subprocess.hpp"
#include "../storage/temp_files.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <sstream>

namespace {

bool has_wav_suffix(const std::string& path) {
    if (path.size() < 4) return false;
    std::string ext = path.substr(path.size() - 4);
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".wav";
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string w;
    while (in >> w) out.push_back(w);
    return out;
}

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

std::string format_number(double v) {
    if (std::floor(v) == v) return std::format("{:.1f}", v);
    return std::format("{}", v);
}

ProcessedAudio::~ProcessedAudio() {
    if (!artifacts_.empty()) rm_->release(artifacts_);
}

AudioPipeline::AudioPipeline(Config::Audio audio, Config::Tools tools, ResourceManager& resources)
    : audio_(std::move(audio)), tools_(std::move(tools)), resources_(resources) {}

std::chrono::milliseconds AudioPipeline::process_timeout() const {
    return to_ms(audio_.process_timeout_s);
}

std::chrono::milliseconds AudioPipeline::probe_timeout() const {
    return to_ms(audio_.probe_timeout_s);
}

std::expected<StageResult, Error>
AudioPipeline::run_stage(std::string_view stage, const std::string& suffix,
                         std::vector<std::string> argv, const std::string& input,
                         std::vector<std::string> tail, bool output_before_tail) {
    auto out = resources_.create(suffix);
    if (!out) {
        logging::error("pipeline", "{}: could not create output file: {}", stage, out.error());
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error processing audio"});
    }

    argv.push_back(input);
    if (output_before_tail) {
        argv.push_back(*out);
        argv.insert(argv.end(), tail.begin(), tail.end());
    } else {
        argv.insert(argv.end(), tail.begin(), tail.end());
        argv.push_back(*out);
    }

    logging::debug("pipeline", "{}: {}", stage, proc::join_command(argv));
    auto res = proc::run(argv, process_timeout());

    if (!res || !res->ok()) {
        resources_.release(*out);
        if (!res) {
            logging::error("pipeline", "{} failed to run: {}", stage, res.error());
            return std::unexpected(Error{ErrorKind::ExternalTool, "Error processing audio"});
        }
        if (res->timed_out) {
            logging::error("pipeline", "{} timed out after {}s", stage, audio_.process_timeout_s);
            return std::unexpected(Error{ErrorKind::Timeout, "Timeout while processing audio"});
        }
        logging::error("pipeline", "{} exited with {}: {}", stage, res->exit_code, res->err);
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error processing audio"});
    }

    return StageResult{.path = *out, .produced = true};
}

std::expected<StageResult, Error> AudioPipeline::convert(const std::string& input) {
    if (has_wav_suffix(input)) {
        auto fmt = probe_format(tools_.soxi, input, probe_timeout());
        if (fmt && fmt->sample_rate == audio_.sample_rate && fmt->channels == 1) {
            logging::debug("pipeline", "convert: {} already {} Hz mono", input, audio_.sample_rate);
            return StageResult{.path = input, .produced = false};
        }
    }

    return run_stage("convert", ".wav",
                     {tools_.ffmpeg, "-hide_banner", "-loglevel", "warning", "-i"}, input,
                     {"-ar", std::to_string(audio_.sample_rate), "-ac", "1"}, false);
}

std::expected<StageResult, Error> AudioPipeline::normalize(const std::string& input) {
    std::vector<std::string> tail = {"norm", audio_.norm_level, "compand"};
    for (auto& w : split_words(audio_.compand_params)) tail.push_back(w);
    return run_stage("normalize", "_normalized.wav", {tools_.sox}, input, std::move(tail), true);
}

std::expected<StageResult, Error> AudioPipeline::speed_up(const std::string& input) {
    if (audio_.speed_factor == 1.0) {
        return StageResult{.path = input, .produced = false};
    }
    return run_stage("speed_up", "_speedup.wav",
                     {tools_.ffmpeg, "-hide_banner", "-loglevel", "warning", "-i"}, input,
                     {"-filter:a", "atempo=" + format_number(audio_.speed_factor)}, false);
}

std::expected<StageResult, Error> AudioPipeline::pad(const std::string& input) {
    return run_stage("pad", "_silence.wav", {tools_.sox}, input,
                     {"pad", format_number(audio_.pad_lead_s), format_number(audio_.pad_trail_s)},
                     true);
}

std::expected<ProcessedAudio, Error> AudioPipeline::process(const std::string& input) {
    using Stage = std::expected<StageResult, Error> (AudioPipeline::*)(const std::string&);
    constexpr Stage stages[] = {
        &AudioPipeline::convert,
        &AudioPipeline::normalize,
        &AudioPipeline::speed_up,
        &AudioPipeline::pad,
    };

    std::vector<std::string> artifacts;
    std::string current = input;

    for (auto stage : stages) {
        auto res = (this->*stage)(current);
        if (!res) {
            resources_.release(artifacts);
            return std::unexpected(res.error());
        }
        if (res->produced) artifacts.push_back(res->path);
        current = res->path;
    }

    return ProcessedAudio(resources_, std::move(current), std::move(artifacts));
}
