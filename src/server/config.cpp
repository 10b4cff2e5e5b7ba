#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            read_key(s, "host", cfg.server.host);
            read_key(s, "port", cfg.server.port);
            read_key(s, "version", cfg.server.version);
        }

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "type", cfg.backend.type);
            read_key(b, "url", cfg.backend.url);
            read_key(b, "api_format", cfg.backend.api_format);
            read_key(b, "language", cfg.backend.language);
            read_key(b, "model", cfg.backend.model);
            read_key(b, "temperature", cfg.backend.temperature);
            read_key(b, "return_timestamps", cfg.backend.return_timestamps);
            read_key(b, "timeout_s", cfg.backend.timeout_s);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "norm_level", cfg.audio.norm_level);
            read_key(a, "compand_params", cfg.audio.compand_params);
            read_key(a, "speed_factor", cfg.audio.speed_factor);
            read_key(a, "pad_lead_s", cfg.audio.pad_lead_s);
            read_key(a, "pad_trail_s", cfg.audio.pad_trail_s);
            read_key(a, "probe_timeout_s", cfg.audio.probe_timeout_s);
            read_key(a, "process_timeout_s", cfg.audio.process_timeout_s);
            read_key(a, "scratch_dir", cfg.audio.scratch_dir);
        }

        if (j.contains("tools")) {
            auto& t = j["tools"];
            read_key(t, "ffmpeg", cfg.tools.ffmpeg);
            read_key(t, "ffprobe", cfg.tools.ffprobe);
            read_key(t, "sox", cfg.tools.sox);
            read_key(t, "soxi", cfg.tools.soxi);
        }

        if (j.contains("validation")) {
            auto& v = j["validation"];
            read_key(v, "max_file_size_mb", cfg.validation.max_file_size_mb);
            read_key(v, "allowed_extensions", cfg.validation.allowed_extensions);
            read_key(v, "allowed_mime_types", cfg.validation.allowed_mime_types);
        }

        read_key(j, "allowed_directories", cfg.allowed_directories);

        if (j.contains("tasks")) read_key(j["tasks"], "max_age_s", cfg.tasks.max_age_s);
        if (j.contains("cache")) read_key(j["cache"], "model_ttl_s", cfg.cache.model_ttl_s);

        if (j.contains("history")) {
            auto& h = j["history"];
            read_key(h, "enabled", cfg.history.enabled);
            read_key(h, "path", cfg.history.path);
        }

        if (j.contains("logging")) {
            auto& l = j["logging"];
            read_key(l, "level", cfg.logging.level);
            read_key(l, "file", cfg.logging.file);
            read_key(l, "requests", cfg.logging.requests);
            read_key(l, "exclude_paths", cfg.logging.exclude_paths);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
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

json Config::to_json() const {
    return {
        {"server", {{"host", server.host}, {"port", server.port}, {"version", server.version}}},
        {"backend", {
            {"type", backend.type},
            {"url", backend.url},
            {"api_format", backend.api_format},
            {"language", backend.language},
            {"model", backend.model},
            {"temperature", backend.temperature},
            {"return_timestamps", backend.return_timestamps},
            {"timeout_s", backend.timeout_s},
        }},
        {"audio", {
            {"sample_rate", audio.sample_rate},
            {"norm_level", audio.norm_level},
            {"compand_params", audio.compand_params},
            {"speed_factor", audio.speed_factor},
            {"pad_lead_s", audio.pad_lead_s},
            {"pad_trail_s", audio.pad_trail_s},
            {"probe_timeout_s", audio.probe_timeout_s},
            {"process_timeout_s", audio.process_timeout_s},
            {"scratch_dir", audio.scratch_dir},
        }},
        {"tools", {
            {"ffmpeg", tools.ffmpeg},
            {"ffprobe", tools.ffprobe},
            {"sox", tools.sox},
            {"soxi", tools.soxi},
        }},
        {"validation", {
            {"max_file_size_mb", validation.max_file_size_mb},
            {"allowed_extensions", validation.allowed_extensions},
            {"allowed_mime_types", validation.allowed_mime_types},
        }},
        {"allowed_directories", allowed_directories},
        {"tasks", {{"max_age_s", tasks.max_age_s}}},
        {"cache", {{"model_ttl_s", cache.model_ttl_s}}},
        {"history", {{"enabled", history.enabled}, {"path", history.path}}},
        {"logging", {
            {"level", logging.level},
            {"file", logging.file},
            {"requests", logging.requests},
            {"exclude_paths", logging.exclude_paths},
        }},
    };
}
