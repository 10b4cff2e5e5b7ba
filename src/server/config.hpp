#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 5042;
        std::string version = "1.0.0";
    } server;

    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        std::string model = "whisper-large-v3";
        double temperature = 0.0;
        bool return_timestamps = false;
        uint32_t timeout_s = 600;
    } backend;

    struct Audio {
        uint32_t sample_rate = 16000;
        std::string norm_level = "-0.5";
        std::string compand_params = "0.3,1 -90,-90,-70,-70,-60,-20,0,0 -5 0 0.2";
        double speed_factor = 1.25;
        double pad_lead_s = 2.0;
        double pad_trail_s = 1.0;
        double probe_timeout_s = 10.0;
        double process_timeout_s = 300.0;
        std::string scratch_dir; // empty: system temp directory
    } audio;

    struct Tools {
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
        std::string sox = "sox";
        std::string soxi = "soxi";
    } tools;

    struct Validation {
        uint32_t max_file_size_mb = 100;
        std::vector<std::string> allowed_extensions = {".wav", ".mp3", ".ogg", ".flac", ".m4a"};
        std::vector<std::string> allowed_mime_types = {
            "audio/wav", "audio/x-wav", "audio/vnd.wave", "audio/mpeg", "audio/ogg",
            "audio/flac", "audio/x-flac", "audio/mp4", "audio/x-m4a", "video/mp4"};

        uint64_t max_file_size_bytes() const {
            return static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024;
        }
    } validation;

    // Roots that POST /local/transcriptions may read from.
    std::vector<std::string> allowed_directories;

    struct Tasks {
        uint32_t max_age_s = 3600;
    } tasks;

    struct Cache {
        uint32_t model_ttl_s = 3600;
    } cache;

    struct History {
        bool enabled = false;
        std::string path; // empty: <data dir>/history.db
    } history;

    struct Logging {
        std::string level = "info";
        std::string file;
        bool requests = true;
        std::vector<std::string> exclude_paths = {"/health"};
    } logging;

    static Config load(const std::string& path);
    static Config load_default();

    nlohmann::json to_json() const;
};
