#include "lan_backend.hpp"
#include "../wav.hpp"

#include <curl/curl.h>
#include <format>
#include <vector>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string trim(std::string text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

} // namespace

LanBackend::LanBackend(std::string url, std::string api_format, std::string model, long timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)), model_(std::move(model)),
      timeout_s_(timeout_s) {}

std::expected<Transcript, std::string>
LanBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                       const TranscribeOptions& options) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode(audio, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = api_format_ == "openai" ? url_ + "/v1/audio/transcriptions"
                                                   : url_ + "/inference";
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (api_format_ == "openai") add_field(mime, "model", model_);
    add_field(mime, "temperature", std::format("{}", options.temperature));
    add_field(mime, "response_format", options.return_timestamps ? "verbose_json" : "json");
    if (!options.language.empty()) add_field(mime, "language", options.language);
    if (!options.prompt.empty()) add_field(mime, "prompt", options.prompt);

    std::string response_body;
    long http_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    try {
        auto j = json::parse(response_body);
        if (http_code >= 400 && !j.contains("error")) {
            return std::unexpected(std::format("server returned HTTP {}", http_code));
        }
        return parse_response(j, options.return_timestamps);
    } catch (const json::exception& e) {
        if (http_code >= 400) return std::unexpected(std::format("server returned HTTP {}", http_code));
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<Transcript, std::string>
LanBackend::parse_response(const json& j, bool want_segments) {
    if (j.contains("error")) {
        const auto& err = j["error"];
        std::string msg = err.is_string() ? err.get<std::string>()
                        : err.contains("message") ? err["message"].get<std::string>()
                        : err.dump();
        return std::unexpected("server error: " + msg);
    }
    if (!j.contains("text")) {
        return std::unexpected("unexpected response: " + j.dump());
    }

    Transcript t{.text = trim(j["text"].get<std::string>())};
    if (!want_segments) return t;

    std::vector<Segment> segments;
    if (j.contains("segments")) {
        for (const auto& s : j["segments"]) {
            // Seconds as floats; truncated to whole milliseconds
            segments.push_back(Segment{
                .start_time_ms = static_cast<int64_t>(s.value("start", 0.0) * 1000.0),
                .end_time_ms = static_cast<int64_t>(s.value("end", 0.0) * 1000.0),
                .text = trim(s.value("text", std::string{})),
            });
        }
    }
    t.segments = std::move(segments);
    return t;
}
