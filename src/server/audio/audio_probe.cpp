#include "audio_probe.hpp"

#include "../log.hpp"
#include "../process/subprocess.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::expected<double, Error> probe_duration(const std::string& ffprobe, const std::string& path,
                                            std::chrono::milliseconds timeout) {
    std::vector<std::string> argv = {
        ffprobe, "-v", "error",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        path,
    };

    auto res = proc::run(argv, timeout);
    if (!res) {
        logging::error("probe", "{}: {}", proc::join_command(argv), res.error());
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error getting audio duration"});
    }
    if (res->timed_out) {
        logging::error("probe", "ffprobe timed out after {}ms on {}", timeout.count(), path);
        return std::unexpected(Error{ErrorKind::Timeout, "Timeout while getting audio duration"});
    }
    if (res->exit_code != 0) {
        logging::error("probe", "ffprobe exited with {}: {}", res->exit_code, trim(res->err));
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error getting audio duration"});
    }

    auto text = trim(res->out);
    try {
        size_t used = 0;
        double d = std::stod(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return d;
    } catch (const std::exception&) {
        logging::error("probe", "unparseable ffprobe duration '{}' for {}", text, path);
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error getting audio duration"});
    }
}

std::expected<AudioFormat, std::string> parse_soxi_report(const std::string& report) {
    AudioFormat fmt;
    std::istringstream in(report);
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        auto key = trim(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));

        uint32_t* target = nullptr;
        if (key == "Sample Rate") target = &fmt.sample_rate;
        else if (key == "Channels") target = &fmt.channels;
        if (!target) continue;

        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), *target);
        if (ec != std::errc{}) return std::unexpected("bad " + key + " value: " + value);
    }
    if (fmt.sample_rate == 0 || fmt.channels == 0) {
        return std::unexpected("sample rate or channel count missing from soxi output");
    }
    return fmt;
}

std::expected<AudioFormat, Error> probe_format(const std::string& soxi, const std::string& path,
                                               std::chrono::milliseconds timeout) {
    std::vector<std::string> argv = {soxi, path};
    auto res = proc::run(argv, timeout);
    if (!res || !res->ok()) {
        std::string why = !res ? res.error()
                         : res->timed_out ? "timed out"
                         : trim(res->err);
        logging::debug("probe", "soxi failed on {}: {}", path, why);
        if (res && res->timed_out) {
            return std::unexpected(Error{ErrorKind::Timeout, "Timeout while probing audio format"});
        }
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error probing audio format"});
    }

    auto fmt = parse_soxi_report(res->out);
    if (!fmt) {
        logging::debug("probe", "{}: {}", path, fmt.error());
        return std::unexpected(Error{ErrorKind::ExternalTool, "Error probing audio format"});
    }
    return *fmt;
}
