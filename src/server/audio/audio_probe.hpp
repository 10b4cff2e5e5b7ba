#pragma once

#include "../error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

struct AudioFormat {
    uint32_t sample_rate = 0;
    uint32_t channels = 0;
};

// ffprobe format=duration, in seconds. A probe still running at the deadline
// is killed and reported as ErrorKind::Timeout.
std::expected<double, Error> probe_duration(const std::string& ffprobe, const std::string& path,
                                            std::chrono::milliseconds timeout);

// Sample rate and channel count as reported by soxi.
std::expected<AudioFormat, Error> probe_format(const std::string& soxi, const std::string& path,
                                               std::chrono::milliseconds timeout);

// Parses soxi's "Sample Rate : 16000" / "Channels : 1" report.
std::expected<AudioFormat, std::string> parse_soxi_report(const std::string& report);
