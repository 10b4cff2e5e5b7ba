#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace proc {

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;

    bool ok() const { return !timed_out && exit_code == 0; }
};

// Runs argv[0] (PATH lookup) with stdin from /dev/null, collecting stdout and
// stderr. A process still alive at the deadline is killed with SIGKILL and
// reaped; the result then has timed_out set. Exit code 127 means exec failed.
// The unexpected branch covers failures to set up or wait for the child.
std::expected<ProcessResult, std::string>
run(const std::vector<std::string>& argv,
    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

// "ffmpeg -i in.wav out.wav" style rendering for log lines.
std::string join_command(const std::vector<std::string>& argv);

} // namespace proc
