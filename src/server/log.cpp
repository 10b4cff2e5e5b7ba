#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <print>

namespace logging {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_mutex;
std::FILE* g_file = nullptr;

std::string_view level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

void set_level(Level lvl) {
    g_level.store(lvl, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

Level parse_level(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

bool set_file(const std::string& path) {
    std::lock_guard lock(g_mutex);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    if (path.empty()) return true;

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    g_file = std::fopen(path.c_str(), "a");
    if (!g_file) {
        std::println(stderr, "log: could not open {}, logging to stderr only", path);
        return false;
    }
    return true;
}

void write(Level lvl, std::string_view component, std::string_view msg) {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto line = std::format("{:%F %T} {} {}: {}", now, level_name(lvl), component, msg);

    std::lock_guard lock(g_mutex);
    std::println(stderr, "{}", line);
    if (g_file) {
        std::println(g_file, "{}", line);
        std::fflush(g_file);
    }
}

} // namespace logging
