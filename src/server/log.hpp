#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

// Leveled stderr logging in the "component: message" style, optionally
// mirrored to a file.
namespace logging {

enum class Level { Debug, Info, Warn, Error };

void set_level(Level level);
Level level();

// Parses "debug", "info", "warn"/"warning", "error". Unknown names yield Info.
Level parse_level(std::string_view name);

// Appends every line to this file as well as stderr. Empty path disables it.
bool set_file(const std::string& path);

void write(Level level, std::string_view component, std::string_view msg);

inline bool enabled(Level lvl) { return lvl >= level(); }

template <typename... Args>
void debug(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug))
        write(Level::Debug, component, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info))
        write(Level::Info, component, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn))
        write(Level::Warn, component, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error))
        write(Level::Error, component, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
