#pragma once

#include <cstdio>
#include <utility>

#include "fmt/core.h"

// Leveled diagnostics on stderr. The threshold is process-wide and defaults to Warn.
namespace ctrlkit::log {

enum class Level {
    Silent,
    Error,
    Warn,
    Info,
    Debug,
};

inline Level& threshold() {
    static Level level = Level::Warn;
    return level;
}

inline void  setLevel(Level level) { threshold() = level; }
inline Level getLevel() { return threshold(); }

inline bool enabled(Level level) {
    return level != Level::Silent && static_cast<int>(level) <= static_cast<int>(threshold());
}

constexpr const char* tag(Level level) {
    switch (level) {
        case Level::Error: return "error";
        case Level::Warn: return "warn";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        default: return "";
    }
}

// Writes one tagged line regardless of the threshold. Used for output a caller asked for
// explicitly, such as the outer-approximation verbosity option.
template <typename... Args>
void emit(Level level, fmt::format_string<Args...> format, Args&&... args) {
    fmt::print(stderr, "[ctrlkit:{}] {}\n", tag(level), fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void write(Level level, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(level)) {
        return;
    }
    emit(level, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Debug, format, std::forward<Args>(args)...);
}

}  // namespace ctrlkit::log
