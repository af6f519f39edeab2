#pragma once

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <string_view>
#include <utility>

namespace narrate {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Off = 3 };

// Parse "debug", "info", "warn" or "off". Throws ValidationError otherwise.
LogLevel parseLogLevel(std::string_view name);

inline std::atomic<LogLevel>& logThreshold() {
    static std::atomic<LogLevel> level{LogLevel::Info};
    return level;
}

inline void setLogLevel(LogLevel level) { logThreshold().store(level); }

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level == LogLevel::Off or level < logThreshold().load()) return;
    static constexpr std::string_view tags[] = {"[debug] ", "[info] ",
                                                "[warn] "};
    std::fputs("narrate ", stderr);
    std::fputs(tags[static_cast<int>(level)].data(), stderr);
    fmt::print(stderr, format, std::forward<Args>(args)...);
    std::fputc('\n', stderr);
}

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Warn, format, std::forward<Args>(args)...);
}

}  // namespace narrate
