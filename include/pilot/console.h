#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/console.h — Leveled, timestamped console logging
// ═══════════════════════════════════════════════════════════════════
//
//  console::info("listening on", host, port);
//  console::setLevel(console::Level::Warn);   // drop info/debug lines
//
//  Arguments are joined with spaces. Info and debug go to stdout,
//  warn and error to stderr. Whole lines are written under one lock,
//  so output from concurrent I/O threads never interleaves. Colors are
//  only used when the stream is a terminal.
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unistd.h>

namespace pilot::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

namespace detail {

// How one kind of line looks
struct Style {
    Level level;
    bool toStderr;
    const char* color;      // ANSI escape
    const char* marker;
};

inline constexpr Style kLog     {Level::Info,  false, "\033[0m",  ""};
inline constexpr Style kInfo    {Level::Info,  false, "\033[34m", "ℹ "};
inline constexpr Style kSuccess {Level::Info,  false, "\033[32m", "✔ "};
inline constexpr Style kDebug   {Level::Debug, false, "\033[36m", "● "};
inline constexpr Style kWarn    {Level::Warn,  true,  "\033[33m", "⚠ "};
inline constexpr Style kError   {Level::Error, true,  "\033[31m", "✖ "};

inline std::atomic<int> threshold{static_cast<int>(Level::Info)};
inline std::mutex writeLock;

inline bool colorful(bool toStderr) {
    static const bool out = ::isatty(STDOUT_FILENO) == 1;
    static const bool err = ::isatty(STDERR_FILENO) == 1;
    return toStderr ? err : out;
}

template <typename T>
void append(std::ostringstream& line, const T& arg) {
    if constexpr (std::is_same_v<T, bool>) {
        line << (arg ? "true" : "false");
    } else if constexpr (std::is_same_v<T, nlohmann::json>) {
        line << arg.dump();
    } else {
        line << arg;
    }
}

// "HH:MM:SS.mmm" local time
inline void appendClock(std::ostringstream& line) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    line << std::put_time(&local, "%H:%M:%S") << '.'
         << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
}

template <typename... Args>
void write(const Style& style, const Args&... args) {
    if (static_cast<int>(style.level) < threshold.load(std::memory_order_relaxed)) return;

    bool color = colorful(style.toStderr);
    std::ostringstream line;
    if (color) line << "\033[90m";
    line << '[';
    appendClock(line);
    line << "] ";
    if (color) line << style.color;
    line << style.marker;
    if (color) line << "\033[0m";

    const char* separator = "";
    ((line << separator, append(line, args), separator = " "), ...);
    line << '\n';

    std::lock_guard<std::mutex> lock(writeLock);
    auto& os = style.toStderr ? std::cerr : std::cout;
    os << line.str() << std::flush;
}

} // namespace detail

// ── Level control ──
inline void setLevel(Level level) {
    detail::threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level level() {
    return static_cast<Level>(detail::threshold.load(std::memory_order_relaxed));
}

// "debug", "info", "warn"/"warning", "error"
inline std::optional<Level> parseLevel(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

template <typename... Args> void log(const Args&... args)     { detail::write(detail::kLog, args...); }
template <typename... Args> void info(const Args&... args)    { detail::write(detail::kInfo, args...); }
template <typename... Args> void success(const Args&... args) { detail::write(detail::kSuccess, args...); }
template <typename... Args> void debug(const Args&... args)   { detail::write(detail::kDebug, args...); }
template <typename... Args> void warn(const Args&... args)    { detail::write(detail::kWarn, args...); }
template <typename... Args> void error(const Args&... args)   { detail::write(detail::kError, args...); }

} // namespace pilot::console
