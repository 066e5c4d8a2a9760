#pragma once
#include <chrono>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace parkterm
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-visible outcomes (connect, coins, payment, failures)
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline std::optional<Level> level_from_name(std::string_view name)
{
    std::string level(name);
    for (auto &c : level)
        c = (char)std::tolower((unsigned char)c);

    if (level == "debug")
        return Level::Debug;
    if (level == "info")
        return Level::Info;
    if (level == "warn" || level == "warning")
        return Level::Warning;
    if (level == "error" || level == "err")
        return Level::Error;
    if (level == "system")
        return Level::System;
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    auto lv = level_from_name(name ? name : "");
    set_log_level(lv ? *lv : Level::Info);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one fprintf per line piece keeps lines from different threads mostly intact
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::parkterm::logf(::parkterm::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::parkterm::logf(::parkterm::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::parkterm::logf(::parkterm::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::parkterm::logf(::parkterm::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::parkterm::logf(::parkterm::Level::System, __func__, __VA_ARGS__)

}  // namespace parkterm
