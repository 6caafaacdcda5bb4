#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace wirefrag
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
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

// false for names it does not know; `out` is left alone then
inline bool parse_log_level(const char *name, Level &out)
{
    std::string level = name ? std::string(name) : std::string();
    if (level == "debug" || level == "DEBUG")
        out = Level::Debug;
    else if (level == "info" || level == "INFO")
        out = Level::Info;
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        out = Level::Warning;
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        out = Level::Error;
    else
        return false;
    return true;
}

// Unknown names fall back to info.
inline void set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;
    parse_log_level(name, lv);
    set_log_level(lv);
}

inline void logf(Level lv, const char *func, const char *fmt, ...);

// WIREFRAG_LOG_LEVEL, if set. An unknown value selects info and says so on stderr.
inline void init_log_from_env()
{
    const char *lv = std::getenv("WIREFRAG_LOG_LEVEL");
    if (!lv || !*lv)
        return;
    Level parsed = Level::Info;
    if (!parse_log_level(lv, parsed))
    {
        set_log_level(Level::Info);
        logf(Level::Warning, __func__, "Ignoring invalid WIREFRAG_LOG_LEVEL=%s, using info", lv);
        return;
    }
    set_log_level(parsed);
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

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::wirefrag::logf(::wirefrag::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::wirefrag::logf(::wirefrag::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::wirefrag::logf(::wirefrag::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::wirefrag::logf(::wirefrag::Level::Error, __func__, __VA_ARGS__)

}  // namespace wirefrag
