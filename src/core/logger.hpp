#pragma once

#include <mutex>
#include <string>
#include <cstdarg>

class Logger {
public:
    enum class Level { Error = 0, Warn, Info, Debug };

    /// Set the global level (call once from main, or from tests)
    static void init(Level lvl);

    /// Parse "error" / "warn" / "info" / "debug"; returns false on anything else
    static bool parse_level(const std::string& name, Level& out);

    static void error(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void debug(const char* fmt, ...);

private:
    static void log(Level lvl, const char* fmt, va_list ap);

    static Level s_level_;
    static std::mutex s_mutex_;
};
