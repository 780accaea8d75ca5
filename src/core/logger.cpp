#include "core/logger.hpp"

#include <cstdio>

Logger::Level Logger::s_level_ = Logger::Level::Info;
std::mutex Logger::s_mutex_;

void Logger::init(Level lvl) {
    s_level_ = lvl;
}

bool Logger::parse_level(const std::string& name, Level& out) {
    if (name == "error") { out = Level::Error; return true; }
    if (name == "warn")  { out = Level::Warn;  return true; }
    if (name == "info")  { out = Level::Info;  return true; }
    if (name == "debug") { out = Level::Debug; return true; }
    return false;
}

void Logger::error(const char* fmt, ...) {
    if (s_level_ < Level::Error) return;
    va_list ap;
    va_start(ap, fmt);
    log(Level::Error, fmt, ap);
    va_end(ap);
}

void Logger::warn(const char* fmt, ...) {
    if (s_level_ < Level::Warn) return;
    va_list ap;
    va_start(ap, fmt);
    log(Level::Warn, fmt, ap);
    va_end(ap);
}

void Logger::info(const char* fmt, ...) {
    if (s_level_ < Level::Info) return;
    va_list ap;
    va_start(ap, fmt);
    log(Level::Info, fmt, ap);
    va_end(ap);
}

void Logger::debug(const char* fmt, ...) {
    if (s_level_ < Level::Debug) return;
    va_list ap;
    va_start(ap, fmt);
    log(Level::Debug, fmt, ap);
    va_end(ap);
}

void Logger::log(Level lvl, const char* fmt, va_list ap) {
    static const char* names[] = { "ERROR", "WARN", "INFO", "DEBUG" };
    std::lock_guard<std::mutex> lk(s_mutex_);
    std::fprintf(stderr, "[%s] ", names[static_cast<int>(lvl)]);
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
}
