/**
 * @file Log.cpp
 * @brief Line logging shared by the engine and the console handlers.
 */

#include "Log.hpp"

#include <atomic>
#include <iostream>

namespace {
    std::ostream* g_sink = &std::clog;
    std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};

    const char* tag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "[debug] ";
            case LogLevel::Info:  return "[info]  ";
            case LogLevel::Warn:  return "[warn]  ";
            case LogLevel::Error: return "[error] ";
        }
        return "";
    }
}

std::mutex& Log::mutex() {
    static std::mutex m;
    return m;
}

void Log::setSink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex());
    g_sink = sink;
}

void Log::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Log::level() {
    return static_cast<LogLevel>(g_level.load());
}

bool Log::parseLevel(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

void Log::write(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(mutex());
    if (!g_sink) return;
    *g_sink << tag(level) << message << '\n' << std::flush;
}
