/**
 * @file Log.hpp
 * @brief Line logging shared by the engine and the console handlers.
 */

#pragma once

#include <mutex>
#include <ostream>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * @brief Process-wide, mutex-guarded line logger.
 *
 * Every call writes one whole line to the current sink, so lines coming from
 * the display, keyboard and command threads never interleave. The sink can be
 * swapped for a log file (so the reel frame owns stdout) or set to nullptr.
 */
class Log {
public:
    static void setSink(std::ostream* sink);
    static void setLevel(LogLevel level);
    static LogLevel level();

    static bool parseLevel(const std::string& name, LogLevel& out);

    static void write(LogLevel level, const std::string& message);

    static void debug(const std::string& m) { write(LogLevel::Debug, m); }
    static void info(const std::string& m)  { write(LogLevel::Info, m); }
    static void warn(const std::string& m)  { write(LogLevel::Warn, m); }
    static void error(const std::string& m) { write(LogLevel::Error, m); }

private:
    static std::mutex& mutex();
};
