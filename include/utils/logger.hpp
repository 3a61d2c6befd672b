#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <cstdlib>

namespace Strata {

/**
 * @brief Thread-safe logging utility for the fabric.
 *
 * Messages below the current minimum level are dropped. The initial level is
 * read once from STRATA_LOG_LEVEL (info, step, success, warning, error, off).
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void log(Level level, const std::string& message) {
        if (level == Level::Off || level < min_level()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Off:     break;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_level(Level level) { level_ref().store(level); }
    static Level min_level() { return level_ref().load(); }

    static Level parse_level(const std::string& name, Level fallback = Level::Info) {
        if (name == "info")    return Level::Info;
        if (name == "step")    return Level::Step;
        if (name == "success") return Level::Success;
        if (name == "warning" || name == "warn") return Level::Warning;
        if (name == "error")   return Level::Error;
        if (name == "off")     return Level::Off;
        return fallback;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& level_ref() {
        static std::atomic<Level> level{initial_level()};
        return level;
    }

    static Level initial_level() {
        const char* env = std::getenv("STRATA_LOG_LEVEL");
        return env ? parse_level(env) : Level::Info;
    }
};

} // namespace Strata
