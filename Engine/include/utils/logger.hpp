#pragma once

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>

namespace Lookalike {

/**
 * @brief Thread-safe logging utility for the engine.
 *
 * Levels below the configured minimum are dropped. The minimum starts from
 * LOOKALIKE_LOG_LEVEL (info, step, success, warn, error, quiet) and can be
 * changed at runtime with set_level().
 */
class Logger {
public:
    enum class Level {
        Bulk,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Quiet
    };

    static void set_level(Level level) {
        min_level() = level;
    }

    static Level level() {
        return min_level().load();
    }

    static Level parse_level(const std::string& name) {
        if (name == "bulk")    return Level::Bulk;
        if (name == "info")    return Level::Info;
        if (name == "step")    return Level::Step;
        if (name == "success") return Level::Success;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error")   return Level::Error;
        if (name == "quiet")   return Level::Quiet;
        return Level::Info;
    }

    static void log(Level level, const std::string& message) {
        if (level < min_level().load()) return;

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
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[BULK] "; break; // Magenta
            case Level::Quiet:   return;
        }

        // Diagnostics go to stderr so CLI output on stdout stays parseable
        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

private:
    static std::atomic<Level>& min_level() {
        static std::atomic<Level> level{initial_level()};
        return level;
    }

    static Level initial_level() {
        const char* env = std::getenv("LOOKALIKE_LOG_LEVEL");
        return env ? parse_level(env) : Level::Info;
    }
};

} // namespace Lookalike
