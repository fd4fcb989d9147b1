#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace WikiCorpus {

/**
 * @brief Thread-safe logging utility shared by the parser, writers and workers.
 *
 * Messages below the process-wide threshold are dropped before taking the lock.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void set_level(Level level) { threshold().store(level); }
    static Level level() { return threshold().load(); }

    /**
     * @brief Parse "debug", "info", "warn"/"warning" or "error".
     * @return false if the name is not recognised (threshold unchanged)
     */
    static bool parse_level(const std::string& name, Level& out) {
        if (name == "debug") { out = Level::Debug; return true; }
        if (name == "info") { out = Level::Info; return true; }
        if (name == "warn" || name == "warning") { out = Level::Warning; return true; }
        if (name == "error") { out = Level::Error; return true; }
        return false;
    }

    static void log(Level level, const std::string& message) {
        if (rank(level) < rank(threshold().load())) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;37m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = (level == Level::Warning || level == Level::Error) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> value{Level::Info};
        return value;
    }

    // Step and Success are informational
    static int rank(Level level) {
        switch (level) {
            case Level::Debug:   return 0;
            case Level::Info:
            case Level::Step:
            case Level::Success: return 1;
            case Level::Warning: return 2;
            case Level::Error:   return 3;
        }
        return 1;
    }
};

} // namespace WikiCorpus
