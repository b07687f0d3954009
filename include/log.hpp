#pragma once

#include <unistd.h>
#include <string_view>
#include <string>
#include <cstdlib>
#include <atomic>
#include <mutex>

namespace gitwire {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Lightweight stderr logger. One ::write per line keeps output from
// concurrent callers unmixed.
class Log {
public:
    static void set_level(LogLevel level) { threshold().store(level); }
    static LogLevel level() { return threshold().load(); }

    static bool enabled(LogLevel level) { return level >= threshold().load() && level != LogLevel::Off; }

    static void debug(std::string_view s) { emit(LogLevel::Debug, s); }
    static void info(std::string_view s) { emit(LogLevel::Info, s); }
    static void warn(std::string_view s) { emit(LogLevel::Warn, s); }
    static void error(std::string_view s) { emit(LogLevel::Error, s); }

    // GITWIRE_LOG=debug|info|warn|error|off
    static LogLevel level_from_env(LogLevel fallback = LogLevel::Warn) {
        const char* value = std::getenv("GITWIRE_LOG");
        if (!value) return fallback;
        std::string_view v(value);
        if (v == "debug") return LogLevel::Debug;
        if (v == "info") return LogLevel::Info;
        if (v == "warn") return LogLevel::Warn;
        if (v == "error") return LogLevel::Error;
        if (v == "off") return LogLevel::Off;
        return fallback;
    }

private:
    static void emit(LogLevel level, std::string_view s) {
        if (!enabled(level)) return;
        std::string line;
        line.reserve(s.size() + 16);
        line += prefix(level);
        line += s;
        line += '\n';
        std::lock_guard<std::mutex> lock(get_mutex());
        auto rc = ::write(STDERR_FILENO, line.data(), line.size());
        (void)rc;
    }

    static std::string_view prefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "[gitwire] debug: ";
            case LogLevel::Info: return "[gitwire] info: ";
            case LogLevel::Warn: return "[gitwire] warn: ";
            case LogLevel::Error: return "[gitwire] error: ";
            case LogLevel::Off: break;
        }
        return "[gitwire] ";
    }

    static std::atomic<LogLevel>& threshold() {
        static std::atomic<LogLevel> t{level_from_env()};
        return t;
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

} // namespace gitwire
