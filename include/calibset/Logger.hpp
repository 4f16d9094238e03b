#ifndef CALIBSET_LOGGER_HPP
#define CALIBSET_LOGGER_HPP

#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace calib {

// Leveled console logger. One instance is created by the entry point and
// handed to every component that reports; there is no global logger.
// Lines look like: 2026-01-31 12:00:00 - calibset - INFO - message
class Logger {
public:
    enum class Level { Debug = 0, Info, Warning, Error };

    explicit Logger(Level threshold = Level::Info, std::ostream& out = std::cerr)
        : threshold_level(threshold), stream(&out) {}

    void setLevel(Level level) { threshold_level = level; }
    Level level() const { return threshold_level; }
    bool enabled(Level level) const { return level >= threshold_level; }

    void debug(const std::string& message) { log(Level::Debug, message); }
    void info(const std::string& message) { log(Level::Info, message); }
    void warning(const std::string& message) { log(Level::Warning, message); }
    void error(const std::string& message) { log(Level::Error, message); }

    // Safe to call from worker threads; a line is never interleaved with another.
    void log(Level level, const std::string& message) {
        if (!enabled(level)) return;
        const std::string line = timestamp() + " - calibset - " + levelName(level) + " - " + message;
        std::lock_guard<std::mutex> lock(write_mutex);
        *stream << line << std::endl;
    }

    static const char* levelName(Level level) {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info: return "INFO";
            case Level::Warning: return "WARNING";
            case Level::Error: return "ERROR";
        }
        return "INFO";
    }

private:
    Level threshold_level;
    std::ostream* stream;
    std::mutex write_mutex;

    static std::string timestamp() {
        std::time_t t = std::time(nullptr);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }
};

} // namespace calib

#endif // CALIBSET_LOGGER_HPP
