#pragma once

#include <iosfwd>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Writes "[Component] message" lines to a stream.
/// A default-constructed Logger is silent.
class Logger {
public:
    Logger();
    Logger(std::ostream& out, LogLevel level);

    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& component, const std::string& message) const;

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::Debug, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::Info, component, message);
    }
    void warn(const std::string& component, const std::string& message) const {
        log(LogLevel::Warn, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::Error, component, message);
    }

private:
    std::ostream* out_;
    LogLevel level_;
};
