#include "logger.h"

#include <ostream>

Logger::Logger() : out_(nullptr), level_(LogLevel::Off) {}

Logger::Logger(std::ostream& out, LogLevel level) : out_(&out), level_(level) {}

bool Logger::enabled(LogLevel level) const {
    return out_ != nullptr && level != LogLevel::Off && level >= level_;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) const {
    if (!enabled(level)) {
        return;
    }
    *out_ << "[" << component << "] ";
    if (level == LogLevel::Warn) {
        *out_ << "WARN: ";
    } else if (level == LogLevel::Error) {
        *out_ << "ERROR: ";
    }
    *out_ << message << "\n";
}
