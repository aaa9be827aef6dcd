#pragma once

#include <functional>
#include <string>
#include <utility>

namespace logging {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

inline const char* toString(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

using LogCallback = std::function<void(LogLevel, const std::string&)>;

// Cheap to copy; an empty callback discards everything.
class Logger {
public:
    Logger() = default;
    explicit Logger(LogCallback sink) : sink_(std::move(sink)) {}

    void debug(const std::string& message) const { write(LogLevel::Debug, message); }
    void info(const std::string& message) const { write(LogLevel::Info, message); }
    void warning(const std::string& message) const { write(LogLevel::Warning, message); }
    void error(const std::string& message) const { write(LogLevel::Error, message); }

    void write(LogLevel level, const std::string& message) const {
        if (sink_) {
            sink_(level, message);
        }
    }

private:
    LogCallback sink_;
};

} // namespace logging
