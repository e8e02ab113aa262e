#ifndef XLOAD_LOGGER_H_
#define XLOAD_LOGGER_H_

#include "status.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace xload {

// ============================================================================
// Logger - "[Component] message key=value ..." lines on a shared sink
// ============================================================================

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* logLevelName(LogLevel level);

/// Output stream shared by every logger derived from it
struct LogSink {
    std::ostream* out;
    LogLevel min_level;
    std::mutex mutex;

    LogSink();
    LogSink(std::ostream* stream, LogLevel level);
};

class LogTask;

class Logger {
public:
    /// Logger writing to std::cerr at INFO
    explicit Logger(std::string component);

    Logger(std::string component, std::shared_ptr<LogSink> sink);

    /// Copy with one more context field
    Logger with(const std::string& key, const std::string& value) const;
    Logger with(const std::string& key, int64_t value) const;

    void debug(const std::string& message) const { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) const { log(LogLevel::INFO, message); }
    void warn(const std::string& message) const { log(LogLevel::WARN, message); }
    void error(const std::string& message) const { log(LogLevel::ERROR, message); }

    void log(LogLevel level, const std::string& message) const;

    /// Log the start of a task; LogTask::end reports its outcome and duration
    LogTask begin(LogLevel level, const std::string& name) const;

    const std::string& component() const { return component_; }
    const std::shared_ptr<LogSink>& sink() const { return sink_; }

private:
    std::string component_;
    std::vector<std::pair<std::string, std::string>> fields_;
    std::shared_ptr<LogSink> sink_;
};

class LogTask {
public:
    LogTask(Logger logger, LogLevel level, std::string name);

    /// Log completion at the begin level, or at error_level on failure
    void end(LogLevel error_level, const Status& status) const;

    /// Intermediate warning while the task is still running
    void warn(const std::string& message, const Status& status) const;

private:
    Logger logger_;
    LogLevel level_;
    std::string name_;
    std::chrono::steady_clock::time_point since_;
};

}  // namespace xload

#endif  // XLOAD_LOGGER_H_
