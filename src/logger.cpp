#include "xLoad/logger.h"
#include <iostream>
#include <sstream>

namespace xload {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogSink::LogSink()
    : out(&std::cerr), min_level(LogLevel::INFO) {
}

LogSink::LogSink(std::ostream* stream, LogLevel level)
    : out(stream), min_level(level) {
}

Logger::Logger(std::string component)
    : component_(std::move(component)), sink_(std::make_shared<LogSink>()) {
}

Logger::Logger(std::string component, std::shared_ptr<LogSink> sink)
    : component_(std::move(component)), sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = std::make_shared<LogSink>();
    }
}

Logger Logger::with(const std::string& key, const std::string& value) const {
    Logger copy(*this);
    copy.fields_.emplace_back(key, value);
    return copy;
}

Logger Logger::with(const std::string& key, int64_t value) const {
    return with(key, std::to_string(value));
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (level < sink_->min_level || !sink_->out) {
        return;
    }

    // Format outside the lock
    std::ostringstream line;
    line << "[" << component_ << "] " << logLevelName(level) << " " << message;
    for (const auto& [key, value] : fields_) {
        line << " " << key << "=" << value;
    }

    std::lock_guard<std::mutex> lock(sink_->mutex);
    *sink_->out << line.str() << std::endl;
}

LogTask Logger::begin(LogLevel level, const std::string& name) const {
    log(level, name + " start");
    return LogTask(*this, level, name);
}

LogTask::LogTask(Logger logger, LogLevel level, std::string name)
    : logger_(std::move(logger)), level_(level), name_(std::move(name)),
      since_(std::chrono::steady_clock::now()) {
}

void LogTask::end(LogLevel error_level, const Status& status) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since_).count();
    Logger logger = logger_.with("takeTime", std::to_string(elapsed) + "ms");
    if (status.ok()) {
        logger.log(level_, name_ + " completed");
    } else {
        logger.with("error", status.toString()).log(error_level, name_ + " failed");
    }
}

void LogTask::warn(const std::string& message, const Status& status) const {
    logger_.with("error", status.toString()).warn(message);
}

}  // namespace xload
