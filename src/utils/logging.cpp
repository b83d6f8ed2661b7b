#include "applink/utils/logging.hpp"

namespace applink {
namespace utils {

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(LogLevel level, std::ostream& out) : level_(level), out_(out) {}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[applink] [" << toString(level) << "] " << message << std::endl;
}

std::shared_ptr<Logger> defaultLogger() {
    static std::shared_ptr<Logger> logger = std::make_shared<Logger>(LogLevel::ERROR);
    return logger;
}

} // namespace utils
} // namespace applink
