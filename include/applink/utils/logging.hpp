#ifndef APPLINK_UTILS_LOGGING_HPP
#define APPLINK_UTILS_LOGGING_HPP

#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace applink {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* toString(LogLevel level);

/**
 * @brief Minimal leveled logger writing "[applink] [LEVEL] message" lines.
 *
 * A single logger is shared by every component of an engine instance. Writes
 * are serialized so the callback listener thread and the caller can log
 * concurrently.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::INFO, std::ostream& out = std::clog);

    bool enabled(LogLevel level) const;
    void setLevel(LogLevel level);
    LogLevel level() const;

    void write(LogLevel level, const std::string& message);

private:
    LogLevel level_;
    std::ostream& out_;
    mutable std::mutex mutex_;
};

// Shared logger that discards everything below ERROR; used when a component
// is constructed without one.
std::shared_ptr<Logger> defaultLogger();

} // namespace utils
} // namespace applink

#define APPLINK_LOG(logger, level, message) \
    do { \
        if ((logger) && (logger)->enabled(level)) { \
            std::ostringstream applink_log_stream_; \
            applink_log_stream_ << message; \
            (logger)->write(level, applink_log_stream_.str()); \
        } \
    } while (false)

#define APPLINK_LOG_DEBUG(logger, message) APPLINK_LOG(logger, ::applink::utils::LogLevel::DEBUG, message)
#define APPLINK_LOG_INFO(logger, message)  APPLINK_LOG(logger, ::applink::utils::LogLevel::INFO, message)
#define APPLINK_LOG_WARN(logger, message)  APPLINK_LOG(logger, ::applink::utils::LogLevel::WARN, message)
#define APPLINK_LOG_ERROR(logger, message) APPLINK_LOG(logger, ::applink::utils::LogLevel::ERROR, message)

#endif // APPLINK_UTILS_LOGGING_HPP
