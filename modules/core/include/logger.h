#ifndef TVLINK_LOGGER_H
#define TVLINK_LOGGER_H

#include <string>
#include <functional>

namespace tvlink {

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Connection lifecycle, discovery results
    WARNING = 2,   // Recoverable problems
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

void setSessionId(const std::string& session_id);
std::string generate_session_id(size_t len);
void nativeLog(const std::string& message);

// Route log lines somewhere other than stderr (the interactive CLI uses this).
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO
void set_log_level(LogLevel level);
LogLevel get_log_level();
LogLevel parse_log_level(const std::string& value);

// Async mode: messages go to a queue drained by a background thread.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

} // namespace tvlink

#define LOG_DEBUG(msg) if (::tvlink::get_log_level() <= ::tvlink::LogLevel::DEBUG) ::tvlink::nativeLog(msg)
#define LOG_INFO(msg)  if (::tvlink::get_log_level() <= ::tvlink::LogLevel::INFO) ::tvlink::nativeLog(msg)
#define LOG_WARN(msg)  if (::tvlink::get_log_level() <= ::tvlink::LogLevel::WARNING) ::tvlink::nativeLog(msg)
#define LOG_ERROR(msg) if (::tvlink::get_log_level() <= ::tvlink::LogLevel::ERROR) ::tvlink::nativeLog(msg)

#endif // TVLINK_LOGGER_H
