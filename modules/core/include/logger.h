#ifndef FILECHAT_LOGGER_H
#define FILECHAT_LOGGER_H

#include <string>
#include <functional>

// Messages below the current level are skipped before formatting
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4,  // silences every sink
};

// Prefix attached to every log line (the chat nickname once it is known)
void setSessionId(const std::string& session_id);
void nativeLog(const std::string& message);

// Optional extra sink for every formatted line
void setLogCallback(std::function<void(const std::string&)> callback);

// Append log lines to a file. Empty path disables the file sink.
// Returns false if the file cannot be opened.
bool set_log_file(const std::string& path);

// Mirror log lines to stderr (on by default). The TUI turns this off
// because it owns the terminal.
void set_console_output(bool enabled);

// INFO until changed
void set_log_level(LogLevel level);
LogLevel get_log_level();
LogLevel parse_log_level(const std::string& value);

// Async logging: messages go to a queue drained by a background thread
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(std::string("DEBUG: ") + (msg))
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(std::string("INFO: ") + (msg))
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(std::string("WARN: ") + (msg))
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(std::string("ERROR: ") + (msg))

#endif // FILECHAT_LOGGER_H
