#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR, CRITICAL };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and configures rotation.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if the file could be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/// Gzip rotated log files (`<path>.1.gz`, ...).
void set_log_compression(bool enable);

/**
 * @brief Parse a level name such as `debug` or `WARNING`.
 *
 * @param name Case-insensitive level name; `error` and `err` are synonyms.
 * @param ok   Set to `false` when @p name is not a level.
 */
LogLevel parse_log_level(const std::string& name, bool& ok);

/**
 * @brief Check whether the logger has been initialized.
 *
 * @return `true` if the logger is ready to use; `false` otherwise.
 */
bool logger_initialized();

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Optional key/value pairs providing structured context.
 */
void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg, const LogFields& fields = {});
void log_info(const std::string& msg, const LogFields& fields = {});
void log_warning(const std::string& msg, const LogFields& fields = {});
void log_error(const std::string& msg, const LogFields& fields = {});
void log_critical(const std::string& msg, const LogFields& fields = {});

/// Flush buffered output to disk.
void flush_logger();

/**
 * @brief Close the log file and reset the logger to its uninitialized state.
 */
void shutdown_logger();

#endif // LOGGER_HPP
