#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and configures log rotation
 * parameters. Calling it again switches to the new file.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `false` if the file could not be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 *
 * @param level Desired @ref LogLevel threshold for emitting messages.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit logs as JSON objects instead of plain
 *               text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has been initialized.
 *
 * @return `true` if the logger is ready to use; `false` otherwise.
 */
bool logger_initialized();

/**
 * @brief Log a message with structured key/value fields.
 *
 * Messages are dropped silently while the logger is not initialized.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields = {});

void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields = {});
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields = {});
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields = {});
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields = {});

/**
 * @brief Flush and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
