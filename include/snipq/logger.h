/**
 * @file logger.h
 * @brief Server log writer for snipq
 *
 * Appends timestamped, leveled lines to <log_dir>/server.log.
 */

#ifndef SNIPQ_LOGGER_H
#define SNIPQ_LOGGER_H

#include <mutex>
#include <string>

namespace snipq {

/**
 * @brief Thread-safe append-only log file writer
 *
 * Line format:
 * @code
 * [2024-01-15 10:30:00.123] [INFO] Task t_... submitted
 * @endcode
 *
 * A Logger constructed with an empty directory is disabled and every
 * call is a no-op.
 */
class Logger {
public:
    /**
     * @brief Construct a logger
     * @param log_dir Directory holding server.log (empty = disabled)
     */
    explicit Logger(const std::string& log_dir = "");

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Write a message to the log file
     * @param level Log level (INFO, WARN, ERROR, DEBUG)
     * @param message Log message
     */
    void log(const std::string& level, const std::string& message);

    void debug(const std::string& message) { log("DEBUG", message); }
    void info(const std::string& message) { log("INFO", message); }
    void warn(const std::string& message) { log("WARN", message); }
    void error(const std::string& message) { log("ERROR", message); }

    /// true if log lines are being written
    bool enabled() const { return !log_dir_.empty(); }

    /// Full path of the log file (empty if disabled)
    std::string logPath() const;

    /**
     * @brief Get current local timestamp with millisecond precision
     * @return Formatted timestamp string
     */
    static std::string timestamp();

    /**
     * @brief Create a directory recursively (like mkdir -p)
     * @param path Directory path to create
     * @return true if directory exists or was created successfully
     */
    static bool createDirectory(const std::string& path);

private:
    std::string log_dir_;
    std::mutex mutex_;
};

} // namespace snipq

#endif // SNIPQ_LOGGER_H
