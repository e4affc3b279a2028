/**
 * @file errors.h
 * @brief Error codes and exception classes for snipq
 *
 * Defines error handling infrastructure including error codes and
 * a custom exception class for the snipq system.
 */

#ifndef SNIPQ_ERRORS_H
#define SNIPQ_ERRORS_H

#include <stdexcept>
#include <string>

namespace snipq {

/**
 * @brief Error codes for snipq operations
 *
 * Categorized by type:
 * - 0: Success
 * - 100-199: Submission validation errors
 * - 200-299: Query errors
 * - 300-399: Execution errors
 * - 400-499: IPC errors
 * - 500-599: File and configuration errors
 */
enum class ErrorCode {
    SUCCESS = 0,

    // Validation errors (100-199)
    CODE_TOO_SHORT = 100,
    CODE_TOO_LONG = 101,
    INVALID_ARGUMENT = 102,

    // Query errors (200-299)
    TASK_NOT_FOUND = 200,
    UNAUTHORIZED = 201,

    // Execution errors (300-399)
    SPAWN_FAILED = 300,
    TEMPFILE_FAILED = 301,
    SERVICE_STOPPED = 302,

    // IPC errors (400-499)
    IPC_CONNECTION_FAILED = 400,
    IPC_SERVER_NOT_RUNNING = 401,
    IPC_SEND_FAILED = 402,
    IPC_RECEIVE_FAILED = 403,
    IPC_PROTOCOL_ERROR = 404,

    // File and configuration errors (500-599)
    FILE_NOT_FOUND = 500,
    FILE_PARSE_ERROR = 501,
    FILE_READ_ERROR = 502,
    CONFIG_INVALID = 503,
};

/**
 * @brief Convert ErrorCode to human-readable string
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "Success";

        case ErrorCode::CODE_TOO_SHORT:
            return "Code is too short";
        case ErrorCode::CODE_TOO_LONG:
            return "Code is too long";
        case ErrorCode::INVALID_ARGUMENT:
            return "Invalid argument";

        case ErrorCode::TASK_NOT_FOUND:
            return "Task not found";
        case ErrorCode::UNAUTHORIZED:
            return "Not authorized";

        case ErrorCode::SPAWN_FAILED:
            return "Failed to start process";
        case ErrorCode::TEMPFILE_FAILED:
            return "Failed to write source file";
        case ErrorCode::SERVICE_STOPPED:
            return "Service is not accepting tasks";

        case ErrorCode::IPC_CONNECTION_FAILED:
            return "IPC connection failed";
        case ErrorCode::IPC_SERVER_NOT_RUNNING:
            return "Server is not running";
        case ErrorCode::IPC_SEND_FAILED:
            return "Failed to send IPC message";
        case ErrorCode::IPC_RECEIVE_FAILED:
            return "Failed to receive IPC message";
        case ErrorCode::IPC_PROTOCOL_ERROR:
            return "IPC protocol error";

        case ErrorCode::FILE_NOT_FOUND:
            return "File not found";
        case ErrorCode::FILE_PARSE_ERROR:
            return "File parse error";
        case ErrorCode::FILE_READ_ERROR:
            return "Failed to read file";
        case ErrorCode::CONFIG_INVALID:
            return "Invalid configuration";

        default:
            return "Unknown error";
    }
}

/**
 * @brief Custom exception class for snipq errors
 *
 * Submission rejections and query failures are reported by throwing
 * this exception; the code tells callers which one it was.
 */
class SnipqException : public std::runtime_error {
public:
    /**
     * @brief Construct exception with error code and message
     * @param code The error code
     * @param message Additional error message
     */
    SnipqException(ErrorCode code, const std::string& message)
        : std::runtime_error(buildMessage(code, message))
        , code_(code)
        , message_(message) {}

    /**
     * @brief Construct exception with error code only
     * @param code The error code
     */
    explicit SnipqException(ErrorCode code)
        : std::runtime_error(errorCodeToString(code))
        , code_(code)
        , message_() {}

    ErrorCode code() const noexcept { return code_; }

    /// Additional message (may be empty)
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;

    static std::string buildMessage(ErrorCode code, const std::string& message) {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        return result;
    }
};

} // namespace snipq

#endif // SNIPQ_ERRORS_H
